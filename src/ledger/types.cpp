#include "ledger/bot_tables.hpp"
#include "ledger/errors.hpp"
#include "ledger/types.hpp"
#include "ledger/util.hpp"

namespace ledger {

namespace {

[[noreturn]] void unknown(const char* what, const std::string& text) {
    throw_error(ErrorKind::InvalidArgument, std::string("Unknown ") + what + " '" + text + "'");
}

} // namespace

const char* to_string(Side side) {
    return side == Side::Yes ? "yes" : "no";
}

const char* to_string(Outcome outcome) {
    return outcome == Outcome::Yes ? "yes" : "no";
}

const char* to_string(MarketStatus status) {
    switch (status) {
        case MarketStatus::Open: return "open";
        case MarketStatus::PendingResolution: return "pending_resolution";
        case MarketStatus::Resolved: return "resolved";
        case MarketStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::Open: return "open";
        case OrderStatus::Partial: return "partial";
        case OrderStatus::Filled: return "filled";
        case OrderStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(PositionStatus status) {
    switch (status) {
        case PositionStatus::Active: return "active";
        case PositionStatus::Settled: return "settled";
        case PositionStatus::Refunded: return "refunded";
    }
    return "unknown";
}

const char* to_string(AuditKind kind) {
    switch (kind) {
        case AuditKind::OpeningBalance: return "opening_balance";
        case AuditKind::OrderPlaced: return "order_placed";
        case AuditKind::PriceImprovement: return "price_improvement";
        case AuditKind::OrderCancelled: return "order_cancelled";
        case AuditKind::OrderReduced: return "order_reduced";
        case AuditKind::PositionWon: return "position_won";
        case AuditKind::PositionLost: return "position_lost";
        case AuditKind::AutoSettle: return "auto_settle";
        case AuditKind::PositionRefunded: return "position_refunded";
        case AuditKind::BotAction: return "bot_action";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::InvalidState: return "InvalidState";
        case ErrorKind::Forbidden: return "Forbidden";
        case ErrorKind::InsufficientFunds: return "InsufficientFunds";
        case ErrorKind::InvariantViolation: return "InvariantViolation";
    }
    return "Unknown";
}

const char* to_string(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::Bell: return "bell";
        case ShapeKind::Flat: return "flat";
        case ShapeKind::Exponential: return "exponential";
        case ShapeKind::Logarithmic: return "logarithmic";
        case ShapeKind::Sigmoid: return "sigmoid";
        case ShapeKind::Parabolic: return "parabolic";
        case ShapeKind::Custom: return "custom";
    }
    return "unknown";
}

Side parse_side(const std::string& text) {
    const auto value = to_lower_copy(text);
    if (value == "yes") return Side::Yes;
    if (value == "no") return Side::No;
    unknown("side", text);
}

Outcome parse_outcome(const std::string& text) {
    const auto value = to_lower_copy(text);
    if (value == "yes") return Outcome::Yes;
    if (value == "no") return Outcome::No;
    unknown("outcome", text);
}

MarketStatus parse_market_status(const std::string& text) {
    if (text == "open") return MarketStatus::Open;
    if (text == "pending_resolution") return MarketStatus::PendingResolution;
    if (text == "resolved") return MarketStatus::Resolved;
    if (text == "cancelled") return MarketStatus::Cancelled;
    unknown("market status", text);
}

OrderStatus parse_order_status(const std::string& text) {
    if (text == "open") return OrderStatus::Open;
    if (text == "partial") return OrderStatus::Partial;
    if (text == "filled") return OrderStatus::Filled;
    if (text == "cancelled") return OrderStatus::Cancelled;
    unknown("order status", text);
}

PositionStatus parse_position_status(const std::string& text) {
    if (text == "active") return PositionStatus::Active;
    if (text == "settled") return PositionStatus::Settled;
    if (text == "refunded") return PositionStatus::Refunded;
    unknown("position status", text);
}

AuditKind parse_audit_kind(const std::string& text) {
    for (const auto kind : {AuditKind::OpeningBalance, AuditKind::OrderPlaced, AuditKind::PriceImprovement,
                            AuditKind::OrderCancelled, AuditKind::OrderReduced, AuditKind::PositionWon,
                            AuditKind::PositionLost, AuditKind::AutoSettle, AuditKind::PositionRefunded,
                            AuditKind::BotAction}) {
        if (text == to_string(kind)) {
            return kind;
        }
    }
    unknown("audit kind", text);
}

ShapeKind parse_shape_kind(const std::string& text) {
    const auto value = to_lower_copy(text);
    for (const auto kind : {ShapeKind::Bell, ShapeKind::Flat, ShapeKind::Exponential, ShapeKind::Logarithmic,
                            ShapeKind::Sigmoid, ShapeKind::Parabolic, ShapeKind::Custom}) {
        if (value == to_string(kind)) {
            return kind;
        }
    }
    unknown("shape type", text);
}

ShapeKind shape_kind(const ShapeParams& params) {
    // Variant alternatives are declared in ShapeKind order.
    return static_cast<ShapeKind>(params.index());
}

const char* override_name(const MarketOverride& override_value) {
    switch (override_value.index()) {
        case 0: return "default";
        case 1: return "disable";
        case 2: return "replace";
        case 3: return "multiply";
        default: return "unknown";
    }
}

} // namespace ledger
