#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ledger {

// One share pays this many units to the winning side.
constexpr std::int64_t kPayoutPerShare = 1000;
constexpr std::int64_t kMinPrice = 1;
constexpr std::int64_t kMaxPrice = kPayoutPerShare - 1;

enum class Side { Yes, No };
enum class Outcome { Yes, No };
enum class MarketStatus { Open, PendingResolution, Resolved, Cancelled };
enum class OrderStatus { Open, Partial, Filled, Cancelled };
enum class PositionStatus { Active, Settled, Refunded };

enum class AuditKind {
    OpeningBalance,
    OrderPlaced,
    PriceImprovement,
    OrderCancelled,
    OrderReduced,
    PositionWon,
    PositionLost,
    AutoSettle,
    PositionRefunded,
    BotAction
};

struct Account {
    std::string id;
    std::int64_t balance = 0;
};

struct Market {
    std::string id;
    std::string title;
    MarketStatus status = MarketStatus::Open;
    std::optional<Outcome> resolution;
    std::int64_t created_at_ms = 0;
    std::int64_t resolved_at_ms = 0;
};

struct Order {
    std::string id;
    std::string account_id;
    std::string market_id;
    Side side = Side::Yes;
    std::int64_t price = 0;      // what this side pays per share
    std::int64_t shares = 0;
    std::int64_t filled = 0;
    OrderStatus status = OrderStatus::Open;
    std::uint64_t sequence = 0;  // creation order, breaks price ties
    std::int64_t created_at_ms = 0;
    std::int64_t updated_at_ms = 0;

    [[nodiscard]] std::int64_t remaining() const { return shares - filled; }
    [[nodiscard]] bool is_resting() const {
        return status == OrderStatus::Open || status == OrderStatus::Partial;
    }
};

struct Position {
    std::string id;
    std::string market_id;
    std::string yes_account_id;
    std::string no_account_id;
    std::string yes_order_id;
    std::string no_order_id;
    std::int64_t trade_price = 0;  // YES side cost per share
    std::int64_t shares = 0;
    PositionStatus status = PositionStatus::Active;
    std::optional<std::string> winner_account_id;
    std::optional<std::string> parent_id;
    std::uint64_t sequence = 0;
    std::int64_t created_at_ms = 0;
    std::int64_t settled_at_ms = 0;

    [[nodiscard]] std::int64_t payout() const { return shares * kPayoutPerShare; }
};

struct ExposureSnapshot {
    std::int64_t total_at_risk = 0;
    std::int64_t tier = 0;
    std::optional<std::int64_t> last_pullback_at_ms;
    std::int64_t updated_at_ms = 0;
};

struct AuditEntry {
    std::uint64_t sequence = 0;
    AuditKind kind = AuditKind::OrderPlaced;
    std::string account_id;
    std::int64_t amount = 0;          // signed balance delta
    std::int64_t balance_after = 0;
    std::string reference_id;
    std::string details;
    std::int64_t timestamp_ms = 0;
};

const char* to_string(Side side);
const char* to_string(Outcome outcome);
const char* to_string(MarketStatus status);
const char* to_string(OrderStatus status);
const char* to_string(PositionStatus status);
const char* to_string(AuditKind kind);

// Parsers throw LedgerError(InvalidArgument) on unknown text.
Side parse_side(const std::string& text);
Outcome parse_outcome(const std::string& text);
MarketStatus parse_market_status(const std::string& text);
OrderStatus parse_order_status(const std::string& text);
PositionStatus parse_position_status(const std::string& text);
AuditKind parse_audit_kind(const std::string& text);

inline Side opposite(Side side) { return side == Side::Yes ? Side::No : Side::Yes; }

} // namespace ledger
