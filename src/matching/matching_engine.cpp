#include "matching/matching_engine.hpp"

#include "ledger/errors.hpp"
#include "ledger/util.hpp"

#include <algorithm>
#include <iostream>
#include <limits>

namespace matching {

using ledger::AuditKind;
using ledger::ErrorKind;
using ledger::kPayoutPerShare;
using ledger::LedgerTransaction;
using ledger::Market;
using ledger::MarketStatus;
using ledger::Order;
using ledger::OrderStatus;
using ledger::Position;
using ledger::PositionStatus;
using ledger::Side;
using ledger::throw_error;

namespace {

// Keeps shares * kPayoutPerShare well inside int64.
constexpr std::int64_t kMaxShares = std::numeric_limits<std::int64_t>::max() / (kPayoutPerShare * 1000);

void validate_order_args(std::int64_t price, std::int64_t shares) {
    if (price < ledger::kMinPrice || price > ledger::kMaxPrice) {
        throw_error(ErrorKind::InvalidArgument,
                    "Price must be between " + std::to_string(ledger::kMinPrice) + " and " +
                    std::to_string(ledger::kMaxPrice) + ", got " + std::to_string(price));
    }
    if (shares <= 0) {
        throw_error(ErrorKind::InvalidArgument, "Shares must be positive, got " + std::to_string(shares));
    }
    if (shares > kMaxShares) {
        throw_error(ErrorKind::InvalidArgument, "Shares exceed the supported maximum");
    }
}

void update_fill_status(Order& order) {
    if (order.remaining() == 0) {
        order.status = OrderStatus::Filled;
    } else if (order.filled > 0) {
        order.status = OrderStatus::Partial;
    } else {
        order.status = OrderStatus::Open;
    }
}

} // namespace

OrderResult MatchingEngine::place_order(LedgerTransaction& txn,
                                        const std::string& account_id,
                                        const std::string& market_id,
                                        Side side,
                                        std::int64_t price,
                                        std::int64_t shares) {
    validate_order_args(price, shares);
    txn.require_account(account_id);
    const auto market = txn.get_market(market_id);
    if (market.status != MarketStatus::Open) {
        throw_error(ErrorKind::InvalidState,
                    "Market " + market_id + " is not open (" + ledger::to_string(market.status) + ")");
    }

    Order order;
    order.sequence = txn.next_sequence();
    order.id = ledger::make_id("ord", order.sequence);
    order.account_id = account_id;
    order.market_id = market_id;
    order.side = side;
    order.price = price;
    order.shares = shares;
    order.created_at_ms = txn.timestamp_ms();
    order.updated_at_ms = txn.timestamp_ms();

    OrderResult result;
    result.reserved = shares * price;
    txn.debit(account_id, result.reserved, AuditKind::OrderPlaced, order.id,
              std::string(ledger::to_string(side)) + " " + std::to_string(shares) + " @ " + std::to_string(price));

    std::vector<Order> makers;
    for (auto& resting : txn.orders_in_market(market_id)) {
        if (resting.is_resting() && resting.side != side &&
            resting.price + price >= kPayoutPerShare && resting.account_id != account_id) {
            makers.push_back(std::move(resting));
        }
    }
    std::sort(makers.begin(), makers.end(), [](const Order& a, const Order& b) {
        if (a.price != b.price) {
            return a.price > b.price;
        }
        return a.sequence < b.sequence;
    });

    std::int64_t matched_cost = 0;
    for (auto& maker : makers) {
        if (order.remaining() == 0) {
            break;
        }
        auto quantity = std::min(order.remaining(), maker.remaining());
        if (listener_) {
            quantity = std::min(quantity, listener_->fill_limit(txn, order, maker, quantity));
        }
        if (quantity <= 0) {
            continue;
        }

        Position position;
        position.sequence = txn.next_sequence();
        position.id = ledger::make_id("pos", position.sequence);
        position.market_id = market_id;
        if (side == Side::Yes) {
            position.yes_account_id = account_id;
            position.yes_order_id = order.id;
            position.no_account_id = maker.account_id;
            position.no_order_id = maker.id;
            position.trade_price = kPayoutPerShare - maker.price;
        } else {
            position.yes_account_id = maker.account_id;
            position.yes_order_id = maker.id;
            position.no_account_id = account_id;
            position.no_order_id = order.id;
            position.trade_price = maker.price;
        }
        position.shares = quantity;
        position.created_at_ms = txn.timestamp_ms();
        txn.put_position(position);

        maker.filled += quantity;
        update_fill_status(maker);
        maker.updated_at_ms = txn.timestamp_ms();
        txn.put_order(maker);

        order.filled += quantity;
        matched_cost += quantity * (kPayoutPerShare - maker.price);

        MatchedFill fill;
        fill.position_id = position.id;
        fill.maker_order_id = maker.id;
        fill.maker_account_id = maker.account_id;
        fill.yes_account_id = position.yes_account_id;
        fill.no_account_id = position.no_account_id;
        fill.maker_price = maker.price;
        fill.trade_price = position.trade_price;
        fill.shares = quantity;
        result.fills.push_back(std::move(fill));
    }

    update_fill_status(order);
    txn.put_order(order);

    result.refunded = result.reserved - (matched_cost + order.remaining() * price);
    if (result.refunded > 0) {
        txn.credit(account_id, result.refunded, AuditKind::PriceImprovement, order.id);
    }

    if (!result.fills.empty()) {
        result.auto_settle = auto_settle(txn, account_id, market_id);
        std::clog << "[Matching] " << order.id << " " << ledger::to_string(side) << " " << shares
                  << " @ " << price << " filled " << order.filled << " across " << result.fills.size()
                  << " makers, refund " << result.refunded << std::endl;
        if (listener_) {
            listener_->on_fills(txn, result.fills);
        }
    }

    // The listener may have reduced other orders; this one is only read back.
    result.order = txn.find_order(order.id).value_or(order);
    return result;
}

std::optional<AutoSettleOutcome> MatchingEngine::auto_settle(LedgerTransaction& txn,
                                                             const std::string& account_id,
                                                             const std::string& market_id) {
    std::vector<Position> yes_side;
    std::vector<Position> no_side;
    for (auto& position : txn.positions_in_market(market_id)) {
        if (position.status != PositionStatus::Active) {
            continue;
        }
        if (position.yes_account_id == account_id) {
            yes_side.push_back(std::move(position));
        } else if (position.no_account_id == account_id) {
            no_side.push_back(std::move(position));
        }
    }

    std::int64_t yes_shares = 0;
    std::int64_t no_shares = 0;
    for (const auto& position : yes_side) {
        yes_shares += position.shares;
    }
    for (const auto& position : no_side) {
        no_shares += position.shares;
    }
    const auto netted = std::min(yes_shares, no_shares);
    if (netted == 0) {
        return std::nullopt;
    }

    AutoSettleOutcome outcome;
    outcome.shares_netted = netted;

    // Oldest positions first on both sides (lists are in sequence order).
    std::vector<std::int64_t> yes_consumed(yes_side.size(), 0);
    std::vector<std::int64_t> no_consumed(no_side.size(), 0);
    std::size_t i = 0;
    std::size_t j = 0;
    std::int64_t left = netted;
    while (left > 0) {
        const auto& yes_position = yes_side[i];
        const auto& no_position = no_side[j];
        const auto slice = std::min({yes_position.shares - yes_consumed[i],
                                     no_position.shares - no_consumed[j],
                                     left});

        // The account steps out; its two counterparties now face each other.
        const auto& new_no_holder = yes_position.no_account_id;
        const auto& new_yes_holder = no_position.yes_account_id;
        if (new_no_holder == new_yes_holder) {
            txn.credit(new_no_holder, slice * kPayoutPerShare, AuditKind::AutoSettle, yes_position.id,
                       "offsetting counterparties");
        } else {
            Position novated;
            novated.sequence = txn.next_sequence();
            novated.id = ledger::make_id("pos", novated.sequence);
            novated.market_id = market_id;
            novated.yes_account_id = new_yes_holder;
            novated.yes_order_id = no_position.yes_order_id;
            novated.no_account_id = new_no_holder;
            novated.no_order_id = yes_position.no_order_id;
            novated.trade_price = no_position.trade_price;
            novated.shares = slice;
            novated.created_at_ms = txn.timestamp_ms();
            txn.put_position(novated);
            outcome.created_positions.push_back(novated.id);
        }

        yes_consumed[i] += slice;
        no_consumed[j] += slice;
        left -= slice;
        if (yes_consumed[i] == yes_position.shares) {
            ++i;
        }
        if (no_consumed[j] == no_position.shares) {
            ++j;
        }
    }

    const auto settle = [&](Position position, std::int64_t consumed) {
        if (consumed == 0) {
            return;
        }
        if (consumed < position.shares) {
            Position remainder = position;
            remainder.sequence = txn.next_sequence();
            remainder.id = ledger::make_id("pos", remainder.sequence);
            remainder.shares = position.shares - consumed;
            remainder.parent_id = position.id;
            remainder.created_at_ms = txn.timestamp_ms();
            txn.put_position(remainder);
            outcome.created_positions.push_back(remainder.id);
        }
        position.status = PositionStatus::Settled;
        position.winner_account_id = account_id;
        position.settled_at_ms = txn.timestamp_ms();
        txn.put_position(position);
        outcome.settled_positions.push_back(position.id);
    };
    for (std::size_t k = 0; k < yes_side.size(); ++k) {
        settle(yes_side[k], yes_consumed[k]);
    }
    for (std::size_t k = 0; k < no_side.size(); ++k) {
        settle(no_side[k], no_consumed[k]);
    }

    outcome.credited = netted * kPayoutPerShare;
    txn.credit(account_id, outcome.credited, AuditKind::AutoSettle, market_id,
               "netted " + std::to_string(netted) + " shares");
    std::clog << "[Matching] Auto-settled " << netted << " shares for " << account_id
              << " in " << market_id << std::endl;
    return outcome;
}

std::int64_t MatchingEngine::refund_resting(LedgerTransaction& txn, Order& order) {
    const auto refund = order.remaining() * order.price;
    order.status = OrderStatus::Cancelled;
    order.updated_at_ms = txn.timestamp_ms();
    txn.put_order(order);
    if (refund > 0) {
        txn.credit(order.account_id, refund, AuditKind::OrderCancelled, order.id);
    }
    return refund;
}

CancelResult MatchingEngine::cancel_order(LedgerTransaction& txn,
                                          const std::string& account_id,
                                          const std::string& order_id) {
    auto order = txn.find_order(order_id);
    if (!order) {
        throw_error(ErrorKind::NotFound, "Order not found: " + order_id);
    }
    if (order->account_id != account_id) {
        throw_error(ErrorKind::Forbidden, "Order " + order_id + " belongs to another account");
    }
    if (!order->is_resting()) {
        throw_error(ErrorKind::InvalidState,
                    "Order " + order_id + " is " + ledger::to_string(order->status));
    }

    CancelResult result;
    result.refunded = refund_resting(txn, *order);
    result.order = *order;
    return result;
}

std::int64_t MatchingEngine::reduce_order(LedgerTransaction& txn,
                                          const std::string& order_id,
                                          std::int64_t new_remaining,
                                          const std::string& details) {
    auto order = txn.find_order(order_id);
    if (!order) {
        throw_error(ErrorKind::NotFound, "Order not found: " + order_id);
    }
    if (!order->is_resting()) {
        throw_error(ErrorKind::InvalidState, "Order " + order_id + " is not resting");
    }
    if (new_remaining < 0) {
        throw_error(ErrorKind::InvalidArgument, "Remaining shares must not be negative");
    }
    if (new_remaining >= order->remaining()) {
        return 0;
    }

    const auto released = (order->remaining() - new_remaining) * order->price;
    AuditKind kind = AuditKind::OrderReduced;
    if (new_remaining == 0) {
        order->status = OrderStatus::Cancelled;
        kind = AuditKind::OrderCancelled;
    } else {
        order->shares = order->filled + new_remaining;
        update_fill_status(*order);
    }
    order->updated_at_ms = txn.timestamp_ms();
    txn.put_order(*order);
    txn.credit(order->account_id, released, kind, order->id, details);
    return released;
}

std::vector<CancelResult> MatchingEngine::cancel_resting_orders(LedgerTransaction& txn,
                                                                const std::string& account_id,
                                                                const std::optional<std::string>& market_id) {
    txn.require_account(account_id);
    std::vector<CancelResult> results;
    for (auto& order : txn.orders_of_account(account_id)) {
        if (!order.is_resting() || (market_id && order.market_id != *market_id)) {
            continue;
        }
        CancelResult result;
        result.refunded = refund_resting(txn, order);
        result.order = order;
        results.push_back(std::move(result));
    }
    return results;
}

ResolutionResult MatchingEngine::resolve_market(LedgerTransaction& txn,
                                                const std::string& market_id,
                                                ledger::Outcome outcome) {
    auto market = txn.get_market(market_id);
    if (market.status == MarketStatus::Resolved) {
        throw_error(ErrorKind::InvalidState, "Market " + market_id + " is already resolved");
    }
    if (market.status == MarketStatus::Cancelled) {
        throw_error(ErrorKind::InvalidState, "Market " + market_id + " was cancelled");
    }

    ResolutionResult result;
    result.market_id = market_id;
    result.outcome = outcome;

    for (auto& position : txn.positions_in_market(market_id)) {
        if (position.status != PositionStatus::Active) {
            continue;
        }
        const bool yes_wins = outcome == ledger::Outcome::Yes;
        const auto& winner = yes_wins ? position.yes_account_id : position.no_account_id;
        const auto& loser = yes_wins ? position.no_account_id : position.yes_account_id;
        txn.credit(winner, position.payout(), AuditKind::PositionWon, position.id);
        txn.record(AuditKind::PositionLost, loser, position.id,
                   std::to_string(position.shares) + " shares");

        position.status = PositionStatus::Settled;
        position.winner_account_id = winner;
        position.settled_at_ms = txn.timestamp_ms();
        txn.put_position(position);
        ++result.positions_settled;
        result.total_paid += position.payout();
    }

    for (auto& order : txn.orders_in_market(market_id)) {
        if (!order.is_resting()) {
            continue;
        }
        result.total_refunded += refund_resting(txn, order);
        ++result.orders_cancelled;
    }

    market.status = MarketStatus::Resolved;
    market.resolution = outcome;
    market.resolved_at_ms = txn.timestamp_ms();
    txn.put_market(market);

    if (listener_) {
        listener_->on_settlement(txn);
    }
    std::clog << "[Matching] Resolved " << market_id << " " << ledger::to_string(outcome)
              << ": paid " << result.total_paid << " on " << result.positions_settled
              << " positions, refunded " << result.orders_cancelled << " orders" << std::endl;
    return result;
}

Market MatchingEngine::close_market(LedgerTransaction& txn, const std::string& market_id) {
    auto market = txn.get_market(market_id);
    if (market.status != MarketStatus::Open) {
        throw_error(ErrorKind::InvalidState,
                    "Market " + market_id + " is not open (" + ledger::to_string(market.status) + ")");
    }
    market.status = MarketStatus::PendingResolution;
    txn.put_market(market);
    return market;
}

MarketCancellationResult MatchingEngine::cancel_market(LedgerTransaction& txn, const std::string& market_id) {
    auto market = txn.get_market(market_id);
    if (market.status != MarketStatus::Open && market.status != MarketStatus::PendingResolution) {
        throw_error(ErrorKind::InvalidState,
                    "Market " + market_id + " cannot be cancelled (" + ledger::to_string(market.status) + ")");
    }

    MarketCancellationResult result;
    result.market_id = market_id;

    for (auto& position : txn.positions_in_market(market_id)) {
        if (position.status != PositionStatus::Active) {
            continue;
        }
        const auto yes_refund = position.trade_price * position.shares;
        const auto no_refund = (kPayoutPerShare - position.trade_price) * position.shares;
        txn.credit(position.yes_account_id, yes_refund, AuditKind::PositionRefunded, position.id);
        txn.credit(position.no_account_id, no_refund, AuditKind::PositionRefunded, position.id);

        position.status = PositionStatus::Refunded;
        position.settled_at_ms = txn.timestamp_ms();
        txn.put_position(position);
        ++result.positions_refunded;
        result.position_refunds += yes_refund + no_refund;
    }

    for (auto& order : txn.orders_in_market(market_id)) {
        if (!order.is_resting()) {
            continue;
        }
        result.order_refunds += refund_resting(txn, order);
        ++result.orders_cancelled;
    }

    market.status = MarketStatus::Cancelled;
    market.resolved_at_ms = txn.timestamp_ms();
    txn.put_market(market);

    if (listener_) {
        listener_->on_settlement(txn);
    }
    std::clog << "[Matching] Cancelled " << market_id << ": refunded " << result.positions_refunded
              << " positions and " << result.orders_cancelled << " orders" << std::endl;
    return result;
}

ledger::Account MatchingEngine::create_account(LedgerTransaction& txn,
                                               const std::string& account_id,
                                               std::int64_t opening_balance) {
    if (account_id.empty()) {
        throw_error(ErrorKind::InvalidArgument, "Account id must not be empty");
    }
    if (opening_balance < 0) {
        throw_error(ErrorKind::InvalidArgument, "Opening balance must not be negative");
    }
    if (txn.find_account(account_id)) {
        throw_error(ErrorKind::InvalidState, "Account " + account_id + " already exists");
    }
    txn.put_account(ledger::Account{account_id, 0});
    txn.credit(account_id, opening_balance, AuditKind::OpeningBalance, account_id);
    return txn.get_account(account_id);
}

Market MatchingEngine::create_market(LedgerTransaction& txn,
                                     const std::string& market_id,
                                     const std::string& title) {
    if (market_id.empty()) {
        throw_error(ErrorKind::InvalidArgument, "Market id must not be empty");
    }
    if (txn.find_market(market_id)) {
        throw_error(ErrorKind::InvalidState, "Market " + market_id + " already exists");
    }
    Market market;
    market.id = market_id;
    market.title = title;
    market.status = MarketStatus::Open;
    market.created_at_ms = txn.timestamp_ms();
    txn.put_market(market);
    return market;
}

} // namespace matching
