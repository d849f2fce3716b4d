#pragma once

#include "ledger/store.hpp"
#include "ledger/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace matching {

struct MatchedFill {
    std::string position_id;
    std::string maker_order_id;
    std::string maker_account_id;
    std::string yes_account_id;
    std::string no_account_id;
    std::int64_t maker_price = 0;
    std::int64_t trade_price = 0;  // YES side cost per share
    std::int64_t shares = 0;
};

struct AutoSettleOutcome {
    std::int64_t shares_netted = 0;
    std::int64_t credited = 0;
    std::vector<std::string> settled_positions;
    std::vector<std::string> created_positions;
};

struct OrderResult {
    ledger::Order order;
    std::vector<MatchedFill> fills;
    std::int64_t reserved = 0;
    std::int64_t refunded = 0;
    std::optional<AutoSettleOutcome> auto_settle;
};

struct CancelResult {
    ledger::Order order;
    std::int64_t refunded = 0;
};

struct ResolutionResult {
    std::string market_id;
    ledger::Outcome outcome = ledger::Outcome::Yes;
    std::size_t positions_settled = 0;
    std::int64_t total_paid = 0;
    std::size_t orders_cancelled = 0;
    std::int64_t total_refunded = 0;
};

struct MarketCancellationResult {
    std::string market_id;
    std::size_t positions_refunded = 0;
    std::int64_t position_refunds = 0;
    std::size_t orders_cancelled = 0;
    std::int64_t order_refunds = 0;
};

// Hook for components that must react to fills inside the same transaction.
class FillListener {
public:
    virtual ~FillListener() = default;

    // Largest number of shares the engine may trade in this slice.
    virtual std::int64_t fill_limit(ledger::LedgerTransaction& txn,
                                    const ledger::Order& taker,
                                    const ledger::Order& maker,
                                    std::int64_t shares) = 0;

    // Called once per placement after all slices and auto-settlement.
    virtual void on_fills(ledger::LedgerTransaction& txn, const std::vector<MatchedFill>& fills) = 0;

    // Called after a market's positions were paid out or refunded.
    virtual void on_settlement(ledger::LedgerTransaction& txn) = 0;
};

// Price-time priority matching of complementary YES/NO offers.
// Every operation works inside a caller-owned transaction and never commits.
class MatchingEngine {
public:
    MatchingEngine() = default;

    void set_listener(FillListener* listener) { listener_ = listener; }

    OrderResult place_order(ledger::LedgerTransaction& txn,
                            const std::string& account_id,
                            const std::string& market_id,
                            ledger::Side side,
                            std::int64_t price,
                            std::int64_t shares);

    CancelResult cancel_order(ledger::LedgerTransaction& txn,
                              const std::string& account_id,
                              const std::string& order_id);

    // Shrinks a resting order to new_remaining unfilled shares (0 cancels it)
    // and refunds the released reservation. Returns the refund.
    std::int64_t reduce_order(ledger::LedgerTransaction& txn,
                              const std::string& order_id,
                              std::int64_t new_remaining,
                              const std::string& details);

    // Cancels resting orders of an account, optionally limited to one market.
    std::vector<CancelResult> cancel_resting_orders(ledger::LedgerTransaction& txn,
                                                    const std::string& account_id,
                                                    const std::optional<std::string>& market_id = std::nullopt);

    ResolutionResult resolve_market(ledger::LedgerTransaction& txn,
                                    const std::string& market_id,
                                    ledger::Outcome outcome);

    ledger::Market close_market(ledger::LedgerTransaction& txn, const std::string& market_id);

    MarketCancellationResult cancel_market(ledger::LedgerTransaction& txn, const std::string& market_id);

    ledger::Account create_account(ledger::LedgerTransaction& txn,
                                   const std::string& account_id,
                                   std::int64_t opening_balance);

    ledger::Market create_market(ledger::LedgerTransaction& txn,
                                 const std::string& market_id,
                                 const std::string& title);

private:
    std::optional<AutoSettleOutcome> auto_settle(ledger::LedgerTransaction& txn,
                                                 const std::string& account_id,
                                                 const std::string& market_id);
    std::int64_t refund_resting(ledger::LedgerTransaction& txn, ledger::Order& order);

    FillListener* listener_ = nullptr;
};

} // namespace matching
