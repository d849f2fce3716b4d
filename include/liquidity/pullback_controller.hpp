#pragma once

#include "ledger/store.hpp"
#include "liquidity/bot_config.hpp"
#include "matching/matching_engine.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace liquidity {

struct PullbackOutcome {
    std::int64_t exposure_before = 0;
    std::int64_t exposure_after = 0;
    std::int64_t previous_tier = 0;
    std::int64_t tier = 0;
    bool triggered = false;
    std::size_t orders_reduced = 0;
    std::size_t orders_cancelled = 0;
    std::int64_t refunded = 0;
};

// Keeps the exposure snapshot current and shrinks the bot's resting orders
// whenever a fill moves exposure into a different tier. Runs inside the
// transaction of the fill that triggered it.
class PullbackController : public matching::FillListener {
public:
    PullbackController(matching::MatchingEngine& engine, BotConfig config);

    [[nodiscard]] const BotConfig& config() const { return config_; }
    void set_config(BotConfig config) { config_ = std::move(config); }

    std::int64_t fill_limit(ledger::LedgerTransaction& txn,
                            const ledger::Order& taker,
                            const ledger::Order& maker,
                            std::int64_t shares) override;
    void on_fills(ledger::LedgerTransaction& txn, const std::vector<matching::MatchedFill>& fills) override;
    void on_settlement(ledger::LedgerTransaction& txn) override;

    // Recomputes exposure and stores the snapshot. With allow_shrink, a tier
    // change also shrinks every resting bot order.
    PullbackOutcome evaluate(ledger::LedgerTransaction& txn, bool allow_shrink = true);

private:
    matching::MatchingEngine& engine_;
    BotConfig config_;
};

} // namespace liquidity
