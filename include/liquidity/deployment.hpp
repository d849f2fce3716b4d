#pragma once

#include "ledger/store.hpp"
#include "liquidity/bot_config.hpp"
#include "liquidity/liquidity_shaper.hpp"
#include "matching/matching_engine.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace liquidity {

struct DeploymentResult {
    std::string market_id;
    std::vector<matching::OrderResult> orders;
    std::int64_t total_cost = 0;       // reserved by the placed ladder
    std::int64_t refunded = 0;         // released by cancelling the previous ladder
    std::size_t orders_cancelled = 0;
    bool stopped_early = false;        // ran out of balance before the last rung
};

struct MarketPreview {
    std::string market_id;
    std::string title;
    std::vector<LadderRung> rungs;
    std::int64_t cost = 0;
    std::int64_t existing_refund = 0;
};

struct DeploymentPreview {
    std::int64_t user_balance = 0;
    std::int64_t existing_refund = 0;
    std::int64_t effective_balance = 0;
    std::int64_t total_cost = 0;
    std::size_t total_orders = 0;
    std::size_t market_count = 0;
    bool has_sufficient = true;
    std::int64_t shortfall = 0;
    std::vector<MarketPreview> markets;
};

// Replaces the funding account's resting orders in one market with the
// current target ladder. Runs inside the caller's transaction.
DeploymentResult deploy_market(matching::MatchingEngine& engine,
                               ledger::LedgerTransaction& txn,
                               const BotConfig& config,
                               const std::string& market_id,
                               const std::string& funding_account_id);

// Read-only estimate of deploying every open market from one account.
DeploymentPreview preview_deployment(const ledger::LedgerTransaction& txn,
                                     const BotConfig& config,
                                     const std::string& funding_account_id);

} // namespace liquidity
