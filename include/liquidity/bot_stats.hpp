#pragma once

#include "ledger/store.hpp"
#include "liquidity/bot_config.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace liquidity {

struct BotStatistics {
    std::int64_t exposure = 0;
    double exposure_percent = 0.0;
    std::int64_t tier = 0;
    std::int64_t next_tier_threshold = 0;
    double pullback_ratio = 1.0;
    std::size_t resting_orders = 0;
    std::int64_t resting_shares = 0;
    std::int64_t locked_value = 0;
    std::map<std::string, std::int64_t> holdings_by_market;  // NO shares held in active positions
    std::int64_t guaranteed_max_loss = 0;
    std::optional<std::int64_t> last_pullback_at_ms;
    bool is_active = false;
};

BotStatistics compute_statistics(const ledger::LedgerTransaction& txn, const BotConfig& config);

} // namespace liquidity
