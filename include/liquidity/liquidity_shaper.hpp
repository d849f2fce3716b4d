#pragma once

#include "ledger/bot_tables.hpp"
#include "ledger/store.hpp"
#include "liquidity/bot_config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace liquidity {

struct LadderRung {
    std::int64_t yes_price = 0;
    std::int64_t order_price = 0;  // NO price the bot posts: 1000 - yes_price
    std::int64_t shares = 0;
};

// Target ladder for one market. std::nullopt when the market is disabled by
// override; an empty ladder when it is not open or every size rounds below
// the minimum. Throws NotFound for an unknown market.
std::optional<std::vector<LadderRung>> compute_effective_curve(const ledger::LedgerTransaction& txn,
                                                               const BotConfig& config,
                                                               const std::string& market_id);

// Stores a per-market override. Replaced curves are validated and normalized.
ledger::MarketOverride set_market_override(ledger::LedgerTransaction& txn,
                                           const std::string& market_id,
                                           ledger::MarketOverride override_value);

} // namespace liquidity
