#pragma once

#include <cstdint>
#include <string>

namespace liquidity {

// Upper bound for max_acceptable_loss. Keeps the integer order scaling
// (remaining * headroom, both below the ceiling) inside int64.
constexpr std::int64_t kMaxLossCeiling = 3'000'000'000;

struct BotConfig {
    std::string bot_account_id = "liquidity-bot";
    std::int64_t max_acceptable_loss = 10'000'000;  // currency units
    std::int64_t total_liquidity = 100'000;         // shares across all markets
    std::int64_t tier_width_percent = 10;
    double global_multiplier = 1.0;
    std::int64_t min_order_shares = 1;
    bool is_active = false;
    bool enforce_loss_cap = true;  // cap bot NO fills at the remaining loss headroom

    // Reads BINEX_* variables, keeping the defaults above for anything unset.
    static BotConfig from_env();

    // Throws ledger::LedgerError(InvalidArgument) on out-of-range values.
    void validate() const;
};

} // namespace liquidity
