#pragma once

#include "ledger/store.hpp"

#include <cstdint>
#include <string>

namespace liquidity {

// Worst-case payout the bot owes: every active position where it holds NO, at full payout.
std::int64_t compute_exposure(const ledger::LedgerTransaction& txn, const std::string& bot_account_id);

// max(0, 1 - exposure / max_loss).
double pullback_ratio(std::int64_t exposure, std::int64_t max_loss);

// Index of the tier_width_percent-wide band of max_loss that exposure falls in.
std::int64_t exposure_tier(std::int64_t exposure, std::int64_t max_loss, std::int64_t tier_width_percent);

// Exposure at which the next tier starts.
std::int64_t next_tier_threshold(std::int64_t tier, std::int64_t max_loss, std::int64_t tier_width_percent);

// Shares the bot can still take on the NO side before exposure reaches max_loss.
std::int64_t loss_headroom_shares(std::int64_t exposure, std::int64_t max_loss);

// floor(remaining * (max_loss - exposure) / max_loss) in integers; 0 once exposure >= max_loss.
std::int64_t scale_remaining(std::int64_t remaining, std::int64_t exposure, std::int64_t max_loss);

} // namespace liquidity
