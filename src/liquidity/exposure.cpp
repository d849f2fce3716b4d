#include "liquidity/exposure.hpp"

#include <algorithm>

namespace liquidity {

std::int64_t compute_exposure(const ledger::LedgerTransaction& txn, const std::string& bot_account_id) {
    std::int64_t exposure = 0;
    for (const auto& position : txn.positions_of_account(bot_account_id)) {
        if (position.status == ledger::PositionStatus::Active && position.no_account_id == bot_account_id) {
            exposure += position.payout();
        }
    }
    return exposure;
}

double pullback_ratio(std::int64_t exposure, std::int64_t max_loss) {
    if (max_loss <= 0) {
        return 0.0;
    }
    return std::max(0.0, 1.0 - static_cast<double>(exposure) / static_cast<double>(max_loss));
}

std::int64_t exposure_tier(std::int64_t exposure, std::int64_t max_loss, std::int64_t tier_width_percent) {
    if (max_loss <= 0 || tier_width_percent <= 0 || exposure <= 0) {
        return 0;
    }
    // exposure * 100 / (max_loss * width), split to stay clear of overflow.
    const auto band = max_loss * tier_width_percent;
    const auto scaled = exposure / band * 100 + (exposure % band) * 100 / band;
    return scaled;
}

std::int64_t next_tier_threshold(std::int64_t tier, std::int64_t max_loss, std::int64_t tier_width_percent) {
    const auto band = max_loss * tier_width_percent;
    // Smallest exposure e with e * 100 / band >= tier + 1.
    return ((tier + 1) * band + 99) / 100;
}

std::int64_t loss_headroom_shares(std::int64_t exposure, std::int64_t max_loss) {
    if (exposure >= max_loss) {
        return 0;
    }
    return (max_loss - exposure) / ledger::kPayoutPerShare;
}

std::int64_t scale_remaining(std::int64_t remaining, std::int64_t exposure, std::int64_t max_loss) {
    if (max_loss <= 0 || exposure >= max_loss || remaining <= 0) {
        return 0;
    }
    if (exposure <= 0) {
        return remaining;
    }
    const auto headroom = max_loss - exposure;
    return remaining / max_loss * headroom + (remaining % max_loss) * headroom / max_loss;
}

} // namespace liquidity
