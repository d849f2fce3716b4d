#include "liquidity/bot_stats.hpp"

#include "liquidity/exposure.hpp"

namespace liquidity {

BotStatistics compute_statistics(const ledger::LedgerTransaction& txn, const BotConfig& config) {
    BotStatistics stats;
    const auto max_loss = config.max_acceptable_loss;
    stats.exposure = compute_exposure(txn, config.bot_account_id);
    stats.exposure_percent = max_loss > 0
        ? static_cast<double>(stats.exposure) * 100.0 / static_cast<double>(max_loss)
        : 0.0;
    stats.tier = exposure_tier(stats.exposure, max_loss, config.tier_width_percent);
    stats.next_tier_threshold = next_tier_threshold(stats.tier, max_loss, config.tier_width_percent);
    stats.pullback_ratio = pullback_ratio(stats.exposure, max_loss);
    stats.guaranteed_max_loss = max_loss;
    stats.last_pullback_at_ms = txn.exposure().last_pullback_at_ms;
    stats.is_active = config.is_active;

    for (const auto& order : txn.orders_of_account(config.bot_account_id)) {
        if (!order.is_resting()) {
            continue;
        }
        ++stats.resting_orders;
        stats.resting_shares += order.remaining();
        stats.locked_value += order.remaining() * order.price;
    }
    for (const auto& position : txn.positions_of_account(config.bot_account_id)) {
        if (position.status == ledger::PositionStatus::Active && position.no_account_id == config.bot_account_id) {
            stats.holdings_by_market[position.market_id] += position.shares;
        }
    }
    return stats;
}

} // namespace liquidity
