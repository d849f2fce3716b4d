#include "liquidity/pullback_controller.hpp"

#include "liquidity/exposure.hpp"

#include <algorithm>
#include <iostream>
#include <string>

namespace liquidity {

PullbackController::PullbackController(matching::MatchingEngine& engine, BotConfig config)
    : engine_(engine), config_(std::move(config)) {}

std::int64_t PullbackController::fill_limit(ledger::LedgerTransaction& txn,
                                            const ledger::Order& taker,
                                            const ledger::Order& maker,
                                            std::int64_t shares) {
    if (!config_.enforce_loss_cap) {
        return shares;
    }
    const auto& no_holder = taker.side == ledger::Side::No ? taker.account_id : maker.account_id;
    if (no_holder != config_.bot_account_id) {
        return shares;
    }
    const auto exposure = compute_exposure(txn, config_.bot_account_id);
    return std::min(shares, loss_headroom_shares(exposure, config_.max_acceptable_loss));
}

void PullbackController::on_fills(ledger::LedgerTransaction& txn,
                                  const std::vector<matching::MatchedFill>& fills) {
    const auto touches_bot = std::any_of(fills.begin(), fills.end(), [&](const matching::MatchedFill& fill) {
        return fill.yes_account_id == config_.bot_account_id || fill.no_account_id == config_.bot_account_id;
    });
    if (touches_bot) {
        evaluate(txn);
    }
}

void PullbackController::on_settlement(ledger::LedgerTransaction& txn) {
    evaluate(txn, false);
}

PullbackOutcome PullbackController::evaluate(ledger::LedgerTransaction& txn, bool allow_shrink) {
    const auto max_loss = config_.max_acceptable_loss;
    auto snapshot = txn.exposure();

    PullbackOutcome outcome;
    outcome.exposure_before = snapshot.total_at_risk;
    outcome.previous_tier = snapshot.tier;
    outcome.exposure_after = compute_exposure(txn, config_.bot_account_id);
    outcome.tier = exposure_tier(outcome.exposure_after, max_loss, config_.tier_width_percent);

    if (allow_shrink && outcome.tier != outcome.previous_tier) {
        outcome.triggered = true;
        const auto details = "pullback to tier " + std::to_string(outcome.tier);
        for (const auto& order : txn.orders_of_account(config_.bot_account_id)) {
            if (!order.is_resting()) {
                continue;
            }
            auto new_remaining = scale_remaining(order.remaining(), outcome.exposure_after, max_loss);
            if (new_remaining < config_.min_order_shares) {
                new_remaining = 0;
            }
            if (new_remaining >= order.remaining()) {
                continue;
            }
            outcome.refunded += engine_.reduce_order(txn, order.id, new_remaining, details);
            if (new_remaining == 0) {
                ++outcome.orders_cancelled;
            } else {
                ++outcome.orders_reduced;
            }
        }
        snapshot.last_pullback_at_ms = txn.timestamp_ms();
        txn.record(ledger::AuditKind::BotAction, config_.bot_account_id, "pullback",
                   "exposure " + std::to_string(outcome.exposure_before) + " -> " +
                   std::to_string(outcome.exposure_after) + ", tier " +
                   std::to_string(outcome.previous_tier) + " -> " + std::to_string(outcome.tier));
        std::clog << "[Pullback] Exposure " << outcome.exposure_after << "/" << max_loss
                  << " tier " << outcome.previous_tier << " -> " << outcome.tier
                  << ": reduced " << outcome.orders_reduced << ", cancelled " << outcome.orders_cancelled
                  << ", refunded " << outcome.refunded << std::endl;
    }

    snapshot.total_at_risk = outcome.exposure_after;
    snapshot.tier = outcome.tier;
    snapshot.updated_at_ms = txn.timestamp_ms();
    txn.put_exposure(snapshot);
    return outcome;
}

} // namespace liquidity
