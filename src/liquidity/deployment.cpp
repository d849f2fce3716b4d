#include "liquidity/deployment.hpp"

#include "ledger/errors.hpp"
#include "liquidity/exposure.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

namespace liquidity {

namespace {

std::int64_t resting_value(const ledger::LedgerTransaction& txn,
                           const std::string& account_id,
                           const std::string& market_id) {
    std::int64_t value = 0;
    for (const auto& order : txn.orders_of_account(account_id)) {
        if (order.is_resting() && order.market_id == market_id) {
            value += order.remaining() * order.price;
        }
    }
    return value;
}

} // namespace

DeploymentResult deploy_market(matching::MatchingEngine& engine,
                               ledger::LedgerTransaction& txn,
                               const BotConfig& config,
                               const std::string& market_id,
                               const std::string& funding_account_id) {
    using ledger::ErrorKind;
    if (!config.is_active) {
        ledger::throw_error(ErrorKind::InvalidState, "Liquidity bot is not active");
    }
    const auto market = txn.get_market(market_id);
    if (market.status != ledger::MarketStatus::Open) {
        ledger::throw_error(ErrorKind::InvalidState, "Market " + market_id + " is not open");
    }
    txn.require_account(funding_account_id);

    const auto ladder = compute_effective_curve(txn, config, market_id);
    if (!ladder) {
        ledger::throw_error(ErrorKind::InvalidState, "Market " + market_id + " is disabled for the liquidity bot");
    }

    DeploymentResult result;
    result.market_id = market_id;
    for (const auto& cancelled : engine.cancel_resting_orders(txn, funding_account_id, market_id)) {
        result.refunded += cancelled.refunded;
        ++result.orders_cancelled;
    }

    auto sized_at = compute_exposure(txn, config.bot_account_id);
    auto current = *ladder;
    for (const auto& planned : *ladder) {
        const auto exposure = compute_exposure(txn, config.bot_account_id);
        if (exposure != sized_at) {
            // A crossing rung traded: size the rest of the ladder at the new ratio.
            current = compute_effective_curve(txn, config, market_id).value_or(std::vector<LadderRung>{});
            sized_at = exposure;
        }
        const auto it = std::find_if(current.begin(), current.end(), [&](const LadderRung& rung) {
            return rung.yes_price == planned.yes_price;
        });
        if (it == current.end()) {
            continue;
        }
        const auto& rung = *it;
        const auto cost = rung.shares * rung.order_price;
        const auto balance = txn.get_account(funding_account_id).balance;
        if (balance < cost) {
            result.stopped_early = true;
            std::clog << "[Deploy] " << market_id << ": stopping at YES " << rung.yes_price
                      << ", need " << cost << " have " << balance << std::endl;
            break;
        }
        auto placed = engine.place_order(txn, funding_account_id, market_id, ledger::Side::No,
                                         rung.order_price, rung.shares);
        result.total_cost += placed.reserved;
        result.orders.push_back(std::move(placed));
    }

    txn.record(ledger::AuditKind::BotAction, funding_account_id, market_id,
               "deploy_market: " + std::to_string(result.orders.size()) + " orders, cost " +
               std::to_string(result.total_cost) + ", refunded " + std::to_string(result.refunded));
    std::clog << "[Deploy] " << market_id << ": placed " << result.orders.size() << "/" << ladder->size()
              << " rungs for " << result.total_cost << ", released " << result.refunded << std::endl;
    return result;
}

DeploymentPreview preview_deployment(const ledger::LedgerTransaction& txn,
                                     const BotConfig& config,
                                     const std::string& funding_account_id) {
    DeploymentPreview preview;
    preview.user_balance = txn.get_account(funding_account_id).balance;

    for (const auto& market : txn.markets()) {
        if (market.status != ledger::MarketStatus::Open) {
            continue;
        }
        const auto ladder = compute_effective_curve(txn, config, market.id);
        if (!ladder) {
            continue;
        }
        MarketPreview entry;
        entry.market_id = market.id;
        entry.title = market.title;
        entry.rungs = *ladder;
        for (const auto& rung : entry.rungs) {
            entry.cost += rung.shares * rung.order_price;
        }
        entry.existing_refund = resting_value(txn, funding_account_id, market.id);

        preview.total_cost += entry.cost;
        preview.existing_refund += entry.existing_refund;
        preview.total_orders += entry.rungs.size();
        preview.markets.push_back(std::move(entry));
    }

    preview.market_count = preview.markets.size();
    preview.effective_balance = preview.user_balance + preview.existing_refund;
    preview.has_sufficient = preview.effective_balance >= preview.total_cost;
    preview.shortfall = std::max<std::int64_t>(0, preview.total_cost - preview.effective_balance);
    return preview;
}

} // namespace liquidity
