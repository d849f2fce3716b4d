#include "binex/exchange.hpp"

#include "ledger/errors.hpp"
#include "ledger/util.hpp"
#include "liquidity/market_weights.hpp"
#include "liquidity/shape_library.hpp"

#include <iostream>
#include <utility>

namespace binex {

using ledger::LedgerTransaction;

namespace {

constexpr auto kReadOnly = LedgerTransaction::Mode::ReadOnly;

// Runs fn in a read-write transaction and commits it.
template <typename Fn>
auto write(ledger::LedgerStore& store, Fn&& fn) {
    LedgerTransaction txn(store);
    auto result = fn(txn);
    txn.commit();
    return result;
}

} // namespace

ExchangeConfig ExchangeConfig::from_env() {
    ExchangeConfig config;
    config.journal_path = ledger::env_string("BINEX_JOURNAL_PATH", config.journal_path);
    config.bot = liquidity::BotConfig::from_env();
    return config;
}

Exchange::Exchange(ExchangeConfig config)
    : config_(std::move(config)),
      store_(config_.journal_path),
      pullback_(engine_, config_.bot) {
    config_.bot.validate();
    engine_.set_listener(&pullback_);
}

std::size_t Exchange::load() {
    return store_.load();
}

ledger::Account Exchange::create_account(const std::string& account_id, std::int64_t opening_balance) {
    return write(store_, [&](LedgerTransaction& txn) {
        return engine_.create_account(txn, account_id, opening_balance);
    });
}

ledger::Market Exchange::create_market(const std::string& market_id, const std::string& title) {
    return write(store_, [&](LedgerTransaction& txn) {
        auto market = engine_.create_market(txn, market_id, title);
        liquidity::initialize_market_weights(txn);
        return market;
    });
}

ledger::Market Exchange::close_market(const std::string& market_id) {
    return write(store_, [&](LedgerTransaction& txn) {
        auto market = engine_.close_market(txn, market_id);
        liquidity::normalize_weights(txn);
        return market;
    });
}

matching::MarketCancellationResult Exchange::cancel_market(const std::string& market_id) {
    return write(store_, [&](LedgerTransaction& txn) {
        auto result = engine_.cancel_market(txn, market_id);
        liquidity::normalize_weights(txn);
        return result;
    });
}

matching::OrderResult Exchange::place_order(const std::string& account_id,
                                            const std::string& market_id,
                                            ledger::Side side,
                                            std::int64_t price,
                                            std::int64_t shares) {
    return write(store_, [&](LedgerTransaction& txn) {
        return engine_.place_order(txn, account_id, market_id, side, price, shares);
    });
}

matching::CancelResult Exchange::cancel_order(const std::string& account_id, const std::string& order_id) {
    return write(store_, [&](LedgerTransaction& txn) {
        return engine_.cancel_order(txn, account_id, order_id);
    });
}

std::vector<matching::CancelResult> Exchange::withdraw_all_orders(const std::string& account_id) {
    return write(store_, [&](LedgerTransaction& txn) {
        auto cancelled = engine_.cancel_resting_orders(txn, account_id);
        std::int64_t refunded = 0;
        for (const auto& result : cancelled) {
            refunded += result.refunded;
        }
        if (account_id == pullback_.config().bot_account_id) {
            txn.record(ledger::AuditKind::BotAction, account_id, "withdraw_all",
                       std::to_string(cancelled.size()) + " orders, refunded " + std::to_string(refunded));
        }
        std::clog << "[Exchange] Withdrew " << cancelled.size() << " orders for " << account_id
                  << ", refunded " << refunded << std::endl;
        return cancelled;
    });
}

matching::ResolutionResult Exchange::resolve_market(const std::string& market_id, ledger::Outcome outcome) {
    return write(store_, [&](LedgerTransaction& txn) {
        auto result = engine_.resolve_market(txn, market_id, outcome);
        liquidity::normalize_weights(txn);
        return result;
    });
}

ledger::Account Exchange::get_account(const std::string& account_id) const {
    LedgerTransaction txn(store_, kReadOnly);
    return txn.get_account(account_id);
}

ledger::Market Exchange::get_market(const std::string& market_id) const {
    LedgerTransaction txn(store_, kReadOnly);
    return txn.get_market(market_id);
}

std::vector<ledger::Market> Exchange::list_markets() const {
    LedgerTransaction txn(store_, kReadOnly);
    return txn.markets();
}

ledger::Order Exchange::get_order(const std::string& order_id) const {
    LedgerTransaction txn(store_, kReadOnly);
    auto order = txn.find_order(order_id);
    if (!order) {
        ledger::throw_error(ledger::ErrorKind::NotFound, "Order not found: " + order_id);
    }
    return *order;
}

std::vector<ledger::Order> Exchange::orders_of_account(const std::string& account_id) const {
    LedgerTransaction txn(store_, kReadOnly);
    txn.require_account(account_id);
    return txn.orders_of_account(account_id);
}

std::vector<ledger::Order> Exchange::orders_in_market(const std::string& market_id) const {
    LedgerTransaction txn(store_, kReadOnly);
    txn.require_market(market_id);
    return txn.orders_in_market(market_id);
}

std::vector<ledger::Position> Exchange::positions_of_account(const std::string& account_id) const {
    LedgerTransaction txn(store_, kReadOnly);
    txn.require_account(account_id);
    return txn.positions_of_account(account_id);
}

std::vector<ledger::Position> Exchange::positions_in_market(const std::string& market_id) const {
    LedgerTransaction txn(store_, kReadOnly);
    txn.require_market(market_id);
    return txn.positions_in_market(market_id);
}

std::vector<ledger::AuditEntry> Exchange::audit_log(const std::string& account_id) const {
    return store_.audit_log(account_id);
}

ledger::ExposureSnapshot Exchange::get_exposure() const {
    LedgerTransaction txn(store_, kReadOnly);
    return txn.exposure();
}

liquidity::BotStatistics Exchange::statistics() const {
    LedgerTransaction txn(store_, kReadOnly);
    return liquidity::compute_statistics(txn, pullback_.config());
}

std::optional<std::vector<liquidity::LadderRung>> Exchange::compute_effective_curve(
    const std::string& market_id) const {
    LedgerTransaction txn(store_, kReadOnly);
    return liquidity::compute_effective_curve(txn, pullback_.config(), market_id);
}

liquidity::DeploymentResult Exchange::deploy_market(const std::string& market_id,
                                                    const std::string& funding_account_id) {
    return write(store_, [&](LedgerTransaction& txn) {
        return liquidity::deploy_market(engine_, txn, pullback_.config(), market_id, funding_account_id);
    });
}

DeployAllResult Exchange::deploy_all(const std::string& funding_account_id) {
    if (!bot_config().is_active) {
        ledger::throw_error(ledger::ErrorKind::InvalidState, "Liquidity bot is not active");
    }

    DeployAllResult result;
    for (const auto& market : list_markets()) {
        if (market.status != ledger::MarketStatus::Open) {
            continue;
        }
        try {
            auto deployed = deploy_market(market.id, funding_account_id);
            result.total_cost += deployed.total_cost;
            result.refunded += deployed.refunded;
            result.markets.push_back(std::move(deployed));
        } catch (const ledger::LedgerError& ex) {
            // Disabled or no-longer-open markets are skipped.
            if (ex.kind() != ledger::ErrorKind::InvalidState) {
                throw;
            }
            std::cerr << "[Deploy] Skipping " << market.id << ": " << ex.what() << std::endl;
            result.skipped.push_back(market.id);
        }
    }
    return result;
}

liquidity::DeploymentPreview Exchange::preview_deployment(const std::string& funding_account_id) const {
    LedgerTransaction txn(store_, kReadOnly);
    return liquidity::preview_deployment(txn, pullback_.config(), funding_account_id);
}

std::vector<ledger::MarketWeight> Exchange::initialize_market_weights() {
    return write(store_, [&](LedgerTransaction& txn) { return liquidity::initialize_market_weights(txn); });
}

std::vector<ledger::MarketWeight> Exchange::set_market_weight(const std::string& market_id,
                                                              double weight,
                                                              bool locked) {
    return write(store_, [&](LedgerTransaction& txn) {
        return liquidity::set_market_weight(txn, market_id, weight, locked);
    });
}

std::vector<ledger::MarketWeight> Exchange::set_weight_lock(const std::string& market_id, bool locked) {
    return write(store_, [&](LedgerTransaction& txn) {
        return liquidity::set_weight_lock(txn, market_id, locked);
    });
}

ledger::MarketWeight Exchange::set_relative_odds(const std::string& market_id, double odds) {
    return write(store_, [&](LedgerTransaction& txn) {
        return liquidity::set_relative_odds(txn, market_id, odds);
    });
}

std::vector<ledger::MarketWeight> Exchange::apply_relative_odds() {
    return write(store_, [&](LedgerTransaction& txn) { return liquidity::apply_relative_odds(txn); });
}

std::vector<ledger::MarketWeight> Exchange::market_weights() const {
    LedgerTransaction txn(store_, kReadOnly);
    return liquidity::open_market_weights(txn);
}

std::string Exchange::save_curve_shape(const std::string& name, const ledger::ShapeParams& params) {
    return write(store_, [&](LedgerTransaction& txn) {
        return liquidity::save_shape(txn, name, params).id;
    });
}

std::vector<ledger::CurveShape> Exchange::list_curve_shapes() const {
    LedgerTransaction txn(store_, kReadOnly);
    return liquidity::list_shapes(txn);
}

ledger::CurveShape Exchange::get_curve_shape(const std::string& shape_id) const {
    LedgerTransaction txn(store_, kReadOnly);
    return liquidity::get_shape(txn, shape_id);
}

ledger::CurveShape Exchange::update_curve_shape(const std::string& shape_id,
                                                const ledger::ShapeParams& params,
                                                const std::optional<std::string>& name) {
    return write(store_, [&](LedgerTransaction& txn) {
        return liquidity::update_shape(txn, shape_id, params, name);
    });
}

ledger::CurveShape Exchange::set_default_curve_shape(const std::string& shape_id) {
    return write(store_, [&](LedgerTransaction& txn) {
        return liquidity::set_default_shape(txn, shape_id);
    });
}

void Exchange::delete_curve_shape(const std::string& shape_id) {
    LedgerTransaction txn(store_);
    liquidity::delete_shape(txn, shape_id);
    txn.commit();
}

ledger::CurveShape Exchange::default_curve_shape() {
    return write(store_, [&](LedgerTransaction& txn) { return liquidity::ensure_default_shape(txn); });
}

ledger::MarketOverride Exchange::set_market_override(const std::string& market_id,
                                                     ledger::MarketOverride override_value) {
    return write(store_, [&](LedgerTransaction& txn) {
        return liquidity::set_market_override(txn, market_id, std::move(override_value));
    });
}

ledger::MarketOverride Exchange::market_override(const std::string& market_id) const {
    LedgerTransaction txn(store_, kReadOnly);
    txn.require_market(market_id);
    return txn.market_override(market_id);
}

liquidity::BotConfig Exchange::bot_config() const {
    LedgerTransaction txn(store_, kReadOnly);
    return pullback_.config();
}

void Exchange::update_bot_config(const liquidity::BotConfig& config) {
    config.validate();
    LedgerTransaction txn(store_);
    const auto previous = pullback_.config();
    const auto risk_changed = previous.max_acceptable_loss != config.max_acceptable_loss ||
                              previous.tier_width_percent != config.tier_width_percent;
    pullback_.set_config(config);
    try {
        pullback_.evaluate(txn, risk_changed);
        txn.record(ledger::AuditKind::BotAction, config.bot_account_id, "config_updated",
                   std::string("active=") + (config.is_active ? "true" : "false") +
                   " max_loss=" + std::to_string(config.max_acceptable_loss) +
                   " liquidity=" + std::to_string(config.total_liquidity));
        txn.commit();
    } catch (...) {
        pullback_.set_config(previous);
        throw;
    }
    std::clog << "[Exchange] Bot config updated (active=" << std::boolalpha << config.is_active
              << ", max loss " << config.max_acceptable_loss << ")" << std::endl;
}

} // namespace binex
