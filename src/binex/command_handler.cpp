#include "binex/command_handler.hpp"

#include "ledger/errors.hpp"
#include "ledger/serialization.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace binex {

namespace {

using nlohmann::json;

template <typename T>
T require(const json& request, const char* key) {
    if (!request.contains(key) || request[key].is_null()) {
        ledger::throw_error(ledger::ErrorKind::InvalidArgument, std::string("Missing field '") + key + "'");
    }
    return request[key].get<T>();
}

template <typename T>
T optional_field(const json& request, const char* key, T fallback) {
    if (!request.contains(key) || request[key].is_null()) {
        return fallback;
    }
    return request[key].get<T>();
}

json fill_json(const matching::MatchedFill& fill) {
    return json{
        {"position", fill.position_id},
        {"makerOrder", fill.maker_order_id},
        {"makerAccount", fill.maker_account_id},
        {"yesAccount", fill.yes_account_id},
        {"noAccount", fill.no_account_id},
        {"makerPrice", fill.maker_price},
        {"tradePrice", fill.trade_price},
        {"shares", fill.shares},
    };
}

json order_result_json(const matching::OrderResult& result) {
    json fills = json::array();
    for (const auto& fill : result.fills) {
        fills.push_back(fill_json(fill));
    }
    json out{
        {"order", result.order},
        {"fills", std::move(fills)},
        {"reserved", result.reserved},
        {"refunded", result.refunded},
        {"autoSettle", nullptr},
    };
    if (result.auto_settle) {
        out["autoSettle"] = json{
            {"sharesNetted", result.auto_settle->shares_netted},
            {"credited", result.auto_settle->credited},
            {"settledPositions", result.auto_settle->settled_positions},
            {"createdPositions", result.auto_settle->created_positions},
        };
    }
    return out;
}

json cancel_result_json(const matching::CancelResult& result) {
    return json{{"order", result.order}, {"refunded", result.refunded}};
}

json rungs_json(const std::vector<liquidity::LadderRung>& rungs) {
    json out = json::array();
    for (const auto& rung : rungs) {
        out.push_back(json{{"yesPrice", rung.yes_price}, {"orderPrice", rung.order_price}, {"shares", rung.shares}});
    }
    return out;
}

json deployment_json(const liquidity::DeploymentResult& result) {
    json orders = json::array();
    for (const auto& order : result.orders) {
        orders.push_back(order_result_json(order));
    }
    return json{
        {"market", result.market_id},
        {"ordersPlaced", result.orders.size()},
        {"orders", std::move(orders)},
        {"totalCost", result.total_cost},
        {"refunded", result.refunded},
        {"ordersCancelled", result.orders_cancelled},
        {"stoppedEarly", result.stopped_early},
    };
}

json preview_json(const liquidity::DeploymentPreview& preview) {
    json markets = json::array();
    for (const auto& market : preview.markets) {
        markets.push_back(json{
            {"market", market.market_id},
            {"title", market.title},
            {"orders", rungs_json(market.rungs)},
            {"cost", market.cost},
            {"existingRefund", market.existing_refund},
        });
    }
    return json{
        {"userBalance", preview.user_balance},
        {"existingRefund", preview.existing_refund},
        {"effectiveBalance", preview.effective_balance},
        {"totalCost", preview.total_cost},
        {"totalOrders", preview.total_orders},
        {"marketCount", preview.market_count},
        {"hasSufficient", preview.has_sufficient},
        {"shortfall", preview.shortfall},
        {"markets", std::move(markets)},
    };
}

json statistics_json(const liquidity::BotStatistics& stats) {
    json out{
        {"exposure", stats.exposure},
        {"exposurePercent", stats.exposure_percent},
        {"tier", stats.tier},
        {"nextTierThreshold", stats.next_tier_threshold},
        {"pullbackRatio", stats.pullback_ratio},
        {"restingOrders", stats.resting_orders},
        {"restingShares", stats.resting_shares},
        {"lockedValue", stats.locked_value},
        {"holdingsByMarket", stats.holdings_by_market},
        {"guaranteedMaxLoss", stats.guaranteed_max_loss},
        {"isActive", stats.is_active},
        {"lastPullbackAt", nullptr},
    };
    if (stats.last_pullback_at_ms) {
        out["lastPullbackAt"] = *stats.last_pullback_at_ms;
    }
    return out;
}

json bot_config_json(const liquidity::BotConfig& config) {
    return json{
        {"botAccount", config.bot_account_id},
        {"maxAcceptableLoss", config.max_acceptable_loss},
        {"totalLiquidity", config.total_liquidity},
        {"tierWidthPercent", config.tier_width_percent},
        {"globalMultiplier", config.global_multiplier},
        {"minOrderShares", config.min_order_shares},
        {"isActive", config.is_active},
        {"enforceLossCap", config.enforce_loss_cap},
    };
}

json error_json(const std::string& kind, const std::string& message) {
    return json{{"ok", false}, {"error", kind}, {"message", message}};
}

} // namespace

CommandHandler::CommandHandler(Exchange& exchange)
    : exchange_(exchange) {
    register_handlers();
}

void CommandHandler::register_handlers() {
    auto& ex = exchange_;

    handlers_["create_account"] = [&ex](const json& r) -> json {
        return ex.create_account(require<std::string>(r, "account"), optional_field<std::int64_t>(r, "balance", 0));
    };
    handlers_["create_market"] = [&ex](const json& r) -> json {
        return ex.create_market(require<std::string>(r, "market"), optional_field<std::string>(r, "title", ""));
    };
    handlers_["close_market"] = [&ex](const json& r) -> json {
        return ex.close_market(require<std::string>(r, "market"));
    };
    handlers_["cancel_market"] = [&ex](const json& r) -> json {
        const auto result = ex.cancel_market(require<std::string>(r, "market"));
        return json{
            {"market", result.market_id},
            {"positionsRefunded", result.positions_refunded},
            {"positionRefunds", result.position_refunds},
            {"ordersCancelled", result.orders_cancelled},
            {"orderRefunds", result.order_refunds},
        };
    };
    handlers_["place_order"] = [&ex](const json& r) -> json {
        return order_result_json(ex.place_order(require<std::string>(r, "account"),
                                                require<std::string>(r, "market"),
                                                ledger::parse_side(require<std::string>(r, "side")),
                                                require<std::int64_t>(r, "price"),
                                                require<std::int64_t>(r, "shares")));
    };
    handlers_["cancel_order"] = [&ex](const json& r) -> json {
        return cancel_result_json(ex.cancel_order(require<std::string>(r, "account"), require<std::string>(r, "order")));
    };
    handlers_["withdraw_all_orders"] = [&ex](const json& r) -> json {
        json out = json::array();
        for (const auto& result : ex.withdraw_all_orders(require<std::string>(r, "account"))) {
            out.push_back(cancel_result_json(result));
        }
        return out;
    };
    handlers_["resolve_market"] = [&ex](const json& r) -> json {
        const auto result = ex.resolve_market(require<std::string>(r, "market"),
                                              ledger::parse_outcome(require<std::string>(r, "outcome")));
        return json{
            {"market", result.market_id},
            {"outcome", ledger::to_string(result.outcome)},
            {"positionsSettled", result.positions_settled},
            {"totalPaid", result.total_paid},
            {"ordersCancelled", result.orders_cancelled},
            {"totalRefunded", result.total_refunded},
        };
    };

    handlers_["get_account"] = [&ex](const json& r) -> json {
        return ex.get_account(require<std::string>(r, "account"));
    };
    handlers_["get_market"] = [&ex](const json& r) -> json {
        return ex.get_market(require<std::string>(r, "market"));
    };
    handlers_["list_markets"] = [&ex](const json&) -> json {
        return ex.list_markets();
    };
    handlers_["get_order"] = [&ex](const json& r) -> json {
        return ex.get_order(require<std::string>(r, "order"));
    };
    handlers_["list_orders"] = [&ex](const json& r) -> json {
        if (r.contains("market")) {
            return ex.orders_in_market(require<std::string>(r, "market"));
        }
        return ex.orders_of_account(require<std::string>(r, "account"));
    };
    handlers_["list_positions"] = [&ex](const json& r) -> json {
        if (r.contains("market")) {
            return ex.positions_in_market(require<std::string>(r, "market"));
        }
        return ex.positions_of_account(require<std::string>(r, "account"));
    };
    handlers_["audit_log"] = [&ex](const json& r) -> json {
        return ex.audit_log(optional_field<std::string>(r, "account", ""));
    };

    handlers_["get_exposure"] = [&ex](const json&) -> json {
        return ex.get_exposure();
    };
    handlers_["statistics"] = [&ex](const json&) -> json {
        return statistics_json(ex.statistics());
    };
    handlers_["effective_curve"] = [&ex](const json& r) -> json {
        const auto curve = ex.compute_effective_curve(require<std::string>(r, "market"));
        return curve ? rungs_json(*curve) : json(nullptr);
    };
    handlers_["deploy_market"] = [&ex](const json& r) -> json {
        return deployment_json(ex.deploy_market(require<std::string>(r, "market"), require<std::string>(r, "account")));
    };
    handlers_["deploy_all"] = [&ex](const json& r) -> json {
        const auto result = ex.deploy_all(require<std::string>(r, "account"));
        json markets = json::array();
        for (const auto& market : result.markets) {
            markets.push_back(deployment_json(market));
        }
        return json{
            {"markets", std::move(markets)},
            {"skipped", result.skipped},
            {"totalCost", result.total_cost},
            {"refunded", result.refunded},
        };
    };
    handlers_["preview_deployment"] = [&ex](const json& r) -> json {
        return preview_json(ex.preview_deployment(require<std::string>(r, "account")));
    };

    handlers_["initialize_weights"] = [&ex](const json&) -> json {
        return ex.initialize_market_weights();
    };
    handlers_["set_market_weight"] = [&ex](const json& r) -> json {
        return ex.set_market_weight(require<std::string>(r, "market"),
                                    require<double>(r, "weight"),
                                    optional_field<bool>(r, "locked", false));
    };
    handlers_["set_weight_lock"] = [&ex](const json& r) -> json {
        return ex.set_weight_lock(require<std::string>(r, "market"), require<bool>(r, "locked"));
    };
    handlers_["set_relative_odds"] = [&ex](const json& r) -> json {
        return ex.set_relative_odds(require<std::string>(r, "market"), require<double>(r, "odds"));
    };
    handlers_["apply_relative_odds"] = [&ex](const json&) -> json {
        return ex.apply_relative_odds();
    };
    handlers_["market_weights"] = [&ex](const json&) -> json {
        return ex.market_weights();
    };

    handlers_["save_curve_shape"] = [&ex](const json& r) -> json {
        return json{{"id", ex.save_curve_shape(require<std::string>(r, "name"), require<ledger::ShapeParams>(r, "params"))}};
    };
    handlers_["list_curve_shapes"] = [&ex](const json&) -> json {
        return ex.list_curve_shapes();
    };
    handlers_["get_curve_shape"] = [&ex](const json& r) -> json {
        return ex.get_curve_shape(require<std::string>(r, "shape"));
    };
    handlers_["update_curve_shape"] = [&ex](const json& r) -> json {
        std::optional<std::string> name;
        if (r.contains("name")) {
            name = require<std::string>(r, "name");
        }
        return ex.update_curve_shape(require<std::string>(r, "shape"), require<ledger::ShapeParams>(r, "params"), name);
    };
    handlers_["set_default_curve_shape"] = [&ex](const json& r) -> json {
        return ex.set_default_curve_shape(require<std::string>(r, "shape"));
    };
    handlers_["delete_curve_shape"] = [&ex](const json& r) -> json {
        ex.delete_curve_shape(require<std::string>(r, "shape"));
        return json{{"deleted", r["shape"]}};
    };
    handlers_["default_curve_shape"] = [&ex](const json&) -> json {
        return ex.default_curve_shape();
    };
    handlers_["set_market_override"] = [&ex](const json& r) -> json {
        return ex.set_market_override(require<std::string>(r, "market"), require<ledger::MarketOverride>(r, "override"));
    };
    handlers_["get_market_override"] = [&ex](const json& r) -> json {
        return ex.market_override(require<std::string>(r, "market"));
    };

    handlers_["get_bot_config"] = [&ex](const json&) -> json {
        return bot_config_json(ex.bot_config());
    };
    handlers_["update_bot_config"] = [&ex](const json& r) -> json {
        auto config = ex.bot_config();
        config.bot_account_id = optional_field<std::string>(r, "botAccount", config.bot_account_id);
        config.max_acceptable_loss = optional_field<std::int64_t>(r, "maxAcceptableLoss", config.max_acceptable_loss);
        config.total_liquidity = optional_field<std::int64_t>(r, "totalLiquidity", config.total_liquidity);
        config.tier_width_percent = optional_field<std::int64_t>(r, "tierWidthPercent", config.tier_width_percent);
        config.global_multiplier = optional_field<double>(r, "globalMultiplier", config.global_multiplier);
        config.min_order_shares = optional_field<std::int64_t>(r, "minOrderShares", config.min_order_shares);
        config.is_active = optional_field<bool>(r, "isActive", config.is_active);
        config.enforce_loss_cap = optional_field<bool>(r, "enforceLossCap", config.enforce_loss_cap);
        ex.update_bot_config(config);
        return bot_config_json(ex.bot_config());
    };
}

json CommandHandler::handle(const json& request) {
    json response;
    try {
        if (!request.is_object()) {
            ledger::throw_error(ledger::ErrorKind::InvalidArgument, "Request must be a JSON object");
        }
        const auto op = require<std::string>(request, "op");
        const auto it = handlers_.find(op);
        if (it == handlers_.end()) {
            ledger::throw_error(ledger::ErrorKind::InvalidArgument, "Unknown op '" + op + "'");
        }
        response = json{{"ok", true}, {"result", it->second(request)}};
    } catch (const ledger::InsufficientFunds& ex) {
        response = error_json(ledger::to_string(ex.kind()), ex.what());
        response["required"] = ex.required();
        response["available"] = ex.available();
    } catch (const ledger::LedgerError& ex) {
        if (!ex.is_actionable()) {
            std::cerr << "[Exchange] " << ledger::to_string(ex.kind()) << ": " << ex.what() << std::endl;
        }
        response = error_json(ledger::to_string(ex.kind()), ex.what());
    } catch (const json::exception& ex) {
        response = error_json(ledger::to_string(ledger::ErrorKind::InvalidArgument), ex.what());
    } catch (const std::exception& ex) {
        std::cerr << "[Exchange] Request failed: " << ex.what() << std::endl;
        response = error_json("Internal", ex.what());
    }

    if (request.is_object() && request.contains("id")) {
        response["id"] = request["id"];
    }
    return response;
}

std::string CommandHandler::handle_line(const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& ex) {
        return error_json(ledger::to_string(ledger::ErrorKind::InvalidArgument),
                          std::string("Malformed request: ") + ex.what()).dump();
    }
    return handle(request).dump();
}

} // namespace binex
