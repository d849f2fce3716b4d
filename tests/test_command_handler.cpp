#include "binex/command_handler.hpp"

#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <string>

using nlohmann::json;

namespace {

struct Fixture {
    binex::Exchange exchange{test_support::memory_config(test_support::bot_config(1'000'000))};
    binex::CommandHandler handler{exchange};

    Fixture() {
        ok({{"op", "create_account"}, {"account", "alice"}, {"balance", 100'000}});
        ok({{"op", "create_account"}, {"account", "bob"}, {"balance", 100'000}});
        ok({{"op", "create_market"}, {"market", "rain"}, {"title", "Rain tomorrow"}});
    }

    json ok(const json& request) {
        const auto response = handler.handle(request);
        INFO(response.dump());
        REQUIRE(response.at("ok") == true);
        return response.at("result");
    }

    json fail(const json& request) {
        const auto response = handler.handle(request);
        INFO(response.dump());
        REQUIRE(response.at("ok") == false);
        return response;
    }
};

} // namespace

TEST_CASE("Accounts and markets are created over the command surface") {
    Fixture f;

    const auto account = f.ok({{"op", "get_account"}, {"account", "alice"}});
    CHECK(account["id"] == "alice");
    CHECK(account["balance"] == 100'000);

    const auto market = f.ok({{"op", "get_market"}, {"market", "rain"}});
    CHECK(market["title"] == "Rain tomorrow");
    CHECK(market["status"] == "open");

    CHECK(f.ok({{"op", "list_markets"}}).size() == 1);

    const auto duplicate = f.fail({{"op", "create_account"}, {"account", "alice"}});
    CHECK(duplicate["error"] == "InvalidState");
}

TEST_CASE("Placing crossing orders reports fills and refunds") {
    Fixture f;

    const auto maker = f.ok({{"op", "place_order"}, {"account", "alice"}, {"market", "rain"},
                             {"side", "no"}, {"price", 400}, {"shares", 10}});
    CHECK(maker["fills"].empty());
    CHECK(maker["reserved"] == 4'000);
    CHECK(maker["order"]["status"] == "open");
    const auto maker_id = maker["order"]["id"].get<std::string>();

    const auto taker = f.ok({{"op", "place_order"}, {"account", "bob"}, {"market", "rain"},
                             {"side", "YES"}, {"price", 700}, {"shares", 10}});
    REQUIRE(taker["fills"].size() == 1);
    const auto& fill = taker["fills"][0];
    CHECK(fill["makerOrder"] == maker_id);
    CHECK(fill["makerAccount"] == "alice");
    CHECK(fill["yesAccount"] == "bob");
    CHECK(fill["noAccount"] == "alice");
    CHECK(fill["tradePrice"] == 600);
    CHECK(fill["shares"] == 10);
    CHECK(taker["reserved"] == 7'000);
    CHECK(taker["refunded"] == 1'000);
    CHECK(taker["order"]["status"] == "filled");
    CHECK(taker["autoSettle"].is_null());

    CHECK(f.ok({{"op", "get_order"}, {"order", maker_id}})["filled"] == 10);
    CHECK(f.ok({{"op", "list_positions"}, {"market", "rain"}}).size() == 1);
    CHECK(f.ok({{"op", "list_orders"}, {"account", "bob"}}).size() == 1);

    const auto resolved = f.ok({{"op", "resolve_market"}, {"market", "rain"}, {"outcome", "yes"}});
    CHECK(resolved["outcome"] == "yes");
    CHECK(resolved["positionsSettled"] == 1);
    CHECK(resolved["totalPaid"] == 10'000);
    CHECK(f.ok({{"op", "get_account"}, {"account", "bob"}})["balance"] == 104'000);
}

TEST_CASE("Errors carry their kind and the request id") {
    Fixture f;

    SECTION("insufficient funds reports the shortfall") {
        const auto response = f.fail({{"op", "place_order"}, {"account", "alice"}, {"market", "rain"},
                                      {"side", "yes"}, {"price", 500}, {"shares", 1'000}});
        CHECK(response["error"] == "InsufficientFunds");
        CHECK(response["required"] == 500'000);
        CHECK(response["available"] == 100'000);
    }
    SECTION("unknown entities") {
        const auto response = f.fail({{"op", "get_order"}, {"order", "ord-999999"}, {"id", 7}});
        CHECK(response["error"] == "NotFound");
        CHECK(response["id"] == 7);
    }
    SECTION("cancelling someone else's order") {
        const auto placed = f.ok({{"op", "place_order"}, {"account", "alice"}, {"market", "rain"},
                                  {"side", "no"}, {"price", 300}, {"shares", 5}});
        const auto order_id = placed["order"]["id"];
        CHECK(f.fail({{"op", "cancel_order"}, {"account", "bob"}, {"order", order_id}})["error"] == "Forbidden");

        const auto cancelled = f.ok({{"op", "cancel_order"}, {"account", "alice"}, {"order", order_id}});
        CHECK(cancelled["refunded"] == 1'500);
        CHECK(cancelled["order"]["status"] == "cancelled");
        CHECK(f.fail({{"op", "cancel_order"}, {"account", "alice"}, {"order", order_id}})["error"] ==
              "InvalidState");
    }
    SECTION("trading on a closed market") {
        f.ok({{"op", "close_market"}, {"market", "rain"}});
        const auto response = f.fail({{"op", "place_order"}, {"account", "alice"}, {"market", "rain"},
                                      {"side", "no"}, {"price", 300}, {"shares", 5}});
        CHECK(response["error"] == "InvalidState");
    }
    SECTION("missing fields and unknown ops") {
        const auto missing = f.fail({{"op", "get_account"}, {"id", "req-1"}});
        CHECK(missing["error"] == "InvalidArgument");
        CHECK(missing["id"] == "req-1");

        const auto unknown = f.fail({{"op", "launch_rocket"}});
        CHECK(unknown["error"] == "InvalidArgument");
        CHECK(unknown["message"].get<std::string>().find("launch_rocket") != std::string::npos);

        CHECK(f.fail(json::array())["error"] == "InvalidArgument");
        CHECK(f.fail({{"op", "place_order"}, {"account", "alice"}, {"market", "rain"},
                      {"side", "maybe"}, {"price", 300}, {"shares", 5}})["error"] == "InvalidArgument");
    }
}

TEST_CASE("Lines are parsed and answered as JSON") {
    Fixture f;

    const auto reply = json::parse(f.handler.handle_line(R"({"op":"get_account","account":"bob","id":"x"})"));
    CHECK(reply["ok"] == true);
    CHECK(reply["id"] == "x");
    CHECK(reply["result"]["balance"] == 100'000);

    const auto broken = json::parse(f.handler.handle_line("{\"op\": "));
    CHECK(broken["ok"] == false);
    CHECK(broken["error"] == "InvalidArgument");
    CHECK(broken["message"].get<std::string>().find("Malformed request") != std::string::npos);
}

TEST_CASE("Curve shapes, overrides and weights are managed over the command surface") {
    Fixture f;

    const auto saved = f.ok({{"op", "save_curve_shape"}, {"name", "Even"}, {"params", {{"type", "flat"}}}});
    const auto shape_id = saved["id"].get<std::string>();
    const auto shape = f.ok({{"op", "get_curve_shape"}, {"shape", shape_id}});
    CHECK(shape["name"] == "Even");
    CHECK(shape["params"]["type"] == "flat");
    CHECK(shape["points"].size() == 10);

    f.ok({{"op", "set_default_curve_shape"}, {"shape", shape_id}});
    CHECK(f.ok({{"op", "default_curve_shape"}})["id"] == shape_id);
    CHECK(f.fail({{"op", "delete_curve_shape"}, {"shape", shape_id}})["error"] == "InvalidState");

    const auto updated = f.ok({{"op", "update_curve_shape"}, {"shape", shape_id},
                               {"params", {{"type", "exponential"}, {"decay", 0.01}}}});
    CHECK(updated["params"]["type"] == "exponential");
    CHECK(f.fail({{"op", "save_curve_shape"}, {"name", "Odd"}, {"params", {{"type", "zigzag"}}}})["error"] ==
          "InvalidArgument");

    f.ok({{"op", "set_market_override"}, {"market", "rain"}, {"override", {{"type", "multiply"}, {"factor", 0.5}}}});
    const auto override_value = f.ok({{"op", "get_market_override"}, {"market", "rain"}});
    CHECK(override_value["type"] == "multiply");
    CHECK(override_value["factor"] == Catch::Approx(0.5));

    f.ok({{"op", "create_market"}, {"market", "snow"}, {"title", "Snow tomorrow"}});
    f.ok({{"op", "set_market_override"}, {"market", "snow"}, {"override", {{"type", "disable"}}}});
    CHECK(f.ok({{"op", "effective_curve"}, {"market", "snow"}}).is_null());

    f.ok({{"op", "apply_relative_odds"}});
    const auto weights = f.ok({{"op", "set_market_weight"}, {"market", "rain"}, {"weight", 0.75}, {"locked", true}});
    REQUIRE(weights.size() == 2);
    for (const auto& row : weights) {
        if (row["market"] == "rain") {
            CHECK(row["weightPpb"] == 750'000'000);
            CHECK(row["locked"] == true);
        } else {
            CHECK(row["weightPpb"] == 250'000'000);
        }
    }
}

TEST_CASE("The bot is configured and deployed over the command surface") {
    Fixture f;
    f.ok({{"op", "create_account"}, {"account", "bot"}, {"balance", 1'000'000}});
    f.ok({{"op", "save_curve_shape"}, {"name", "Even"}, {"params", {{"type", "flat"}}}});

    CHECK(f.ok({{"op", "get_bot_config"}})["isActive"] == false);
    CHECK(f.fail({{"op", "deploy_market"}, {"market", "rain"}, {"account", "bot"}})["error"] == "InvalidState");

    const auto config = f.ok({{"op", "update_bot_config"}, {"isActive", true}, {"totalLiquidity", 1'000}});
    CHECK(config["isActive"] == true);
    CHECK(config["totalLiquidity"] == 1'000);
    CHECK(config["botAccount"] == "bot");
    CHECK(f.fail({{"op", "update_bot_config"}, {"tierWidthPercent", 0}})["error"] == "InvalidArgument");

    const auto curve = f.ok({{"op", "effective_curve"}, {"market", "rain"}});
    REQUIRE(curve.size() == 10);
    CHECK(curve[0]["yesPrice"] == 50);
    CHECK(curve[0]["orderPrice"] == 950);
    CHECK(curve[0]["shares"] == 100);

    const auto preview = f.ok({{"op", "preview_deployment"}, {"account", "bot"}});
    CHECK(preview["totalOrders"] == 10);
    CHECK(preview["hasSufficient"] == true);

    const auto deployed = f.ok({{"op", "deploy_market"}, {"market", "rain"}, {"account", "bot"}});
    CHECK(deployed["ordersPlaced"] == 10);
    CHECK(deployed["totalCost"] == preview["totalCost"]);
    CHECK(deployed["stoppedEarly"] == false);

    const auto stats = f.ok({{"op", "statistics"}});
    CHECK(stats["restingOrders"] == 10);
    CHECK(stats["exposure"] == 0);
    CHECK(stats["tier"] == 0);
    CHECK(stats["isActive"] == true);

    const auto withdrawn = f.ok({{"op", "withdraw_all_orders"}, {"account", "bot"}});
    CHECK(withdrawn.size() == 10);
    CHECK(f.ok({{"op", "get_account"}, {"account", "bot"}})["balance"] == 1'000'000);
}
