#include "binex/exchange.hpp"
#include "ledger/errors.hpp"
#include "liquidity/bot_config.hpp"
#include "liquidity/exposure.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using ledger::Side;

namespace {

struct Fixture {
    binex::Exchange exchange;
    std::vector<std::string> accounts{"bot", "alice", "bob"};

    explicit Fixture(const liquidity::BotConfig& bot)
        : exchange(test_support::memory_config(bot)) {
        exchange.create_account("bot", 1'000'000);
        exchange.create_account("alice", 100'000);
        exchange.create_account("bob", 100'000);
        exchange.create_market("rain", "Rain tomorrow");
        exchange.create_market("snow", "Snow tomorrow");
    }

    std::size_t resting_bot_orders() const {
        std::size_t count = 0;
        for (const auto& order : exchange.orders_of_account("bot")) {
            if (order.is_resting()) {
                ++count;
            }
        }
        return count;
    }
};

} // namespace

TEST_CASE("Tier math stays in integers") {
    using namespace liquidity;

    CHECK(exposure_tier(0, 100'000, 10) == 0);
    CHECK(exposure_tier(9'999, 100'000, 10) == 0);
    CHECK(exposure_tier(10'000, 100'000, 10) == 1);
    CHECK(exposure_tier(95'000, 100'000, 10) == 9);
    CHECK(exposure_tier(105'000, 100'000, 10) == 10);
    CHECK(exposure_tier(50'000, 100'000, 25) == 2);

    CHECK(next_tier_threshold(0, 100'000, 10) == 10'000);
    CHECK(next_tier_threshold(9, 100'000, 10) == 100'000);

    CHECK(pullback_ratio(25'000, 100'000) == 0.75);
    CHECK(pullback_ratio(150'000, 100'000) == 0.0);

    CHECK(scale_remaining(105, 95'000, 100'000) == 5);
    CHECK(scale_remaining(300, 95'000, 100'000) == 15);
    CHECK(scale_remaining(40, 0, 100'000) == 40);
    CHECK(scale_remaining(40, 100'000, 100'000) == 0);

    CHECK(loss_headroom_shares(95'000, 100'000) == 5);
    CHECK(loss_headroom_shares(99'999, 100'000) == 0);
    CHECK(loss_headroom_shares(120'000, 100'000) == 0);

    // Largest accepted ceiling with a remaining size above it.
    CHECK(scale_remaining(10'000'000'000, 1'000'000'000, kMaxLossCeiling) == 6'666'666'666);

    BotConfig config;
    config.max_acceptable_loss = kMaxLossCeiling;
    CHECK_NOTHROW(config.validate());
    config.max_acceptable_loss = kMaxLossCeiling + 1;
    CHECK_THROWS_AS(config.validate(), ledger::LedgerError);
}

TEST_CASE("Fills inside the current tier only refresh the snapshot") {
    Fixture f(test_support::bot_config(1'000'000));

    f.exchange.place_order("bot", "rain", Side::No, 900, 100);
    const auto other = f.exchange.place_order("bot", "snow", Side::No, 800, 100);
    f.exchange.place_order("alice", "rain", Side::Yes, 100, 10);

    const auto snapshot = f.exchange.get_exposure();
    CHECK(snapshot.total_at_risk == 10'000);
    CHECK(snapshot.tier == 0);
    CHECK_FALSE(snapshot.last_pullback_at_ms.has_value());
    CHECK(f.exchange.get_order(other.order.id).remaining() == 100);
}

TEST_CASE("Crossing a tier shrinks every resting bot order") {
    Fixture f(test_support::bot_config(100'000, false));

    const auto rain = f.exchange.place_order("bot", "rain", Side::No, 900, 200);
    const auto snow = f.exchange.place_order("bot", "snow", Side::No, 800, 300);

    const auto taker = f.exchange.place_order("alice", "rain", Side::Yes, 100, 95);
    CHECK(taker.order.filled == 95);

    auto snapshot = f.exchange.get_exposure();
    CHECK(snapshot.total_at_risk == 95'000);
    CHECK(snapshot.tier == 9);
    CHECK(snapshot.last_pullback_at_ms.has_value());

    // Remaining sizes scale by the 5% of headroom left.
    CHECK(f.exchange.get_order(rain.order.id).remaining() == 5);
    CHECK(f.exchange.get_order(snow.order.id).remaining() == 15);
    CHECK(f.exchange.get_account("bot").balance == 1'000'000 - 180'000 - 240'000 + 90'000 + 228'000);
    CHECK(test_support::total_value(f.exchange, f.accounts) == 1'200'000);

    SECTION("without the loss cap a single fill can pass the ceiling") {
        f.exchange.place_order("bob", "snow", Side::Yes, 200, 10);

        snapshot = f.exchange.get_exposure();
        CHECK(snapshot.total_at_risk == 105'000);
        CHECK(snapshot.tier == 10);
        CHECK(f.resting_bot_orders() == 0);
        CHECK(f.exchange.get_account("bot").balance == 906'500);

        const auto stats = f.exchange.statistics();
        CHECK(stats.pullback_ratio == 0.0);
        CHECK(stats.resting_orders == 0);
        CHECK(test_support::total_value(f.exchange, f.accounts) == 1'200'000);
    }
}

TEST_CASE("The loss cap keeps exposure at or below the maximum") {
    Fixture f(test_support::bot_config(100'000, true));

    f.exchange.place_order("bot", "rain", Side::No, 900, 200);
    f.exchange.place_order("bot", "snow", Side::No, 800, 300);
    f.exchange.place_order("alice", "rain", Side::Yes, 100, 95);

    const auto taker = f.exchange.place_order("bob", "snow", Side::Yes, 200, 10);
    CHECK(taker.order.filled == 5);
    CHECK(taker.order.is_resting());

    const auto snapshot = f.exchange.get_exposure();
    CHECK(snapshot.total_at_risk == 100'000);
    CHECK(snapshot.tier == 10);
    CHECK(f.resting_bot_orders() == 0);

    // With no headroom left the bot takes no further NO risk.
    const auto more = f.exchange.place_order("bot", "rain", Side::No, 950, 10);
    const auto blocked = f.exchange.place_order("alice", "rain", Side::Yes, 100, 10);
    CHECK(blocked.fills.empty());
    CHECK(f.exchange.get_order(more.order.id).filled == 0);
    CHECK(f.exchange.get_exposure().total_at_risk == 100'000);
    CHECK(test_support::total_value(f.exchange, f.accounts) == 1'200'000);
}

TEST_CASE("Resolution lowers exposure without shrinking orders") {
    Fixture f(test_support::bot_config(100'000, false));

    f.exchange.place_order("bot", "rain", Side::No, 900, 20);
    f.exchange.place_order("alice", "rain", Side::Yes, 100, 20);
    CHECK(f.exchange.get_exposure().total_at_risk == 20'000);
    CHECK(f.exchange.get_exposure().tier == 2);

    const auto resting = f.exchange.place_order("bot", "snow", Side::No, 700, 40);
    f.exchange.resolve_market("rain", ledger::Outcome::No);

    const auto snapshot = f.exchange.get_exposure();
    CHECK(snapshot.total_at_risk == 0);
    CHECK(snapshot.tier == 0);
    CHECK(f.exchange.get_order(resting.order.id).remaining() == 40);
    CHECK(f.exchange.get_account("bot").balance == 1'000'000 - 18'000 + 20'000 - 28'000);
}

TEST_CASE("Orders below the minimum size are cancelled outright") {
    auto config = test_support::bot_config(100'000, false);
    config.min_order_shares = 10;
    Fixture f(config);

    const auto small = f.exchange.place_order("bot", "snow", Side::No, 800, 100);
    f.exchange.place_order("bot", "rain", Side::No, 900, 60);
    f.exchange.place_order("alice", "rain", Side::Yes, 100, 60);

    // 60% exposure leaves 40% of the remaining size.
    CHECK(f.exchange.get_order(small.order.id).remaining() == 40);

    f.exchange.place_order("bob", "snow", Side::Yes, 200, 35);
    // At 95% the scaled size rounds below the minimum.
    CHECK(f.exchange.get_order(small.order.id).status == ledger::OrderStatus::Cancelled);
    CHECK(f.resting_bot_orders() == 0);
}

TEST_CASE("A second tier crossing compounds the reduction") {
    Fixture f(test_support::bot_config(100'000, false));

    const auto rain = f.exchange.place_order("bot", "rain", Side::No, 900, 100);
    const auto snow = f.exchange.place_order("bot", "snow", Side::No, 800, 100);

    f.exchange.place_order("alice", "rain", Side::Yes, 100, 20);
    CHECK(f.exchange.get_exposure().tier == 2);
    CHECK(f.exchange.get_order(rain.order.id).remaining() == 64);
    CHECK(f.exchange.get_order(snow.order.id).remaining() == 80);

    f.exchange.place_order("bob", "rain", Side::Yes, 100, 30);
    CHECK(f.exchange.get_exposure().total_at_risk == 50'000);
    CHECK(f.exchange.get_exposure().tier == 5);
    CHECK(f.exchange.get_order(rain.order.id).remaining() == 17);
    CHECK(f.exchange.get_order(snow.order.id).remaining() == 40);

    SECTION("netting lowers the tier and rescales again") {
        f.exchange.place_order("alice", "rain", Side::No, 850, 30);
        const auto netting = f.exchange.place_order("bot", "rain", Side::Yes, 200, 30);
        REQUIRE(netting.auto_settle.has_value());
        CHECK(netting.auto_settle->shares_netted == 30);

        const auto snapshot = f.exchange.get_exposure();
        CHECK(snapshot.total_at_risk == 20'000);
        CHECK(snapshot.tier == 2);
        CHECK(f.exchange.get_order(rain.order.id).remaining() == 13);
        CHECK(f.exchange.get_order(snow.order.id).remaining() == 32);
        CHECK(test_support::total_value(f.exchange, f.accounts) == 1'200'000);
    }
}

TEST_CASE("Changing the loss ceiling runs the pullback on resting orders") {
    Fixture f(test_support::bot_config(1'000'000, false));

    f.exchange.place_order("bot", "rain", Side::No, 900, 50);
    const auto resting = f.exchange.place_order("bot", "snow", Side::No, 800, 100);
    f.exchange.place_order("alice", "rain", Side::Yes, 100, 50);
    CHECK(f.exchange.get_exposure().tier == 0);

    auto config = f.exchange.bot_config();
    config.is_active = true;
    f.exchange.update_bot_config(config);
    CHECK(f.exchange.get_order(resting.order.id).remaining() == 100);

    config.max_acceptable_loss = 100'000;
    f.exchange.update_bot_config(config);
    CHECK(f.exchange.bot_config().max_acceptable_loss == 100'000);
    CHECK(f.exchange.get_exposure().tier == 5);
    CHECK(f.exchange.get_exposure().last_pullback_at_ms.has_value());
    CHECK(f.exchange.get_order(resting.order.id).remaining() == 50);

    config.max_acceptable_loss = 40'000;
    f.exchange.update_bot_config(config);
    CHECK(f.exchange.get_order(resting.order.id).status == ledger::OrderStatus::Cancelled);
    CHECK(f.resting_bot_orders() == 0);
    CHECK(test_support::total_value(f.exchange, f.accounts) == 1'200'000);

    config.tier_width_percent = 0;
    CHECK_THROWS_AS(f.exchange.update_bot_config(config), ledger::LedgerError);
    CHECK(f.exchange.bot_config().tier_width_percent == 10);
}
