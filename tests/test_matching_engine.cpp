#include "binex/exchange.hpp"
#include "ledger/errors.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <functional>
#include <string>

using ledger::Side;

namespace {

struct Fixture {
    binex::Exchange exchange{test_support::memory_config()};

    Fixture() {
        for (const auto* id : {"alice", "bob", "carol", "dave"}) {
            exchange.create_account(id, 100'000);
        }
        exchange.create_market("rain", "Rain tomorrow");
    }

    std::int64_t balance(const std::string& id) const { return exchange.get_account(id).balance; }
};

ledger::ErrorKind error_kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ledger::LedgerError& ex) {
        return ex.kind();
    }
    FAIL("expected a ledger error");
    return ledger::ErrorKind::InvariantViolation;
}

} // namespace

TEST_CASE("Complementary offers match at the maker's price") {
    Fixture f;

    const auto maker = f.exchange.place_order("alice", "rain", Side::No, 400, 10);
    CHECK(maker.fills.empty());
    CHECK(maker.reserved == 4'000);
    CHECK(f.balance("alice") == 96'000);

    const auto taker = f.exchange.place_order("bob", "rain", Side::Yes, 700, 10);
    REQUIRE(taker.fills.size() == 1);
    const auto& fill = taker.fills.front();
    CHECK(fill.shares == 10);
    CHECK(fill.maker_order_id == maker.order.id);
    CHECK(fill.maker_price == 400);
    CHECK(fill.trade_price == 600);
    CHECK(fill.yes_account_id == "bob");
    CHECK(fill.no_account_id == "alice");

    CHECK(taker.reserved == 7'000);
    CHECK(taker.refunded == 1'000);
    CHECK(taker.order.status == ledger::OrderStatus::Filled);
    CHECK(f.balance("bob") == 94'000);
    CHECK(f.exchange.get_order(maker.order.id).status == ledger::OrderStatus::Filled);

    const auto positions = f.exchange.positions_in_market("rain");
    REQUIRE(positions.size() == 1);
    CHECK(positions.front().trade_price == 600);
    CHECK(positions.front().payout() == 10'000);

    const auto audit = f.exchange.audit_log("bob");
    REQUIRE_FALSE(audit.empty());
    CHECK(audit.back().kind == ledger::AuditKind::PriceImprovement);
    CHECK(audit.back().amount == 1'000);
}

TEST_CASE("Offers that do not cross both rest") {
    Fixture f;

    f.exchange.place_order("alice", "rain", Side::No, 200, 10);
    const auto yes = f.exchange.place_order("bob", "rain", Side::Yes, 700, 10);

    CHECK(yes.fills.empty());
    CHECK(yes.refunded == 0);
    CHECK(yes.order.status == ledger::OrderStatus::Open);
    CHECK(f.exchange.orders_in_market("rain").size() == 2);
    CHECK(f.exchange.positions_in_market("rain").empty());
}

TEST_CASE("Best price fills first and ties go to the earlier order") {
    Fixture f;

    const auto cheap = f.exchange.place_order("alice", "rain", Side::No, 300, 10);
    const auto first = f.exchange.place_order("carol", "rain", Side::No, 450, 10);
    const auto second = f.exchange.place_order("dave", "rain", Side::No, 450, 10);

    const auto taker = f.exchange.place_order("bob", "rain", Side::Yes, 700, 15);
    REQUIRE(taker.fills.size() == 2);
    CHECK(taker.fills[0].maker_order_id == first.order.id);
    CHECK(taker.fills[0].shares == 10);
    CHECK(taker.fills[1].maker_order_id == second.order.id);
    CHECK(taker.fills[1].shares == 5);

    CHECK(taker.reserved == 10'500);
    CHECK(taker.refunded == 2'250);
    CHECK(f.balance("bob") == 100'000 - 15 * 550);

    CHECK(f.exchange.get_order(second.order.id).status == ledger::OrderStatus::Partial);
    CHECK(f.exchange.get_order(second.order.id).filled == 5);
    CHECK(f.exchange.get_order(cheap.order.id).filled == 0);
}

TEST_CASE("Partially filled takers rest the remainder at their own price") {
    Fixture f;

    f.exchange.place_order("alice", "rain", Side::No, 500, 4);
    const auto taker = f.exchange.place_order("bob", "rain", Side::Yes, 600, 10);

    CHECK(taker.order.filled == 4);
    CHECK(taker.order.status == ledger::OrderStatus::Partial);
    // 4 shares at 500 each, 6 still reserved at 600.
    CHECK(taker.refunded == 6'000 - (4 * 500 + 6 * 600));
    CHECK(f.balance("bob") == 100'000 - 4 * 500 - 6 * 600);
}

TEST_CASE("An account never trades with itself") {
    Fixture f;

    const auto own = f.exchange.place_order("alice", "rain", Side::No, 450, 10);
    const auto other = f.exchange.place_order("carol", "rain", Side::No, 400, 10);
    const auto taker = f.exchange.place_order("alice", "rain", Side::Yes, 700, 10);

    REQUIRE(taker.fills.size() == 1);
    CHECK(taker.fills.front().maker_order_id == other.order.id);
    CHECK(f.exchange.get_order(own.order.id).status == ledger::OrderStatus::Open);
}

TEST_CASE("NO takers pay the complement of the resting YES price") {
    Fixture f;

    f.exchange.place_order("alice", "rain", Side::Yes, 650, 10);
    const auto taker = f.exchange.place_order("bob", "rain", Side::No, 500, 10);

    REQUIRE(taker.fills.size() == 1);
    CHECK(taker.fills.front().trade_price == 650);
    CHECK(taker.fills.front().yes_account_id == "alice");
    CHECK(taker.fills.front().no_account_id == "bob");
    CHECK(taker.refunded == 10 * (500 - 350));
    CHECK(f.balance("bob") == 100'000 - 3'500);
}

TEST_CASE("Invalid orders are rejected without side effects") {
    Fixture f;
    const auto audit_before = f.exchange.audit_log().size();

    CHECK(error_kind_of([&] { f.exchange.place_order("alice", "rain", Side::Yes, 0, 10); }) ==
          ledger::ErrorKind::InvalidArgument);
    CHECK(error_kind_of([&] { f.exchange.place_order("alice", "rain", Side::Yes, 1'000, 10); }) ==
          ledger::ErrorKind::InvalidArgument);
    CHECK(error_kind_of([&] { f.exchange.place_order("alice", "rain", Side::Yes, 500, 0); }) ==
          ledger::ErrorKind::InvalidArgument);
    CHECK(error_kind_of([&] { f.exchange.place_order("nobody", "rain", Side::Yes, 500, 1); }) ==
          ledger::ErrorKind::NotFound);
    CHECK(error_kind_of([&] { f.exchange.place_order("alice", "snow", Side::Yes, 500, 1); }) ==
          ledger::ErrorKind::NotFound);

    CHECK(f.balance("alice") == 100'000);
    CHECK(f.exchange.orders_in_market("rain").empty());
    CHECK(f.exchange.audit_log().size() == audit_before);
}

TEST_CASE("Orders beyond the balance report the shortfall") {
    Fixture f;
    f.exchange.create_account("erin", 1'000);

    try {
        f.exchange.place_order("erin", "rain", Side::Yes, 500, 3);
        FAIL("expected InsufficientFunds");
    } catch (const ledger::InsufficientFunds& ex) {
        CHECK(ex.required() == 1'500);
        CHECK(ex.available() == 1'000);
    }
    CHECK(f.balance("erin") == 1'000);
    CHECK(f.exchange.orders_of_account("erin").empty());
}

TEST_CASE("Cancelling refunds only the unfilled remainder") {
    Fixture f;

    const auto maker = f.exchange.place_order("alice", "rain", Side::No, 400, 10);
    f.exchange.place_order("bob", "rain", Side::Yes, 600, 4);

    const auto cancelled = f.exchange.cancel_order("alice", maker.order.id);
    CHECK(cancelled.refunded == 6 * 400);
    CHECK(cancelled.order.status == ledger::OrderStatus::Cancelled);
    CHECK(f.balance("alice") == 100'000 - 4'000 + 2'400);

    CHECK(error_kind_of([&] { f.exchange.cancel_order("alice", maker.order.id); }) ==
          ledger::ErrorKind::InvalidState);
    CHECK(error_kind_of([&] { f.exchange.cancel_order("alice", "ord-999999"); }) ==
          ledger::ErrorKind::NotFound);

    const auto other = f.exchange.place_order("carol", "rain", Side::Yes, 100, 5);
    CHECK(error_kind_of([&] { f.exchange.cancel_order("alice", other.order.id); }) ==
          ledger::ErrorKind::Forbidden);
    CHECK(f.exchange.get_order(other.order.id).is_resting());
}

TEST_CASE("Withdrawing all orders spans every market") {
    Fixture f;
    f.exchange.create_market("snow", "Snow tomorrow");

    f.exchange.place_order("alice", "rain", Side::No, 300, 10);
    f.exchange.place_order("alice", "snow", Side::Yes, 200, 5);
    f.exchange.place_order("bob", "rain", Side::Yes, 100, 5);

    const auto cancelled = f.exchange.withdraw_all_orders("alice");
    CHECK(cancelled.size() == 2);
    CHECK(f.balance("alice") == 100'000);
    for (const auto& order : f.exchange.orders_of_account("alice")) {
        CHECK(order.status == ledger::OrderStatus::Cancelled);
    }
    CHECK(f.balance("bob") == 100'000 - 500);
}
