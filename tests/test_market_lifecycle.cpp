#include "binex/exchange.hpp"
#include "ledger/errors.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

using ledger::Outcome;
using ledger::Side;

namespace {

struct Fixture {
    binex::Exchange exchange{test_support::memory_config()};
    std::vector<std::string> accounts{"alice", "bob", "carol"};

    Fixture() {
        for (const auto& id : accounts) {
            exchange.create_account(id, 100'000);
        }
        exchange.create_market("rain", "Rain tomorrow");
    }

    std::int64_t balance(const std::string& id) const { return exchange.get_account(id).balance; }

    // alice sells NO at 400, bob buys YES at 700: 10 shares traded at 600.
    void trade() {
        exchange.place_order("alice", "rain", Side::No, 400, 10);
        exchange.place_order("bob", "rain", Side::Yes, 700, 10);
    }

    std::vector<ledger::Position> active_positions() const {
        auto positions = exchange.positions_in_market("rain");
        positions.erase(std::remove_if(positions.begin(), positions.end(),
                                       [](const ledger::Position& p) {
                                           return p.status != ledger::PositionStatus::Active;
                                       }),
                        positions.end());
        return positions;
    }
};

} // namespace

TEST_CASE("Resolving YES pays the YES holders and refunds resting orders") {
    Fixture f;
    f.trade();
    f.exchange.place_order("carol", "rain", Side::Yes, 100, 5);

    const auto result = f.exchange.resolve_market("rain", Outcome::Yes);
    CHECK(result.positions_settled == 1);
    CHECK(result.total_paid == 10'000);
    CHECK(result.orders_cancelled == 1);
    CHECK(result.total_refunded == 500);

    CHECK(f.balance("bob") == 104'000);
    CHECK(f.balance("alice") == 96'000);
    CHECK(f.balance("carol") == 100'000);

    const auto market = f.exchange.get_market("rain");
    CHECK(market.status == ledger::MarketStatus::Resolved);
    REQUIRE(market.resolution.has_value());
    CHECK(*market.resolution == Outcome::Yes);

    const auto positions = f.exchange.positions_in_market("rain");
    REQUIRE(positions.size() == 1);
    CHECK(positions.front().status == ledger::PositionStatus::Settled);
    CHECK(positions.front().winner_account_id == std::optional<std::string>("bob"));

    const auto alice_audit = f.exchange.audit_log("alice");
    CHECK(std::any_of(alice_audit.begin(), alice_audit.end(), [](const ledger::AuditEntry& entry) {
        return entry.kind == ledger::AuditKind::PositionLost;
    }));
    CHECK(test_support::total_value(f.exchange, f.accounts) == 300'000);
}

TEST_CASE("Resolving NO pays the NO holders") {
    Fixture f;
    f.trade();

    f.exchange.resolve_market("rain", Outcome::No);
    CHECK(f.balance("alice") == 106'000);
    CHECK(f.balance("bob") == 94'000);
}

TEST_CASE("A market resolves at most once") {
    Fixture f;
    f.trade();
    f.exchange.resolve_market("rain", Outcome::Yes);

    try {
        f.exchange.resolve_market("rain", Outcome::No);
        FAIL("expected the second resolution to be rejected");
    } catch (const ledger::LedgerError& ex) {
        CHECK(ex.kind() == ledger::ErrorKind::InvalidState);
    }
    CHECK(f.balance("bob") == 104'000);
    CHECK(f.balance("alice") == 96'000);
    CHECK(*f.exchange.get_market("rain").resolution == Outcome::Yes);
}

TEST_CASE("Closed markets stop trading but can still resolve") {
    Fixture f;
    f.trade();
    f.exchange.place_order("carol", "rain", Side::No, 100, 5);

    CHECK(f.exchange.close_market("rain").status == ledger::MarketStatus::PendingResolution);
    CHECK_THROWS_AS(f.exchange.place_order("carol", "rain", Side::Yes, 500, 1), ledger::LedgerError);
    CHECK_THROWS_AS(f.exchange.close_market("rain"), ledger::LedgerError);

    const auto result = f.exchange.resolve_market("rain", Outcome::No);
    CHECK(result.total_paid == 10'000);
    CHECK(result.total_refunded == 500);
    CHECK(f.balance("alice") == 106'000);
    CHECK(f.balance("carol") == 100'000);
}

TEST_CASE("Cancelling a market returns every stake") {
    Fixture f;
    f.trade();
    f.exchange.place_order("carol", "rain", Side::Yes, 150, 4);

    const auto result = f.exchange.cancel_market("rain");
    CHECK(result.positions_refunded == 1);
    CHECK(result.position_refunds == 10'000);
    CHECK(result.orders_cancelled == 1);
    CHECK(result.order_refunds == 600);

    for (const auto& id : f.accounts) {
        CHECK(f.balance(id) == 100'000);
    }
    CHECK(f.exchange.get_market("rain").status == ledger::MarketStatus::Cancelled);
    CHECK(f.exchange.positions_in_market("rain").front().status == ledger::PositionStatus::Refunded);

    CHECK_THROWS_AS(f.exchange.resolve_market("rain", Outcome::Yes), ledger::LedgerError);
    CHECK_THROWS_AS(f.exchange.cancel_market("rain"), ledger::LedgerError);
}

TEST_CASE("Holding both sides settles the matched shares immediately") {
    Fixture f;

    f.exchange.place_order("bob", "rain", Side::No, 400, 10);
    f.exchange.place_order("alice", "rain", Side::Yes, 600, 10);
    f.exchange.place_order("carol", "rain", Side::Yes, 700, 10);
    const auto result = f.exchange.place_order("alice", "rain", Side::No, 300, 10);

    REQUIRE(result.auto_settle.has_value());
    CHECK(result.auto_settle->shares_netted == 10);
    CHECK(result.auto_settle->credited == 10'000);
    CHECK(result.auto_settle->settled_positions.size() == 2);
    CHECK(result.auto_settle->created_positions.size() == 1);

    // Paid 600 + 300 per share, received 1000.
    CHECK(f.balance("alice") == 101'000);

    const auto active = f.active_positions();
    REQUIRE(active.size() == 1);
    CHECK(active.front().yes_account_id == "carol");
    CHECK(active.front().no_account_id == "bob");
    CHECK(active.front().shares == 10);
    CHECK(active.front().trade_price == 700);

    for (const auto& position : f.exchange.positions_of_account("alice")) {
        CHECK(position.status == ledger::PositionStatus::Settled);
        CHECK(position.winner_account_id == std::optional<std::string>("alice"));
    }
    CHECK(test_support::total_value(f.exchange, f.accounts) == 300'000);

    f.exchange.resolve_market("rain", Outcome::Yes);
    CHECK(f.balance("carol") == 103'000);
    CHECK(f.balance("bob") == 96'000);
    CHECK(test_support::total_value(f.exchange, f.accounts) == 300'000);
}

TEST_CASE("Partial netting leaves a child position for the rest") {
    Fixture f;

    f.exchange.place_order("bob", "rain", Side::No, 400, 10);
    const auto yes = f.exchange.place_order("alice", "rain", Side::Yes, 600, 10);
    const auto original_id = yes.fills.front().position_id;

    f.exchange.place_order("carol", "rain", Side::Yes, 700, 4);
    const auto result = f.exchange.place_order("alice", "rain", Side::No, 300, 4);

    REQUIRE(result.auto_settle.has_value());
    CHECK(result.auto_settle->shares_netted == 4);
    CHECK(result.auto_settle->credited == 4'000);

    std::int64_t alice_yes = 0;
    std::optional<std::string> parent;
    for (const auto& position : f.active_positions()) {
        if (position.yes_account_id == "alice") {
            alice_yes += position.shares;
            parent = position.parent_id;
        }
        CHECK(position.no_account_id != "alice");
    }
    CHECK(alice_yes == 6);
    CHECK(parent == std::optional<std::string>(original_id));
    CHECK(test_support::total_value(f.exchange, f.accounts) == 300'000);
}

TEST_CASE("Netting against the same counterparty pays it out directly") {
    Fixture f;

    f.exchange.place_order("bob", "rain", Side::No, 400, 10);
    f.exchange.place_order("alice", "rain", Side::Yes, 600, 10);
    f.exchange.place_order("bob", "rain", Side::Yes, 700, 10);
    const auto result = f.exchange.place_order("alice", "rain", Side::No, 300, 10);

    REQUIRE(result.auto_settle.has_value());
    CHECK(result.auto_settle->created_positions.empty());
    CHECK(f.active_positions().empty());
    CHECK(f.balance("alice") == 101'000);
    CHECK(f.balance("bob") == 99'000);
}

TEST_CASE("Accounts and markets are created once") {
    Fixture f;

    CHECK_THROWS_AS(f.exchange.create_account("alice", 5), ledger::LedgerError);
    CHECK_THROWS_AS(f.exchange.create_account("", 5), ledger::LedgerError);
    CHECK_THROWS_AS(f.exchange.create_account("erin", -1), ledger::LedgerError);
    CHECK_THROWS_AS(f.exchange.create_market("rain", "again"), ledger::LedgerError);
    CHECK(f.balance("alice") == 100'000);
    CHECK(f.exchange.get_market("rain").title == "Rain tomorrow");

    const auto opened = f.exchange.create_account("erin", 0);
    CHECK(opened.balance == 0);
}
