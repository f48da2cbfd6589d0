// vperp - Funding Settlement Tests

#include <catch2/catch_test_macros.hpp>

#include "fixture.hpp"

using namespace vperp;
using namespace vperp::test;

TEST_CASE("Longs pay when the mark trades above the index", "[funding]") {
    VenueFixture f;
    f.fund(f.alice, 10000);
    TradeResult t;
    REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);
    REQUIRE(*f.house.pending_funding(f.alice, 1) == 0);

    f.clock.advance(3600);
    I128 pending = *f.house.pending_funding(f.alice, 1);
    REQUIRE(pending < 0);

    Position before = f.position(f.alice);
    I128 balance_before = f.balance(f.alice);

    REQUIRE(f.house.settle_funding(f.alice, 1) == errors::OK);

    Position after = f.position(f.alice);
    REQUIRE(after.margin_x18 == before.margin_x18 + pending);
    REQUIRE(f.balance(f.alice) == balance_before - to_token_up(-pending, 1000000));
    REQUIRE(after.last_funding_index_x18 == f.vamm.cumulative_funding());
    REQUIRE(*f.house.pending_funding(f.alice, 1) == 0);

    REQUIRE(f.events.fundings.size() == 1);
    REQUIRE(f.events.fundings[0].payment_x18 == pending);

    SECTION("Settling again at the same time changes nothing") {
        REQUIRE(f.house.settle_funding(f.alice, 1) == errors::OK);

        Position again = f.position(f.alice);
        REQUIRE(again.margin_x18 == after.margin_x18);
        REQUIRE(again.last_funding_index_x18 == after.last_funding_index_x18);
        REQUIRE(f.balance(f.alice) == balance_before - to_token_up(-pending, 1000000));
        REQUIRE(f.events.fundings.size() == 1);
        REQUIRE(f.house.get_stats().total_funding_settlements == 2);
    }
}

TEST_CASE("Shorts receive funding", "[funding]") {
    VenueFixture f;
    f.fund(f.alice, 10000);
    f.fund(f.bob, 10000);
    TradeResult t;
    REQUIRE(f.house.open_position(f.alice, 1, true, x18::from_int(2), 0, t) == errors::OK);
    REQUIRE(f.house.open_position(f.bob, 1, false, X18_ONE, 0, t) == errors::OK);
    REQUIRE(*f.vamm.mark_price() > x18::from_int(2000));

    f.clock.advance(3600);
    I128 pending = *f.house.pending_funding(f.bob, 1);
    REQUIRE(pending > 0);

    Position before = f.position(f.bob);
    I128 balance_before = f.balance(f.bob);
    I128 tokens = to_token_down(pending, 1000000);

    REQUIRE(f.house.settle_funding(f.bob, 1) == errors::OK);
    REQUIRE(f.balance(f.bob) == balance_before + tokens);
    REQUIRE(f.position(f.bob).margin_x18 == before.margin_x18 + from_token(tokens, 1000000));
}

TEST_CASE("Trades settle funding first", "[funding]") {
    VenueFixture f;
    f.fund(f.alice, 10000);
    TradeResult t;
    REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);

    f.clock.advance(3600);
    REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);

    REQUIRE(f.events.fundings.size() == 1);
    REQUIRE(f.events.fundings[0].payment_x18 < 0);
    REQUIRE(f.position(f.alice).last_funding_index_x18 == f.vamm.cumulative_funding());
    REQUIRE(f.vamm.last_funding_time() == f.clock.get());
}

TEST_CASE("Unpaid funding becomes bad debt", "[funding][bad_debt]") {
    VenueFixture f;
    f.fund(f.alice, 10000);
    TradeResult t;
    REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);
    REQUIRE(f.venue.vault().seize(f.alice, f.whale, f.usdc, f.balance(f.alice)) == errors::OK);

    f.clock.advance(3600);
    I128 pending = *f.house.pending_funding(f.alice, 1);
    REQUIRE(pending < 0);

    REQUIRE(f.house.settle_funding(f.alice, 1) == errors::OK);
    REQUIRE(f.house.total_bad_debt() == -pending);
    REQUIRE(f.house.market_bad_debt(1) == -pending);

    REQUIRE(f.events.bad_debts.size() == 1);
    REQUIRE(f.events.bad_debts[0].reason == BadDebtReason::FUNDING);
    REQUIRE(f.events.bad_debts[0].amount_x18 == -pending);
    REQUIRE(std::string(to_string(BadDebtReason::FUNDING)) == "funding");
}

TEST_CASE("Funding without an index only advances time", "[funding]") {
    VenueFixture f;
    f.fund(f.alice, 10000);
    TradeResult t;
    REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);

    I128 cumulative = f.vamm.cumulative_funding();
    f.index.set_failing(true);
    f.clock.advance(3600);

    REQUIRE(f.house.settle_funding(f.alice, 1) == errors::OK);
    REQUIRE(f.vamm.cumulative_funding() == cumulative);
    REQUIRE(f.vamm.last_funding_time() == f.clock.get());
    REQUIRE(f.events.fundings.empty());

    SECTION("Restored index accrues only new time") {
        f.index.set_failing(false);
        REQUIRE(*f.house.pending_funding(f.alice, 1) == 0);
        f.clock.advance(60);
        REQUIRE(*f.house.pending_funding(f.alice, 1) < 0);
    }
}

TEST_CASE("Funding poke without a position", "[funding]") {
    VenueFixture f;
    f.clock.advance(600);

    REQUIRE(f.house.settle_funding(f.bob, 1) == errors::OK);
    REQUIRE(f.vamm.last_funding_time() == f.clock.get());
    REQUIRE_FALSE(f.house.get_position(f.bob, 1).has_value());
    REQUIRE(f.house.settle_funding(f.bob, 42) == errors::MARKET_NOT_FOUND);
}
