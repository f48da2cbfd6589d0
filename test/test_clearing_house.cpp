// vperp - Clearing House Trading and Margin Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "fixture.hpp"

using namespace vperp;
using namespace vperp::test;
using Catch::Approx;

TEST_CASE("Position sign follows the trade", "[clearing]") {
    VenueFixture f;
    f.fund(f.alice, 10000);
    TradeResult t;

    SECTION("Opening from zero") {
        f.fund(f.bob, 10000);
        REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);
        REQUIRE(f.position(f.alice).size_x18 == X18_ONE);
        REQUIRE(f.position(f.alice).entry_price_x18 == t.exec_price_x18);

        REQUIRE(f.house.open_position(f.bob, 1, false, X18_ONE, 0, t) == errors::OK);
        REQUIRE(f.position(f.bob).size_x18 == -X18_ONE);
        REQUIRE_FALSE(f.position(f.bob).is_long());
    }

    SECTION("Smaller opposite trade reduces, larger one flips") {
        REQUIRE(f.house.open_position(f.alice, 1, true, x18::from_int(2), 0, t) == errors::OK);

        REQUIRE(f.house.open_position(f.alice, 1, false, X18_ONE, 0, t) == errors::OK);
        REQUIRE(t.size_after_x18 == X18_ONE);
        REQUIRE(t.realized_pnl_x18 != 0);

        REQUIRE(f.house.open_position(f.alice, 1, false, x18::from_int(3), 0, t) == errors::OK);
        Position pos = f.position(f.alice);
        REQUIRE(pos.size_x18 == -x18::from_int(2));
        REQUIRE(pos.entry_price_x18 == t.exec_price_x18);
        REQUIRE(pos.margin_x18 > 0);
    }

    SECTION("Adding keeps a volume-weighted entry") {
        TradeResult first;
        REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, first) == errors::OK);
        REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);

        Position pos = f.position(f.alice);
        REQUIRE(pos.size_x18 == x18::from_int(2));
        REQUIRE(pos.entry_price_x18 > first.exec_price_x18);
        REQUIRE(pos.entry_price_x18 < t.exec_price_x18);
    }

    SECTION("Close bounds") {
        REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);
        REQUIRE(f.house.close_position(f.alice, 1, x18::from_int(2), 0, t) == errors::INVALID_AMOUNT);
        REQUIRE(f.house.close_position(f.bob, 1, X18_ONE, 0, t) == errors::POSITION_NOT_FOUND);
        REQUIRE(f.position(f.alice).size_x18 == X18_ONE);
    }
}

TEST_CASE("Open then close at unchanged prices costs the fees", "[clearing][pnl]") {
    VenueFixture f;
    f.fund(f.alice, 10000);
    TradeResult open;
    TradeResult close;

    REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, open) == errors::OK);
    REQUIRE(open.trade_fee_x18 > 0);
    REQUIRE(open.realized_pnl_x18 == -open.trade_fee_x18);
    REQUIRE(f.position(f.alice).realized_pnl_x18 == -open.trade_fee_x18);

    REQUIRE(f.house.close_position(f.alice, 1, X18_ONE, 0, close) == errors::OK);

    I128 fees = open.swap_fee_x18 + close.swap_fee_x18 + open.trade_fee_x18 + close.trade_fee_x18;
    Position pos = f.position(f.alice);
    REQUIRE(pos.realized_pnl_x18 < 0);
    REQUIRE(x18::to_double(pos.realized_pnl_x18) == Approx(-x18::to_double(fees)).epsilon(0.01));
    REQUIRE(pos.realized_pnl_x18 == open.realized_pnl_x18 + close.realized_pnl_x18);
    REQUIRE(f.events.positions.back().realized_pnl_x18 == close.realized_pnl_x18);

    REQUIRE(pos.size_x18 == 0);
    REQUIRE(pos.entry_price_x18 == 0);
    REQUIRE(pos.margin_x18 == 0);
    REQUIRE(f.house.active_markets(f.alice).empty());
    REQUIRE(f.house.reserved_margin(f.alice, f.usdc) == 0);
    REQUIRE(f.house.free_collateral(f.alice, f.usdc) == from_token(f.balance(f.alice), 1000000));
}

TEST_CASE("Round trip without a swap fee loses exactly the trade fees", "[clearing][pnl][fees]") {
    VenueConfig config = make_config();
    config.markets[0].vamm.fee_bps = 0;
    VenueFixture f(config);
    f.fund(f.alice, 10000);
    TradeResult open;
    TradeResult close;

    REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, open) == errors::OK);
    REQUIRE(f.house.close_position(f.alice, 1, X18_ONE, 0, close) == errors::OK);
    REQUIRE(open.swap_fee_x18 == 0);
    REQUIRE(close.swap_fee_x18 == 0);

    I128 trade_fees = open.trade_fee_x18 + close.trade_fee_x18;
    I128 residual = -f.position(f.alice).realized_pnl_x18 - trade_fees;
    REQUIRE(residual >= -1000);
    REQUIRE(residual <= 1000);

    I128 fee_tokens = to_token_up(open.trade_fee_x18, 1000000) + to_token_up(close.trade_fee_x18, 1000000);
    REQUIRE(f.balance(f.alice) <= usdc_units(10000) - fee_tokens);
    REQUIRE(f.balance(f.alice) >= usdc_units(10000) - fee_tokens - 1);
}

TEST_CASE("Flipping reserves initial margin for the new leg", "[clearing][margin]") {
    VenueFixture f;
    TradeResult t;

    SECTION("Reserve covers the opposite side") {
        f.fund(f.alice, 10000);
        REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);
        REQUIRE(f.house.open_position(f.alice, 1, false, x18::from_int(3), 0, t) == errors::OK);

        Position pos = f.position(f.alice);
        REQUIRE(pos.size_x18 == -x18::from_int(2));
        REQUIRE(pos.margin_x18 >= bps_of_up(x18::mul_up(x18::from_int(2), t.exec_price_x18), 1000));
        REQUIRE(f.house.reserved_margin(f.alice, f.usdc) == pos.margin_x18);
    }

    SECTION("Flip rejected when the new leg cannot be backed") {
        f.fund(f.alice, 300);
        REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);
        Position before = f.position(f.alice);
        I128 balance_before = f.balance(f.alice);

        REQUIRE(f.house.open_position(f.alice, 1, false, x18::from_int(3), 0, t) ==
                errors::INSUFFICIENT_COLLATERAL);
        Position after = f.position(f.alice);
        REQUIRE(after.size_x18 == X18_ONE);
        REQUIRE(after.margin_x18 == before.margin_x18);
        REQUIRE(f.balance(f.alice) == balance_before);
    }
}

TEST_CASE("Zero collateral cannot open", "[clearing][collateral]") {
    VenueFixture f;
    TradeResult t;

    SECTION("Never deposited") {
        REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::INSUFFICIENT_COLLATERAL);
        REQUIRE(f.house.open_position(f.alice, 1, false, dec("0.5"), 0, t) == errors::INSUFFICIENT_COLLATERAL);
        REQUIRE_FALSE(f.house.get_position(f.alice, 1).has_value());
        REQUIRE(f.vamm.swap_count() == 0);
    }

    SECTION("Collateral removed while margin is still reserved") {
        f.fund(f.alice, 10000);
        REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);
        Position before = f.position(f.alice);
        REQUIRE(before.margin_x18 > 0);

        REQUIRE(f.venue.vault().seize(f.alice, f.bob, f.usdc, f.balance(f.alice)) == errors::OK);
        REQUIRE(f.balance(f.alice) == 0);

        REQUIRE(f.house.open_position(f.alice, 1, true, dec("0.5"), 0, t) == errors::INSUFFICIENT_COLLATERAL);
        REQUIRE(f.house.open_position(f.alice, 1, false, x18::from_int(2), 0, t) == errors::INSUFFICIENT_COLLATERAL);

        Position after = f.position(f.alice);
        REQUIRE(after.size_x18 == before.size_x18);
        REQUIRE(after.margin_x18 == before.margin_x18);
    }
}

TEST_CASE("Trade validation", "[clearing]") {
    VenueFixture f;
    f.fund(f.alice, 10000);
    TradeResult t;

    SECTION("Unknown market") {
        REQUIRE(f.house.open_position(f.alice, 99, true, X18_ONE, 0, t) == errors::MARKET_NOT_FOUND);
    }

    SECTION("Zero size") {
        REQUIRE(f.house.open_position(f.alice, 1, true, 0, 0, t) == errors::INVALID_AMOUNT);
    }

    SECTION("Size bounds") {
        REQUIRE(f.house.open_position(f.alice, 1, true, dec("0.05"), 0, t) == errors::POSITION_TOO_SMALL);
        REQUIRE(f.house.open_position(f.alice, 1, true, x18::from_int(600), 0, t) == errors::POSITION_TOO_LARGE);
    }

    SECTION("Price limit") {
        REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, x18::from_int(2001), t) ==
                errors::PRICE_LIMIT_EXCEEDED);
    }

    SECTION("Risk params not set") {
        MarketSpec sol;
        sol.id = 3;
        sol.symbol = "SOL-PERP";
        sol.quote_token = "USDC";
        sol.index_price_x18 = x18::from_int(100);
        sol.vamm.initial_price_x18 = x18::from_int(100);
        sol.vamm.initial_base_reserve_x18 = x18::from_int(10000);
        REQUIRE(f.venue.create_market(sol) == errors::OK);

        REQUIRE(f.house.open_position(f.alice, 3, true, X18_ONE, 0, t) == errors::RISK_PARAMS_NOT_SET);
        REQUIRE_FALSE(f.house.get_risk_params(3).has_value());
    }

    SECTION("Paused market") {
        REQUIRE(f.house.set_market_paused(f.alice, 1, true) == errors::UNAUTHORIZED);
        REQUIRE(f.house.set_market_paused(ADMIN, 1, true) == errors::OK);
        REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::MARKET_NOT_ACTIVE);

        REQUIRE(f.house.set_market_paused(ADMIN, 1, false) == errors::OK);
        REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);
    }
}

TEST_CASE("Active market cap", "[clearing]") {
    VenueConfig config = make_config(true);
    config.max_active_markets = 1;
    VenueFixture f(config);
    f.fund(f.alice, 100000);
    TradeResult t;

    REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);
    REQUIRE(f.house.open_position(f.alice, 2, true, dec("0.01"), 0, t) == errors::TOO_MANY_ACTIVE_MARKETS);
    REQUIRE(f.house.active_markets(f.alice) == std::vector<MarketId>{1});

    REQUIRE(f.house.close_position(f.alice, 1, X18_ONE, 0, t) == errors::OK);
    REQUIRE(f.house.active_markets(f.alice).empty());

    REQUIRE(f.house.open_position(f.alice, 2, true, dec("0.01"), 0, t) == errors::OK);
    REQUIRE(f.house.active_markets(f.alice) == std::vector<MarketId>{2});
}

TEST_CASE("Margin adjustments", "[clearing][margin]") {
    VenueFixture f;
    f.fund(f.alice, 10000);
    TradeResult t;
    REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);
    I128 margin = t.margin_after_x18;
    REQUIRE(f.position(f.alice).margin_x18 == margin);

    SECTION("Add") {
        REQUIRE(f.house.add_margin(f.alice, 1, x18::from_int(100)) == errors::OK);
        REQUIRE(f.position(f.alice).margin_x18 == margin + x18::from_int(100));
        REQUIRE(f.house.reserved_margin(f.alice, f.usdc) == margin + x18::from_int(100));

        REQUIRE(f.house.add_margin(f.alice, 1, x18::from_int(1000000)) == errors::INSUFFICIENT_COLLATERAL);
    }

    SECTION("Remove") {
        REQUIRE(f.house.remove_margin(f.alice, 1, margin + 1) == errors::INSUFFICIENT_MARGIN);
        REQUIRE(f.house.remove_margin(f.alice, 1, x18::from_int(150)) == errors::WOULD_BE_LIQUIDATABLE);
        REQUIRE(f.position(f.alice).margin_x18 == margin);

        REQUIRE(f.house.remove_margin(f.alice, 1, x18::from_int(50)) == errors::OK);
        REQUIRE(f.position(f.alice).margin_x18 == margin - x18::from_int(50));
    }

    SECTION("Without a position") {
        REQUIRE(f.house.add_margin(f.bob, 1, X18_ONE) == errors::POSITION_NOT_FOUND);
        REQUIRE(f.house.add_margin(f.alice, 1, 0) == errors::INVALID_AMOUNT);
        REQUIRE(f.house.remove_margin(f.alice, 99, X18_ONE) == errors::MARKET_NOT_FOUND);
    }
}

TEST_CASE("Withdrawals keep reserved margin backed", "[clearing][collateral]") {
    VenueFixture f;
    f.fund(f.alice, 10000);
    TradeResult t;
    REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);

    REQUIRE(f.house.withdraw(f.alice, f.usdc, usdc_units(9900)) == errors::WITHDRAW_BREACHES_MARGIN);
    REQUIRE(f.house.withdraw(f.alice, f.usdc, usdc_units(20000)) == errors::INSUFFICIENT_BALANCE);

    REQUIRE(f.house.withdraw(f.alice, f.usdc, usdc_units(9000)) == errors::OK);
    REQUIRE(f.balance(f.alice) < usdc_units(1000));
    REQUIRE(f.balance(f.alice) > usdc_units(998));

    SECTION("Blocked while liquidatable") {
        f.index.set_price(x18::from_int(1800));
        REQUIRE(f.house.withdraw(f.alice, f.usdc, 1) == errors::ACCOUNT_LIQUIDATABLE);
    }

    SECTION("No positions") {
        f.fund(f.bob, 100);
        REQUIRE(f.house.withdraw(f.bob, f.usdc, usdc_units(100)) == errors::OK);
        REQUIRE(f.balance(f.bob) == 0);
    }
}

TEST_CASE("Rejected trade leaves no trace", "[clearing][atomic]") {
    VenueFixture f;
    f.fund(f.alice, 100);
    uint64_t rejected = f.house.get_stats().rejected_operations;
    TradeResult t;

    // Swap succeeds, margin reservation does not
    REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::INSUFFICIENT_COLLATERAL);

    REQUIRE(*f.vamm.mark_price() == x18::from_int(2000));
    REQUIRE(f.vamm.swap_count() == 0);
    REQUIRE_FALSE(f.house.get_position(f.alice, 1).has_value());
    REQUIRE(f.balance(f.alice) == usdc_units(100));
    REQUIRE(f.events.positions.empty());
    REQUIRE(f.house.get_stats().rejected_operations == rejected + 1);
    REQUIRE(f.house.get_stats().total_trades == 0);
}

TEST_CASE("Trade fees and events", "[clearing][fees]") {
    VenueFixture f;
    f.fund(f.alice, 10000);
    TradeResult t;
    REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);

    I128 fee_tokens = to_token_up(t.trade_fee_x18, 1000000);
    REQUIRE(t.trade_fee_x18 == bps_of_up(t.exec_price_x18, 5));
    REQUIRE(f.venue.fee_router().totals(f.usdc).trade_fees == fee_tokens);
    REQUIRE(f.venue.insurance_fund().balance(f.usdc) +
            f.venue.vault().balance_of(f.venue.config().treasury, f.usdc) ==
            fee_tokens);
    REQUIRE(f.balance(f.alice) == usdc_units(10000) - fee_tokens);

    REQUIRE(f.events.positions.size() == 1);
    const PositionChangedEvent& e = f.events.positions[0];
    REQUIRE(e.size_before_x18 == 0);
    REQUIRE(e.size_after_x18 == X18_ONE);
    REQUIRE(e.fee_x18 == t.trade_fee_x18);
    REQUIRE_FALSE(e.liquidation);

    nlohmann::json j = e;
    REQUIRE(j["type"] == "position_changed");
    REQUIRE(j["size_after"] == "1");
}

TEST_CASE("Risk reads", "[clearing][risk]") {
    VenueFixture f;
    f.fund(f.alice, 10000);
    TradeResult t;
    REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);

    SECTION("Notional and margin ratio at the index") {
        REQUIRE(*f.house.get_notional(f.alice, 1) == x18::from_int(2000));
        double ratio = x18::to_double(*f.house.get_margin_ratio(f.alice, 1));
        REQUIRE(ratio > 0.09);
        REQUIRE(ratio < 0.11);
        REQUIRE_FALSE(f.house.get_notional(f.bob, 1).has_value());
    }

    SECTION("Account value") {
        I128 value = f.house.get_account_value(f.alice);
        REQUIRE(value < x18::from_int(10000));
        REQUIRE(value > x18::from_int(9990));
        REQUIRE(f.house.get_account_value(f.bob) == 0);
    }

    SECTION("Price fallback when the index fails") {
        f.index.set_failing(true);
        REQUIRE(*f.house.risk_price(1) == *f.vamm.mark_price());
        REQUIRE(f.house.get_notional(f.alice, 1).has_value());
    }

    SECTION("Price falls back to the TWAP once history covers the window") {
        I128 first_mark = *f.vamm.mark_price();
        f.clock.advance(1800);
        REQUIRE(f.house.open_position(f.alice, 1, true, X18_ONE, 0, t) == errors::OK);
        I128 second_mark = *f.vamm.mark_price();
        f.clock.advance(1800);
        f.index.set_failing(true);

        I128 twap = 0;
        REQUIRE(f.vamm.twap(3600, twap) == errors::OK);
        REQUIRE(twap > first_mark);
        REQUIRE(twap < second_mark);
        REQUIRE(*f.house.risk_price(1) == twap);
        REQUIRE(*f.house.risk_price(1) != *f.vamm.mark_price());
    }

    SECTION("Liquidation price") {
        I128 liq = f.venue.risk().liquidation_price(f.alice, 1);
        REQUIRE(liq > x18::from_int(1890));
        REQUIRE(liq < x18::from_int(1910));

        f.index.set_price(x18::from_int(1910));
        REQUIRE_FALSE(f.house.is_liquidatable(f.alice, 1));
        f.index.set_price(x18::from_int(1890));
        REQUIRE(f.house.is_liquidatable(f.alice, 1));
    }

    SECTION("Sizing and solvency") {
        I128 max_size = f.venue.risk().max_open_size(f.alice, 1, true);
        REQUIRE(max_size > x18::from_int(10));
        REQUIRE(max_size < x18::from_int(499));
        REQUIRE_FALSE(f.venue.risk().is_bankrupt(f.alice));
    }
}

TEST_CASE("Admin operations", "[clearing][admin]") {
    VenueFixture f;

    SECTION("Swap fee capped at 300 bps") {
        REQUIRE(f.house.set_swap_fee(f.alice, 1, 20) == errors::UNAUTHORIZED);
        REQUIRE(f.house.set_swap_fee(ADMIN, 1, 301) == errors::INVALID_FEE);
        REQUIRE(f.house.set_swap_fee(ADMIN, 1, 300) == errors::OK);
        REQUIRE(f.vamm.fee_bps() == 300);
    }

    SECTION("Risk params") {
        MarketRiskParams bad = eth_risk();
        bad.imr_bps = 100;
        REQUIRE(f.house.set_risk_params(ADMIN, 1, bad) == errors::INVALID_RISK_PARAMS);
        REQUIRE(f.house.set_risk_params(ADMIN, 42, eth_risk()) == errors::MARKET_NOT_FOUND);
        REQUIRE(f.house.set_risk_params(f.alice, 1, eth_risk()) == errors::UNAUTHORIZED);

        MarketRiskParams tighter = eth_risk();
        tighter.imr_bps = 2000;
        REQUIRE(f.house.set_risk_params(ADMIN, 1, tighter) == errors::OK);
        REQUIRE(f.house.get_risk_params(1)->imr_bps == 2000);
    }

    SECTION("Reserve reset and funding params") {
        REQUIRE(f.house.reset_reserves(f.alice, 1, x18::from_int(2100), x18::from_int(1000)) ==
                errors::UNAUTHORIZED);
        REQUIRE(f.house.reset_reserves(ADMIN, 1, x18::from_int(2500), x18::from_int(1000)) ==
                errors::RESET_BOUND_EXCEEDED);
        REQUIRE(f.house.reset_reserves(ADMIN, 1, x18::from_int(2100), x18::from_int(1000)) == errors::OK);
        REQUIRE(*f.vamm.mark_price() == x18::from_int(2100));

        REQUIRE(f.house.set_funding_params(ADMIN, 1, X18_ONE / 2, 50, 1800) == errors::OK);
        REQUIRE(f.vamm.config().funding_twap_window == 1800);
    }
}
