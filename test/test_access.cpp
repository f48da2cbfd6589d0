// vperp - Access Control and Market Registry Tests

#include <catch2/catch_test_macros.hpp>

#include "fixture.hpp"

using namespace vperp;
using namespace vperp::test;

TEST_CASE("AccessControl admin set", "[access]") {
    const Address other = addresses::from_u16(0x0BAD);
    AccessControl access(ADMIN);

    REQUIRE(access.is_admin(ADMIN));
    REQUIRE(access.require_admin(other) == errors::UNAUTHORIZED);

    SECTION("Only admins grant") {
        REQUIRE(access.grant_admin(other, other) == errors::UNAUTHORIZED);
        REQUIRE(access.grant_admin(ADMIN, other) == errors::OK);
        REQUIRE(access.grant_admin(ADMIN, other) == errors::ALREADY_EXISTS);
        REQUIRE(access.require_admin(other) == errors::OK);
        REQUIRE(access.admin_count() == 2);
    }

    SECTION("Last admin stays") {
        REQUIRE(access.revoke_admin(ADMIN, ADMIN) == errors::INVALID_CONFIG);
        REQUIRE(access.grant_admin(ADMIN, other) == errors::OK);
        REQUIRE(access.revoke_admin(other, ADMIN) == errors::OK);
        REQUIRE_FALSE(access.is_admin(ADMIN));
    }
}

TEST_CASE("MarketRegistry", "[market]") {
    ManualClock clock;
    ManualPriceSource index(x18::from_int(2000));
    Vamm vamm(&index, clock.fn());
    CollateralVault vault;
    InsuranceFund fund(vault, addresses::from_u16(0x0003));
    FeeRouter router(vault, addresses::from_u16(0x0004), fund.address(), addresses::from_u16(0x0002));

    MarketInfo info;
    info.id = 7;
    info.symbol = "SOL-PERP";
    info.vamm = &vamm;
    info.oracle = &index;
    info.fee_router = &router;
    info.insurance_fund = &fund;
    info.quote_token = Currency(USDC_ADDRESS);
    info.base_unit = 1000000;

    MarketRegistry registry;

    SECTION("Create and look up") {
        REQUIRE(registry.create_market(info) == errors::OK);
        REQUIRE(registry.create_market(info) == errors::ALREADY_EXISTS);
        REQUIRE(registry.exists(7));
        REQUIRE(registry.is_active(7));
        REQUIRE(registry.get_market(7)->symbol == "SOL-PERP");
        REQUIRE_FALSE(registry.get_market(8).has_value());
        REQUIRE(registry.market_ids() == std::vector<MarketId>{7});
    }

    SECTION("Pause") {
        REQUIRE(registry.create_market(info) == errors::OK);
        REQUIRE(registry.set_paused(7, true) == errors::OK);
        REQUIRE_FALSE(registry.is_active(7));
        REQUIRE(registry.exists(7));
        REQUIRE(registry.set_paused(8, true) == errors::MARKET_NOT_FOUND);
    }

    SECTION("Incomplete entries rejected") {
        MarketInfo missing = info;
        missing.vamm = nullptr;
        REQUIRE(registry.create_market(missing) == errors::INVALID_CONFIG);

        MarketInfo fee = info;
        fee.fee_bps = 10001;
        REQUIRE(registry.create_market(fee) == errors::INVALID_FEE);
        REQUIRE(registry.size() == 0);
    }
}
