#ifndef VPERP_TEST_FIXTURE_HPP
#define VPERP_TEST_FIXTURE_HPP

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_tostring.hpp>

#include <memory>
#include <string>
#include <vector>

#include <vperp/vperp.hpp>

namespace Catch {
template <>
struct StringMaker<__int128> {
    static std::string convert(__int128 value) {
        return vperp::int_to_string(value);
    }
};
} // namespace Catch

namespace vperp {
namespace test {

constexpr uint64_t T0 = 1700000000;

// Shared mutable time; copies of fn() all observe advance()
struct ManualClock {
    std::shared_ptr<uint64_t> now = std::make_shared<uint64_t>(T0);

    Clock fn() const {
        auto t = now;
        return [t] { return *t; };
    }
    void advance(uint64_t seconds) { *now += seconds; }
    uint64_t get() const { return *now; }
};

inline I128 dec(const std::string& text) {
    I128 value = 0;
    REQUIRE(x18::parse(text, value));
    return value;
}

inline I128 usdc_units(int64_t whole) {
    return static_cast<I128>(whole) * 1000000;
}

const Address USDC_ADDRESS = addresses::from_u16(0x1001);
const Address ADMIN = addresses::from_u16(0x0001);

inline MarketRiskParams eth_risk() {
    MarketRiskParams risk;
    risk.imr_bps = 1000;
    risk.mmr_bps = 500;
    risk.liquidation_penalty_bps = 250;
    risk.penalty_cap_x18 = x18::from_int(100);
    risk.max_position_size_x18 = x18::from_int(500);
    risk.min_position_size_x18 = dec("0.1");
    risk.liquidator_share_bps = 5000;
    return risk;
}

inline VammConfig eth_vamm() {
    VammConfig vamm;
    vamm.initial_price_x18 = x18::from_int(2000);
    vamm.initial_base_reserve_x18 = x18::from_int(1000);
    vamm.fee_bps = 10;
    vamm.fr_max_bps_per_hour = 100;
    vamm.funding_twap_window = 3600;
    return vamm;
}

// USDC (6 decimals), ETH-PERP (id 1) and optionally BTC-PERP (id 2)
inline VenueConfig make_config(bool with_btc = false) {
    VenueConfig config;
    config.log_level = "warn";
    config.admin = ADMIN;

    TokenSpec usdc;
    usdc.symbol = "USDC";
    usdc.address = USDC_ADDRESS;
    usdc.decimals = 6;
    config.tokens.push_back(usdc);

    MarketSpec eth;
    eth.id = 1;
    eth.symbol = "ETH-PERP";
    eth.quote_token = "USDC";
    eth.base_token = addresses::from_u16(0x2001);
    eth.index_price_x18 = x18::from_int(2000);
    eth.trade_fee_bps = 5;
    eth.vamm = eth_vamm();
    eth.risk = eth_risk();
    config.markets.push_back(eth);

    if (with_btc) {
        MarketSpec btc;
        btc.id = 2;
        btc.symbol = "BTC-PERP";
        btc.quote_token = "USDC";
        btc.base_token = addresses::from_u16(0x2002);
        btc.index_price_x18 = x18::from_int(60000);
        btc.trade_fee_bps = 5;
        btc.vamm.initial_price_x18 = x18::from_int(60000);
        btc.vamm.initial_base_reserve_x18 = x18::from_int(100);
        btc.vamm.fee_bps = 10;
        btc.vamm.fr_max_bps_per_hour = 100;
        btc.risk.imr_bps = 500;
        btc.risk.mmr_bps = 250;
        btc.risk.liquidation_penalty_bps = 200;
        btc.risk.min_position_size_x18 = dec("0.001");
        config.markets.push_back(btc);
    }
    return config;
}

// Captures every clearing-house event
struct RecordingListener : ClearingHouseListener {
    std::vector<PositionChangedEvent> positions;
    std::vector<LiquidationEvent> liquidations;
    std::vector<FundingSettledEvent> fundings;
    std::vector<BadDebtEvent> bad_debts;

    void on_position_changed(const PositionChangedEvent& e) override { positions.push_back(e); }
    void on_liquidation(const LiquidationEvent& e) override { liquidations.push_back(e); }
    void on_funding_settled(const FundingSettledEvent& e) override { fundings.push_back(e); }
    void on_bad_debt(const BadDebtEvent& e) override { bad_debts.push_back(e); }
};

struct VenueFixture {
    const AccountId alice = addresses::from_u16(0xA11C);
    const AccountId bob = addresses::from_u16(0x0B0B);
    const AccountId keeper = addresses::from_u16(0x0EE9);
    const AccountId whale = addresses::from_u16(0x3A1E);
    const Currency usdc{USDC_ADDRESS};

    ManualClock clock;
    Venue venue;
    ClearingHouse& house;
    ManualPriceSource& index;
    Vamm& vamm;
    RecordingListener events;

    explicit VenueFixture(const VenueConfig& config = make_config())
        : venue(config, clock.fn()),
          house(venue.clearing_house()),
          index(*venue.index_source(1)),
          vamm(*venue.vamm(1)) {
        house.set_listener(&events);
    }

    ~VenueFixture() { house.set_listener(nullptr); }

    void fund(const AccountId& account, int64_t whole) {
        REQUIRE(house.deposit(account, usdc, usdc_units(whole)) == errors::OK);
    }

    I128 balance(const AccountId& account) {
        return venue.vault().balance_of(account, usdc);
    }

    Position position(const AccountId& account, MarketId market = 1) {
        auto pos = house.get_position(account, market);
        REQUIRE(pos.has_value());
        return *pos;
    }
};

} // namespace test
} // namespace vperp

#endif // VPERP_TEST_FIXTURE_HPP
