// vperp - Scripted venue session
// Deposits, opens positions, moves the index, settles funding and liquidates

#include <vperp/vperp.hpp>

#include <atomic>
#include <iostream>

using namespace vperp;

namespace {

std::atomic<uint64_t> g_now{0};

uint64_t sim_clock() {
    return g_now.load(std::memory_order_relaxed);
}

class AuditLog : public ClearingHouseListener {
public:
    void on_position_changed(const PositionChangedEvent& e) override { print(e); }
    void on_liquidation(const LiquidationEvent& e) override { print(e); }
    void on_funding_settled(const FundingSettledEvent& e) override { print(e); }
    void on_bad_debt(const BadDebtEvent& e) override { print(e); }

private:
    template <typename Event>
    void print(const Event& e) {
        nlohmann::json j = e;
        std::cout << j.dump() << "\n";
    }
};

bool check(int32_t err, const char* what) {
    if (err != errors::OK) {
        log::get()->error("{} failed: {}", what, errors::to_string(err));
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <venue.json>\n";
        return 2;
    }

    g_now = system_clock_seconds();

    try {
        VenueConfig config = VenueConfig::from_file(argv[1]);
        Venue venue(config, sim_clock);
        auto logger = log::get();

        AuditLog audit;
        ClearingHouse& house = venue.clearing_house();
        house.set_listener(&audit);

        auto usdc_opt = venue.token("USDC");
        if (!usdc_opt) {
            logger->error("config has no USDC token");
            return 1;
        }
        const Currency usdc = *usdc_opt;
        const MarketId eth = 1;
        ManualPriceSource* index = venue.index_source(eth);
        if (!index || !house.get_risk_params(eth)) {
            logger->error("config has no risk-enabled market {}", eth);
            return 1;
        }

        const AccountId alice = addresses::from_u16(0xA11C);
        const AccountId bob = addresses::from_u16(0x0B0B);
        const AccountId keeper = addresses::from_u16(0x0EE9);

        // Collateral
        if (!check(house.deposit(alice, usdc, 10000 * pow10(6)), "alice deposit")) return 1;
        if (!check(house.deposit(bob, usdc, 1000 * pow10(6)), "bob deposit")) return 1;

        // Positions
        TradeResult trade;
        if (!check(house.open_position(alice, eth, true, x18::from_int(2), 0, trade), "alice open")) return 1;
        logger->info("alice long 2 @ {} margin={}", x18::to_string(trade.exec_price_x18),
                     x18::to_string(trade.margin_after_x18));

        if (!check(house.open_position(bob, eth, true, x18::from_int(2), 0, trade), "bob open")) return 1;
        logger->info("bob long 2 @ {} margin={}", x18::to_string(trade.exec_price_x18),
                     x18::to_string(trade.margin_after_x18));

        // One hour later, funding against a slightly higher index
        g_now += 3600;
        index->set_price(x18::from_int(2010));
        logger->info("alice pending funding {}",
                     x18::to_string(house.pending_funding(alice, eth).value_or(0)));
        if (!check(house.settle_funding(alice, eth), "settle funding")) return 1;

        // Index crash
        g_now += 60;
        index->set_price(x18::from_int(1700));
        logger->info("bob margin ratio {} liquidatable={} liquidation price {}",
                     x18::to_string(house.get_margin_ratio(bob, eth).value_or(0)),
                     house.is_liquidatable(bob, eth),
                     x18::to_string(venue.risk().liquidation_price(bob, eth)));

        if (house.is_liquidatable(bob, eth)) {
            LiquidationResult liq;
            if (!check(house.liquidate(keeper, bob, eth, x18::from_int(2), liq), "liquidate bob")) return 1;
            logger->info("keeper received {} USDC", int_to_string(venue.vault().balance_of(keeper, usdc)));
        }

        // Alice exits
        g_now += 60;
        if (!check(house.close_position(alice, eth, x18::from_int(2), 0, trade), "alice close")) return 1;
        logger->info("alice realized {} account value {}", x18::to_string(trade.realized_pnl_x18),
                     x18::to_string(house.get_account_value(alice)));

        auto stats = house.get_stats();
        auto fees = venue.fee_router().totals(usdc);
        logger->info("trades={} liquidations={} fundings={} rejected={}",
                     stats.total_trades, stats.total_liquidations,
                     stats.total_funding_settlements, stats.rejected_operations);
        logger->info("fees={} penalties={} insurance={} bad_debt={}",
                     int_to_string(fees.trade_fees), int_to_string(fees.liquidation_penalties),
                     int_to_string(venue.insurance_fund().balance(usdc)),
                     x18::to_string(house.total_bad_debt()));
        house.set_listener(nullptr);
    } catch (const ConfigError& e) {
        std::cerr << "config error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
