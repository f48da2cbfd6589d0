#ifndef VPERP_POSITION_HPP
#define VPERP_POSITION_HPP

#include <algorithm>
#include <map>
#include <vector>

#include "types.hpp"

namespace vperp {

// =============================================================================
// Position (per account, per market)
// =============================================================================

struct Position {
    I128 size_x18 = 0;                 // Signed base size (+ long, - short)
    I128 margin_x18 = 0;               // Reserved quote, never negative
    I128 entry_price_x18 = 0;          // Zero iff size is zero
    I128 last_funding_index_x18 = 0;
    I128 realized_pnl_x18 = 0;         // Cumulative, trade fees deducted

    bool empty() const { return size_x18 == 0; }
    bool is_long() const { return size_x18 > 0; }
};

// =============================================================================
// Market Risk Parameters
// =============================================================================

struct MarketRiskParams {
    uint32_t imr_bps = 0;                  // Initial margin
    uint32_t mmr_bps = 0;                  // Maintenance margin
    uint32_t liquidation_penalty_bps = 0;
    I128 penalty_cap_x18 = 0;              // 0 = uncapped
    I128 max_position_size_x18 = 0;        // 0 = unbounded
    I128 min_position_size_x18 = 0;        // 0 = no floor
    uint32_t liquidator_share_bps = 10000; // Remainder goes to the protocol

    bool is_set() const { return mmr_bps > 0; }

    bool valid() const {
        return mmr_bps > 0 && imr_bps >= mmr_bps && imr_bps <= 10000 &&
               liquidation_penalty_bps <= 10000 && liquidator_share_bps <= 10000 &&
               penalty_cap_x18 >= 0 && min_position_size_x18 >= 0 &&
               max_position_size_x18 >= 0 &&
               (max_position_size_x18 == 0 || min_position_size_x18 <= max_position_size_x18);
    }
};

// =============================================================================
// Account State
// =============================================================================

struct AccountState {
    std::map<MarketId, Position> positions;
    std::vector<MarketId> active_markets;   // Markets with a nonzero position

    bool is_active(MarketId market) const {
        return std::find(active_markets.begin(), active_markets.end(), market) !=
               active_markets.end();
    }

    void deactivate(MarketId market) {
        active_markets.erase(
            std::remove(active_markets.begin(), active_markets.end(), market),
            active_markets.end());
    }
};

// =============================================================================
// Bad Debt (uncovered shortfalls, never forgiven)
// =============================================================================

struct BadDebtTotals {
    I128 total_x18 = 0;
    std::map<MarketId, I128> by_market;
};

} // namespace vperp

#endif // VPERP_POSITION_HPP
