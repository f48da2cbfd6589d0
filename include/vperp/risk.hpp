#ifndef VPERP_RISK_HPP
#define VPERP_RISK_HPP

#include "types.hpp"
#include "clearing_house.hpp"
#include "market.hpp"

namespace vperp {

// =============================================================================
// RiskEngine - Read-only risk views over the clearing house
// =============================================================================

class RiskEngine {
public:
    RiskEngine(const ClearingHouse& house, const MarketRegistry& markets);

    // Index price at which the position reaches maintenance margin (0 if none)
    I128 liquidation_price(const AccountId& account, MarketId market_id) const;

    // Largest additional size free collateral can margin at IMR, fee included
    I128 max_open_size(const AccountId& account, MarketId market_id, bool is_long) const;

    // Account value (collateral + unrealized PnL + pending funding) <= 0
    bool is_bankrupt(const AccountId& account) const;

private:
    const ClearingHouse& house_;
    const MarketRegistry& markets_;
};

} // namespace vperp

#endif // VPERP_RISK_HPP
