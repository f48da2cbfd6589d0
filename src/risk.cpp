// =============================================================================
// risk.cpp - Liquidation price, sizing and bankruptcy views
// =============================================================================

#include "vperp/risk.hpp"
#include "vperp/math.hpp"

namespace vperp {

RiskEngine::RiskEngine(const ClearingHouse& house, const MarketRegistry& markets)
    : house_(house), markets_(markets) {}

I128 RiskEngine::liquidation_price(const AccountId& account, MarketId market_id) const {
    auto position = house_.get_position(account, market_id);
    if (!position || position->size_x18 == 0) return 0;

    auto params = house_.get_risk_params(market_id);
    if (!params) return 0;

    I128 pending = house_.pending_funding(account, market_id).value_or(0);

    // margin + pending + size * (P - entry) = mmr * |size| * P
    // P = (size * entry - margin - pending) / (size - mmr * |size|)
    I128 size = position->size_x18;
    I128 numerator = x18::mul(size, position->entry_price_x18) - position->margin_x18 - pending;
    I128 denominator = size - bps_of(abs128(size), params->mmr_bps);
    if (denominator == 0) return 0;

    I128 price = x18::div(numerator, denominator);
    return price > 0 ? price : 0;
}

I128 RiskEngine::max_open_size(const AccountId& account, MarketId market_id, bool is_long) const {
    auto market = markets_.get_market(market_id);
    auto params = house_.get_risk_params(market_id);
    auto price = house_.risk_price(market_id);
    if (!market || !params || !price || *price <= 0) return 0;

    I128 free = house_.free_collateral(account, market->quote_token);
    if (free <= 0) return 0;

    // max_size = free / (price * (imr + fee))
    I128 per_unit = bps_of_up(*price, params->imr_bps) + bps_of_up(*price, market->fee_bps);
    if (per_unit <= 0) return 0;
    I128 size = x18::div(free, per_unit);

    if (params->max_position_size_x18 > 0) {
        I128 current = 0;
        if (auto position = house_.get_position(account, market_id)) {
            current = position->size_x18;
        }
        I128 signed_current = is_long ? current : -current;
        I128 headroom = params->max_position_size_x18 - signed_current;
        size = min128(size, max128(headroom, 0));
    }
    return size;
}

bool RiskEngine::is_bankrupt(const AccountId& account) const {
    return house_.get_account_value(account) <= 0;
}

} // namespace vperp
