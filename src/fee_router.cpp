// =============================================================================
// fee_router.cpp - Fee and penalty split
// =============================================================================

#include "vperp/fee_router.hpp"
#include "vperp/math.hpp"
#include "vperp/log.hpp"

namespace vperp {

FeeRouter::FeeRouter(ICollateralLedger& ledger, const Address& address,
                     const Address& insurance_fund, const Address& treasury)
    : ledger_(ledger), address_(address), insurance_fund_(insurance_fund),
      treasury_(treasury), logger_(log::get()) {}

void FeeRouter::on_trade_fee(const Currency& token, I128 amount) {
    if (amount <= 0) return;

    uint32_t split;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        totals_[token].trade_fees += amount;
        split = trade_to_fund_bps_;
    }
    route(token, amount, split);
}

void FeeRouter::on_liquidation_penalty(const Currency& token, I128 amount) {
    if (amount <= 0) return;

    uint32_t split;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        totals_[token].liquidation_penalties += amount;
        split = liq_to_fund_bps_;
    }
    route(token, amount, split);
}

void FeeRouter::route(const Currency& token, I128 amount, uint32_t to_fund_bps) {
    I128 to_fund = bps_of(amount, to_fund_bps);
    I128 to_treasury = amount - to_fund;

    if (to_fund > 0) {
        int32_t err = ledger_.seize(address_, insurance_fund_, token, to_fund);
        if (err != errors::OK) {
            logger_->error("fee routing to insurance failed: {}", errors::to_string(err));
            return;
        }
    }
    if (to_treasury > 0) {
        int32_t err = ledger_.seize(address_, treasury_, token, to_treasury);
        if (err != errors::OK) {
            logger_->error("fee routing to treasury failed: {}", errors::to_string(err));
            to_treasury = 0;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Totals& t = totals_[token];
    t.to_insurance += to_fund;
    t.to_treasury += to_treasury;
}

int32_t FeeRouter::set_split(uint32_t trade_to_fund_bps, uint32_t liq_to_fund_bps) {
    if (trade_to_fund_bps > 10000 || liq_to_fund_bps > 10000) {
        return errors::INVALID_FEE;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    trade_to_fund_bps_ = trade_to_fund_bps;
    liq_to_fund_bps_ = liq_to_fund_bps;
    return errors::OK;
}

uint32_t FeeRouter::trade_to_fund_bps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trade_to_fund_bps_;
}

uint32_t FeeRouter::liq_to_fund_bps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return liq_to_fund_bps_;
}

FeeRouter::Totals FeeRouter::totals(const Currency& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = totals_.find(token);
    if (it == totals_.end()) return Totals{};
    return it->second;
}

} // namespace vperp
