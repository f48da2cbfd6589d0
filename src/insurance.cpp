// =============================================================================
// insurance.cpp - Insurance fund
// =============================================================================

#include "vperp/insurance.hpp"
#include "vperp/log.hpp"
#include "vperp/math.hpp"

#include <algorithm>

namespace vperp {

InsuranceFund::InsuranceFund(ICollateralLedger& ledger, const Address& address)
    : ledger_(ledger), address_(address), logger_(log::get()) {}

I128 InsuranceFund::balance(const Currency& token) const {
    return ledger_.balance_of(address_, token);
}

I128 InsuranceFund::payout(const AccountId& to, const Currency& token, I128 amount) {
    if (amount <= 0) return 0;

    std::lock_guard<std::mutex> lock(mutex_);
    I128 paid = std::min(amount, ledger_.balance_of(address_, token));
    if (paid <= 0) {
        logger_->warn("insurance fund empty, requested payout of {} unpaid",
                      int_to_string(amount));
        return 0;
    }

    int32_t err = ledger_.seize(address_, to, token, paid);
    if (err != errors::OK) {
        logger_->error("insurance payout failed: {}", errors::to_string(err));
        return 0;
    }

    paid_out_[token] += paid;
    payout_count_.fetch_add(1, std::memory_order_relaxed);
    return paid;
}

int32_t InsuranceFund::contribute(const AccountId& from, const Currency& token, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }
    return ledger_.seize(from, address_, token, amount);
}

I128 InsuranceFund::total_paid_out(const Currency& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = paid_out_.find(token);
    return it == paid_out_.end() ? 0 : it->second;
}

} // namespace vperp
