#ifndef VPERP_INSURANCE_HPP
#define VPERP_INSURANCE_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "types.hpp"
#include "vault.hpp"

namespace vperp {

// =============================================================================
// IInsuranceFund - Backstop for liquidation shortfalls
// =============================================================================

class IInsuranceFund {
public:
    virtual ~IInsuranceFund() = default;

    virtual const Address& address() const = 0;

    // Available funds in native token units
    virtual I128 balance(const Currency& token) const = 0;

    // Pays min(amount, balance) to `to`; returns the amount actually paid
    virtual I128 payout(const AccountId& to, const Currency& token, I128 amount) = 0;
};

// =============================================================================
// InsuranceFund - Funds held as a collateral vault account at its own address
// =============================================================================

class InsuranceFund : public IInsuranceFund {
public:
    InsuranceFund(ICollateralLedger& ledger, const Address& address);

    InsuranceFund(const InsuranceFund&) = delete;
    InsuranceFund& operator=(const InsuranceFund&) = delete;

    const Address& address() const override { return address_; }
    I128 balance(const Currency& token) const override;
    I128 payout(const AccountId& to, const Currency& token, I128 amount) override;

    // Direct top-up from a contributor's vault balance
    int32_t contribute(const AccountId& from, const Currency& token, I128 amount);

    I128 total_paid_out(const Currency& token) const;
    uint64_t payout_count() const { return payout_count_.load(std::memory_order_relaxed); }

private:
    ICollateralLedger& ledger_;
    Address address_;
    mutable std::mutex mutex_;
    std::unordered_map<Currency, I128, CurrencyHash> paid_out_;
    std::atomic<uint64_t> payout_count_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace vperp

#endif // VPERP_INSURANCE_HPP
