#ifndef VPERP_FEE_ROUTER_HPP
#define VPERP_FEE_ROUTER_HPP

#include <memory>
#include <mutex>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "types.hpp"
#include "vault.hpp"

namespace vperp {

// =============================================================================
// IFeeDistributor - Receives trade fees and protocol penalty shares
//
// The clearing house moves the funds to address() first and then notifies.
// =============================================================================

class IFeeDistributor {
public:
    virtual ~IFeeDistributor() = default;

    virtual const Address& address() const = 0;

    virtual void on_trade_fee(const Currency& token, I128 amount) = 0;
    virtual void on_liquidation_penalty(const Currency& token, I128 amount) = 0;
};

// =============================================================================
// FeeRouter - Splits receipts between the insurance fund and the treasury
// =============================================================================

class FeeRouter : public IFeeDistributor {
public:
    static constexpr uint32_t DEFAULT_SPLIT_BPS = 5000;

    FeeRouter(ICollateralLedger& ledger, const Address& address,
              const Address& insurance_fund, const Address& treasury);

    FeeRouter(const FeeRouter&) = delete;
    FeeRouter& operator=(const FeeRouter&) = delete;

    const Address& address() const override { return address_; }

    void on_trade_fee(const Currency& token, I128 amount) override;
    void on_liquidation_penalty(const Currency& token, I128 amount) override;

    // Shares routed to the insurance fund; INVALID_FEE above 10000
    int32_t set_split(uint32_t trade_to_fund_bps, uint32_t liq_to_fund_bps);
    uint32_t trade_to_fund_bps() const;
    uint32_t liq_to_fund_bps() const;

    struct Totals {
        I128 trade_fees;
        I128 liquidation_penalties;
        I128 to_insurance;
        I128 to_treasury;
    };
    Totals totals(const Currency& token) const;

private:
    void route(const Currency& token, I128 amount, uint32_t to_fund_bps);

    ICollateralLedger& ledger_;
    Address address_;
    Address insurance_fund_;
    Address treasury_;

    mutable std::mutex mutex_;
    uint32_t trade_to_fund_bps_ = DEFAULT_SPLIT_BPS;
    uint32_t liq_to_fund_bps_ = DEFAULT_SPLIT_BPS;
    std::unordered_map<Currency, Totals, CurrencyHash> totals_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace vperp

#endif // VPERP_FEE_ROUTER_HPP
