#ifndef VPERP_VAULT_HPP
#define VPERP_VAULT_HPP

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace vperp {

// =============================================================================
// Token Configuration
// =============================================================================

struct TokenConfig {
    Currency token;
    std::string symbol;
    uint8_t decimals = 6;
    bool enabled = true;
    I128 price_x18 = X18_ONE;     // Valuation price (USD)
    uint32_t haircut_bps = 0;     // Discount applied to the valuation

    I128 base_unit() const;       // 10^decimals
};

// =============================================================================
// ICollateralLedger - Custody of collateral in native token units
// =============================================================================

class ICollateralLedger {
public:
    virtual ~ICollateralLedger() = default;

    virtual I128 balance_of(const AccountId& account, const Currency& token) const = 0;

    virtual int32_t deposit(const AccountId& account, const Currency& token, I128 amount) = 0;
    virtual int32_t withdraw(const AccountId& account, const Currency& token, I128 amount) = 0;

    // Move amount from one account to another
    virtual int32_t seize(const AccountId& from, const AccountId& to,
                          const Currency& token, I128 amount) = 0;

    // Signed credit (+) or debit (-) of realized PnL and funding
    virtual int32_t settle_pnl(const AccountId& account, const Currency& token, I128 amount) = 0;

    // Haircut valuation of all enabled tokens (X18)
    virtual I128 account_collateral_value(const AccountId& account) const = 0;

    virtual std::optional<TokenConfig> token_config(const Currency& token) const = 0;
};

// =============================================================================
// CollateralVault - In-memory custody
// =============================================================================

class CollateralVault : public ICollateralLedger {
public:
    CollateralVault() = default;
    ~CollateralVault() override = default;

    // Non-copyable
    CollateralVault(const CollateralVault&) = delete;
    CollateralVault& operator=(const CollateralVault&) = delete;

    // =========================================================================
    // Token Registry
    // =========================================================================

    int32_t register_token(const TokenConfig& config);
    int32_t set_token_enabled(const Currency& token, bool enabled);
    int32_t set_token_price(const Currency& token, I128 price_x18);
    std::vector<TokenConfig> tokens() const;

    // =========================================================================
    // ICollateralLedger
    // =========================================================================

    I128 balance_of(const AccountId& account, const Currency& token) const override;
    int32_t deposit(const AccountId& account, const Currency& token, I128 amount) override;
    int32_t withdraw(const AccountId& account, const Currency& token, I128 amount) override;
    int32_t seize(const AccountId& from, const AccountId& to,
                  const Currency& token, I128 amount) override;
    int32_t settle_pnl(const AccountId& account, const Currency& token, I128 amount) override;
    I128 account_collateral_value(const AccountId& account) const override;
    std::optional<TokenConfig> token_config(const Currency& token) const override;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_deposits;
        uint64_t total_withdrawals;
        uint64_t total_seizures;
        I128 net_pnl_settled;
    };
    Stats get_stats() const;

    I128 total_balance(const Currency& token) const;

private:
    using Balances = std::unordered_map<Currency, I128, CurrencyHash>;

    I128& slot(const AccountId& account, const Currency& token);

    mutable std::shared_mutex mutex_;
    std::unordered_map<Currency, TokenConfig, CurrencyHash> tokens_;
    std::unordered_map<AccountId, Balances, AddressHash> balances_;
    Stats stats_{};
};

} // namespace vperp

#endif // VPERP_VAULT_HPP
