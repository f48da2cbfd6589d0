// =============================================================================
// vault.cpp - CollateralVault custody implementation
// =============================================================================

#include "vperp/vault.hpp"
#include "vperp/math.hpp"

#include <mutex>

namespace vperp {

I128 TokenConfig::base_unit() const {
    return pow10(decimals);
}

// =============================================================================
// Token Registry
// =============================================================================

int32_t CollateralVault::register_token(const TokenConfig& config) {
    if (config.decimals > 30 || config.price_x18 < 0 ||
        config.haircut_bps > BPS_DENOMINATOR) {
        return errors::INVALID_CONFIG;
    }

    std::unique_lock lock(mutex_);
    if (tokens_.find(config.token) != tokens_.end()) {
        return errors::ALREADY_EXISTS;
    }
    tokens_[config.token] = config;
    return errors::OK;
}

int32_t CollateralVault::set_token_enabled(const Currency& token, bool enabled) {
    std::unique_lock lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return errors::TOKEN_NOT_ENABLED;
    }
    it->second.enabled = enabled;
    return errors::OK;
}

int32_t CollateralVault::set_token_price(const Currency& token, I128 price_x18) {
    if (price_x18 < 0) {
        return errors::INVALID_PRICE;
    }
    std::unique_lock lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return errors::TOKEN_NOT_ENABLED;
    }
    it->second.price_x18 = price_x18;
    return errors::OK;
}

std::vector<TokenConfig> CollateralVault::tokens() const {
    std::shared_lock lock(mutex_);
    std::vector<TokenConfig> out;
    out.reserve(tokens_.size());
    for (const auto& [token, config] : tokens_) {
        out.push_back(config);
    }
    return out;
}

std::optional<TokenConfig> CollateralVault::token_config(const Currency& token) const {
    std::shared_lock lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// Balances
// =============================================================================

I128& CollateralVault::slot(const AccountId& account, const Currency& token) {
    return balances_[account][token];
}

I128 CollateralVault::balance_of(const AccountId& account, const Currency& token) const {
    std::shared_lock lock(mutex_);
    auto acc = balances_.find(account);
    if (acc == balances_.end()) return 0;
    auto it = acc->second.find(token);
    if (it == acc->second.end()) return 0;
    return it->second;
}

int32_t CollateralVault::deposit(const AccountId& account, const Currency& token, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end() || !it->second.enabled) {
        return errors::TOKEN_NOT_ENABLED;
    }

    slot(account, token) += amount;
    stats_.total_deposits++;
    return errors::OK;
}

int32_t CollateralVault::withdraw(const AccountId& account, const Currency& token, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    I128& balance = slot(account, token);
    if (balance < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    balance -= amount;
    stats_.total_withdrawals++;
    return errors::OK;
}

int32_t CollateralVault::seize(const AccountId& from, const AccountId& to,
                               const Currency& token, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    I128& source = slot(from, token);
    if (source < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    source -= amount;
    slot(to, token) += amount;
    stats_.total_seizures++;
    return errors::OK;
}

int32_t CollateralVault::settle_pnl(const AccountId& account, const Currency& token, I128 amount) {
    if (amount == 0) {
        return errors::OK;
    }

    std::unique_lock lock(mutex_);
    I128& balance = slot(account, token);
    if (amount < 0 && balance < -amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    balance += amount;
    stats_.net_pnl_settled += amount;
    return errors::OK;
}

I128 CollateralVault::account_collateral_value(const AccountId& account) const {
    std::shared_lock lock(mutex_);
    auto acc = balances_.find(account);
    if (acc == balances_.end()) return 0;

    I128 total = 0;
    for (const auto& [token, balance] : acc->second) {
        auto cfg = tokens_.find(token);
        if (cfg == tokens_.end() || !cfg->second.enabled || balance <= 0) continue;

        I128 amount_x18 = from_token(balance, cfg->second.base_unit());
        I128 value = x18::mul(amount_x18, cfg->second.price_x18);
        total += bps_of(value, 10000 - cfg->second.haircut_bps);
    }
    return total;
}

// =============================================================================
// Statistics
// =============================================================================

CollateralVault::Stats CollateralVault::get_stats() const {
    std::shared_lock lock(mutex_);
    return stats_;
}

I128 CollateralVault::total_balance(const Currency& token) const {
    std::shared_lock lock(mutex_);
    I128 total = 0;
    for (const auto& [account, balances] : balances_) {
        auto it = balances.find(token);
        if (it != balances.end()) total += it->second;
    }
    return total;
}

} // namespace vperp
