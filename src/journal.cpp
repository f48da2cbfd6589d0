// =============================================================================
// journal.cpp - Undo images and staged collateral effects
// =============================================================================

#include "vperp/journal.hpp"
#include "vperp/log.hpp"
#include "vperp/math.hpp"

namespace vperp {

Journal::Journal(ICollateralLedger& ledger, Accounts& accounts, BadDebtTotals& bad_debt)
    : ledger_(ledger), accounts_(accounts), bad_debt_(bad_debt),
      bad_debt_undo_(bad_debt), logger_(log::get()) {}

Journal::~Journal() {
    if (!committed_ && !rolled_back_) {
        rollback();
    }
}

// =============================================================================
// Undo Images
// =============================================================================

AccountState& Journal::account(const AccountId& id) {
    auto it = accounts_.find(id);
    if (account_undo_.find(id) == account_undo_.end()) {
        if (it == accounts_.end()) {
            account_undo_[id] = std::nullopt;
        } else {
            account_undo_[id] = it->second;
        }
    }
    if (it == accounts_.end()) {
        it = accounts_.emplace(id, AccountState{}).first;
    }
    return it->second;
}

void Journal::touch(Vamm& vamm) {
    for (const auto& [ptr, state] : vamm_undo_) {
        if (ptr == &vamm) return;
    }
    vamm_undo_.emplace_back(&vamm, vamm.snapshot());
}

// =============================================================================
// Staged Effects
// =============================================================================

void Journal::adjust(const AccountId& account, const Currency& token, I128 delta) {
    overlay_[BalanceKey(account, token)] += delta;
}

I128 Journal::balance_of(const AccountId& account, const Currency& token) const {
    I128 balance = ledger_.balance_of(account, token);
    auto it = overlay_.find(BalanceKey(account, token));
    if (it != overlay_.end()) balance += it->second;
    return balance;
}

void Journal::settle_pnl(const AccountId& account, const Currency& token, I128 amount) {
    if (amount == 0) return;
    adjust(account, token, amount);
    effects_.push_back(Effect{EffectKind::SETTLE_PNL, account, account, token, amount,
                              nullptr, nullptr});
}

void Journal::seize(const AccountId& from, const AccountId& to, const Currency& token, I128 amount) {
    if (amount <= 0) return;
    adjust(from, token, -amount);
    adjust(to, token, amount);
    effects_.push_back(Effect{EffectKind::SEIZE, from, to, token, amount, nullptr, nullptr});
}

void Journal::withdraw(const AccountId& account, const Currency& token, I128 amount) {
    if (amount <= 0) return;
    adjust(account, token, -amount);
    effects_.push_back(Effect{EffectKind::WITHDRAW, account, account, token, amount,
                              nullptr, nullptr});
}

I128 Journal::insurance_available(IInsuranceFund& fund, const Currency& token) const {
    I128 available = fund.balance(token);
    auto it = pending_payouts_.find(std::make_pair(&fund, token));
    if (it != pending_payouts_.end()) available -= it->second;
    return available > 0 ? available : 0;
}

void Journal::insurance_payout(IInsuranceFund& fund, const AccountId& to,
                               const Currency& token, I128 amount) {
    if (amount <= 0) return;
    pending_payouts_[std::make_pair(&fund, token)] += amount;
    adjust(fund.address(), token, -amount);
    adjust(to, token, amount);
    effects_.push_back(Effect{EffectKind::INSURANCE_PAYOUT, fund.address(), to, token, amount,
                              &fund, nullptr});
}

void Journal::trade_fee(IFeeDistributor& distributor, const Currency& token, I128 amount) {
    if (amount <= 0) return;
    effects_.push_back(Effect{EffectKind::TRADE_FEE, distributor.address(), distributor.address(),
                              token, amount, nullptr, &distributor});
}

void Journal::liquidation_penalty(IFeeDistributor& distributor, const Currency& token, I128 amount) {
    if (amount <= 0) return;
    effects_.push_back(Effect{EffectKind::LIQUIDATION_PENALTY, distributor.address(),
                              distributor.address(), token, amount, nullptr, &distributor});
}

void Journal::emit(std::function<void()> dispatch) {
    dispatch_.push_back(std::move(dispatch));
}

// =============================================================================
// Completion
// =============================================================================

int32_t Journal::apply(const Effect& effect) {
    switch (effect.kind) {
        case EffectKind::SETTLE_PNL:
            return ledger_.settle_pnl(effect.from, effect.token, effect.amount);
        case EffectKind::SEIZE:
            return ledger_.seize(effect.from, effect.to, effect.token, effect.amount);
        case EffectKind::WITHDRAW:
            return ledger_.withdraw(effect.from, effect.token, effect.amount);
        case EffectKind::INSURANCE_PAYOUT: {
            I128 paid = effect.fund->payout(effect.to, effect.token, effect.amount);
            return paid == effect.amount ? errors::OK : errors::SETTLEMENT_FAILED;
        }
        case EffectKind::TRADE_FEE:
            effect.distributor->on_trade_fee(effect.token, effect.amount);
            return errors::OK;
        case EffectKind::LIQUIDATION_PENALTY:
            effect.distributor->on_liquidation_penalty(effect.token, effect.amount);
            return errors::OK;
    }
    return errors::SETTLEMENT_FAILED;
}

bool Journal::validate() const {
    std::map<BalanceKey, I128> running;
    auto debit = [&](const AccountId& account, const Currency& token, I128 amount) {
        BalanceKey key(account, token);
        auto it = running.find(key);
        if (it == running.end()) {
            it = running.emplace(key, ledger_.balance_of(account, token)).first;
        }
        if (it->second < amount) return false;
        it->second -= amount;
        return true;
    };
    auto credit = [&](const AccountId& account, const Currency& token, I128 amount) {
        BalanceKey key(account, token);
        auto it = running.find(key);
        if (it == running.end()) {
            it = running.emplace(key, ledger_.balance_of(account, token)).first;
        }
        it->second += amount;
    };

    for (const auto& effect : effects_) {
        switch (effect.kind) {
            case EffectKind::SETTLE_PNL:
                if (effect.amount > 0) {
                    credit(effect.from, effect.token, effect.amount);
                } else if (!debit(effect.from, effect.token, -effect.amount)) {
                    return false;
                }
                break;
            case EffectKind::SEIZE:
            case EffectKind::INSURANCE_PAYOUT:
                if (!debit(effect.from, effect.token, effect.amount)) return false;
                credit(effect.to, effect.token, effect.amount);
                break;
            case EffectKind::WITHDRAW:
            case EffectKind::TRADE_FEE:
            case EffectKind::LIQUIDATION_PENALTY:
                if (!debit(effect.from, effect.token, effect.amount)) return false;
                break;
        }
    }
    return true;
}

int32_t Journal::commit() {
    if (!validate()) {
        logger_->error("staged collateral effects exceed ledger balances, operation rolled back");
        rollback();
        return errors::SETTLEMENT_FAILED;
    }
    committed_ = true;

    // Only a concurrent ledger mutation can refuse an effect at this point
    int32_t result = errors::OK;
    for (const auto& effect : effects_) {
        int32_t err = apply(effect);
        if (err != errors::OK) {
            logger_->error("staged collateral effect refused: {} (amount {} of {})",
                           errors::to_string(err), int_to_string(effect.amount),
                           addresses::to_hex(effect.token.addr));
            result = errors::SETTLEMENT_FAILED;
        }
    }
    effects_.clear();

    for (auto& dispatch : dispatch_) {
        dispatch();
    }
    dispatch_.clear();
    return result;
}

void Journal::rollback() {
    rolled_back_ = true;

    for (auto& [id, image] : account_undo_) {
        if (image) {
            accounts_[id] = *image;
        } else {
            accounts_.erase(id);
        }
    }
    for (auto it = vamm_undo_.rbegin(); it != vamm_undo_.rend(); ++it) {
        it->first->restore(it->second);
    }
    bad_debt_ = bad_debt_undo_;

    account_undo_.clear();
    vamm_undo_.clear();
    overlay_.clear();
    pending_payouts_.clear();
    effects_.clear();
    dispatch_.clear();
}

} // namespace vperp
