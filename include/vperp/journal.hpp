#ifndef VPERP_JOURNAL_HPP
#define VPERP_JOURNAL_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "types.hpp"
#include "position.hpp"
#include "vamm.hpp"
#include "vault.hpp"
#include "insurance.hpp"
#include "fee_router.hpp"

namespace vperp {

// =============================================================================
// Journal - All-or-nothing scope for one clearing-house operation
//
// Undo images are taken on first touch of an account or vAMM. Collateral
// movements, insurance payouts and fee notifications are staged and only
// applied by commit(); reads during the operation go through the staged
// overlay. Destruction without commit() restores every undo image.
// =============================================================================

class Journal {
public:
    using Accounts = std::unordered_map<AccountId, AccountState, AddressHash>;

    Journal(ICollateralLedger& ledger, Accounts& accounts, BadDebtTotals& bad_debt);
    ~Journal();

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    // =========================================================================
    // Undo Images
    // =========================================================================

    // Account state for mutation, created if missing
    AccountState& account(const AccountId& id);
    void touch(Vamm& vamm);

    // =========================================================================
    // Staged Collateral Effects (native token units)
    // =========================================================================

    I128 balance_of(const AccountId& account, const Currency& token) const;

    void settle_pnl(const AccountId& account, const Currency& token, I128 amount);
    void seize(const AccountId& from, const AccountId& to, const Currency& token, I128 amount);
    void withdraw(const AccountId& account, const Currency& token, I128 amount);

    I128 insurance_available(IInsuranceFund& fund, const Currency& token) const;
    void insurance_payout(IInsuranceFund& fund, const AccountId& to,
                          const Currency& token, I128 amount);

    // Funds must already be staged to distributor.address()
    void trade_fee(IFeeDistributor& distributor, const Currency& token, I128 amount);
    void liquidation_penalty(IFeeDistributor& distributor, const Currency& token, I128 amount);

    // Runs after the staged effects have been applied
    void emit(std::function<void()> dispatch);

    // =========================================================================
    // Completion
    // =========================================================================

    // Applies staged effects in order. Effects the ledger balances cannot
    // cover roll the whole operation back with SETTLEMENT_FAILED.
    int32_t commit();
    void rollback();

    bool committed() const { return committed_; }

private:
    enum class EffectKind : uint8_t {
        SETTLE_PNL,
        SEIZE,
        WITHDRAW,
        INSURANCE_PAYOUT,
        TRADE_FEE,
        LIQUIDATION_PENALTY,
    };

    struct Effect {
        EffectKind kind;
        AccountId from;
        AccountId to;
        Currency token;
        I128 amount;
        IInsuranceFund* fund;
        IFeeDistributor* distributor;
    };

    using BalanceKey = std::pair<AccountId, Currency>;

    void adjust(const AccountId& account, const Currency& token, I128 delta);
    bool validate() const;
    int32_t apply(const Effect& effect);

    ICollateralLedger& ledger_;
    Accounts& accounts_;
    BadDebtTotals& bad_debt_;
    BadDebtTotals bad_debt_undo_;

    std::map<AccountId, std::optional<AccountState>> account_undo_;
    std::vector<std::pair<Vamm*, Vamm::State>> vamm_undo_;

    std::map<BalanceKey, I128> overlay_;
    std::map<std::pair<IInsuranceFund*, Currency>, I128> pending_payouts_;
    std::vector<Effect> effects_;
    std::vector<std::function<void()>> dispatch_;

    bool committed_ = false;
    bool rolled_back_ = false;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace vperp

#endif // VPERP_JOURNAL_HPP
