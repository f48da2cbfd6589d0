#ifndef VPERP_CLEARING_HOUSE_HPP
#define VPERP_CLEARING_HOUSE_HPP

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "types.hpp"
#include "position.hpp"
#include "events.hpp"
#include "market.hpp"
#include "access.hpp"
#include "vault.hpp"
#include "vamm.hpp"

namespace vperp {

class Journal;

// =============================================================================
// Operation Results
// =============================================================================

struct TradeResult {
    I128 base_delta_x18 = 0;
    I128 quote_delta_x18 = 0;
    I128 exec_price_x18 = 0;
    I128 swap_fee_x18 = 0;        // Retained by the vAMM reserves
    I128 trade_fee_x18 = 0;       // Routed to the fee distributor
    I128 realized_pnl_x18 = 0;    // Net of the trade fee
    I128 size_after_x18 = 0;
    I128 margin_after_x18 = 0;
};

struct LiquidationResult {
    I128 size_x18 = 0;
    I128 exec_price_x18 = 0;
    I128 snapshot_price_x18 = 0;
    I128 realized_pnl_x18 = 0;
    I128 penalty_x18 = 0;
    I128 liquidator_paid_x18 = 0;   // Including the insurance-covered part
    I128 protocol_paid_x18 = 0;
    I128 insurance_paid_x18 = 0;
    I128 bad_debt_x18 = 0;
    I128 remaining_size_x18 = 0;
};

// =============================================================================
// ClearingHouse - Positions, margin, funding settlement and liquidations
//
// Single writer: every mutation holds mutex_ exclusively and runs inside a
// Journal, reads take it shared. Listener callbacks run after commit with
// the lock still held and must not call back into the clearing house.
// =============================================================================

class ClearingHouse {
public:
    static constexpr size_t DEFAULT_MAX_ACTIVE_MARKETS = 16;

    ClearingHouse(ICollateralLedger& ledger, MarketRegistry& markets, AccessControl& access,
                  Clock clock = system_clock_seconds,
                  size_t max_active_markets = DEFAULT_MAX_ACTIVE_MARKETS);
    ~ClearingHouse();

    // Non-copyable
    ClearingHouse(const ClearingHouse&) = delete;
    ClearingHouse& operator=(const ClearingHouse&) = delete;

    void set_listener(ClearingHouseListener* listener);

    // =========================================================================
    // Trading
    // =========================================================================

    int32_t open_position(const AccountId& account, MarketId market, bool is_long,
                          I128 size_x18, I128 price_limit_x18, TradeResult& out);

    // Reduces the existing position by size (at most its absolute size)
    int32_t close_position(const AccountId& account, MarketId market,
                           I128 size_x18, I128 price_limit_x18, TradeResult& out);

    int32_t liquidate(const AccountId& liquidator, const AccountId& account, MarketId market,
                      I128 size_x18, LiquidationResult& out);

    // =========================================================================
    // Margin & Funding
    // =========================================================================

    int32_t add_margin(const AccountId& account, MarketId market, I128 amount_x18);
    int32_t remove_margin(const AccountId& account, MarketId market, I128 amount_x18);
    int32_t settle_funding(const AccountId& account, MarketId market);

    // =========================================================================
    // Collateral (native token units)
    // =========================================================================

    int32_t deposit(const AccountId& account, const Currency& token, I128 amount);

    // Remaining collateral must cover reserved margin; no position may be liquidatable
    int32_t withdraw(const AccountId& account, const Currency& token, I128 amount);

    // =========================================================================
    // Admin (caller must be an admin)
    // =========================================================================

    int32_t set_risk_params(const Address& caller, MarketId market, const MarketRiskParams& params);
    int32_t reset_reserves(const Address& caller, MarketId market, I128 price_x18, I128 base_reserve_x18);
    int32_t set_swap_fee(const Address& caller, MarketId market, uint32_t fee_bps);
    int32_t set_funding_params(const Address& caller, MarketId market, I128 k_x18,
                               uint32_t fr_max_bps_per_hour, uint64_t twap_window);
    int32_t set_market_paused(const Address& caller, MarketId market, bool paused);

    // =========================================================================
    // Reads
    // =========================================================================

    std::optional<Position> get_position(const AccountId& account, MarketId market) const;
    std::optional<MarketRiskParams> get_risk_params(MarketId market) const;

    // |size| valued at the risk price
    std::optional<I128> get_notional(const AccountId& account, MarketId market) const;

    // (margin + pending funding + unrealized PnL) / notional
    std::optional<I128> get_margin_ratio(const AccountId& account, MarketId market) const;

    // Signed funding not yet settled (+ owed to the account)
    std::optional<I128> pending_funding(const AccountId& account, MarketId market) const;

    // Oracle, then TWAP, then mark
    std::optional<I128> risk_price(MarketId market) const;

    bool is_liquidatable(const AccountId& account, MarketId market) const;

    // Collateral valuation plus unrealized PnL and pending funding
    I128 get_account_value(const AccountId& account) const;

    // Quote collateral not reserved as position margin (X18, may be negative)
    I128 free_collateral(const AccountId& account, const Currency& token) const;
    I128 reserved_margin(const AccountId& account, const Currency& token) const;

    std::vector<MarketId> active_markets(const AccountId& account) const;

    I128 total_bad_debt() const;
    I128 market_bad_debt(MarketId market) const;

    size_t max_active_markets() const { return max_active_markets_; }

    struct Stats {
        uint64_t total_trades;
        uint64_t total_liquidations;
        uint64_t total_funding_settlements;
        uint64_t rejected_operations;
    };
    Stats get_stats() const;

private:
    // Funds drawn from an account for a loss, a funding debit or a penalty
    struct Collection {
        I128 tokens = 0;
        I128 value_x18 = 0;
        I128 shortfall_x18 = 0;
    };

    // Outcome of applying a vAMM fill to a position
    struct Fill {
        I128 realized_pnl_x18 = 0;
        I128 bad_debt_x18 = 0;
    };

    // Everything below assumes mutex_ is held

    int32_t load_market(MarketId market, MarketInfo& out) const;
    int32_t resolve_price(const MarketInfo& market, I128& out) const;
    I128 unit_of(const Currency& token) const;

    I128 balance(const Journal* txn, const AccountId& account, const Currency& token) const;
    I128 reserved_locked(const AccountState& state, const Currency& token) const;
    I128 free_locked(const Journal* txn, const AccountId& account, const AccountState& state,
                     const Currency& token, I128 base_unit) const;

    // margin + pending + unrealized PnL at price
    static I128 health(const Position& pos, I128 price_x18, I128 pending_x18);
    static I128 maintenance(const Position& pos, const MarketRiskParams& params, I128 price_x18);
    static bool below_maintenance(const Position& pos, const MarketRiskParams& params,
                                  I128 price_x18, I128 pending_x18);
    static I128 funding_payment(I128 index_delta_x18, I128 size_x18);
    I128 pending_locked(const Position& pos, const MarketInfo& market) const;

    int32_t execute_trade(const AccountId& account, MarketId market, I128 base_delta_x18,
                          I128 price_limit_x18, TradeResult& out);
    int32_t swap(Journal& txn, const MarketInfo& market, I128 base_delta_x18,
                 I128 price_limit_x18, SwapResult& out);
    int32_t apply_fill(Journal& txn, const AccountId& account, AccountState& state,
                       MarketId market_id, const MarketInfo& market, const MarketRiskParams& params,
                       const SwapResult& swap, bool liquidation, Fill& out);

    Collection collect(Journal& txn, const AccountId& account, AccountState& state,
                       MarketId market_id, const MarketInfo& market,
                       I128 amount_x18, I128 released_x18);

    // Insurance-covered part of a shortfall paid to `to`; the rest becomes bad debt
    I128 cover_shortfall(Journal& txn, const AccountId& account, MarketId market_id,
                         const MarketInfo& market, const AccountId& to, I128 shortfall_x18,
                         BadDebtReason reason, bool notify_router, I128& bad_debt_x18);

    void settle_funding_locked(Journal& txn, const AccountId& account, AccountState& state,
                               MarketId market_id, const MarketInfo& market);
    // Every active market of the account
    void settle_all_funding(Journal& txn, const AccountId& account, AccountState& state);
    int32_t check_account_healthy(const AccountState& state) const;

    void record_bad_debt(Journal& txn, const AccountId& account, MarketId market,
                         I128 amount_x18, BadDebtReason reason);

    int32_t reject(int32_t err);

    ICollateralLedger& ledger_;
    MarketRegistry& markets_;
    AccessControl& access_;
    Clock clock_;
    size_t max_active_markets_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<AccountId, AccountState, AddressHash> accounts_;
    std::map<MarketId, MarketRiskParams> risk_params_;
    BadDebtTotals bad_debt_;
    Stats stats_{};

    ClearingHouseListener* listener_;
    NullClearingHouseListener null_listener_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace vperp

#endif // VPERP_CLEARING_HOUSE_HPP
