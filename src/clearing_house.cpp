// =============================================================================
// clearing_house.cpp - Positions, margin, funding and liquidations
// =============================================================================

#include "vperp/clearing_house.hpp"
#include "vperp/journal.hpp"
#include "vperp/fee_router.hpp"
#include "vperp/insurance.hpp"
#include "vperp/oracle.hpp"
#include "vperp/math.hpp"
#include "vperp/log.hpp"

#include <mutex>

namespace vperp {

// =============================================================================
// Constructor
// =============================================================================

ClearingHouse::ClearingHouse(ICollateralLedger& ledger, MarketRegistry& markets,
                             AccessControl& access, Clock clock, size_t max_active_markets)
    : ledger_(ledger), markets_(markets), access_(access), clock_(std::move(clock)),
      max_active_markets_(max_active_markets), listener_(&null_listener_),
      logger_(log::get()) {}

ClearingHouse::~ClearingHouse() = default;

void ClearingHouse::set_listener(ClearingHouseListener* listener) {
    std::unique_lock lock(mutex_);
    listener_ = listener ? listener : &null_listener_;
}

int32_t ClearingHouse::reject(int32_t err) {
    stats_.rejected_operations++;
    return err;
}

// =============================================================================
// Lookups
// =============================================================================

int32_t ClearingHouse::load_market(MarketId market, MarketInfo& out) const {
    auto info = markets_.get_market(market);
    if (!info) {
        return errors::MARKET_NOT_FOUND;
    }
    out = *info;
    return errors::OK;
}

int32_t ClearingHouse::resolve_price(const MarketInfo& market, I128& out) const {
    if (market.oracle) {
        auto index = market.oracle->get_price();
        if (index && *index > 0) {
            out = *index;
            return errors::OK;
        }
    }

    I128 twap = 0;
    if (market.vamm->twap(market.vamm->config().funding_twap_window, twap) == errors::OK && twap > 0) {
        logger_->warn("market {} index unavailable, risk price from twap", market.id);
        out = twap;
        return errors::OK;
    }

    auto mark = market.vamm->mark_price();
    if (mark && *mark > 0) {
        logger_->warn("market {} index and twap unavailable, risk price from mark", market.id);
        out = *mark;
        return errors::OK;
    }
    return errors::NO_PRICE_SOURCE;
}

I128 ClearingHouse::unit_of(const Currency& token) const {
    auto config = ledger_.token_config(token);
    return config ? config->base_unit() : X18_ONE;
}

I128 ClearingHouse::balance(const Journal* txn, const AccountId& account,
                            const Currency& token) const {
    return txn ? txn->balance_of(account, token) : ledger_.balance_of(account, token);
}

I128 ClearingHouse::reserved_locked(const AccountState& state, const Currency& token) const {
    I128 total = 0;
    for (const auto& [market_id, pos] : state.positions) {
        if (pos.margin_x18 == 0) continue;
        auto info = markets_.get_market(market_id);
        if (info && info->quote_token == token) {
            total += pos.margin_x18;
        }
    }
    return total;
}

I128 ClearingHouse::free_locked(const Journal* txn, const AccountId& account,
                                const AccountState& state, const Currency& token,
                                I128 base_unit) const {
    I128 collateral = from_token(balance(txn, account, token), base_unit);
    return collateral - reserved_locked(state, token);
}

// =============================================================================
// Risk Math
// =============================================================================

I128 ClearingHouse::health(const Position& pos, I128 price_x18, I128 pending_x18) {
    I128 upnl = x18::mul(price_x18 - pos.entry_price_x18, pos.size_x18);
    return pos.margin_x18 + pending_x18 + upnl;
}

I128 ClearingHouse::maintenance(const Position& pos, const MarketRiskParams& params,
                                I128 price_x18) {
    return bps_of_up(x18::mul_up(abs128(pos.size_x18), price_x18), params.mmr_bps);
}

bool ClearingHouse::below_maintenance(const Position& pos, const MarketRiskParams& params,
                                      I128 price_x18, I128 pending_x18) {
    if (pos.size_x18 == 0) return false;
    return health(pos, price_x18, pending_x18) < maintenance(pos, params, price_x18);
}

I128 ClearingHouse::funding_payment(I128 index_delta_x18, I128 size_x18) {
    if (index_delta_x18 == 0 || size_x18 == 0) return 0;
    // Debits round up, credits round down
    if ((index_delta_x18 > 0) == (size_x18 > 0)) {
        return -mul_div_up(index_delta_x18, size_x18, X18_ONE);
    }
    return -mul_div(index_delta_x18, size_x18, X18_ONE);
}

I128 ClearingHouse::pending_locked(const Position& pos, const MarketInfo& market) const {
    if (pos.size_x18 == 0) return 0;
    I128 index = market.vamm->preview_funding_index();
    return funding_payment(index - pos.last_funding_index_x18, pos.size_x18);
}

int32_t ClearingHouse::check_account_healthy(const AccountState& state) const {
    for (MarketId market_id : state.active_markets) {
        auto pos = state.positions.find(market_id);
        auto params = risk_params_.find(market_id);
        if (pos == state.positions.end() || params == risk_params_.end()) continue;

        MarketInfo market;
        if (load_market(market_id, market) != errors::OK) continue;

        I128 price = 0;
        int32_t err = resolve_price(market, price);
        if (err != errors::OK) return err;

        if (below_maintenance(pos->second, params->second, price, pending_locked(pos->second, market))) {
            return errors::ACCOUNT_LIQUIDATABLE;
        }
    }
    return errors::OK;
}

// =============================================================================
// Collection & Bad Debt
// =============================================================================

ClearingHouse::Collection ClearingHouse::collect(Journal& txn, const AccountId& account,
                                                 AccountState& state, MarketId market_id,
                                                 const MarketInfo& market, I128 amount_x18,
                                                 I128 released_x18) {
    Collection c;
    if (amount_x18 <= 0) return c;

    Position& pos = state.positions[market_id];
    I128 free = max128(free_locked(&txn, account, state, market.quote_token, market.base_unit), 0);

    // Margin just released by this trade, then the position's margin, then other free collateral
    I128 from_released = min128(amount_x18, min128(released_x18, free));
    I128 rest = amount_x18 - from_released;
    I128 from_margin = min128(rest, pos.margin_x18);
    pos.margin_x18 -= from_margin;
    rest -= from_margin;
    I128 from_free = min128(rest, free - from_released);

    I128 wanted = from_released + from_margin + from_free;
    I128 available = max128(txn.balance_of(account, market.quote_token), 0);
    c.tokens = min128(to_token_up(wanted, market.base_unit), available);
    c.value_x18 = min128(wanted, from_token(c.tokens, market.base_unit));
    c.shortfall_x18 = amount_x18 - c.value_x18;
    return c;
}

I128 ClearingHouse::cover_shortfall(Journal& txn, const AccountId& account, MarketId market_id,
                                    const MarketInfo& market, const AccountId& to,
                                    I128 shortfall_x18, BadDebtReason reason, bool notify_router,
                                    I128& bad_debt_x18) {
    bad_debt_x18 = 0;
    if (shortfall_x18 <= 0) return 0;

    I128 wanted = to_token_down(shortfall_x18, market.base_unit);
    I128 pay = min128(wanted, txn.insurance_available(*market.insurance_fund, market.quote_token));
    if (pay > 0) {
        txn.insurance_payout(*market.insurance_fund, to, market.quote_token, pay);
        if (notify_router) {
            txn.liquidation_penalty(*market.fee_router, market.quote_token, pay);
        }
    }

    I128 paid_x18 = from_token(pay, market.base_unit);
    if (pay < wanted) {
        bad_debt_x18 = shortfall_x18 - paid_x18;
        record_bad_debt(txn, account, market_id, bad_debt_x18, reason);
    }
    return paid_x18;
}

void ClearingHouse::record_bad_debt(Journal& txn, const AccountId& account, MarketId market,
                                    I128 amount_x18, BadDebtReason reason) {
    if (amount_x18 <= 0) return;

    bad_debt_.total_x18 += amount_x18;
    bad_debt_.by_market[market] += amount_x18;

    BadDebtEvent event;
    event.account = account;
    event.market = market;
    event.amount_x18 = amount_x18;
    event.reason = reason;
    event.timestamp = clock_();

    txn.emit([this, event] {
        nlohmann::json j = event;
        logger_->warn("bad_debt {}", j.dump());
        listener_->on_bad_debt(event);
    });
}

// =============================================================================
// Funding Settlement
// =============================================================================

void ClearingHouse::settle_funding_locked(Journal& txn, const AccountId& account,
                                          AccountState& state, MarketId market_id,
                                          const MarketInfo& market) {
    txn.touch(*market.vamm);
    market.vamm->poke_funding();
    I128 index = market.vamm->cumulative_funding();

    auto it = state.positions.find(market_id);
    if (it == state.positions.end()) return;

    Position& pos = it->second;
    I128 before = pos.last_funding_index_x18;
    pos.last_funding_index_x18 = index;
    if (pos.size_x18 == 0 || index == before) return;

    I128 payment = funding_payment(index - before, pos.size_x18);
    I128 settled = 0;

    if (payment > 0) {
        I128 tokens = to_token_down(payment, market.base_unit);
        settled = from_token(tokens, market.base_unit);
        pos.margin_x18 += settled;
        txn.settle_pnl(account, market.quote_token, tokens);
    } else if (payment < 0) {
        Collection c = collect(txn, account, state, market_id, market, -payment, 0);
        settled = -c.value_x18;
        txn.settle_pnl(account, market.quote_token, -c.tokens);
        if (c.shortfall_x18 > 0) {
            record_bad_debt(txn, account, market_id, c.shortfall_x18, BadDebtReason::FUNDING);
        }
    }

    FundingSettledEvent event;
    event.account = account;
    event.market = market_id;
    event.payment_x18 = settled;
    event.index_before_x18 = before;
    event.index_after_x18 = index;
    event.timestamp = clock_();
    txn.emit([this, event] { listener_->on_funding_settled(event); });
}

void ClearingHouse::settle_all_funding(Journal& txn, const AccountId& account, AccountState& state) {
    std::vector<MarketId> active = state.active_markets;
    for (MarketId market_id : active) {
        MarketInfo market;
        if (load_market(market_id, market) != errors::OK) continue;
        settle_funding_locked(txn, account, state, market_id, market);
    }
}

// =============================================================================
// Trading
// =============================================================================

int32_t ClearingHouse::open_position(const AccountId& account, MarketId market, bool is_long,
                                     I128 size_x18, I128 price_limit_x18, TradeResult& out) {
    std::unique_lock lock(mutex_);
    if (size_x18 <= 0) {
        return reject(errors::INVALID_AMOUNT);
    }
    return execute_trade(account, market, is_long ? size_x18 : -size_x18, price_limit_x18, out);
}

int32_t ClearingHouse::close_position(const AccountId& account, MarketId market,
                                      I128 size_x18, I128 price_limit_x18, TradeResult& out) {
    std::unique_lock lock(mutex_);
    if (size_x18 <= 0) {
        return reject(errors::INVALID_AMOUNT);
    }

    auto acc = accounts_.find(account);
    if (acc == accounts_.end()) {
        return reject(errors::POSITION_NOT_FOUND);
    }
    auto pos = acc->second.positions.find(market);
    if (pos == acc->second.positions.end() || pos->second.size_x18 == 0) {
        return reject(errors::POSITION_NOT_FOUND);
    }
    if (size_x18 > abs128(pos->second.size_x18)) {
        return reject(errors::INVALID_AMOUNT);
    }

    I128 delta = pos->second.size_x18 > 0 ? -size_x18 : size_x18;
    return execute_trade(account, market, delta, price_limit_x18, out);
}

int32_t ClearingHouse::swap(Journal& txn, const MarketInfo& market, I128 base_delta_x18,
                            I128 price_limit_x18, SwapResult& out) {
    txn.touch(*market.vamm);
    if (base_delta_x18 > 0) {
        return market.vamm->buy(base_delta_x18, price_limit_x18, out);
    }
    return market.vamm->sell(-base_delta_x18, price_limit_x18, out);
}

int32_t ClearingHouse::execute_trade(const AccountId& account, MarketId market_id,
                                     I128 base_delta_x18, I128 price_limit_x18,
                                     TradeResult& out) {
    MarketInfo market;
    int32_t err = load_market(market_id, market);
    if (err != errors::OK) return reject(err);
    if (market.paused) return reject(errors::MARKET_NOT_ACTIVE);

    auto rp = risk_params_.find(market_id);
    if (rp == risk_params_.end() || !rp->second.is_set()) {
        return reject(errors::RISK_PARAMS_NOT_SET);
    }
    const MarketRiskParams& params = rp->second;

    Journal txn(ledger_, accounts_, bad_debt_);
    AccountState& state = txn.account(account);

    settle_all_funding(txn, account, state);
    if (!state.is_active(market_id)) {
        settle_funding_locked(txn, account, state, market_id, market);
    }

    I128 old_size = state.positions[market_id].size_x18;
    I128 new_size = old_size + base_delta_x18;
    bool increases = old_size == 0 || (old_size > 0) == (base_delta_x18 > 0) ||
                     abs128(base_delta_x18) > abs128(old_size);

    if (increases) {
        if (balance(&txn, account, market.quote_token) <= 0) {
            return reject(errors::INSUFFICIENT_COLLATERAL);
        }
        err = check_account_healthy(state);
        if (err != errors::OK) return reject(err);

        if (old_size == 0 && state.active_markets.size() >= max_active_markets_) {
            return reject(errors::TOO_MANY_ACTIVE_MARKETS);
        }
    }

    I128 abs_new = abs128(new_size);
    if (abs_new != 0 && params.min_position_size_x18 > 0 && abs_new < params.min_position_size_x18) {
        return reject(errors::POSITION_TOO_SMALL);
    }
    if (params.max_position_size_x18 > 0 && abs_new > params.max_position_size_x18) {
        return reject(errors::POSITION_TOO_LARGE);
    }

    SwapResult fill_swap;
    err = swap(txn, market, base_delta_x18, price_limit_x18, fill_swap);
    if (err != errors::OK) return reject(err);

    Fill fill;
    err = apply_fill(txn, account, state, market_id, market, params, fill_swap, false, fill);
    if (err != errors::OK) return reject(err);

    Position& pos = state.positions[market_id];

    // Trade fee comes out of free collateral before the margin checks
    I128 notional = x18::mul(abs128(fill_swap.base_delta_x18), fill_swap.avg_price_x18);
    I128 fee = bps_of_up(notional, market.fee_bps);
    if (fee > 0) {
        I128 fee_tokens = to_token_up(fee, market.base_unit);
        I128 free = free_locked(&txn, account, state, market.quote_token, market.base_unit);
        if (free < fee || balance(&txn, account, market.quote_token) < fee_tokens) {
            return reject(errors::INSUFFICIENT_COLLATERAL);
        }
        txn.seize(account, market.fee_router->address(), market.quote_token, fee_tokens);
        txn.trade_fee(*market.fee_router, market.quote_token, fee_tokens);
        pos.realized_pnl_x18 -= fee;
    }
    I128 realized = fill.realized_pnl_x18 - fee;

    if (pos.size_x18 != 0) {
        I128 index_price = 0;
        err = resolve_price(market, index_price);
        if (err != errors::OK) return reject(err);

        // Initial margin at the less favourable of mark and index
        auto mark = market.vamm->mark_price();
        I128 check_price = mark ? max128(*mark, index_price) : index_price;
        I128 required = bps_of_up(x18::mul_up(abs128(pos.size_x18), check_price), params.imr_bps);
        if (pos.margin_x18 < required) {
            I128 top_up = required - pos.margin_x18;
            I128 free = free_locked(&txn, account, state, market.quote_token, market.base_unit);
            if (free < top_up) {
                return reject(errors::INSUFFICIENT_COLLATERAL);
            }
            pos.margin_x18 += top_up;
        }

        if (increases && below_maintenance(pos, params, index_price, 0)) {
            return reject(errors::WOULD_BE_LIQUIDATABLE);
        }
    }

    out.base_delta_x18 = fill_swap.base_delta_x18;
    out.quote_delta_x18 = fill_swap.quote_delta_x18;
    out.exec_price_x18 = fill_swap.avg_price_x18;
    out.swap_fee_x18 = fill_swap.fee_x18;
    out.trade_fee_x18 = fee;
    out.realized_pnl_x18 = realized;
    out.size_after_x18 = pos.size_x18;
    out.margin_after_x18 = pos.margin_x18;

    PositionChangedEvent event;
    event.account = account;
    event.market = market_id;
    event.size_before_x18 = old_size;
    event.size_after_x18 = pos.size_x18;
    event.exec_price_x18 = fill_swap.avg_price_x18;
    event.quote_delta_x18 = fill_swap.quote_delta_x18;
    event.realized_pnl_x18 = realized;
    event.fee_x18 = fee;
    event.margin_after_x18 = pos.margin_x18;
    event.timestamp = clock_();
    txn.emit([this, event] { listener_->on_position_changed(event); });

    logger_->debug("trade account={} market={} delta={} price={} pnl={}",
                   addresses::to_hex(account), market_id,
                   x18::to_string(fill_swap.base_delta_x18),
                   x18::to_string(fill_swap.avg_price_x18),
                   x18::to_string(realized));

    stats_.total_trades++;
    return txn.commit();
}

int32_t ClearingHouse::apply_fill(Journal& txn, const AccountId& account, AccountState& state,
                                  MarketId market_id, const MarketInfo& market,
                                  const MarketRiskParams& params, const SwapResult& swap,
                                  bool liquidation, Fill& out) {
    Position& pos = state.positions[market_id];
    I128 old_size = pos.size_x18;
    I128 delta = swap.base_delta_x18;
    I128 exec = swap.avg_price_x18;
    I128 new_size = old_size + delta;
    I128 opened = 0;

    if (old_size == 0) {
        pos.entry_price_x18 = exec;
        pos.last_funding_index_x18 = market.vamm->cumulative_funding();
        opened = abs128(delta);
    } else if ((old_size > 0) == (delta > 0)) {
        I128 notional = x18::mul(abs128(old_size), pos.entry_price_x18) +
                        x18::mul(abs128(delta), exec);
        pos.entry_price_x18 = x18::div(notional, abs128(new_size));
        opened = abs128(delta);
    } else {
        I128 reduced = min128(abs128(delta), abs128(old_size));
        I128 pnl = x18::mul(exec - pos.entry_price_x18, reduced);
        if (old_size < 0) pnl = -pnl;

        I128 released = reduced == abs128(old_size)
            ? pos.margin_x18
            : mul_div(pos.margin_x18, reduced, abs128(old_size));
        pos.margin_x18 -= released;

        if (abs128(delta) > abs128(old_size)) {
            // Flip: the new leg starts at the fill price
            pos.entry_price_x18 = exec;
            opened = abs128(delta) - abs128(old_size);
        }

        if (pnl > 0) {
            txn.settle_pnl(account, market.quote_token, to_token_down(pnl, market.base_unit));
        } else if (pnl < 0) {
            Collection c = collect(txn, account, state, market_id, market, -pnl, released);
            txn.settle_pnl(account, market.quote_token, -c.tokens);
            if (c.shortfall_x18 > 0) {
                record_bad_debt(txn, account, market_id, c.shortfall_x18,
                                BadDebtReason::REALIZED_LOSS);
                out.bad_debt_x18 = c.shortfall_x18;
            }
        }

        pos.realized_pnl_x18 += pnl;
        out.realized_pnl_x18 = pnl;
    }

    pos.size_x18 = new_size;
    if (new_size == 0) {
        pos.entry_price_x18 = 0;
        state.deactivate(market_id);
    } else if (!state.is_active(market_id)) {
        state.active_markets.push_back(market_id);
    }

    if (opened > 0 && !liquidation) {
        I128 reserve = bps_of_up(x18::mul_up(opened, exec), params.imr_bps);
        I128 free = free_locked(&txn, account, state, market.quote_token, market.base_unit);
        if (free < reserve) {
            return errors::INSUFFICIENT_COLLATERAL;
        }
        pos.margin_x18 += reserve;
    }
    return errors::OK;
}

// =============================================================================
// Liquidation
// =============================================================================

int32_t ClearingHouse::liquidate(const AccountId& liquidator, const AccountId& account,
                                 MarketId market_id, I128 size_x18, LiquidationResult& out) {
    std::unique_lock lock(mutex_);

    if (liquidator == account) return reject(errors::SELF_LIQUIDATION);
    if (size_x18 <= 0) return reject(errors::INVALID_AMOUNT);

    MarketInfo market;
    int32_t err = load_market(market_id, market);
    if (err != errors::OK) return reject(err);

    auto rp = risk_params_.find(market_id);
    if (rp == risk_params_.end() || !rp->second.is_set()) {
        return reject(errors::RISK_PARAMS_NOT_SET);
    }
    const MarketRiskParams& params = rp->second;

    if (accounts_.find(account) == accounts_.end()) {
        return reject(errors::POSITION_NOT_FOUND);
    }

    Journal txn(ledger_, accounts_, bad_debt_);
    AccountState& state = txn.account(account);
    settle_all_funding(txn, account, state);

    auto it = state.positions.find(market_id);
    if (it == state.positions.end() || it->second.size_x18 == 0) {
        return reject(errors::POSITION_NOT_FOUND);
    }

    // Risk price captured before the closing trade moves the mark
    I128 snapshot = 0;
    err = resolve_price(market, snapshot);
    if (err != errors::OK) return reject(err);

    if (!below_maintenance(it->second, params, snapshot, 0)) {
        return reject(errors::NOT_LIQUIDATABLE);
    }

    I128 position_abs = abs128(it->second.size_x18);
    I128 close = min128(size_x18, position_abs);
    I128 remaining = position_abs - close;
    if (remaining > 0 && params.min_position_size_x18 > 0 &&
        remaining < params.min_position_size_x18) {
        return reject(errors::DUST_REMAINDER);
    }

    SwapResult fill_swap;
    err = swap(txn, market, it->second.size_x18 > 0 ? -close : close, 0, fill_swap);
    if (err != errors::OK) return reject(err);

    Fill fill;
    err = apply_fill(txn, account, state, market_id, market, params, fill_swap, true, fill);
    if (err != errors::OK) return reject(err);

    I128 penalty = bps_of(x18::mul(close, snapshot), params.liquidation_penalty_bps);
    if (params.penalty_cap_x18 > 0) {
        penalty = min128(penalty, params.penalty_cap_x18);
    }
    I128 liquidator_share = bps_of(penalty, params.liquidator_share_bps);
    I128 protocol_share = penalty - liquidator_share;

    // Liquidator is paid first out of whatever the account can cover
    Collection c = collect(txn, account, state, market_id, market, penalty, 0);
    I128 liquidator_from_account = min128(c.value_x18, liquidator_share);
    I128 protocol_from_account = c.value_x18 - liquidator_from_account;
    I128 liquidator_tokens = min128(c.tokens, to_token_down(liquidator_from_account, market.base_unit));
    I128 protocol_tokens = c.tokens - liquidator_tokens;

    txn.seize(account, liquidator, market.quote_token, liquidator_tokens);
    if (protocol_tokens > 0) {
        txn.seize(account, market.fee_router->address(), market.quote_token, protocol_tokens);
        txn.liquidation_penalty(*market.fee_router, market.quote_token, protocol_tokens);
    }

    I128 liquidator_bad_debt = 0;
    I128 protocol_bad_debt = 0;
    I128 liquidator_insured = cover_shortfall(txn, account, market_id, market, liquidator,
                                              liquidator_share - liquidator_from_account,
                                              BadDebtReason::LIQUIDATOR_PENALTY, false,
                                              liquidator_bad_debt);
    I128 protocol_insured = cover_shortfall(txn, account, market_id, market,
                                            market.fee_router->address(),
                                            protocol_share - protocol_from_account,
                                            BadDebtReason::PROTOCOL_PENALTY, true,
                                            protocol_bad_debt);

    const Position& pos = state.positions[market_id];

    out.size_x18 = close;
    out.exec_price_x18 = fill_swap.avg_price_x18;
    out.snapshot_price_x18 = snapshot;
    out.realized_pnl_x18 = fill.realized_pnl_x18;
    out.penalty_x18 = penalty;
    out.liquidator_paid_x18 = liquidator_from_account + liquidator_insured;
    out.protocol_paid_x18 = protocol_from_account + protocol_insured;
    out.insurance_paid_x18 = liquidator_insured + protocol_insured;
    out.bad_debt_x18 = fill.bad_debt_x18 + liquidator_bad_debt + protocol_bad_debt;
    out.remaining_size_x18 = abs128(pos.size_x18);

    uint64_t now = clock_();

    PositionChangedEvent changed;
    changed.account = account;
    changed.market = market_id;
    changed.size_before_x18 = pos.size_x18 - fill_swap.base_delta_x18;
    changed.size_after_x18 = pos.size_x18;
    changed.exec_price_x18 = fill_swap.avg_price_x18;
    changed.quote_delta_x18 = fill_swap.quote_delta_x18;
    changed.realized_pnl_x18 = fill.realized_pnl_x18;
    changed.margin_after_x18 = pos.margin_x18;
    changed.liquidation = true;
    changed.timestamp = now;

    LiquidationEvent event;
    event.account = account;
    event.liquidator = liquidator;
    event.market = market_id;
    event.size_x18 = close;
    event.exec_price_x18 = out.exec_price_x18;
    event.snapshot_price_x18 = snapshot;
    event.realized_pnl_x18 = out.realized_pnl_x18;
    event.penalty_x18 = penalty;
    event.liquidator_paid_x18 = out.liquidator_paid_x18;
    event.protocol_paid_x18 = out.protocol_paid_x18;
    event.insurance_paid_x18 = out.insurance_paid_x18;
    event.bad_debt_x18 = out.bad_debt_x18;
    event.timestamp = now;

    txn.emit([this, changed, event] {
        listener_->on_position_changed(changed);
        listener_->on_liquidation(event);
    });

    logger_->info("liquidated account={} market={} size={} price={} penalty={} bad_debt={}",
                  addresses::to_hex(account), market_id, x18::to_string(close),
                  x18::to_string(out.exec_price_x18), x18::to_string(penalty),
                  x18::to_string(out.bad_debt_x18));

    stats_.total_liquidations++;
    return txn.commit();
}

// =============================================================================
// Margin & Funding
// =============================================================================

int32_t ClearingHouse::add_margin(const AccountId& account, MarketId market_id, I128 amount_x18) {
    std::unique_lock lock(mutex_);
    if (amount_x18 <= 0) return reject(errors::INVALID_AMOUNT);

    MarketInfo market;
    int32_t err = load_market(market_id, market);
    if (err != errors::OK) return reject(err);
    if (accounts_.find(account) == accounts_.end()) {
        return reject(errors::POSITION_NOT_FOUND);
    }

    Journal txn(ledger_, accounts_, bad_debt_);
    AccountState& state = txn.account(account);
    settle_all_funding(txn, account, state);

    auto it = state.positions.find(market_id);
    if (it == state.positions.end() || it->second.size_x18 == 0) {
        return reject(errors::POSITION_NOT_FOUND);
    }

    I128 free = free_locked(&txn, account, state, market.quote_token, market.base_unit);
    if (free < amount_x18) {
        return reject(errors::INSUFFICIENT_COLLATERAL);
    }

    it->second.margin_x18 += amount_x18;
    return txn.commit();
}

int32_t ClearingHouse::remove_margin(const AccountId& account, MarketId market_id, I128 amount_x18) {
    std::unique_lock lock(mutex_);
    if (amount_x18 <= 0) return reject(errors::INVALID_AMOUNT);

    MarketInfo market;
    int32_t err = load_market(market_id, market);
    if (err != errors::OK) return reject(err);

    auto rp = risk_params_.find(market_id);
    if (rp == risk_params_.end() || !rp->second.is_set()) {
        return reject(errors::RISK_PARAMS_NOT_SET);
    }
    if (accounts_.find(account) == accounts_.end()) {
        return reject(errors::POSITION_NOT_FOUND);
    }

    Journal txn(ledger_, accounts_, bad_debt_);
    AccountState& state = txn.account(account);
    settle_all_funding(txn, account, state);

    auto it = state.positions.find(market_id);
    if (it == state.positions.end() || it->second.size_x18 == 0) {
        return reject(errors::POSITION_NOT_FOUND);
    }
    Position& pos = it->second;
    if (amount_x18 > pos.margin_x18) {
        return reject(errors::INSUFFICIENT_MARGIN);
    }
    pos.margin_x18 -= amount_x18;

    I128 price = 0;
    err = resolve_price(market, price);
    if (err != errors::OK) return reject(err);
    if (below_maintenance(pos, rp->second, price, 0)) {
        return reject(errors::WOULD_BE_LIQUIDATABLE);
    }
    return txn.commit();
}

int32_t ClearingHouse::settle_funding(const AccountId& account, MarketId market_id) {
    std::unique_lock lock(mutex_);

    MarketInfo market;
    int32_t err = load_market(market_id, market);
    if (err != errors::OK) return reject(err);

    Journal txn(ledger_, accounts_, bad_debt_);
    if (accounts_.find(account) != accounts_.end()) {
        AccountState& state = txn.account(account);
        settle_funding_locked(txn, account, state, market_id, market);
    } else {
        txn.touch(*market.vamm);
        market.vamm->poke_funding();
    }

    stats_.total_funding_settlements++;
    return txn.commit();
}

// =============================================================================
// Collateral
// =============================================================================

int32_t ClearingHouse::deposit(const AccountId& account, const Currency& token, I128 amount) {
    std::unique_lock lock(mutex_);
    int32_t err = ledger_.deposit(account, token, amount);
    if (err != errors::OK) return reject(err);
    return errors::OK;
}

int32_t ClearingHouse::withdraw(const AccountId& account, const Currency& token, I128 amount) {
    std::unique_lock lock(mutex_);
    if (amount <= 0) return reject(errors::INVALID_AMOUNT);

    auto config = ledger_.token_config(token);
    if (!config) return reject(errors::TOKEN_NOT_ENABLED);

    Journal txn(ledger_, accounts_, bad_debt_);

    I128 reserved = 0;
    if (accounts_.find(account) != accounts_.end()) {
        AccountState& state = txn.account(account);
        settle_all_funding(txn, account, state);

        int32_t err = check_account_healthy(state);
        if (err != errors::OK) return reject(err);
        reserved = reserved_locked(state, token);
    }

    I128 current = txn.balance_of(account, token);
    if (current < amount) {
        return reject(errors::INSUFFICIENT_BALANCE);
    }
    if (from_token(current - amount, config->base_unit()) < reserved) {
        return reject(errors::WITHDRAW_BREACHES_MARGIN);
    }

    txn.withdraw(account, token, amount);
    return txn.commit();
}

// =============================================================================
// Admin
// =============================================================================

int32_t ClearingHouse::set_risk_params(const Address& caller, MarketId market,
                                       const MarketRiskParams& params) {
    std::unique_lock lock(mutex_);
    int32_t err = access_.require_admin(caller);
    if (err != errors::OK) return reject(err);

    if (!markets_.exists(market)) return reject(errors::MARKET_NOT_FOUND);
    if (!params.valid()) return reject(errors::INVALID_RISK_PARAMS);

    risk_params_[market] = params;
    logger_->info("market {} risk params imr={}bps mmr={}bps penalty={}bps",
                  market, params.imr_bps, params.mmr_bps, params.liquidation_penalty_bps);
    return errors::OK;
}

int32_t ClearingHouse::reset_reserves(const Address& caller, MarketId market_id,
                                      I128 price_x18, I128 base_reserve_x18) {
    std::unique_lock lock(mutex_);
    int32_t err = access_.require_admin(caller);
    if (err != errors::OK) return reject(err);

    MarketInfo market;
    err = load_market(market_id, market);
    if (err != errors::OK) return reject(err);

    err = market.vamm->reset_reserves(price_x18, base_reserve_x18);
    if (err != errors::OK) return reject(err);
    return errors::OK;
}

int32_t ClearingHouse::set_swap_fee(const Address& caller, MarketId market_id, uint32_t fee_bps) {
    std::unique_lock lock(mutex_);
    int32_t err = access_.require_admin(caller);
    if (err != errors::OK) return reject(err);

    MarketInfo market;
    err = load_market(market_id, market);
    if (err != errors::OK) return reject(err);

    err = market.vamm->set_fee_bps(fee_bps);
    if (err != errors::OK) return reject(err);
    return errors::OK;
}

int32_t ClearingHouse::set_funding_params(const Address& caller, MarketId market_id, I128 k_x18,
                                          uint32_t fr_max_bps_per_hour, uint64_t twap_window) {
    std::unique_lock lock(mutex_);
    int32_t err = access_.require_admin(caller);
    if (err != errors::OK) return reject(err);

    MarketInfo market;
    err = load_market(market_id, market);
    if (err != errors::OK) return reject(err);

    err = market.vamm->set_funding_params(k_x18, fr_max_bps_per_hour, twap_window);
    if (err != errors::OK) return reject(err);
    return errors::OK;
}

int32_t ClearingHouse::set_market_paused(const Address& caller, MarketId market_id, bool paused) {
    std::unique_lock lock(mutex_);
    int32_t err = access_.require_admin(caller);
    if (err != errors::OK) return reject(err);

    MarketInfo market;
    err = load_market(market_id, market);
    if (err != errors::OK) return reject(err);

    if (paused) {
        market.vamm->pause();
    } else {
        market.vamm->unpause();
    }
    err = markets_.set_paused(market_id, paused);
    if (err != errors::OK) return reject(err);

    logger_->warn("market {} {}", market_id, paused ? "paused" : "unpaused");
    return errors::OK;
}

// =============================================================================
// Reads
// =============================================================================

std::optional<Position> ClearingHouse::get_position(const AccountId& account, MarketId market) const {
    std::shared_lock lock(mutex_);
    auto acc = accounts_.find(account);
    if (acc == accounts_.end()) return std::nullopt;
    auto it = acc->second.positions.find(market);
    if (it == acc->second.positions.end()) return std::nullopt;
    return it->second;
}

std::optional<MarketRiskParams> ClearingHouse::get_risk_params(MarketId market) const {
    std::shared_lock lock(mutex_);
    auto it = risk_params_.find(market);
    if (it == risk_params_.end()) return std::nullopt;
    return it->second;
}

std::optional<I128> ClearingHouse::get_notional(const AccountId& account, MarketId market_id) const {
    std::shared_lock lock(mutex_);
    auto acc = accounts_.find(account);
    if (acc == accounts_.end()) return std::nullopt;
    auto it = acc->second.positions.find(market_id);
    if (it == acc->second.positions.end() || it->second.size_x18 == 0) return std::nullopt;

    MarketInfo market;
    if (load_market(market_id, market) != errors::OK) return std::nullopt;
    I128 price = 0;
    if (resolve_price(market, price) != errors::OK) return std::nullopt;
    return x18::mul(abs128(it->second.size_x18), price);
}

std::optional<I128> ClearingHouse::get_margin_ratio(const AccountId& account, MarketId market_id) const {
    std::shared_lock lock(mutex_);
    auto acc = accounts_.find(account);
    if (acc == accounts_.end()) return std::nullopt;
    auto it = acc->second.positions.find(market_id);
    if (it == acc->second.positions.end() || it->second.size_x18 == 0) return std::nullopt;

    MarketInfo market;
    if (load_market(market_id, market) != errors::OK) return std::nullopt;
    I128 price = 0;
    if (resolve_price(market, price) != errors::OK) return std::nullopt;

    I128 notional = x18::mul(abs128(it->second.size_x18), price);
    if (notional == 0) return std::nullopt;
    return x18::div(health(it->second, price, pending_locked(it->second, market)), notional);
}

std::optional<I128> ClearingHouse::pending_funding(const AccountId& account, MarketId market_id) const {
    std::shared_lock lock(mutex_);
    auto acc = accounts_.find(account);
    if (acc == accounts_.end()) return std::nullopt;
    auto it = acc->second.positions.find(market_id);
    if (it == acc->second.positions.end()) return std::nullopt;

    MarketInfo market;
    if (load_market(market_id, market) != errors::OK) return std::nullopt;
    return pending_locked(it->second, market);
}

std::optional<I128> ClearingHouse::risk_price(MarketId market_id) const {
    std::shared_lock lock(mutex_);
    MarketInfo market;
    if (load_market(market_id, market) != errors::OK) return std::nullopt;
    I128 price = 0;
    if (resolve_price(market, price) != errors::OK) return std::nullopt;
    return price;
}

bool ClearingHouse::is_liquidatable(const AccountId& account, MarketId market_id) const {
    std::shared_lock lock(mutex_);
    auto acc = accounts_.find(account);
    if (acc == accounts_.end()) return false;
    auto it = acc->second.positions.find(market_id);
    if (it == acc->second.positions.end() || it->second.size_x18 == 0) return false;

    auto rp = risk_params_.find(market_id);
    if (rp == risk_params_.end()) return false;

    MarketInfo market;
    if (load_market(market_id, market) != errors::OK) return false;
    I128 price = 0;
    if (resolve_price(market, price) != errors::OK) return false;

    return below_maintenance(it->second, rp->second, price, pending_locked(it->second, market));
}

I128 ClearingHouse::get_account_value(const AccountId& account) const {
    std::shared_lock lock(mutex_);
    I128 value = ledger_.account_collateral_value(account);

    auto acc = accounts_.find(account);
    if (acc == accounts_.end()) return value;

    for (MarketId market_id : acc->second.active_markets) {
        auto it = acc->second.positions.find(market_id);
        if (it == acc->second.positions.end()) continue;

        MarketInfo market;
        if (load_market(market_id, market) != errors::OK) continue;
        I128 price = 0;
        if (resolve_price(market, price) != errors::OK) continue;

        // Margin is already part of the collateral valuation
        value += health(it->second, price, pending_locked(it->second, market)) - it->second.margin_x18;
    }
    return value;
}

I128 ClearingHouse::free_collateral(const AccountId& account, const Currency& token) const {
    std::shared_lock lock(mutex_);
    I128 unit = unit_of(token);
    auto acc = accounts_.find(account);
    if (acc == accounts_.end()) {
        return from_token(ledger_.balance_of(account, token), unit);
    }
    return free_locked(nullptr, account, acc->second, token, unit);
}

I128 ClearingHouse::reserved_margin(const AccountId& account, const Currency& token) const {
    std::shared_lock lock(mutex_);
    auto acc = accounts_.find(account);
    if (acc == accounts_.end()) return 0;
    return reserved_locked(acc->second, token);
}

std::vector<MarketId> ClearingHouse::active_markets(const AccountId& account) const {
    std::shared_lock lock(mutex_);
    auto acc = accounts_.find(account);
    if (acc == accounts_.end()) return {};
    return acc->second.active_markets;
}

I128 ClearingHouse::total_bad_debt() const {
    std::shared_lock lock(mutex_);
    return bad_debt_.total_x18;
}

I128 ClearingHouse::market_bad_debt(MarketId market) const {
    std::shared_lock lock(mutex_);
    auto it = bad_debt_.by_market.find(market);
    return it == bad_debt_.by_market.end() ? 0 : it->second;
}

ClearingHouse::Stats ClearingHouse::get_stats() const {
    std::shared_lock lock(mutex_);
    return stats_;
}

} // namespace vperp
