// =============================================================================
// vamm.cpp - Virtual AMM pricing, TWAP and funding
// =============================================================================

#include "vperp/vamm.hpp"
#include "vperp/math.hpp"
#include "vperp/log.hpp"

#include <algorithm>

namespace vperp {

Vamm::Vamm(const IPriceSource* index_source, Clock clock)
    : index_source_(index_source), clock_(std::move(clock)), logger_(log::get()) {}

// =============================================================================
// Initialization
// =============================================================================

int32_t Vamm::initialize(const VammConfig& config) {
    if (state_.initialized) {
        return errors::ALREADY_EXISTS;
    }
    if (config.fee_bps > MAX_FEE_BPS) {
        return errors::INVALID_FEE;
    }
    if (config.initial_price_x18 <= 0 || config.initial_base_reserve_x18 <= 0) {
        return errors::INVALID_PRICE;
    }
    if (config.observation_slots == 0 || config.funding_k_x18 < 0 ||
        config.min_reserve_base_x18 < 0 || config.min_reserve_quote_x18 < 0) {
        return errors::INVALID_CONFIG;
    }

    I128 quote = x18::mul(config.initial_price_x18, config.initial_base_reserve_x18);
    if (quote <= 0) {
        return errors::INVALID_PRICE;
    }

    State state;
    state.config = config;
    state.reserve_base_x18 = config.initial_base_reserve_x18;
    state.reserve_quote_x18 = quote;
    if (config.initial_base_reserve_x18 < config.min_reserve_base_x18 ||
        quote < config.min_reserve_quote_x18) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    uint64_t now = clock_();
    state.initialized = true;
    state.start_time = now;
    state.last_accumulate_time = now;
    state.last_funding_time = now;
    state.observations.resize(config.observation_slots);
    state_ = std::move(state);
    write_observation(now);

    logger_->info("vamm initialized price={} base_reserve={} fee_bps={}",
                  x18::to_string(config.initial_price_x18),
                  x18::to_string(config.initial_base_reserve_x18),
                  config.fee_bps);
    return errors::OK;
}

// =============================================================================
// Swaps
// =============================================================================

int32_t Vamm::buy(I128 base_out_x18, I128 price_limit_x18, SwapResult& out) {
    if (!state_.initialized) return errors::NOT_INITIALIZED;
    if (state_.paused) return errors::SWAPS_PAUSED;
    if (base_out_x18 <= 0) return errors::INVALID_AMOUNT;

    I128 rb = state_.reserve_base_x18;
    I128 rq = state_.reserve_quote_x18;
    if (base_out_x18 >= rb) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }

    I128 new_base = rb - base_out_x18;

    // Quote that must enter the pool (before fee) to release base_out
    I128 net_in = mul_div_up(rq, base_out_x18, new_base);
    I128 gross_in = mul_div_up(net_in, BPS_DENOMINATOR,
                               BPS_DENOMINATOR - state_.config.fee_bps);
    I128 fee = gross_in - net_in;
    I128 avg_price = mul_div_up(gross_in, X18_ONE, base_out_x18);

    if (price_limit_x18 > 0 && avg_price > price_limit_x18) {
        return errors::PRICE_LIMIT_EXCEEDED;
    }

    I128 new_quote = rq + gross_in;
    int32_t err = check_floors(new_base, new_quote);
    if (err != errors::OK) return err;

    uint64_t now = clock_();
    accumulate(now);

    state_.reserve_base_x18 = new_base;
    state_.reserve_quote_x18 = new_quote;
    state_.fee_growth_global_x18 += mul_div(fee, X18_ONE, new_base);
    state_.total_fees_x18 += fee;
    state_.swap_count++;

    write_observation(now);

    out.base_delta_x18 = base_out_x18;
    out.quote_delta_x18 = -gross_in;
    out.avg_price_x18 = avg_price;
    out.fee_x18 = fee;
    return errors::OK;
}

int32_t Vamm::sell(I128 base_in_x18, I128 price_limit_x18, SwapResult& out) {
    if (!state_.initialized) return errors::NOT_INITIALIZED;
    if (state_.paused) return errors::SWAPS_PAUSED;
    if (base_in_x18 <= 0) return errors::INVALID_AMOUNT;

    I128 rb = state_.reserve_base_x18;
    I128 rq = state_.reserve_quote_x18;

    // Fee is taken from the base input before the product formula
    I128 net_in = mul_div(base_in_x18, BPS_DENOMINATOR - state_.config.fee_bps,
                          BPS_DENOMINATOR);
    I128 quote_out = mul_div(rq, net_in, rb + net_in);
    if (quote_out <= 0) {
        return errors::INVALID_AMOUNT;
    }

    I128 quote_without_fee = mul_div(rq, base_in_x18, rb + base_in_x18);
    I128 fee = max128(quote_without_fee - quote_out, 0);
    I128 avg_price = mul_div(quote_out, X18_ONE, base_in_x18);

    if (price_limit_x18 > 0 && avg_price < price_limit_x18) {
        return errors::PRICE_LIMIT_EXCEEDED;
    }

    I128 new_base = rb + base_in_x18;
    I128 new_quote = rq - quote_out;
    int32_t err = check_floors(new_base, new_quote);
    if (err != errors::OK) return err;

    uint64_t now = clock_();
    accumulate(now);

    state_.reserve_base_x18 = new_base;
    state_.reserve_quote_x18 = new_quote;
    state_.fee_growth_global_x18 += mul_div(fee, X18_ONE, new_base);
    state_.total_fees_x18 += fee;
    state_.swap_count++;

    write_observation(now);

    out.base_delta_x18 = -base_in_x18;
    out.quote_delta_x18 = quote_out;
    out.avg_price_x18 = avg_price;
    out.fee_x18 = fee;
    return errors::OK;
}

int32_t Vamm::check_floors(I128 base_x18, I128 quote_x18) const {
    if (base_x18 <= 0 || quote_x18 <= 0) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }
    if (base_x18 < state_.config.min_reserve_base_x18 ||
        quote_x18 < state_.config.min_reserve_quote_x18) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }
    return errors::OK;
}

// =============================================================================
// Prices
// =============================================================================

std::optional<I128> Vamm::mark_price() const {
    if (!state_.initialized || state_.reserve_base_x18 <= 0) {
        return std::nullopt;
    }
    return x18::div(state_.reserve_quote_x18, state_.reserve_base_x18);
}

int32_t Vamm::twap(uint64_t window, I128& out) const {
    return twap_at(clock_(), window, out);
}

int32_t Vamm::twap_at(uint64_t now, uint64_t window, I128& out) const {
    if (!state_.initialized) return errors::NOT_INITIALIZED;

    auto mark = mark_price();
    if (!mark) return errors::INVALID_PRICE;

    uint64_t age = now > state_.start_time ? now - state_.start_time : 0;
    if (window > age) {
        window = age;
    }
    if (window == 0) {
        out = *mark;
        return errors::OK;
    }

    // Accumulator extended to now without mutating state
    I128 cum_price = state_.cumulative_price_x18;
    uint64_t cum_active = state_.cumulative_active_seconds;
    if (!state_.paused && now > state_.last_accumulate_time) {
        uint64_t dt = now - state_.last_accumulate_time;
        cum_price += *mark * static_cast<I128>(dt);
        cum_active += dt;
    }

    uint64_t target = now - window;
    size_t slots = state_.observations.size();
    const Observation* chosen = nullptr;
    const Observation* oldest = nullptr;

    // Newest to oldest
    for (size_t i = 0; i < state_.observation_count; ++i) {
        size_t idx = (state_.next_observation + slots - 1 - i) % slots;
        const Observation& obs = state_.observations[idx];
        oldest = &obs;
        if (obs.timestamp <= target) {
            chosen = &obs;
            break;
        }
    }
    if (!chosen) {
        chosen = oldest;
    }

    if (!chosen || chosen->timestamp > now ||
        (now - chosen->timestamp) * 2 < window) {
        return errors::TWAP_INSUFFICIENT_HISTORY;
    }

    uint64_t active = cum_active - chosen->cumulative_active_seconds;
    if (active == 0) {
        // Paused for the whole interval
        out = *mark;
        return errors::OK;
    }

    out = (cum_price - chosen->cumulative_price_x18) / static_cast<I128>(active);
    return errors::OK;
}

void Vamm::accumulate(uint64_t now) {
    if (now <= state_.last_accumulate_time) return;

    if (!state_.paused && state_.reserve_base_x18 > 0) {
        uint64_t dt = now - state_.last_accumulate_time;
        I128 mark = x18::div(state_.reserve_quote_x18, state_.reserve_base_x18);
        state_.cumulative_price_x18 += mark * static_cast<I128>(dt);
        state_.cumulative_active_seconds += dt;
    }
    state_.last_accumulate_time = now;
}

void Vamm::write_observation(uint64_t now) {
    size_t slots = state_.observations.size();
    if (slots == 0) return;

    Observation obs;
    obs.timestamp = now;
    obs.cumulative_price_x18 = state_.cumulative_price_x18;
    obs.cumulative_active_seconds = state_.cumulative_active_seconds;

    // One observation per timestamp
    if (state_.observation_count > 0) {
        size_t last = (state_.next_observation + slots - 1) % slots;
        if (state_.observations[last].timestamp == now) {
            state_.observations[last] = obs;
            return;
        }
    }

    state_.observations[state_.next_observation] = obs;
    state_.next_observation = (state_.next_observation + 1) % slots;
    if (state_.observation_count < slots) {
        state_.observation_count++;
    }
}

// =============================================================================
// Funding
// =============================================================================

FundingUpdate Vamm::compute_funding(uint64_t now) const {
    FundingUpdate update;
    if (now <= state_.last_funding_time) {
        return update;
    }
    update.elapsed = std::min<uint64_t>(now - state_.last_funding_time, MAX_FUNDING_ELAPSED);

    if (!index_source_) {
        return update;
    }
    auto index = index_source_->get_price();
    if (!index || *index <= 0) {
        return update;
    }

    I128 reference = 0;
    if (twap_at(now, state_.config.funding_twap_window, reference) != errors::OK) {
        auto mark = mark_price();
        if (!mark) return update;
        reference = *mark;
    }

    I128 premium = reference - *index;
    I128 elapsed = static_cast<I128>(update.elapsed);
    I128 rate = mul_div(x18::mul(premium, state_.config.funding_k_x18),
                        elapsed, static_cast<I128>(FUNDING_PERIOD));

    I128 max_rate = mul_div(bps_of(*index, state_.config.fr_max_bps_per_hour),
                            elapsed, static_cast<I128>(SECONDS_PER_HOUR));
    if (rate > max_rate) rate = max_rate;
    if (rate < -max_rate) rate = -max_rate;

    update.applied = true;
    update.delta_x18 = rate;
    update.index_price_x18 = *index;
    update.premium_x18 = premium;
    return update;
}

FundingUpdate Vamm::poke_funding() {
    if (!state_.initialized) {
        return FundingUpdate{};
    }
    uint64_t now = clock_();
    if (now <= state_.last_funding_time) {
        return FundingUpdate{};
    }

    FundingUpdate update = compute_funding(now);
    if (update.applied) {
        state_.cumulative_funding_x18 += update.delta_x18;
    } else {
        logger_->warn("index price unavailable, funding deferred ({}s skipped)", update.elapsed);
    }
    state_.last_funding_time = now;
    return update;
}

I128 Vamm::preview_funding_index() const {
    if (!state_.initialized) {
        return state_.cumulative_funding_x18;
    }
    FundingUpdate update = compute_funding(clock_());
    return state_.cumulative_funding_x18 + update.delta_x18;
}

// =============================================================================
// Admin
// =============================================================================

int32_t Vamm::reset_reserves(I128 price_x18, I128 base_reserve_x18) {
    if (!state_.initialized) return errors::NOT_INITIALIZED;
    if (price_x18 <= 0 || base_reserve_x18 <= 0) {
        return errors::INVALID_PRICE;
    }

    auto mark = mark_price();
    if (!mark) return errors::INVALID_PRICE;

    if (abs128(price_x18 - *mark) > bps_of(*mark, MAX_RESET_MOVE_BPS)) {
        return errors::RESET_BOUND_EXCEEDED;
    }

    I128 new_quote = x18::mul(price_x18, base_reserve_x18);
    int32_t err = check_floors(base_reserve_x18, new_quote);
    if (err != errors::OK) return err;

    uint64_t now = clock_();
    accumulate(now);
    state_.reserve_base_x18 = base_reserve_x18;
    state_.reserve_quote_x18 = new_quote;
    write_observation(now);

    logger_->warn("vamm reserves reset price={} (was {}) base_reserve={}",
                  x18::to_string(price_x18), x18::to_string(*mark),
                  x18::to_string(base_reserve_x18));
    return errors::OK;
}

int32_t Vamm::set_fee_bps(uint32_t fee_bps) {
    if (fee_bps > MAX_FEE_BPS) {
        return errors::INVALID_FEE;
    }
    state_.config.fee_bps = fee_bps;
    return errors::OK;
}

int32_t Vamm::set_funding_params(I128 k_x18, uint32_t fr_max_bps_per_hour, uint64_t twap_window) {
    if (k_x18 < 0) {
        return errors::INVALID_CONFIG;
    }
    // Accrue the elapsed interval under the old parameters
    poke_funding();

    state_.config.funding_k_x18 = k_x18;
    state_.config.fr_max_bps_per_hour = fr_max_bps_per_hour;
    state_.config.funding_twap_window = twap_window;
    return errors::OK;
}

int32_t Vamm::set_min_reserves(I128 min_base_x18, I128 min_quote_x18) {
    if (min_base_x18 < 0 || min_quote_x18 < 0) {
        return errors::INVALID_AMOUNT;
    }
    if (state_.initialized &&
        (state_.reserve_base_x18 < min_base_x18 || state_.reserve_quote_x18 < min_quote_x18)) {
        return errors::INSUFFICIENT_LIQUIDITY;
    }
    state_.config.min_reserve_base_x18 = min_base_x18;
    state_.config.min_reserve_quote_x18 = min_quote_x18;
    return errors::OK;
}

void Vamm::pause() {
    if (!state_.initialized || state_.paused) return;
    uint64_t now = clock_();
    accumulate(now);
    write_observation(now);
    state_.paused = true;
}

void Vamm::unpause() {
    if (!state_.initialized || !state_.paused) return;
    uint64_t now = clock_();
    state_.last_accumulate_time = std::max(state_.last_accumulate_time, now);
    state_.paused = false;
    write_observation(now);
}

} // namespace vperp
