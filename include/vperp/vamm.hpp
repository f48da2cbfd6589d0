#ifndef VPERP_VAMM_HPP
#define VPERP_VAMM_HPP

#include <memory>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

#include "types.hpp"
#include "oracle.hpp"

namespace vperp {

// =============================================================================
// vAMM Configuration
// =============================================================================

struct VammConfig {
    I128 initial_price_x18 = 0;
    I128 initial_base_reserve_x18 = 0;
    uint32_t fee_bps = 0;                 // Input-side swap fee, at most 300
    uint32_t fr_max_bps_per_hour = 0;     // Funding clamp relative to index
    I128 funding_k_x18 = X18_ONE;         // Fraction of the premium paid per day
    uint64_t funding_twap_window = 3600;  // Seconds
    I128 min_reserve_base_x18 = 0;
    I128 min_reserve_quote_x18 = 0;
    size_t observation_slots = 64;
};

// =============================================================================
// Swap Result (trader's perspective)
// =============================================================================

struct SwapResult {
    I128 base_delta_x18 = 0;   // + bought, - sold
    I128 quote_delta_x18 = 0;  // - paid, + received
    I128 avg_price_x18 = 0;
    I128 fee_x18 = 0;          // Fee in quote terms
};

// =============================================================================
// TWAP Observation
// =============================================================================

struct Observation {
    uint64_t timestamp = 0;
    I128 cumulative_price_x18 = 0;        // Sum of mark * active seconds
    uint64_t cumulative_active_seconds = 0;
};

// =============================================================================
// Funding Update
// =============================================================================

struct FundingUpdate {
    bool applied = false;         // False when the index was unavailable
    I128 delta_x18 = 0;           // Change of the cumulative funding index
    I128 index_price_x18 = 0;
    I128 premium_x18 = 0;
    uint64_t elapsed = 0;
};

// =============================================================================
// Vamm - Virtual constant-product pricing and funding engine
//
// Not internally synchronized. A Vamm is owned by a single writer (the
// clearing house) which serializes every call.
// =============================================================================

class Vamm {
public:
    static constexpr uint32_t MAX_FEE_BPS = 300;
    static constexpr uint32_t MAX_RESET_MOVE_BPS = 1000;
    static constexpr uint64_t MAX_FUNDING_ELAPSED = 3600;
    static constexpr uint64_t FUNDING_PERIOD = 86400;
    static constexpr uint64_t SECONDS_PER_HOUR = 3600;

    // Complete mutable state, captured for transactional rollback
    struct State {
        VammConfig config;
        bool initialized = false;
        bool paused = false;
        I128 reserve_base_x18 = 0;
        I128 reserve_quote_x18 = 0;
        I128 fee_growth_global_x18 = 0;
        I128 total_fees_x18 = 0;
        I128 cumulative_funding_x18 = 0;
        uint64_t last_funding_time = 0;
        uint64_t start_time = 0;
        uint64_t last_accumulate_time = 0;
        I128 cumulative_price_x18 = 0;
        uint64_t cumulative_active_seconds = 0;
        std::vector<Observation> observations;
        size_t next_observation = 0;
        size_t observation_count = 0;
        uint64_t swap_count = 0;
    };

    explicit Vamm(const IPriceSource* index_source, Clock clock = system_clock_seconds);
    ~Vamm() = default;

    Vamm(const Vamm&) = delete;
    Vamm& operator=(const Vamm&) = delete;

    // Sets reserves from price and base reserve; INVALID_FEE if fee > 300
    int32_t initialize(const VammConfig& config);
    bool initialized() const { return state_.initialized; }

    // =========================================================================
    // Swaps
    // =========================================================================

    // Buy exactly base_out; average price must not exceed price_limit (0 = none)
    int32_t buy(I128 base_out_x18, I128 price_limit_x18, SwapResult& out);

    // Sell exactly base_in; average price must not fall below price_limit (0 = none)
    int32_t sell(I128 base_in_x18, I128 price_limit_x18, SwapResult& out);

    // =========================================================================
    // Prices
    // =========================================================================

    std::optional<I128> mark_price() const;

    // Time-weighted mark over the trailing window, excluding paused time
    int32_t twap(uint64_t window, I128& out) const;

    // =========================================================================
    // Funding
    // =========================================================================

    // Advances the cumulative funding index at most once per timestamp
    FundingUpdate poke_funding();

    // Index value poke_funding() would produce now, without mutating
    I128 preview_funding_index() const;

    I128 cumulative_funding() const { return state_.cumulative_funding_x18; }
    uint64_t last_funding_time() const { return state_.last_funding_time; }

    // =========================================================================
    // Admin
    // =========================================================================

    // Emergency re-centering; the new mark may move at most 10% from the current one
    int32_t reset_reserves(I128 price_x18, I128 base_reserve_x18);
    int32_t set_fee_bps(uint32_t fee_bps);
    int32_t set_funding_params(I128 k_x18, uint32_t fr_max_bps_per_hour, uint64_t twap_window);
    int32_t set_min_reserves(I128 min_base_x18, I128 min_quote_x18);
    void pause();
    void unpause();
    bool paused() const { return state_.paused; }

    // =========================================================================
    // State
    // =========================================================================

    I128 reserve_base() const { return state_.reserve_base_x18; }
    I128 reserve_quote() const { return state_.reserve_quote_x18; }
    I128 fee_growth_global() const { return state_.fee_growth_global_x18; }
    I128 total_fees() const { return state_.total_fees_x18; }
    uint32_t fee_bps() const { return state_.config.fee_bps; }
    const VammConfig& config() const { return state_.config; }
    size_t observation_count() const { return state_.observation_count; }
    uint64_t swap_count() const { return state_.swap_count; }
    uint64_t now() const { return clock_(); }

    State snapshot() const { return state_; }
    void restore(const State& state) { state_ = state; }

private:
    // Folds mark * elapsed active time into the accumulator up to now
    void accumulate(uint64_t now);
    void write_observation(uint64_t now);
    int32_t twap_at(uint64_t now, uint64_t window, I128& out) const;
    FundingUpdate compute_funding(uint64_t now) const;
    int32_t check_floors(I128 base_x18, I128 quote_x18) const;

    const IPriceSource* index_source_;
    Clock clock_;
    State state_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace vperp

#endif // VPERP_VAMM_HPP
