#ifndef VPERP_ORACLE_HPP
#define VPERP_ORACLE_HPP

#include <atomic>
#include <optional>
#include <shared_mutex>

#include "types.hpp"

namespace vperp {

// =============================================================================
// Index Price Source Interface
// =============================================================================

class IPriceSource {
public:
    virtual ~IPriceSource() = default;

    // Latest index price (X18), or nullopt when the source is unavailable.
    // A zero price is treated by callers as unavailable.
    virtual std::optional<I128> get_price() const = 0;
};

// =============================================================================
// ManualPriceSource - price pushed by an operator or a test
// =============================================================================

class ManualPriceSource : public IPriceSource {
public:
    explicit ManualPriceSource(I128 price_x18 = 0);

    std::optional<I128> get_price() const override;

    void set_price(I128 price_x18);

    // While failing, get_price() returns nullopt
    void set_failing(bool failing);
    bool is_failing() const { return failing_.load(std::memory_order_acquire); }

    uint64_t update_count() const { return updates_.load(std::memory_order_relaxed); }

private:
    mutable std::shared_mutex mutex_;
    I128 price_x18_;
    std::atomic<bool> failing_{false};
    std::atomic<uint64_t> updates_{0};
};

} // namespace vperp

#endif // VPERP_ORACLE_HPP
