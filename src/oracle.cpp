// =============================================================================
// oracle.cpp - Manual index price source
// =============================================================================

#include "vperp/oracle.hpp"
#include <mutex>

namespace vperp {

ManualPriceSource::ManualPriceSource(I128 price_x18) : price_x18_(price_x18) {}

std::optional<I128> ManualPriceSource::get_price() const {
    if (failing_.load(std::memory_order_acquire)) return std::nullopt;
    std::shared_lock lock(mutex_);
    return price_x18_;
}

void ManualPriceSource::set_price(I128 price_x18) {
    std::unique_lock lock(mutex_);
    price_x18_ = price_x18;
    updates_.fetch_add(1, std::memory_order_relaxed);
}

void ManualPriceSource::set_failing(bool failing) {
    failing_.store(failing, std::memory_order_release);
}

} // namespace vperp
