// =============================================================================
// market.cpp - Market registry
// =============================================================================

#include "vperp/market.hpp"

#include <mutex>

namespace vperp {

int32_t MarketRegistry::create_market(const MarketInfo& info) {
    if (info.vamm == nullptr || info.fee_router == nullptr ||
        info.insurance_fund == nullptr || info.base_unit <= 0) {
        return errors::INVALID_CONFIG;
    }
    if (info.fee_bps > 10000) {
        return errors::INVALID_FEE;
    }

    std::unique_lock lock(mutex_);
    if (markets_.find(info.id) != markets_.end()) {
        return errors::ALREADY_EXISTS;
    }
    markets_[info.id] = info;
    return errors::OK;
}

std::optional<MarketInfo> MarketRegistry::get_market(MarketId id) const {
    std::shared_lock lock(mutex_);
    auto it = markets_.find(id);
    if (it == markets_.end()) return std::nullopt;
    return it->second;
}

int32_t MarketRegistry::set_paused(MarketId id, bool paused) {
    std::unique_lock lock(mutex_);
    auto it = markets_.find(id);
    if (it == markets_.end()) {
        return errors::MARKET_NOT_FOUND;
    }
    it->second.paused = paused;
    return errors::OK;
}

bool MarketRegistry::is_active(MarketId id) const {
    std::shared_lock lock(mutex_);
    auto it = markets_.find(id);
    return it != markets_.end() && !it->second.paused;
}

bool MarketRegistry::exists(MarketId id) const {
    std::shared_lock lock(mutex_);
    return markets_.find(id) != markets_.end();
}

std::vector<MarketId> MarketRegistry::market_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<MarketId> ids;
    ids.reserve(markets_.size());
    for (const auto& [id, info] : markets_) {
        ids.push_back(id);
    }
    return ids;
}

size_t MarketRegistry::size() const {
    std::shared_lock lock(mutex_);
    return markets_.size();
}

} // namespace vperp
