#ifndef VPERP_MARKET_HPP
#define VPERP_MARKET_HPP

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "types.hpp"

namespace vperp {

class Vamm;
class IPriceSource;
class IFeeDistributor;
class IInsuranceFund;

// =============================================================================
// Market Directory Entry
// =============================================================================

struct MarketInfo {
    MarketId id = 0;
    std::string symbol;
    Vamm* vamm = nullptr;
    const IPriceSource* oracle = nullptr;
    uint32_t fee_bps = 0;                   // Clearing-house trade fee
    IFeeDistributor* fee_router = nullptr;
    IInsuranceFund* insurance_fund = nullptr;
    Currency quote_token;
    Currency base_token;
    I128 base_unit = 0;                     // 10^decimals of the quote token
    bool paused = false;
};

// =============================================================================
// MarketRegistry - Market configuration directory
// =============================================================================

class MarketRegistry {
public:
    MarketRegistry() = default;

    MarketRegistry(const MarketRegistry&) = delete;
    MarketRegistry& operator=(const MarketRegistry&) = delete;

    int32_t create_market(const MarketInfo& info);
    std::optional<MarketInfo> get_market(MarketId id) const;
    int32_t set_paused(MarketId id, bool paused);

    // Exists and not paused
    bool is_active(MarketId id) const;
    bool exists(MarketId id) const;

    std::vector<MarketId> market_ids() const;
    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<MarketId, MarketInfo> markets_;
};

} // namespace vperp

#endif // VPERP_MARKET_HPP
