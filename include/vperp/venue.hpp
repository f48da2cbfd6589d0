#ifndef VPERP_VENUE_HPP
#define VPERP_VENUE_HPP

// =============================================================================
// Venue - Full perpetual-futures stack
//
//   CollateralVault  custody of collateral tokens
//   MarketRegistry   market directory (vAMM, index source, fees, tokens)
//   ClearingHouse    positions, margin, funding settlement, liquidations
//   InsuranceFund    backstop for liquidation shortfalls
//   FeeRouter        trade fee / penalty split to insurance and treasury
//   AccessControl    admin set for privileged operations
// =============================================================================

#include <map>
#include <memory>
#include <string>

#include "types.hpp"
#include "config.hpp"
#include "vault.hpp"
#include "market.hpp"
#include "access.hpp"
#include "insurance.hpp"
#include "fee_router.hpp"
#include "oracle.hpp"
#include "vamm.hpp"
#include "clearing_house.hpp"
#include "risk.hpp"

namespace vperp {

class Venue {
public:
    // Throws ConfigError when a token or market is rejected
    explicit Venue(const VenueConfig& config, Clock clock = system_clock_seconds);
    ~Venue();

    // Non-copyable
    Venue(const Venue&) = delete;
    Venue& operator=(const Venue&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    CollateralVault& vault() { return *vault_; }
    MarketRegistry& markets() { return *markets_; }
    AccessControl& access() { return *access_; }
    InsuranceFund& insurance_fund() { return *insurance_; }
    FeeRouter& fee_router() { return *fee_router_; }
    ClearingHouse& clearing_house() { return *clearing_house_; }
    const ClearingHouse& clearing_house() const { return *clearing_house_; }
    RiskEngine& risk() { return *risk_; }

    Vamm* vamm(MarketId market);
    ManualPriceSource* index_source(MarketId market);

    // Address of the configured quote token, or nullopt for an unknown symbol
    std::optional<Currency> token(const std::string& symbol) const;

    // =========================================================================
    // Setup
    // =========================================================================

    int32_t add_token(const TokenSpec& spec);

    // vAMM + index source + registry entry + risk params
    int32_t create_market(const MarketSpec& spec);

    const Address& admin() const { return config_.admin; }
    const VenueConfig& config() const { return config_; }

    static constexpr const char* version() { return "1.0.0"; }

private:
    VenueConfig config_;
    Clock clock_;

    std::unique_ptr<CollateralVault> vault_;
    std::unique_ptr<MarketRegistry> markets_;
    std::unique_ptr<AccessControl> access_;
    std::unique_ptr<InsuranceFund> insurance_;
    std::unique_ptr<FeeRouter> fee_router_;
    std::unique_ptr<ClearingHouse> clearing_house_;
    std::unique_ptr<RiskEngine> risk_;

    std::map<std::string, TokenSpec> tokens_;
    std::map<MarketId, std::unique_ptr<ManualPriceSource>> index_sources_;
    std::map<MarketId, std::unique_ptr<Vamm>> vamms_;
};

} // namespace vperp

#endif // VPERP_VENUE_HPP
