#ifndef VPERP_CONFIG_HPP
#define VPERP_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "types.hpp"
#include "position.hpp"
#include "vamm.hpp"

namespace vperp {

// Malformed or inconsistent configuration
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Venue Configuration (JSON; decimal values are strings)
// =============================================================================

struct TokenSpec {
    std::string symbol;
    Address address{};
    uint8_t decimals = 6;
    I128 price_x18 = X18_ONE;
    uint32_t haircut_bps = 0;
    bool enabled = true;
};

struct MarketSpec {
    MarketId id = 0;
    std::string symbol;
    std::string quote_token;         // Symbol of a configured token
    Address base_token{};
    I128 index_price_x18 = 0;        // Initial price of the market's index source
    uint32_t trade_fee_bps = 0;
    VammConfig vamm;
    MarketRiskParams risk;
};

struct VenueConfig {
    std::string log_level = "info";
    size_t max_active_markets = 16;

    Address admin = addresses::from_u16(0x0001);
    Address treasury = addresses::from_u16(0x0002);
    Address insurance_fund = addresses::from_u16(0x0003);
    Address fee_router = addresses::from_u16(0x0004);

    uint32_t trade_to_fund_bps = 5000;
    uint32_t liq_to_fund_bps = 5000;

    std::vector<TokenSpec> tokens;
    std::vector<MarketSpec> markets;

    // Throws ConfigError
    static VenueConfig from_file(const std::string& path);
    static VenueConfig from_json_string(const std::string& content);

    // Throws ConfigError on the first inconsistency
    void validate() const;

    const TokenSpec* find_token(const std::string& symbol) const;
};

} // namespace vperp

#endif // VPERP_CONFIG_HPP
