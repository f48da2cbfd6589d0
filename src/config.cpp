// =============================================================================
// config.cpp - JSON venue configuration
// =============================================================================

#include "vperp/config.hpp"
#include "vperp/math.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>
#include <set>

namespace vperp {

namespace {

using nlohmann::json;

I128 decimal_field(const json& j, const char* key, I128 fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;

    std::string text;
    if (it->is_string()) {
        text = it->get<std::string>();
    } else if (it->is_number_integer()) {
        text = std::to_string(it->get<int64_t>());
    } else {
        throw ConfigError(std::string("'") + key + "' must be a decimal string");
    }

    I128 value = 0;
    if (!x18::parse(text, value)) {
        throw ConfigError(std::string("'") + key + "' is not a valid decimal: " + text);
    }
    return value;
}

Address address_field(const json& j, const char* key, const Address& fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (!it->is_string()) {
        throw ConfigError(std::string("'") + key + "' must be a hex address");
    }
    Address addr{};
    if (!addresses::from_hex(it->get<std::string>(), addr)) {
        throw ConfigError(std::string("'") + key + "' is not a 20-byte hex address");
    }
    return addr;
}

template <typename T>
T number_field(const json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
        throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
    }
    uint64_t value = it->get<uint64_t>();
    if (value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw ConfigError(std::string("'") + key + "' is out of range: " + std::to_string(value));
    }
    return static_cast<T>(value);
}

TokenSpec parse_token(const json& j) {
    TokenSpec token;
    token.symbol = j.at("symbol").get<std::string>();
    token.address = address_field(j, "address", token.address);
    uint32_t decimals = number_field<uint32_t>(j, "decimals", token.decimals);
    if (decimals > 30) {
        throw ConfigError("token " + token.symbol + " has more than 30 decimals");
    }
    token.decimals = static_cast<uint8_t>(decimals);
    token.price_x18 = decimal_field(j, "price", token.price_x18);
    token.haircut_bps = number_field<uint32_t>(j, "haircut_bps", token.haircut_bps);
    token.enabled = j.value("enabled", token.enabled);
    return token;
}

VammConfig parse_vamm(const json& j) {
    VammConfig vamm;
    vamm.initial_price_x18 = decimal_field(j, "price", 0);
    vamm.initial_base_reserve_x18 = decimal_field(j, "base_reserve", 0);
    vamm.fee_bps = number_field<uint32_t>(j, "fee_bps", vamm.fee_bps);
    vamm.fr_max_bps_per_hour = number_field<uint32_t>(j, "fr_max_bps_per_hour", vamm.fr_max_bps_per_hour);
    vamm.funding_k_x18 = decimal_field(j, "funding_k", vamm.funding_k_x18);
    vamm.funding_twap_window = number_field<uint64_t>(j, "twap_window", vamm.funding_twap_window);
    vamm.min_reserve_base_x18 = decimal_field(j, "min_reserve_base", vamm.min_reserve_base_x18);
    vamm.min_reserve_quote_x18 = decimal_field(j, "min_reserve_quote", vamm.min_reserve_quote_x18);
    vamm.observation_slots = number_field<size_t>(j, "observation_slots", vamm.observation_slots);
    return vamm;
}

MarketRiskParams parse_risk(const json& j) {
    MarketRiskParams risk;
    risk.imr_bps = number_field<uint32_t>(j, "imr_bps", risk.imr_bps);
    risk.mmr_bps = number_field<uint32_t>(j, "mmr_bps", risk.mmr_bps);
    risk.liquidation_penalty_bps = number_field<uint32_t>(j, "liquidation_penalty_bps",
                                                          risk.liquidation_penalty_bps);
    risk.penalty_cap_x18 = decimal_field(j, "penalty_cap", risk.penalty_cap_x18);
    risk.max_position_size_x18 = decimal_field(j, "max_position_size", risk.max_position_size_x18);
    risk.min_position_size_x18 = decimal_field(j, "min_position_size", risk.min_position_size_x18);
    risk.liquidator_share_bps = number_field<uint32_t>(j, "liquidator_share_bps",
                                                       risk.liquidator_share_bps);
    return risk;
}

MarketSpec parse_market(const json& j) {
    MarketSpec market;
    market.id = number_field<MarketId>(j, "id", market.id);
    market.symbol = j.at("symbol").get<std::string>();
    market.quote_token = j.at("quote_token").get<std::string>();
    market.base_token = address_field(j, "base_token", market.base_token);
    market.index_price_x18 = decimal_field(j, "index_price", 0);
    market.trade_fee_bps = number_field<uint32_t>(j, "trade_fee_bps", market.trade_fee_bps);
    market.vamm = parse_vamm(j.at("vamm"));
    if (j.contains("risk")) {
        market.risk = parse_risk(j.at("risk"));
    }
    if (market.index_price_x18 == 0) {
        market.index_price_x18 = market.vamm.initial_price_x18;
    }
    return market;
}

} // namespace

// =============================================================================
// Loading
// =============================================================================

VenueConfig VenueConfig::from_file(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
}

VenueConfig VenueConfig::from_json_string(const std::string& content) {
    VenueConfig config;

    try {
        json root = json::parse(content);

        config.log_level = root.value("log_level", config.log_level);
        config.max_active_markets = number_field<size_t>(root, "max_active_markets",
                                                         config.max_active_markets);
        config.admin = address_field(root, "admin", config.admin);
        config.treasury = address_field(root, "treasury", config.treasury);
        config.insurance_fund = address_field(root, "insurance_fund", config.insurance_fund);
        config.fee_router = address_field(root, "fee_router", config.fee_router);

        if (root.contains("fee_split")) {
            const json& split = root.at("fee_split");
            config.trade_to_fund_bps = number_field<uint32_t>(split, "trade_to_fund_bps",
                                                              config.trade_to_fund_bps);
            config.liq_to_fund_bps = number_field<uint32_t>(split, "liq_to_fund_bps",
                                                            config.liq_to_fund_bps);
        }

        if (root.contains("tokens")) {
            for (const auto& token : root.at("tokens")) {
                config.tokens.push_back(parse_token(token));
            }
        }
        if (root.contains("markets")) {
            for (const auto& market : root.at("markets")) {
                config.markets.push_back(parse_market(market));
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid config: ") + e.what());
    }

    config.validate();
    return config;
}

// =============================================================================
// Validation
// =============================================================================

void VenueConfig::validate() const {
    if (max_active_markets == 0) {
        throw ConfigError("max_active_markets must be positive");
    }
    if (trade_to_fund_bps > 10000 || liq_to_fund_bps > 10000) {
        throw ConfigError("fee split above 10000 bps");
    }

    std::set<std::string> symbols;
    for (const auto& token : tokens) {
        if (!symbols.insert(token.symbol).second) {
            throw ConfigError("duplicate token: " + token.symbol);
        }
        if (addresses::is_zero(token.address)) {
            throw ConfigError("token " + token.symbol + " has no address");
        }
        if (token.decimals > 30 || token.haircut_bps > 10000) {
            throw ConfigError("token " + token.symbol + " has invalid decimals or haircut");
        }
    }

    std::set<MarketId> ids;
    for (const auto& market : markets) {
        if (!ids.insert(market.id).second) {
            throw ConfigError("duplicate market id: " + std::to_string(market.id));
        }
        if (!find_token(market.quote_token)) {
            throw ConfigError("market " + market.symbol + " quotes unknown token " + market.quote_token);
        }
        if (market.vamm.fee_bps > Vamm::MAX_FEE_BPS) {
            throw ConfigError("market " + market.symbol + " swap fee above 300 bps");
        }
        if (market.vamm.initial_price_x18 <= 0 || market.vamm.initial_base_reserve_x18 <= 0) {
            throw ConfigError("market " + market.symbol + " needs a positive price and base reserve");
        }
        if (market.risk.is_set() && !market.risk.valid()) {
            throw ConfigError("market " + market.symbol + " has invalid risk params");
        }
    }
}

const TokenSpec* VenueConfig::find_token(const std::string& symbol) const {
    for (const auto& token : tokens) {
        if (token.symbol == symbol) return &token;
    }
    return nullptr;
}

} // namespace vperp
