// =============================================================================
// venue.cpp - Venue wiring
// =============================================================================

#include "vperp/venue.hpp"
#include "vperp/math.hpp"
#include "vperp/log.hpp"

namespace vperp {

Venue::Venue(const VenueConfig& config, Clock clock)
    : config_(config), clock_(std::move(clock)) {
    log::set_level(config_.log_level);

    vault_ = std::make_unique<CollateralVault>();
    markets_ = std::make_unique<MarketRegistry>();
    access_ = std::make_unique<AccessControl>(config_.admin);
    insurance_ = std::make_unique<InsuranceFund>(*vault_, config_.insurance_fund);
    fee_router_ = std::make_unique<FeeRouter>(*vault_, config_.fee_router,
                                              config_.insurance_fund, config_.treasury);
    clearing_house_ = std::make_unique<ClearingHouse>(*vault_, *markets_, *access_, clock_,
                                                      config_.max_active_markets);
    risk_ = std::make_unique<RiskEngine>(*clearing_house_, *markets_);

    int32_t err = fee_router_->set_split(config_.trade_to_fund_bps, config_.liq_to_fund_bps);
    if (err != errors::OK) {
        throw ConfigError(std::string("fee split rejected: ") + errors::to_string(err));
    }

    for (const auto& token : config_.tokens) {
        err = add_token(token);
        if (err != errors::OK) {
            throw ConfigError("token " + token.symbol + " rejected: " + errors::to_string(err));
        }
    }
    for (const auto& market : config_.markets) {
        err = create_market(market);
        if (err != errors::OK) {
            throw ConfigError("market " + market.symbol + " rejected: " + errors::to_string(err));
        }
    }

    log::get()->info("venue {} ready: {} tokens, {} markets", version(),
                     tokens_.size(), vamms_.size());
}

Venue::~Venue() = default;

// =============================================================================
// Component Access
// =============================================================================

Vamm* Venue::vamm(MarketId market) {
    auto it = vamms_.find(market);
    return it == vamms_.end() ? nullptr : it->second.get();
}

ManualPriceSource* Venue::index_source(MarketId market) {
    auto it = index_sources_.find(market);
    return it == index_sources_.end() ? nullptr : it->second.get();
}

std::optional<Currency> Venue::token(const std::string& symbol) const {
    auto it = tokens_.find(symbol);
    if (it == tokens_.end()) return std::nullopt;
    return Currency(it->second.address);
}

// =============================================================================
// Setup
// =============================================================================

int32_t Venue::add_token(const TokenSpec& spec) {
    if (tokens_.find(spec.symbol) != tokens_.end()) {
        return errors::ALREADY_EXISTS;
    }

    TokenConfig token;
    token.token = Currency(spec.address);
    token.symbol = spec.symbol;
    token.decimals = spec.decimals;
    token.enabled = spec.enabled;
    token.price_x18 = spec.price_x18;
    token.haircut_bps = spec.haircut_bps;

    int32_t err = vault_->register_token(token);
    if (err != errors::OK) return err;

    tokens_[spec.symbol] = spec;
    return errors::OK;
}

int32_t Venue::create_market(const MarketSpec& spec) {
    auto quote = tokens_.find(spec.quote_token);
    if (quote == tokens_.end()) {
        return errors::TOKEN_NOT_ENABLED;
    }
    if (markets_->exists(spec.id)) {
        return errors::ALREADY_EXISTS;
    }
    if (spec.risk.is_set() && !spec.risk.valid()) {
        return errors::INVALID_RISK_PARAMS;
    }

    auto source = std::make_unique<ManualPriceSource>(spec.index_price_x18);
    auto vamm = std::make_unique<Vamm>(source.get(), clock_);
    int32_t err = vamm->initialize(spec.vamm);
    if (err != errors::OK) return err;

    MarketInfo info;
    info.id = spec.id;
    info.symbol = spec.symbol;
    info.vamm = vamm.get();
    info.oracle = source.get();
    info.fee_bps = spec.trade_fee_bps;
    info.fee_router = fee_router_.get();
    info.insurance_fund = insurance_.get();
    info.quote_token = Currency(quote->second.address);
    info.base_token = Currency(spec.base_token);
    info.base_unit = pow10(quote->second.decimals);

    err = markets_->create_market(info);
    if (err != errors::OK) return err;

    index_sources_[spec.id] = std::move(source);
    vamms_[spec.id] = std::move(vamm);

    if (spec.risk.is_set()) {
        err = clearing_house_->set_risk_params(config_.admin, spec.id, spec.risk);
        if (err != errors::OK) return err;
    }

    log::get()->info("market {} ({}) created at {} quoted in {}", spec.id, spec.symbol,
                     x18::to_string(spec.vamm.initial_price_x18), spec.quote_token);
    return errors::OK;
}

} // namespace vperp
