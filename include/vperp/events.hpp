#ifndef VPERP_EVENTS_HPP
#define VPERP_EVENTS_HPP

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace vperp {

// =============================================================================
// Clearing House Events (dispatched after commit)
// =============================================================================

struct PositionChangedEvent {
    AccountId account{};
    MarketId market = 0;
    I128 size_before_x18 = 0;
    I128 size_after_x18 = 0;
    I128 exec_price_x18 = 0;
    I128 quote_delta_x18 = 0;
    I128 realized_pnl_x18 = 0;
    I128 fee_x18 = 0;
    I128 margin_after_x18 = 0;
    bool liquidation = false;
    uint64_t timestamp = 0;
};

struct LiquidationEvent {
    AccountId account{};
    AccountId liquidator{};
    MarketId market = 0;
    I128 size_x18 = 0;                 // Base closed
    I128 exec_price_x18 = 0;
    I128 snapshot_price_x18 = 0;       // Risk price before the closing trade
    I128 realized_pnl_x18 = 0;
    I128 penalty_x18 = 0;
    I128 liquidator_paid_x18 = 0;
    I128 protocol_paid_x18 = 0;
    I128 insurance_paid_x18 = 0;
    I128 bad_debt_x18 = 0;
    uint64_t timestamp = 0;
};

struct FundingSettledEvent {
    AccountId account{};
    MarketId market = 0;
    I128 payment_x18 = 0;              // + credited, - debited
    I128 index_before_x18 = 0;
    I128 index_after_x18 = 0;
    uint64_t timestamp = 0;
};

enum class BadDebtReason : uint8_t {
    REALIZED_LOSS = 0,
    FUNDING = 1,
    LIQUIDATOR_PENALTY = 2,
    PROTOCOL_PENALTY = 3,
};

const char* to_string(BadDebtReason reason);

struct BadDebtEvent {
    AccountId account{};
    MarketId market = 0;
    I128 amount_x18 = 0;
    BadDebtReason reason = BadDebtReason::REALIZED_LOSS;
    uint64_t timestamp = 0;
};

// =============================================================================
// Listener
// =============================================================================

class ClearingHouseListener {
public:
    virtual ~ClearingHouseListener() = default;
    virtual void on_position_changed(const PositionChangedEvent& event) = 0;
    virtual void on_liquidation(const LiquidationEvent& event) = 0;
    virtual void on_funding_settled(const FundingSettledEvent& event) = 0;
    virtual void on_bad_debt(const BadDebtEvent& event) = 0;
};

// No-op listener for when notifications aren't needed
class NullClearingHouseListener : public ClearingHouseListener {
public:
    void on_position_changed(const PositionChangedEvent&) override {}
    void on_liquidation(const LiquidationEvent&) override {}
    void on_funding_settled(const FundingSettledEvent&) override {}
    void on_bad_debt(const BadDebtEvent&) override {}
};

// =============================================================================
// JSON (audit log); X18 values rendered as decimal strings
// =============================================================================

void to_json(nlohmann::json& j, const PositionChangedEvent& e);
void to_json(nlohmann::json& j, const LiquidationEvent& e);
void to_json(nlohmann::json& j, const FundingSettledEvent& e);
void to_json(nlohmann::json& j, const BadDebtEvent& e);

} // namespace vperp

#endif // VPERP_EVENTS_HPP
