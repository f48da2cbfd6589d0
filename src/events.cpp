// =============================================================================
// events.cpp - Event names and JSON conversion
// =============================================================================

#include "vperp/events.hpp"
#include "vperp/math.hpp"

namespace vperp {

const char* to_string(BadDebtReason reason) {
    switch (reason) {
        case BadDebtReason::REALIZED_LOSS: return "realized_loss";
        case BadDebtReason::FUNDING: return "funding";
        case BadDebtReason::LIQUIDATOR_PENALTY: return "liquidator_penalty";
        case BadDebtReason::PROTOCOL_PENALTY: return "protocol_penalty";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const PositionChangedEvent& e) {
    j = nlohmann::json{
        {"type", "position_changed"},
        {"account", addresses::to_hex(e.account)},
        {"market", e.market},
        {"size_before", x18::to_string(e.size_before_x18)},
        {"size_after", x18::to_string(e.size_after_x18)},
        {"exec_price", x18::to_string(e.exec_price_x18)},
        {"quote_delta", x18::to_string(e.quote_delta_x18)},
        {"realized_pnl", x18::to_string(e.realized_pnl_x18)},
        {"fee", x18::to_string(e.fee_x18)},
        {"margin_after", x18::to_string(e.margin_after_x18)},
        {"liquidation", e.liquidation},
        {"timestamp", e.timestamp},
    };
}

void to_json(nlohmann::json& j, const LiquidationEvent& e) {
    j = nlohmann::json{
        {"type", "liquidation"},
        {"account", addresses::to_hex(e.account)},
        {"liquidator", addresses::to_hex(e.liquidator)},
        {"market", e.market},
        {"size", x18::to_string(e.size_x18)},
        {"exec_price", x18::to_string(e.exec_price_x18)},
        {"snapshot_price", x18::to_string(e.snapshot_price_x18)},
        {"realized_pnl", x18::to_string(e.realized_pnl_x18)},
        {"penalty", x18::to_string(e.penalty_x18)},
        {"liquidator_paid", x18::to_string(e.liquidator_paid_x18)},
        {"protocol_paid", x18::to_string(e.protocol_paid_x18)},
        {"insurance_paid", x18::to_string(e.insurance_paid_x18)},
        {"bad_debt", x18::to_string(e.bad_debt_x18)},
        {"timestamp", e.timestamp},
    };
}

void to_json(nlohmann::json& j, const FundingSettledEvent& e) {
    j = nlohmann::json{
        {"type", "funding_settled"},
        {"account", addresses::to_hex(e.account)},
        {"market", e.market},
        {"payment", x18::to_string(e.payment_x18)},
        {"index_before", x18::to_string(e.index_before_x18)},
        {"index_after", x18::to_string(e.index_after_x18)},
        {"timestamp", e.timestamp},
    };
}

void to_json(nlohmann::json& j, const BadDebtEvent& e) {
    j = nlohmann::json{
        {"type", "bad_debt"},
        {"account", addresses::to_hex(e.account)},
        {"market", e.market},
        {"amount", x18::to_string(e.amount_x18)},
        {"reason", to_string(e.reason)},
        {"timestamp", e.timestamp},
    };
}

} // namespace vperp
