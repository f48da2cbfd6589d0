// =============================================================================
// types.cpp - Address helpers, clock and error names
// =============================================================================

#include "vperp/types.hpp"
#include <chrono>

namespace vperp {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

namespace addresses {

bool from_hex(const std::string& hex, Address& out) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    if (hex.size() - start != out.size() * 2) return false;

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[start + 2 * i]);
        int lo = hex_value(hex[start + 2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    out = addr;
    return true;
}

std::string to_hex(const Address& addr) {
    static const char digits[] = "0123456789abcdef";
    std::string s = "0x";
    s.reserve(2 + addr.size() * 2);
    for (auto b : addr) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0x0F]);
    }
    return s;
}

} // namespace addresses

uint64_t system_clock_seconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

namespace errors {

const char* to_string(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case INVALID_AMOUNT: return "invalid amount";
        case MARKET_NOT_FOUND: return "market not found";
        case MARKET_NOT_ACTIVE: return "market not active";
        case RISK_PARAMS_NOT_SET: return "risk params not set";
        case INVALID_RISK_PARAMS: return "invalid risk params";
        case POSITION_TOO_SMALL: return "position below minimum size";
        case POSITION_TOO_LARGE: return "position above maximum size";
        case POSITION_NOT_FOUND: return "position not found";
        case INVALID_FEE: return "invalid fee";
        case TOO_MANY_ACTIVE_MARKETS: return "too many active markets";
        case ALREADY_EXISTS: return "already exists";
        case INVALID_CONFIG: return "invalid config";
        case NOT_INITIALIZED: return "not initialized";
        case INSUFFICIENT_COLLATERAL: return "insufficient collateral";
        case INSUFFICIENT_MARGIN: return "insufficient margin";
        case WOULD_BE_LIQUIDATABLE: return "position would be liquidatable";
        case ACCOUNT_LIQUIDATABLE: return "account has a liquidatable position";
        case NOT_LIQUIDATABLE: return "position not liquidatable";
        case DUST_REMAINDER: return "liquidation would leave dust";
        case SELF_LIQUIDATION: return "self liquidation";
        case WITHDRAW_BREACHES_MARGIN: return "withdrawal breaches reserved margin";
        case INSUFFICIENT_BALANCE: return "insufficient balance";
        case TOKEN_NOT_ENABLED: return "token not enabled";
        case SWAPS_PAUSED: return "swaps paused";
        case PRICE_LIMIT_EXCEEDED: return "price limit exceeded";
        case INSUFFICIENT_LIQUIDITY: return "reserve floor breached";
        case TWAP_INSUFFICIENT_HISTORY: return "insufficient twap history";
        case RESET_BOUND_EXCEEDED: return "reserve reset moves price too far";
        case INVALID_PRICE: return "invalid price";
        case NO_PRICE_SOURCE: return "no price source available";
        case SETTLEMENT_FAILED: return "collateral settlement failed";
        case UNAUTHORIZED: return "unauthorized";
        default: return "unknown error";
    }
}

} // namespace errors

} // namespace vperp
