#ifndef VPERP_TYPES_HPP
#define VPERP_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <functional>

namespace vperp {

// =============================================================================
// Addresses (20-byte account / token / contract identifiers)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Helper to create a short address (last two bytes) for well-known actors
constexpr Address from_u16(uint16_t n) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((n >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(n & 0xFF);
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// "0x" prefix optional; returns false on malformed input
bool from_hex(const std::string& hex, Address& out);
std::string to_hex(const Address& addr);

} // namespace addresses

struct AddressHash {
    size_t operator()(const Address& a) const {
        uint64_t h = 0;
        for (auto b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

using AccountId = Address;
using MarketId = uint32_t;

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr I128 BPS_DENOMINATOR = 10000;

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

struct CurrencyHash {
    size_t operator()(const Currency& c) const { return AddressHash{}(c.addr); }
};

// =============================================================================
// Time
// =============================================================================

// Seconds since epoch. Injected so that tests can drive time explicitly.
using Clock = std::function<uint64_t()>;

uint64_t system_clock_seconds();

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Validation / structural
constexpr int32_t INVALID_AMOUNT = -1;
constexpr int32_t MARKET_NOT_FOUND = -2;
constexpr int32_t MARKET_NOT_ACTIVE = -3;
constexpr int32_t RISK_PARAMS_NOT_SET = -4;
constexpr int32_t INVALID_RISK_PARAMS = -5;
constexpr int32_t POSITION_TOO_SMALL = -6;
constexpr int32_t POSITION_TOO_LARGE = -7;
constexpr int32_t POSITION_NOT_FOUND = -8;
constexpr int32_t INVALID_FEE = -9;
constexpr int32_t TOO_MANY_ACTIVE_MARKETS = -10;
constexpr int32_t ALREADY_EXISTS = -11;
constexpr int32_t INVALID_CONFIG = -12;
constexpr int32_t NOT_INITIALIZED = -13;

// Risk policy
constexpr int32_t INSUFFICIENT_COLLATERAL = -20;
constexpr int32_t INSUFFICIENT_MARGIN = -21;
constexpr int32_t WOULD_BE_LIQUIDATABLE = -22;
constexpr int32_t ACCOUNT_LIQUIDATABLE = -23;
constexpr int32_t NOT_LIQUIDATABLE = -24;
constexpr int32_t DUST_REMAINDER = -25;
constexpr int32_t SELF_LIQUIDATION = -26;
constexpr int32_t WITHDRAW_BREACHES_MARGIN = -27;
constexpr int32_t INSUFFICIENT_BALANCE = -28;
constexpr int32_t TOKEN_NOT_ENABLED = -29;

// Pricing engine
constexpr int32_t SWAPS_PAUSED = -30;
constexpr int32_t PRICE_LIMIT_EXCEEDED = -31;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -32;
constexpr int32_t TWAP_INSUFFICIENT_HISTORY = -33;
constexpr int32_t RESET_BOUND_EXCEEDED = -34;
constexpr int32_t INVALID_PRICE = -35;

// Price sources / collaborators
constexpr int32_t NO_PRICE_SOURCE = -40;
constexpr int32_t SETTLEMENT_FAILED = -41;

constexpr int32_t UNAUTHORIZED = -50;

const char* to_string(int32_t code);
}

} // namespace vperp

#endif // VPERP_TYPES_HPP
