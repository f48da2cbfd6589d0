#ifndef VPERP_MATH_HPP
#define VPERP_MATH_HPP

#include <cstdint>
#include <string>

#include "types.hpp"

namespace vperp {

// =============================================================================
// Full-Precision Multiply-Divide
//
// a * b / denom with a 256-bit intermediate product. Throws
// std::overflow_error when the quotient does not fit in I128 and
// std::invalid_argument on a zero denominator.
// =============================================================================

// Truncates toward zero
I128 mul_div(I128 a, I128 b, I128 denom);

// Rounds the magnitude up (away from zero) when there is a remainder
I128 mul_div_up(I128 a, I128 b, I128 denom);

inline I128 abs128(I128 x) { return x < 0 ? -x : x; }

inline I128 min128(I128 a, I128 b) { return a < b ? a : b; }
inline I128 max128(I128 a, I128 b) { return a > b ? a : b; }

// =============================================================================
// X18 Operations
// =============================================================================

namespace x18 {

inline I128 mul(I128 a, I128 b) { return mul_div(a, b, X18_ONE); }
inline I128 mul_up(I128 a, I128 b) { return mul_div_up(a, b, X18_ONE); }
inline I128 div(I128 a, I128 b) { return mul_div(a, X18_ONE, b); }
inline I128 div_up(I128 a, I128 b) { return mul_div_up(a, X18_ONE, b); }

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline I128 from_double(double v) {
    return static_cast<I128>(v * static_cast<double>(X18_ONE));
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

// Parses "123", "-0.5", "2000.000001" (at most 18 fractional digits)
bool parse(const std::string& text, I128& out);

// Decimal rendering with trailing fractional zeros trimmed
std::string to_string(I128 v);

} // namespace x18

// =============================================================================
// Basis Points
// =============================================================================

inline I128 bps_of(I128 amount, uint32_t bps) {
    return mul_div(amount, bps, BPS_DENOMINATOR);
}

inline I128 bps_of_up(I128 amount, uint32_t bps) {
    return mul_div_up(amount, bps, BPS_DENOMINATOR);
}

// =============================================================================
// Token Unit Conversion
//
// base_unit = 10^decimals of the token. Amounts the protocol collects are
// converted rounding up, amounts it pays out rounding down.
// =============================================================================

inline I128 to_token_down(I128 amount_x18, I128 base_unit) {
    return mul_div(amount_x18, base_unit, X18_ONE);
}

inline I128 to_token_up(I128 amount_x18, I128 base_unit) {
    return mul_div_up(amount_x18, base_unit, X18_ONE);
}

inline I128 from_token(I128 amount, I128 base_unit) {
    return mul_div(amount, X18_ONE, base_unit);
}

// Plain integer rendering (token units)
std::string int_to_string(I128 v);

// 10^decimals; decimals must be <= 36
I128 pow10(uint8_t decimals);

} // namespace vperp

#endif // VPERP_MATH_HPP
