// =============================================================================
// math.cpp - 256-bit intermediate mul_div and X18 decimal conversion
// =============================================================================

#include "vperp/math.hpp"
#include <algorithm>
#include <stdexcept>

namespace vperp {

namespace {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits
};

// Multiply two U128 values to produce U256
U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate middle terms with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// Divide U256 by U128. The quotient must fit in 128 bits (num.hi < denom),
// otherwise overflow is set.
U128 divmod_u256(U256 num, U128 denom, U128& rem, bool& overflow) {
    overflow = false;
    if (num.hi == 0) {
        rem = num.lo % denom;
        return num.lo / denom;
    }
    if (num.hi >= denom) {
        overflow = true;
        rem = 0;
        return 0;
    }

    // Restoring long division over the low limb; r < denom throughout
    U128 r = num.hi;
    U128 q = 0;
    for (int i = 127; i >= 0; --i) {
        bool top = (r >> 127) != 0;
        r = (r << 1) | ((num.lo >> i) & 1);
        q <<= 1;
        if (top || r >= denom) {
            r -= denom;
            q |= 1;
        }
    }
    rem = r;
    return q;
}

I128 mul_div_impl(I128 a, I128 b, I128 denom, bool round_up) {
    if (denom == 0) {
        throw std::invalid_argument("mul_div: zero denominator");
    }
    if (a == 0 || b == 0) return 0;

    bool neg = (a < 0) != (b < 0);
    if (denom < 0) neg = !neg;

    U128 ua = static_cast<U128>(abs128(a));
    U128 ub = static_cast<U128>(abs128(b));
    U128 ud = static_cast<U128>(abs128(denom));

    U128 rem = 0;
    bool overflow = false;
    U128 q = divmod_u256(mul_u128(ua, ub), ud, rem, overflow);
    if (round_up && rem != 0) {
        q += 1;
        if (q == 0) overflow = true;
    }
    if (overflow || (q >> 127) != 0) {
        throw std::overflow_error("mul_div: result exceeds 128 bits");
    }

    I128 result = static_cast<I128>(q);
    return neg ? -result : result;
}

std::string u128_to_string(U128 v) {
    if (v == 0) return "0";
    std::string s;
    while (v > 0) {
        s.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(s.begin(), s.end());
    return s;
}

} // anonymous namespace

I128 mul_div(I128 a, I128 b, I128 denom) {
    return mul_div_impl(a, b, denom, false);
}

I128 mul_div_up(I128 a, I128 b, I128 denom) {
    return mul_div_impl(a, b, denom, true);
}

std::string int_to_string(I128 v) {
    if (v < 0) return "-" + u128_to_string(static_cast<U128>(-(v + 1)) + 1);
    return u128_to_string(static_cast<U128>(v));
}

I128 pow10(uint8_t decimals) {
    if (decimals > 36) {
        throw std::overflow_error("pow10: too many decimals");
    }
    I128 v = 1;
    for (uint8_t i = 0; i < decimals; ++i) v *= 10;
    return v;
}

namespace x18 {

bool parse(const std::string& text, I128& out) {
    if (text.empty()) return false;

    size_t pos = 0;
    bool neg = false;
    if (text[0] == '-' || text[0] == '+') {
        neg = text[0] == '-';
        pos = 1;
    }

    I128 int_part = 0;
    I128 frac_part = 0;
    int frac_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;

    // Integer part is bounded well below 2^127 / 1e18
    constexpr I128 INT_LIMIT = static_cast<I128>(1) << 64;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_dot) return false;
            seen_dot = true;
            continue;
        }
        if (c == '_') continue;
        if (c < '0' || c > '9') return false;
        seen_digit = true;
        int d = c - '0';
        if (!seen_dot) {
            int_part = int_part * 10 + d;
            if (int_part >= INT_LIMIT) return false;
        } else {
            if (frac_digits == 18) return false;
            frac_part = frac_part * 10 + d;
            ++frac_digits;
        }
    }
    if (!seen_digit) return false;

    for (int i = frac_digits; i < 18; ++i) frac_part *= 10;

    I128 v = int_part * X18_ONE + frac_part;
    out = neg ? -v : v;
    return true;
}

std::string to_string(I128 v) {
    bool neg = v < 0;
    U128 mag = static_cast<U128>(neg ? -v : v);
    U128 one = static_cast<U128>(X18_ONE);

    std::string s = neg ? "-" : "";
    s += u128_to_string(mag / one);

    U128 frac = mag % one;
    if (frac != 0) {
        std::string f = u128_to_string(frac);
        f.insert(0, 18 - f.size(), '0');
        while (!f.empty() && f.back() == '0') f.pop_back();
        s += "." + f;
    }
    return s;
}

} // namespace x18

} // namespace vperp
