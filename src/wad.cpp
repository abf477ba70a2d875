// =============================================================================
// wad.cpp - 1e18 Fixed-Point Arithmetic with 256-bit Intermediates
// =============================================================================

#include "depth/wad.hpp"
#include "depth/errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace depth {
namespace wad {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;
constexpr U128 I128_MAX_MAGNITUDE = (U128(1) << 127) - 1;

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits
};

struct DivResult {
    U128 quot;
    U128 rem;
};

inline U128 magnitude(I128 x) {
    return x < 0 ? U128(0) - static_cast<U128>(x) : static_cast<U128>(x);
}

// Multiply two U128 values to produce U256
inline U256 mul_u128(U128 a, U128 b) {
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);
    return result;
}

// Restoring long division of a 256-bit numerator by a 128-bit divisor.
// Requires num.hi < denom so the quotient fits in 128 bits.
inline DivResult div_u256_u128(U256 num, U128 denom) {
    if (num.hi == 0) {
        return {num.lo / denom, num.lo % denom};
    }

    U128 rem = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        // With carry set the true remainder is 2^128 + rem, which always
        // exceeds denom; modular subtraction still yields the right value.
        if (carry || rem >= denom) {
            rem -= denom;
            quot |= 1;
        }
    }
    return {quot, rem};
}

DivResult checked_div(I128 a, I128 b, I128 denom, bool& negative) {
    if (denom == 0) {
        throw MathError("wad: division by zero");
    }

    negative = (a < 0) ^ (b < 0) ^ (denom < 0);
    U128 ud = magnitude(denom);

    U256 product = mul_u128(magnitude(a), magnitude(b));
    if (product.hi >= ud) {
        throw MathError("wad: mul_div result overflows 128 bits");
    }
    return div_u256_u128(product, ud);
}

I128 to_signed(U128 quot, bool negative) {
    if (quot > I128_MAX_MAGNITUDE) {
        throw MathError("wad: mul_div result overflows I128");
    }
    I128 value = static_cast<I128>(quot);
    return negative ? -value : value;
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

} // anonymous namespace

// =============================================================================
// Multiply-Divide
// =============================================================================

I128 mul_div(I128 a, I128 b, I128 denom) {
    bool negative = false;
    DivResult r = checked_div(a, b, denom, negative);
    return to_signed(r.quot, negative);
}

I128 mul_div_up(I128 a, I128 b, I128 denom) {
    bool negative = false;
    DivResult r = checked_div(a, b, denom, negative);
    U128 quot = r.quot;
    if (!negative && r.rem != 0) {
        quot += 1;
    }
    return to_signed(quot, negative);
}

// =============================================================================
// Decimal Conversion
// =============================================================================

I128 parse(std::string_view s) {
    if (s.empty()) {
        throw std::invalid_argument("wad: empty amount");
    }

    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = (s[0] == '-');
        s.remove_prefix(1);
    }

    auto dot = s.find('.');
    std::string_view int_part = s.substr(0, dot);
    std::string_view frac_part = dot == std::string_view::npos ? std::string_view{} : s.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) {
        throw std::invalid_argument("wad: no digits in amount");
    }

    const U128 int_limit = I128_MAX_MAGNITUDE / static_cast<U128>(WAD);

    U128 int_val = 0;
    for (char c : int_part) {
        if (!is_digit(c)) {
            throw std::invalid_argument("wad: invalid character in amount");
        }
        int_val = int_val * 10 + static_cast<U128>(c - '0');
        if (int_val > int_limit) {
            throw std::out_of_range("wad: amount out of range");
        }
    }

    // Pad or truncate the fractional part to DECIMALS digits
    U128 frac_val = 0;
    for (size_t i = 0; i < DECIMALS; ++i) {
        U128 digit = 0;
        if (i < frac_part.size()) {
            char c = frac_part[i];
            if (!is_digit(c)) {
                throw std::invalid_argument("wad: invalid character in amount");
            }
            digit = static_cast<U128>(c - '0');
        }
        frac_val = frac_val * 10 + digit;
    }
    for (size_t i = DECIMALS; i < frac_part.size(); ++i) {
        if (!is_digit(frac_part[i])) {
            throw std::invalid_argument("wad: invalid character in amount");
        }
    }

    U128 total = int_val * static_cast<U128>(WAD) + frac_val;
    if (total > I128_MAX_MAGNITUDE) {
        throw std::out_of_range("wad: amount out of range");
    }
    I128 value = static_cast<I128>(total);
    return negative ? -value : value;
}

std::string to_integer_string(I128 value) {
    if (value == 0) return "0";

    U128 mag = magnitude(value);
    std::string digits;
    while (mag != 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (value < 0) digits.push_back('-');
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string to_string(I128 value) {
    U128 mag = magnitude(value);
    U128 int_part = mag / static_cast<U128>(WAD);
    U128 frac_part = mag % static_cast<U128>(WAD);

    std::string result;
    if (value < 0) result.push_back('-');
    result += to_integer_string(static_cast<I128>(int_part));

    if (frac_part != 0) {
        std::string frac_str = to_integer_string(static_cast<I128>(frac_part));
        frac_str.insert(0, DECIMALS - frac_str.size(), '0');
        // Trim trailing zeros after the decimal point
        frac_str.erase(frac_str.find_last_not_of('0') + 1);
        result.push_back('.');
        result += frac_str;
    }

    return result;
}

} // namespace wad
} // namespace depth
