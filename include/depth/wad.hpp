#ifndef DEPTH_WAD_HPP
#define DEPTH_WAD_HPP

#include <string>
#include <string_view>

#include "types.hpp"

namespace depth {

// =============================================================================
// Wad Arithmetic (1e18 fixed point, 256-bit intermediates)
// =============================================================================
//
// All operations except mul_div_up truncate toward zero. Results that do not fit in I128 and
// divisions by zero throw MathError.

namespace wad {

// floor(a * b / denom)
I128 mul_div(I128 a, I128 b, I128 denom);

// ceil(a * b / denom) for non-negative results
I128 mul_div_up(I128 a, I128 b, I128 denom);

// a * w / 1e18 (scale an amount by a Wad fraction)
inline I128 mul_frac(I128 a, I128 w) {
    return mul_div(a, w, WAD);
}

// a * 1e18 / w (inverse of mul_frac)
inline I128 div_frac(I128 a, I128 w) {
    return mul_div(a, WAD, w);
}

// numerator / denominator as a Wad
inline I128 from_ratio(I128 numerator, I128 denominator) {
    return mul_div(numerator, WAD, denominator);
}

// Decimal string ("4000", "0.975", "-1.5") to base units. Digits beyond the
// 18th decimal are truncated. Throws std::invalid_argument on malformed input.
I128 parse(std::string_view s);

// Base units to a decimal string with trailing zeros trimmed
std::string to_string(I128 value);

// Plain integer formatting of a 128-bit value
std::string to_integer_string(I128 value);

} // namespace wad

} // namespace depth

#endif // DEPTH_WAD_HPP
