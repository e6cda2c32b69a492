#ifndef PEERLEND_MATH_HPP
#define PEERLEND_MATH_HPP

#include "types.hpp"

namespace peerlend {

// Saturating subtraction: max(a - b, 0)
inline U128 zero_floor_sub(U128 a, U128 b) {
    return a > b ? a - b : 0;
}

inline U128 min(U128 a, U128 b) {
    return a < b ? a : b;
}

inline U128 max(U128 a, U128 b) {
    return a > b ? a : b;
}

// a + b; throws std::overflow_error when the sum does not fit in 128 bits
U128 checked_add(U128 a, U128 b);

// 10^exp, e.g. one whole token of `exp` decimals
inline U128 pow10(uint8_t exp) {
    U128 r = 1;
    for (uint8_t i = 0; i < exp; ++i) r *= 10;
    return r;
}

// floor(a * b / d), or ceil when round_up, with a 256-bit intermediate.
// Throws std::domain_error on d == 0 and std::overflow_error when the
// quotient does not fit in 128 bits.
U128 mul_div(U128 a, U128 b, U128 d, bool round_up);

// =============================================================================
// X18 Fixed-Point Arithmetic
//
// Every operation names its rounding direction. Round down for amounts held
// (assets), round up for amounts owed (liabilities).
// =============================================================================

namespace x18 {

inline U128 mul_down(U128 a, U128 b) {
    return mul_div(a, b, X18_ONE, false);
}

inline U128 mul_up(U128 a, U128 b) {
    return mul_div(a, b, X18_ONE, true);
}

inline U128 div_down(U128 a, U128 b) {
    return mul_div(a, X18_ONE, b, false);
}

inline U128 div_up(U128 a, U128 b) {
    return mul_div(a, X18_ONE, b, true);
}

inline U128 from_int(uint64_t v) {
    return static_cast<U128>(v) * X18_ONE;
}

// Inexact, for display and test fixtures only
U128 from_double(double v);
double to_double(U128 v);

} // namespace x18

// =============================================================================
// Basis-Point Arithmetic (10000 = 100%)
// =============================================================================

namespace bps {

inline U128 mul_down(U128 value, uint32_t pct) {
    return mul_div(value, pct, constants::MAX_BPS, false);
}

inline U128 mul_up(U128 value, uint32_t pct) {
    return mul_div(value, pct, constants::MAX_BPS, true);
}

// x * (1 - pct) + y * pct, rounded down
U128 weighted_avg(U128 x, U128 y, uint32_t pct);

} // namespace bps

} // namespace peerlend

#endif // PEERLEND_MATH_HPP
