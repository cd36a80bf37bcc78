#ifndef CLAMM_FULL_MATH_HPP
#define CLAMM_FULL_MATH_HPP

#include "types.hpp"

namespace clamm {

// =============================================================================
// Full-precision arithmetic with 512-bit intermediates
// All functions throw ArithmeticOverflow when the result does not fit.
// =============================================================================

namespace full_math {

// Q64.96 scaling factor
inline const U256 Q96 = U256(1) << 96;

// floor(a * b / denom)
U256 mul_div(const U256& a, const U256& b, const U256& denom);

// ceil(a * b / denom)
U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denom);

// ceil(a / b)
U256 div_rounding_up(const U256& a, const U256& b);

// Widening / narrowing between native 128-bit and wide integers
U256 to_u256(U128 v);
I256 to_i256(I128 v);
U128 to_u128(const U256& v);

// Non-negative I256 to U256
U256 to_u256(const I256& v);

} // namespace full_math

} // namespace clamm

#endif // CLAMM_FULL_MATH_HPP
