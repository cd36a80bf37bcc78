#ifndef CLAMM_SQRT_PRICE_MATH_HPP
#define CLAMM_SQRT_PRICE_MATH_HPP

#include "types.hpp"

namespace clamm {

// =============================================================================
// Sqrt Price Math: token amounts between two Q64.96 prices
// =============================================================================

namespace sqrt_price_math {

// amount0 = L * (sqrt_b - sqrt_a) / (sqrt_a * sqrt_b), Q96-scaled.
// Prices may be passed in either order.
U256 get_amount0_delta(U256 sqrt_a_x96, U256 sqrt_b_x96, U128 liquidity, bool round_up);

// amount1 = L * (sqrt_b - sqrt_a) / 2^96
U256 get_amount1_delta(U256 sqrt_a_x96, U256 sqrt_b_x96, U128 liquidity, bool round_up);

// Price after adding amount_in of the input token; never overshoots the
// price implied by the exact input
U256 get_next_sqrt_price_from_input(const U256& sqrt_price_x96, U128 liquidity,
                                    const U256& amount_in, bool zero_for_one);

// Price after removing amount_out of the output token; always moves at
// least as far as needed to cover amount_out
U256 get_next_sqrt_price_from_output(const U256& sqrt_price_x96, U128 liquidity,
                                     const U256& amount_out, bool zero_for_one);

} // namespace sqrt_price_math

} // namespace clamm

#endif // CLAMM_SQRT_PRICE_MATH_HPP
