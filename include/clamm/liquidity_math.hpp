#ifndef CLAMM_LIQUIDITY_MATH_HPP
#define CLAMM_LIQUIDITY_MATH_HPP

#include <utility>

#include "types.hpp"

namespace clamm {

// =============================================================================
// Liquidity Math Utilities
// =============================================================================

namespace liquidity_math {

// Token amounts represented by `liquidity` on [sqrt_a, sqrt_b] at sqrt_price:
//   price <= sqrt_a : all token0
//   price >= sqrt_b : all token1
//   otherwise       : token0 above the price, token1 below it
// round_up = true for amounts owed to the pool (mint), false for payouts (burn).
std::pair<U256, U256> get_amounts_for_liquidity(
    const U256& sqrt_price_x96,
    U256 sqrt_price_a_x96,
    U256 sqrt_price_b_x96,
    U128 liquidity,
    bool round_up);

// Largest liquidity fundable by amount0/amount1 on [sqrt_a, sqrt_b] at sqrt_price
U128 get_liquidity_for_amounts(
    const U256& sqrt_price_x96,
    U256 sqrt_price_a_x96,
    U256 sqrt_price_b_x96,
    const U256& amount0,
    const U256& amount1);

// liquidity + delta; throws InsufficientLiquidity on underflow and
// ArithmeticOverflow above 2^128 - 1
U128 add_delta(U128 liquidity, I128 delta);

} // namespace liquidity_math

} // namespace clamm

#endif // CLAMM_LIQUIDITY_MATH_HPP
