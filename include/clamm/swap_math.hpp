#ifndef CLAMM_SWAP_MATH_HPP
#define CLAMM_SWAP_MATH_HPP

#include "types.hpp"

namespace clamm {

namespace swap_math {

// Result of one constant-product step between two prices
struct SwapStep {
    U256 sqrt_price_next_x96;
    U256 amount_in;    // principal, excluding fee
    U256 amount_out;
    U256 fee_amount;
};

// Swap within a single liquidity segment from sqrt_price_current_x96 toward
// sqrt_price_target_x96. Direction is implied by the two prices;
// amount_remaining > 0 is exact input, < 0 is exact output.
//
// The fee is always withheld from the gross input before the step is sized:
//   exact input, target reached:  fee = ceil(amount_in * fee / (1e6 - fee))
//   exact input, target not met:  the whole remainder is spent, fee = remaining - amount_in
//   exact output:                 fee = ceil(amount_in * fee / (1e6 - fee)) on top of amount_in
SwapStep compute_swap_step(const U256& sqrt_price_current_x96,
                           const U256& sqrt_price_target_x96,
                           U128 liquidity,
                           const I256& amount_remaining,
                           uint32_t fee_pips);

} // namespace swap_math

} // namespace clamm

#endif // CLAMM_SWAP_MATH_HPP
