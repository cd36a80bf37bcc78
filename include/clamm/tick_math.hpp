#ifndef CLAMM_TICK_MATH_HPP
#define CLAMM_TICK_MATH_HPP

#include "types.hpp"

namespace clamm {

// =============================================================================
// Tick Math: tick <-> sqrt(1.0001^tick) as Q64.96
// =============================================================================

namespace tick_math {

// Minimum and maximum ticks
constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;

// sqrt ratios at MIN_TICK and MAX_TICK (Q64.96)
inline const U256 MIN_SQRT_RATIO = U256(4295128739ULL);
inline const U256 MAX_SQRT_RATIO = U256("1461446703485210103287273052203988822378723970342");

// sqrt(1.0001^tick) * 2^96, rounded up.
// Throws PriceOutOfRange if tick is outside [MIN_TICK, MAX_TICK].
U256 get_sqrt_ratio_at_tick(int32_t tick);

// Greatest tick whose sqrt ratio is <= sqrt_price_x96.
// Throws PriceOutOfRange if sqrt_price_x96 is outside [MIN_SQRT_RATIO, MAX_SQRT_RATIO].
int32_t get_tick_at_sqrt_ratio(const U256& sqrt_price_x96);

// (sqrt_price / 2^96)^2, for display only
double price_from_sqrt_ratio(const U256& sqrt_price_x96);

// Throw ValidationError for ticks outside the bounds / inverted ranges
void check_tick(int32_t tick);
void check_ticks(int32_t tick_lower, int32_t tick_upper);

} // namespace tick_math

} // namespace clamm

#endif // CLAMM_TICK_MATH_HPP
