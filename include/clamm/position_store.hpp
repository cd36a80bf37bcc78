#ifndef CLAMM_POSITION_STORE_HPP
#define CLAMM_POSITION_STORE_HPP

#include <map>
#include <tuple>

#include "types.hpp"

namespace clamm {

// =============================================================================
// Position Info
// Fee fields are carried for layout compatibility and stay zero: this engine
// does not accrue fees to positions.
// =============================================================================

struct Position {
    U128 liquidity;
    U256 fee_growth_inside0_last_x128;
    U256 fee_growth_inside1_last_x128;
    U128 tokens_owed0;             // Uncollected fees
    U128 tokens_owed1;
};

struct PositionKey {
    Address owner;
    int32_t tick_lower;
    int32_t tick_upper;

    bool operator<(const PositionKey& other) const {
        return std::tie(owner, tick_lower, tick_upper) <
               std::tie(other.owner, other.tick_lower, other.tick_upper);
    }
};

// =============================================================================
// PositionStore - sparse (owner, lower, upper) -> Position
// Absent and all-zero positions are indistinguishable to readers.
// =============================================================================

class PositionStore {
public:
    Position get(const PositionKey& key) const;

    // Position after applying liquidity_delta, without storing it.
    // Throws InsufficientLiquidity when removing more than the position holds.
    Position updated(const PositionKey& key, I128 liquidity_delta) const;

    void store(const PositionKey& key, const Position& position);

    Position update(const PositionKey& key, I128 liquidity_delta);

    size_t size() const { return positions_.size(); }

private:
    std::map<PositionKey, Position> positions_;
};

} // namespace clamm

#endif // CLAMM_POSITION_STORE_HPP
