// =============================================================================
// position_store.cpp - Per-range liquidity positions
// =============================================================================

#include "clamm/position_store.hpp"
#include "clamm/liquidity_math.hpp"
#include "clamm/errors.hpp"

namespace clamm {

Position PositionStore::get(const PositionKey& key) const {
    auto it = positions_.find(key);
    return it != positions_.end() ? it->second : Position{};
}

Position PositionStore::updated(const PositionKey& key, I128 liquidity_delta) const {
    Position pos = get(key);
    if (liquidity_delta < 0 &&
        U128(0) - static_cast<U128>(liquidity_delta) > pos.liquidity) {
        throw InsufficientLiquidity("position holds less liquidity than requested");
    }
    pos.liquidity = liquidity_math::add_delta(pos.liquidity, liquidity_delta);
    return pos;
}

void PositionStore::store(const PositionKey& key, const Position& position) {
    // Zero positions are pruned; readers see them as absent either way
    if (position.liquidity == 0 && position.tokens_owed0 == 0 && position.tokens_owed1 == 0) {
        positions_.erase(key);
        return;
    }
    positions_[key] = position;
}

Position PositionStore::update(const PositionKey& key, I128 liquidity_delta) {
    Position pos = updated(key, liquidity_delta);
    store(key, pos);
    return pos;
}

} // namespace clamm
