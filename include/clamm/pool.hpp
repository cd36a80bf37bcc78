#ifndef CLAMM_POOL_HPP
#define CLAMM_POOL_HPP

#include <atomic>
#include <shared_mutex>
#include <mutex>
#include <thread>

#include "types.hpp"
#include "config.hpp"
#include "custody.hpp"
#include "audit.hpp"
#include "tick_ledger.hpp"
#include "position_store.hpp"

namespace clamm {

// =============================================================================
// Pool State
// =============================================================================

struct PoolState {
    U128 liquidity;              // Current active liquidity
    U256 sqrt_price_x96;         // Current sqrt(price) as Q64.96
    int32_t tick;                // Current tick
    U256 fee_growth_global0_x128;
    U256 fee_growth_global1_x128;
    bool unlocked;               // False while an operation is in progress
};

struct PositionView {
    U128 liquidity;
    U128 tokens_owed0;
    U128 tokens_owed1;
};

// =============================================================================
// PoolEngine - concentrated liquidity pool for one token pair
// =============================================================================

class PoolEngine {
public:
    // Throws ValidationError (token order), PriceOutOfRange (initial price)
    // or ConfigError (other fields)
    PoolEngine(const PoolConfig& config, ICustody& custody, IShareLedger& shares,
               IPoolObserver* observer = nullptr);
    ~PoolEngine() = default;

    // Non-copyable
    PoolEngine(const PoolEngine&) = delete;
    PoolEngine& operator=(const PoolEngine&) = delete;

    // =========================================================================
    // Core Operations
    // Each either commits in full or throws a PoolError with nothing changed.
    // =========================================================================

    // Add `amount` liquidity on [tick_lower, tick_upper) for caller.
    // Token amounts are rounded up and debited from caller.
    MintResult mint(const Address& caller, int32_t tick_lower, int32_t tick_upper, U128 amount,
                    const U256& amount0_max, const U256& amount1_max);

    // Remove `amount` liquidity from caller's position; amounts rounded down
    // and credited to caller
    BurnResult burn(const Address& caller, int32_t tick_lower, int32_t tick_upper, U128 amount);

    // amount_specified > 0: exact input, < 0: exact output.
    // Stops at sqrt_price_limit_x96 or when the amount is exhausted.
    SwapResult swap(const Address& caller, bool zero_for_one, const I256& amount_specified,
                    const U256& sqrt_price_limit_x96);

    // =========================================================================
    // Query Operations
    // =========================================================================

    PoolState get_pool_state() const;
    PositionView get_position(const Address& owner, int32_t tick_lower, int32_t tick_upper) const;
    TickInfo get_tick(int32_t tick) const;

    const Currency& token0() const { return token0_; }
    const Currency& token1() const { return token1_; }
    uint32_t fee() const { return fees::FEE_030; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_mints;
        uint64_t total_burns;
        uint64_t total_swaps;
        uint64_t total_ticks_crossed;
        size_t initialized_ticks;
        size_t open_positions;
    };
    Stats get_stats() const;

private:
    // Exclusive lock + in-progress flag for one mutating operation.
    // Rejects re-entry from the thread that already holds it.
    class OperationGuard {
    public:
        explicit OperationGuard(PoolEngine& engine);
        ~OperationGuard();

        OperationGuard(const OperationGuard&) = delete;
        OperationGuard& operator=(const OperationGuard&) = delete;

    private:
        PoolEngine& engine_;
        std::unique_lock<std::shared_mutex> lock_;
    };

    // Shared lock, or no lock when called from inside an operation
    std::shared_lock<std::shared_mutex> read_lock() const;

    PriceSnapshot snapshot() const;
    void notify(const AuditRecord& record) noexcept;

    // Swap loop working state
    struct SwapState {
        I256 amount_remaining;
        I256 amount_calculated;
        U256 sqrt_price_x96;
        int32_t tick;
        U128 liquidity;
    };

    Currency token0_;
    Currency token1_;
    int32_t tick_search_window_;

    ICustody& custody_;
    IShareLedger& shares_;
    IPoolObserver* observer_;

    PoolState state_;
    TickLedger ticks_;
    PositionStore positions_;

    mutable std::shared_mutex mutex_;
    std::atomic<std::thread::id> owner_{};

    // Statistics
    std::atomic<uint64_t> total_mints_{0};
    std::atomic<uint64_t> total_burns_{0};
    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_ticks_crossed_{0};
};

} // namespace clamm

#endif // CLAMM_POOL_HPP
