// clamm - Basic Pool Example
// Deploys a pool, adds liquidity, swaps through the range and withdraws

#include <clamm/pool.hpp>
#include <clamm/tick_math.hpp>
#include <clamm/full_math.hpp>
#include <clamm/errors.hpp>
#include <iostream>
#include <limits>

using namespace clamm;

namespace {

void print_state(const PoolEngine& pool) {
    PoolState state = pool.get_pool_state();
    std::cout << "  tick=" << state.tick
              << " price=" << tick_math::price_from_sqrt_ratio(state.sqrt_price_x96)
              << " active_liquidity=" << full_math::to_u256(state.liquidity) << "\n";
}

} // namespace

int main(int argc, char** argv) {
    const Address pool_account = addresses::from_index(0xa11);
    const Address provider = addresses::from_index(1);
    const Address trader = addresses::from_index(2);

    // Build configuration
    PoolConfig config;
    try {
        if (argc > 1) {
            config = PoolConfig::from_file(argv[1]);
        } else {
            config.token0 = Currency(addresses::from_index(0x100));
            config.token1 = Currency(addresses::from_index(0x200));
            config.initial_sqrt_price_x96 = tick_math::get_sqrt_ratio_at_tick(69200);
        }
    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    // Token custody with funded, approved accounts
    InMemoryCustody custody(pool_account);
    InMemoryShareLedger shares;
    const U256 funding = U256(1) << 160;
    const U256 unlimited = (std::numeric_limits<U256>::max)();
    for (const Address& account : {provider, trader}) {
        custody.deposit(account, config.token0, funding);
        custody.deposit(account, config.token1, funding);
        custody.approve(account, config.token0, unlimited);
        custody.approve(account, config.token1, unlimited);
    }

    AuditLog audit(std::cout, config.log_level);

    try {
        PoolEngine pool(config, custody, shares, &audit);

        std::cout << "Pool deployed: token0=" << addresses::to_hex(config.token0.addr)
                  << " token1=" << addresses::to_hex(config.token1.addr)
                  << " fee=" << pool.fee() << "\n";
        print_state(pool);

        // Provide liquidity around the current price
        int32_t lower = 69080;
        int32_t upper = 69320;
        std::cout << "\nMinting 1000000 liquidity in [" << lower << ", " << upper << ")...\n";
        MintResult minted = pool.mint(provider, lower, upper, 1000000, unlimited, unlimited);
        std::cout << "  paid token0=" << minted.amount0 << " token1=" << minted.amount1 << "\n";
        print_state(pool);

        // Swap token0 for token1 down to half the starting sqrt price
        U256 limit = pool.get_pool_state().sqrt_price_x96 / 2;
        std::cout << "\nSwapping 10e18 token0 for token1...\n";
        SwapResult swapped = pool.swap(trader, true, I256("10000000000000000000"), limit);
        std::cout << "  delta token0=" << swapped.delta.amount0
                  << " token1=" << swapped.delta.amount1
                  << " fee=" << swapped.fee_amount
                  << " ticks_crossed=" << swapped.ticks_crossed << "\n";
        print_state(pool);

        // Withdraw half of the position
        std::cout << "\nBurning 500000 liquidity...\n";
        BurnResult burned = pool.burn(provider, lower, upper, 500000);
        std::cout << "  received token0=" << burned.amount0 << " token1=" << burned.amount1 << "\n";

        PositionView position = pool.get_position(provider, lower, upper);
        std::cout << "  remaining position liquidity=" << full_math::to_u256(position.liquidity)
                  << " shares=" << full_math::to_u256(shares.balance_of(provider)) << "\n";

        // Rejected request leaves the pool unchanged
        try {
            pool.burn(provider, lower, upper, 1000000);
        } catch (const InsufficientLiquidity& e) {
            std::cout << "\nOver-burn rejected: " << e.what() << " (code " << e.code() << ")\n";
        }

        PoolEngine::Stats stats = pool.get_stats();
        std::cout << "\nStats: mints=" << stats.total_mints
                  << " burns=" << stats.total_burns
                  << " swaps=" << stats.total_swaps
                  << " ticks_crossed=" << stats.total_ticks_crossed
                  << " audit_records=" << audit.size() << "\n";

    } catch (const PoolError& e) {
        std::cerr << "Error: " << e.what() << " (code " << e.code() << ")\n";
        return 1;
    }

    return 0;
}
