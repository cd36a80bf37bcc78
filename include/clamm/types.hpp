#ifndef CLAMM_TYPES_HPP
#define CLAMM_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

namespace clamm {

// =============================================================================
// Account Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Address with the given value in the low 8 bytes (test and example accounts)
constexpr Address from_index(uint64_t index) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((index >> (8 * i)) & 0xFF);
    }
    return addr;
}

// Parse "0x" + 40 hex digits; throws ValidationError on malformed input
Address from_hex(std::string_view hex);

// Lowercase "0x"-prefixed hex
std::string to_hex(const Address& addr);

} // namespace addresses

// =============================================================================
// Integer Types
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// Wide integers for Q64.96 prices and their products
using U256 = boost::multiprecision::uint256_t;
using I256 = boost::multiprecision::int256_t;
using U512 = boost::multiprecision::uint512_t;

constexpr U128 U128_MAX = ~U128(0);
constexpr I128 I128_MAX = static_cast<I128>(U128_MAX >> 1);
constexpr I128 I128_MIN = -I128_MAX - 1;

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// =============================================================================
// Fee (hundredths of a bip)
// =============================================================================

namespace fees {
constexpr uint32_t FEE_DENOMINATOR = 1000000;  // 1 pip = 0.0001%
constexpr uint32_t FEE_030 = 3000;             // 0.30%, the only pool fee
}

// =============================================================================
// Balance Delta (Signed Token Amounts)
// Positive = caller owes the pool, negative = pool owes the caller
// =============================================================================

struct BalanceDelta {
    I256 amount0;
    I256 amount1;

    BalanceDelta operator+(const BalanceDelta& other) const {
        return {amount0 + other.amount0, amount1 + other.amount1};
    }

    BalanceDelta operator-() const {
        return {-amount0, -amount1};
    }
};

// =============================================================================
// Operation Results
// =============================================================================

struct MintResult {
    U256 amount0;  // token0 debited from the caller
    U256 amount1;  // token1 debited from the caller
};

struct BurnResult {
    U256 amount0;  // token0 credited to the caller
    U256 amount1;  // token1 credited to the caller
};

struct SwapResult {
    BalanceDelta delta;
    U256 sqrt_price_x96;     // price after the swap
    int32_t tick;            // tick after the swap
    U128 liquidity;          // active liquidity after the swap
    U256 fee_amount;         // fee withheld from the input token
    uint32_t ticks_crossed;
};

} // namespace clamm

#endif // CLAMM_TYPES_HPP
