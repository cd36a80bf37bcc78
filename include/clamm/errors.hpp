#ifndef CLAMM_ERRORS_HPP
#define CLAMM_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace clamm {

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t INVALID_TICK_RANGE = -3;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -4;
constexpr int32_t PRICE_LIMIT_EXCEEDED = -5;
constexpr int32_t CURRENCIES_NOT_SORTED = -7;
constexpr int32_t ZERO_AMOUNT = -9;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -11;
constexpr int32_t SLIPPAGE_EXCEEDED = -16;
constexpr int32_t ARITHMETIC_OVERFLOW = -17;
constexpr int32_t INVALID_PRICE = -22;
constexpr int32_t INVALID_ADDRESS = -23;
constexpr int32_t REENTRANCY = -30;
constexpr int32_t INVALID_CONFIG = -50;
}

// =============================================================================
// Exceptions
// Every engine operation either commits all of its mutations or throws one of
// these before committing any.
// =============================================================================

class PoolError : public std::runtime_error {
public:
    PoolError(int32_t code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

// Malformed tick range, out-of-range tick, zero amount, invalid price limit
class ValidationError : public PoolError {
public:
    explicit ValidationError(const std::string& msg, int32_t code = errors::INVALID_TICK_RANGE)
        : PoolError(code, msg) {}
};

// Custody shortfall (balance or allowance)
class InsufficientFunds : public PoolError {
public:
    explicit InsufficientFunds(const std::string& msg, int32_t code = errors::INSUFFICIENT_BALANCE)
        : PoolError(code, msg) {}
};

// Burn exceeds holdings, or a ledger would underflow
class InsufficientLiquidity : public PoolError {
public:
    explicit InsufficientLiquidity(const std::string& msg)
        : PoolError(errors::INSUFFICIENT_LIQUIDITY, msg) {}
};

// Mint cost exceeds the caller's maxima
class SlippageExceeded : public PoolError {
public:
    explicit SlippageExceeded(const std::string& msg)
        : PoolError(errors::SLIPPAGE_EXCEEDED, msg) {}
};

// Fixed-point intermediate exceeds its representable range
class ArithmeticOverflow : public PoolError {
public:
    explicit ArithmeticOverflow(const std::string& msg)
        : PoolError(errors::ARITHMETIC_OVERFLOW, msg) {}
};

// Sqrt price or tick outside the global bounds
class PriceOutOfRange : public PoolError {
public:
    explicit PriceOutOfRange(const std::string& msg)
        : PoolError(errors::INVALID_PRICE, msg) {}
};

// Operation entered while another one is in progress on the same thread
class ReentrancyError : public PoolError {
public:
    explicit ReentrancyError(const std::string& msg)
        : PoolError(errors::REENTRANCY, msg) {}
};

// Unreadable or invalid pool configuration
class ConfigError : public PoolError {
public:
    explicit ConfigError(const std::string& msg)
        : PoolError(errors::INVALID_CONFIG, msg) {}
};

} // namespace clamm

#endif // CLAMM_ERRORS_HPP
