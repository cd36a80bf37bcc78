#ifndef CLAMM_AUDIT_HPP
#define CLAMM_AUDIT_HPP

#include <vector>
#include <mutex>
#include <ostream>
#include <string>

#include "types.hpp"

namespace clamm {

// =============================================================================
// Audit Records
// =============================================================================

enum class AuditKind : uint8_t {
    Mint = 0,
    Burn = 1,
    Swap = 2
};

const char* to_string(AuditKind kind);

struct PriceSnapshot {
    U256 sqrt_price_x96;
    int32_t tick;
    U128 liquidity;              // Active liquidity
};

struct AuditRecord {
    AuditKind kind;
    Address actor;

    // Mint / burn
    int32_t tick_lower = 0;
    int32_t tick_upper = 0;
    U128 liquidity = 0;

    // Swap
    bool zero_for_one = false;
    I256 amount_specified;

    // Positive = actor paid the pool, negative = pool paid the actor
    BalanceDelta delta;

    PriceSnapshot before;
    PriceSnapshot after;
};

// =============================================================================
// Observer Interface
// Called once per successful operation, after commit. Never called for
// failed operations. The operation is already published when this runs, so
// observers cannot fail it.
// =============================================================================

class IPoolObserver {
public:
    virtual ~IPoolObserver() = default;
    virtual void on_record(const AuditRecord& record) noexcept = 0;
};

// =============================================================================
// AuditLog - in-memory record list with optional line output
// =============================================================================

class AuditLog : public IPoolObserver {
public:
    AuditLog() = default;

    // Write one line per record to `out` when log_level is "debug" or "info"
    AuditLog(std::ostream& out, const std::string& log_level);

    void on_record(const AuditRecord& record) noexcept override;

    std::vector<AuditRecord> records() const;
    size_t size() const;
    void clear();

    static std::string format(const AuditRecord& record);

private:
    std::vector<AuditRecord> records_;
    mutable std::mutex mutex_;

    std::ostream* out_ = nullptr;
};

} // namespace clamm

#endif // CLAMM_AUDIT_HPP
