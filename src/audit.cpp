// =============================================================================
// audit.cpp - Audit record collection and formatting
// =============================================================================

#include "clamm/audit.hpp"
#include "clamm/config.hpp"
#include "clamm/full_math.hpp"
#include "clamm/tick_math.hpp"

#include <sstream>

namespace clamm {

const char* to_string(AuditKind kind) {
    switch (kind) {
        case AuditKind::Mint: return "mint";
        case AuditKind::Burn: return "burn";
        case AuditKind::Swap: return "swap";
    }
    return "unknown";
}

AuditLog::AuditLog(std::ostream& out, const std::string& log_level) {
    // Records are line-logged at info and below
    if (log_level_rank(log_level) <= log_level_rank("info")) {
        out_ = &out;
    }
}

void AuditLog::on_record(const AuditRecord& record) noexcept {
    std::lock_guard lock(mutex_);
    records_.push_back(record);
    if (out_) {
        *out_ << format(record) << '\n';
    }
}

std::vector<AuditRecord> AuditLog::records() const {
    std::lock_guard lock(mutex_);
    return records_;
}

size_t AuditLog::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

void AuditLog::clear() {
    std::lock_guard lock(mutex_);
    records_.clear();
}

std::string AuditLog::format(const AuditRecord& record) {
    std::ostringstream ss;
    ss << "[" << to_string(record.kind) << "] actor=" << addresses::to_hex(record.actor);

    if (record.kind == AuditKind::Swap) {
        ss << " zero_for_one=" << (record.zero_for_one ? "true" : "false")
           << " specified=" << record.amount_specified;
    } else {
        ss << " range=[" << record.tick_lower << "," << record.tick_upper << ")"
           << " liquidity=" << full_math::to_u256(record.liquidity).str();
    }

    ss << " amount0=" << record.delta.amount0
       << " amount1=" << record.delta.amount1
       << " tick=" << record.before.tick << "->" << record.after.tick
       << " price=" << tick_math::price_from_sqrt_ratio(record.before.sqrt_price_x96)
       << "->" << tick_math::price_from_sqrt_ratio(record.after.sqrt_price_x96)
       << " active=" << full_math::to_u256(record.before.liquidity).str()
       << "->" << full_math::to_u256(record.after.liquidity).str();
    return ss.str();
}

} // namespace clamm
