#ifndef CLAMM_CONFIG_HPP
#define CLAMM_CONFIG_HPP

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace clamm {

// =============================================================================
// Pool Configuration
// =============================================================================

struct PoolConfig {
    Currency token0;
    Currency token1;
    U256 initial_sqrt_price_x96;

    // Ticks examined per bounded search step during a swap
    int32_t tick_search_window = 2560;

    // Drop a tick's initialized flag (and the entry) once no position uses it
    bool clear_initialized_on_empty = false;

    // debug, info, warn, error, off
    std::string log_level = "info";

    // Throws ConfigError when a field is out of range
    void validate() const;

    // Load from JSON (throws ConfigError)
    static PoolConfig from_json(const nlohmann::json& j);
    static PoolConfig from_string(std::string_view content);
    static PoolConfig from_file(std::string_view path);

    nlohmann::json to_json() const;
};

// Severity order of a log level name; throws ConfigError for unknown names
int log_level_rank(const std::string& level);

} // namespace clamm

#endif // CLAMM_CONFIG_HPP
