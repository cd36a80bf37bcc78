// =============================================================================
// config.cpp - Pool configuration loading
// =============================================================================

#include "clamm/config.hpp"
#include "clamm/errors.hpp"
#include "clamm/tick_math.hpp"

#include <boost/multiprecision/cpp_int.hpp>
#include <nlohmann/json.hpp>
#include <limits>
#include <fstream>
#include <sstream>

namespace clamm {

namespace {

// Parsed unbounded so that values past 2^256 are rejected instead of wrapping
U256 parse_sqrt_price(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("initial_sqrt_price_x96 must be a decimal string: " + text);
    }
    boost::multiprecision::cpp_int value(text);
    if (value > boost::multiprecision::cpp_int((std::numeric_limits<U256>::max)())) {
        throw ConfigError("initial_sqrt_price_x96 exceeds 256 bits: " + text);
    }
    return U256(value);
}

} // anonymous namespace

int log_level_rank(const std::string& level) {
    if (level == "debug") return 0;
    if (level == "info") return 1;
    if (level == "warn") return 2;
    if (level == "error") return 3;
    if (level == "off") return 4;
    throw ConfigError("unknown log level: " + level);
}

void PoolConfig::validate() const {
    if (!(token0 < token1)) {
        throw ConfigError("token0 must sort below token1");
    }
    if (initial_sqrt_price_x96 < tick_math::MIN_SQRT_RATIO ||
        initial_sqrt_price_x96 >= tick_math::MAX_SQRT_RATIO) {
        throw ConfigError("initial_sqrt_price_x96 out of range: " + initial_sqrt_price_x96.str());
    }
    if (tick_search_window <= 0) {
        throw ConfigError("tick_search_window must be positive");
    }
    log_level_rank(log_level);
}

PoolConfig PoolConfig::from_json(const nlohmann::json& j) {
    PoolConfig config;
    try {
        config.token0 = Currency(addresses::from_hex(j.at("token0").get<std::string>()));
        config.token1 = Currency(addresses::from_hex(j.at("token1").get<std::string>()));

        // Prices exceed 64 bits, so they are carried as decimal strings
        const auto& price = j.at("initial_sqrt_price_x96");
        if (price.is_string()) {
            config.initial_sqrt_price_x96 = parse_sqrt_price(price.get<std::string>());
        } else if (price.is_number_unsigned()) {
            config.initial_sqrt_price_x96 = U256(price.get<uint64_t>());
        } else {
            throw ConfigError("initial_sqrt_price_x96 must be a decimal string or unsigned integer");
        }

        if (j.contains("tick_search_window")) {
            config.tick_search_window = j["tick_search_window"].get<int32_t>();
        }
        if (j.contains("clear_initialized_on_empty")) {
            config.clear_initialized_on_empty = j["clear_initialized_on_empty"].get<bool>();
        }
        if (j.contains("log_level")) {
            config.log_level = j["log_level"].get<std::string>();
        }
    } catch (const ConfigError&) {
        throw;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid pool config: ") + e.what());
    } catch (const ValidationError& e) {
        throw ConfigError(std::string("invalid pool config: ") + e.what());
    }

    config.validate();
    return config;
}

PoolConfig PoolConfig::from_string(std::string_view content) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("malformed config JSON: ") + e.what());
    }
    return from_json(j);
}

PoolConfig PoolConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

nlohmann::json PoolConfig::to_json() const {
    return nlohmann::json{
        {"token0", addresses::to_hex(token0.addr)},
        {"token1", addresses::to_hex(token1.addr)},
        {"initial_sqrt_price_x96", initial_sqrt_price_x96.str()},
        {"tick_search_window", tick_search_window},
        {"clear_initialized_on_empty", clear_initialized_on_empty},
        {"log_level", log_level},
    };
}

} // namespace clamm
