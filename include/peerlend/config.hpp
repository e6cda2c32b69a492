#ifndef PEERLEND_CONFIG_HPP
#define PEERLEND_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "types.hpp"

namespace peerlend {

struct GeneralConfig {
    std::string log_level = "warning";
    std::string log_file;             // empty = std::clog
    uint8_t risk_category = 0;        // 0 = any reserve
};

// Default matching budgets per action
struct IterationsConfig {
    uint32_t supply = constants::DEFAULT_MAX_ITERATIONS;
    uint32_t borrow = constants::DEFAULT_MAX_ITERATIONS;
    uint32_t repay = constants::DEFAULT_MAX_ITERATIONS;
    uint32_t withdraw = constants::DEFAULT_MAX_ITERATIONS;
};

struct EngineConfig {
    GeneralConfig general;
    IterationsConfig iterations;

    // Load from a TOML file. Throws std::runtime_error if the file cannot be
    // read or a value is malformed.
    static EngineConfig from_file(std::string_view path);

    // Parse TOML text. Unknown sections and keys are ignored.
    static EngineConfig from_toml(std::string_view content);

    // Point the Logger at general.log_level and general.log_file
    void init_logging() const;
};

} // namespace peerlend

#endif // PEERLEND_CONFIG_HPP
