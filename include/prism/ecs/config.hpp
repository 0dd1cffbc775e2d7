#pragma once

/// @file config.hpp
/// @brief World configuration for prism_ecs

#include "fwd.hpp"
#include "tick.hpp"
#include <prism/core/error.hpp>
#include <prism/core/log.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace prism_ecs {

/// Settings applied when a World is constructed
///
/// JSON form (all keys optional):
/// @code
/// {
///     "entity_capacity": 1024,
///     "change_tick_check_threshold": 518400000,
///     "log_level": "debug",
///     "log_directory": "logs"
/// }
/// @endcode
struct WorldConfig {
    /// Entity slots reserved up front
    std::size_t entity_capacity{0};

    /// Change-tick increments between clamping passes over stored ticks
    std::uint32_t change_tick_check_threshold{Tick::CHECK_TICK_THRESHOLD};

    spdlog::level::level_enum log_level{spdlog::level::info};

    /// Directory for rotating log files; empty logs to the console only
    std::string log_directory;

    [[nodiscard]] static prism_core::Result<WorldConfig> from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;

    /// Logging settings carrying this config's level and log directory
    [[nodiscard]] prism_core::LogConfig log_config() const;
};

/// Parse a config from a JSON string
[[nodiscard]] prism_core::Result<WorldConfig> parse_world_config(const std::string& json_str);

/// Load a config from a JSON file
[[nodiscard]] prism_core::Result<WorldConfig> load_world_config(const std::filesystem::path& path);

} // namespace prism_ecs
