/// @file config.cpp
/// @brief WorldConfig JSON loading

#include <prism/ecs/config.hpp>

#include <fstream>
#include <iterator>

namespace prism_ecs {

using prism_core::ConfigError;
using prism_core::Error;
using prism_core::Result;

Result<WorldConfig> WorldConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error(ConfigError::invalid_value("<root>", "world config must be an object"));
    }

    WorldConfig config;

    if (j.contains("entity_capacity")) {
        const auto& value = j["entity_capacity"];
        if (!value.is_number_unsigned()) {
            return Error(ConfigError::invalid_value("entity_capacity", "expected a non-negative integer"));
        }
        config.entity_capacity = value.get<std::size_t>();
    }

    if (j.contains("change_tick_check_threshold")) {
        const auto& value = j["change_tick_check_threshold"];
        if (!value.is_number_unsigned()) {
            return Error(ConfigError::invalid_value("change_tick_check_threshold",
                "expected a non-negative integer"));
        }
        auto threshold = value.get<std::uint64_t>();
        if (threshold == 0 || threshold > Tick::MAX_CHANGE_AGE) {
            return Error(ConfigError::invalid_value("change_tick_check_threshold",
                "must be between 1 and " + std::to_string(Tick::MAX_CHANGE_AGE)));
        }
        config.change_tick_check_threshold = static_cast<std::uint32_t>(threshold);
    }

    if (j.contains("log_level")) {
        const auto& value = j["log_level"];
        if (!value.is_string()) {
            return Error(ConfigError::invalid_value("log_level", "expected a string"));
        }
        auto level = prism_core::parse_log_level(value.get<std::string>());
        if (!level) {
            return Error(ConfigError::invalid_value("log_level",
                "unknown level '" + value.get<std::string>() + "'"));
        }
        config.log_level = *level;
    }

    if (j.contains("log_directory")) {
        const auto& value = j["log_directory"];
        if (!value.is_string()) {
            return Error(ConfigError::invalid_value("log_directory", "expected a string"));
        }
        config.log_directory = value.get<std::string>();
    }

    return config;
}

nlohmann::json WorldConfig::to_json() const {
    nlohmann::json j;
    j["entity_capacity"] = entity_capacity;
    j["change_tick_check_threshold"] = change_tick_check_threshold;
    j["log_level"] = prism_core::log_level_name(log_level);
    if (!log_directory.empty()) {
        j["log_directory"] = log_directory;
    }
    return j;
}

prism_core::LogConfig WorldConfig::log_config() const {
    prism_core::LogConfig config;
    config.level = log_level;
    config.file_enabled = !log_directory.empty();
    config.log_directory = log_directory;
    return config;
}

Result<WorldConfig> parse_world_config(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::exception& e) {
        return Error(ConfigError::parse_failed(e.what()));
    }

    return WorldConfig::from_json(j);
}

Result<WorldConfig> load_world_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        PRISM_LOG_WARN("World config not found: {}", path.string());
        return Error(ConfigError::file_not_found(path.string()));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    auto result = parse_world_config(content);
    if (!result) {
        result.error().with_context("path", path.string());
        PRISM_LOG_ERROR("Failed to load world config: {}", prism_core::build_error_chain(result.error()));
    }
    return result;
}

} // namespace prism_ecs
