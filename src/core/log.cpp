/// @file log.cpp
/// @brief Logging system implementation for prism_core
///
/// Named spdlog loggers per subsystem with a shared level and sink setup.

#include <prism/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace prism_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

/// Registry of named loggers
struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    spdlog::level::level_enum global_level = spdlog::level::info;
    std::string log_directory;
    bool console_enabled = true;
    bool file_enabled = false;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Create sinks based on current configuration
std::vector<spdlog::sink_ptr> create_sinks(const std::string& name) {
    auto& reg = get_registry();
    std::vector<spdlog::sink_ptr> sinks;

    if (reg.console_enabled) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console_sink);
    }

    if (reg.file_enabled && !reg.log_directory.empty()) {
        std::filesystem::path log_path = std::filesystem::path(reg.log_directory) / (name + ".log");
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path.string(),
                reg.max_file_size,
                reg.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::warn("Cannot open log file {}: {}", log_path.string(), ex.what());
        }
    }

    return sinks;
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.console_enabled = config.console_enabled;
    reg.file_enabled = config.file_enabled;
    reg.log_directory = config.log_directory;
    reg.max_file_size = config.max_file_size;
    reg.max_files = config.max_files;
    reg.global_level = config.level;

    // Loggers created before this call pick up the new sinks too
    for (auto& [name, logger] : reg.loggers) {
        logger->sinks() = create_sinks(name);
        logger->set_level(reg.global_level);
    }

    spdlog::set_level(reg.global_level);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    // Another component may have registered the name with spdlog directly
    if (auto existing = spdlog::get(name)) {
        reg.loggers[name] = existing;
        return existing;
    }

    auto sinks = create_sinks(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.global_level);

    reg.loggers[name] = logger;
    spdlog::register_logger(logger);

    return logger;
}

std::shared_ptr<spdlog::logger> ecs_logger() {
    return get_logger("prism_ecs");
}

std::shared_ptr<spdlog::logger> schedule_logger() {
    return get_logger("prism_schedule");
}

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.global_level = level;
    spdlog::set_level(level);

    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        it->second->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.global_level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();
}

} // namespace prism_core
