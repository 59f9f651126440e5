#pragma once

/// @file log.hpp
/// @brief spdlog-backed module loggers

#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

/// Default-logger shorthands for code outside the three modules
#define TESSERA_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define TESSERA_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define TESSERA_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define TESSERA_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define TESSERA_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define TESSERA_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace tessera_core {

using LogLevel = spdlog::level::level_enum;

// =============================================================================
// LogConfig
// =============================================================================

struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    /// One rotating "<logger>.log" per named logger; ignored when empty
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 5;
    LogLevel level = spdlog::level::info;
};

/// Apply a configuration to every named logger, existing and future
void configure_logging(const LogConfig& config);

[[nodiscard]] LogConfig current_log_config();

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger using the current configuration
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Runtime types and configuration
std::shared_ptr<spdlog::logger> core_logger();

/// Entities and entity stores
std::shared_ptr<spdlog::logger> ecs_logger();

/// Systems and dispatch
std::shared_ptr<spdlog::logger> event_logger();

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(LogLevel level);

/// No effect when the logger was never created
void set_logger_level(const std::string& name, LogLevel level);

[[nodiscard]] LogLevel global_log_level();

/// Accepts the canonical names plus "warning", "err" and "fatal"
[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string& str);

[[nodiscard]] const char* log_level_name(LogLevel level);

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flush and drop every named logger
void shutdown_logging();

} // namespace tessera_core
