#pragma once

/// @file config.hpp
/// @brief Library configuration loaded from JSON

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>

namespace tessera_core {

// =============================================================================
// Configuration
// =============================================================================

/// Dispatcher behavior switches
struct DispatchConfig {
    /// Log events that reach no handler (debug level on the event logger)
    bool log_unhandled_events = false;
    /// Feed returned errors into debug::record_error
    bool record_errors = true;
};

/// Aggregate configuration for all tessera modules
struct CoreConfig {
    LogConfig log;
    DispatchConfig dispatch;
};

/// Parse configuration from a JSON document.
/// Every key is optional; unknown keys are ignored.
/// Wrong value types and unknown log levels yield ErrorCode::ParseError.
[[nodiscard]] Result<CoreConfig> parse_config(const nlohmann::json& j);

/// Parse configuration from JSON text
[[nodiscard]] Result<CoreConfig> parse_config(const std::string& json_text);

/// Load configuration from a JSON file
[[nodiscard]] Result<CoreConfig> load_config(const std::filesystem::path& path);

/// Serialize configuration back to JSON
[[nodiscard]] nlohmann::json config_to_json(const CoreConfig& config);

/// Apply the logging section of a configuration
void apply_config(const CoreConfig& config);

} // namespace tessera_core
