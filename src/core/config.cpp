/// @file config.cpp
/// @brief JSON configuration loading for tessera_core

#include <tessera/core/config.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>

namespace tessera_core {

namespace {

Error parse_error(const std::string& message) {
    return Error(ErrorCode::ParseError, message);
}

/// Read an optional boolean field
Result<void> read_bool(const nlohmann::json& section, const char* key,
                       const std::string& path, bool& out) {
    if (!section.contains(key)) {
        return Ok();
    }
    const auto& value = section[key];
    if (!value.is_boolean()) {
        return parse_error("'" + path + "." + key + "' must be a boolean");
    }
    out = value.get<bool>();
    return Ok();
}

/// Read an optional non-negative integer field
Result<void> read_size(const nlohmann::json& section, const char* key,
                       const std::string& path, std::size_t& out) {
    if (!section.contains(key)) {
        return Ok();
    }
    const auto& value = section[key];
    if (!value.is_number_unsigned()) {
        return parse_error("'" + path + "." + key + "' must be a non-negative integer");
    }
    out = value.get<std::size_t>();
    return Ok();
}

Result<void> parse_log_section(const nlohmann::json& j, LogConfig& log) {
    if (!j.is_object()) {
        return parse_error("'log' must be an object");
    }

    if (j.contains("level")) {
        if (!j["level"].is_string()) {
            return parse_error("'log.level' must be a string");
        }
        auto level_name = j["level"].get<std::string>();
        auto level = parse_log_level(level_name);
        if (!level) {
            return parse_error("Unknown log level: " + level_name);
        }
        log.level = *level;
    }

    if (j.contains("directory")) {
        if (!j["directory"].is_string()) {
            return parse_error("'log.directory' must be a string");
        }
        log.log_directory = j["directory"].get<std::string>();
    }

    if (auto r = read_bool(j, "console", "log", log.console_enabled); !r) return r;
    if (auto r = read_bool(j, "file", "log", log.file_enabled); !r) return r;
    if (auto r = read_size(j, "max_file_size", "log", log.max_file_size); !r) return r;
    if (auto r = read_size(j, "max_files", "log", log.max_files); !r) return r;

    return Ok();
}

Result<void> parse_dispatch_section(const nlohmann::json& j, DispatchConfig& dispatch) {
    if (!j.is_object()) {
        return parse_error("'dispatch' must be an object");
    }
    if (auto r = read_bool(j, "log_unhandled_events", "dispatch", dispatch.log_unhandled_events); !r) return r;
    if (auto r = read_bool(j, "record_errors", "dispatch", dispatch.record_errors); !r) return r;
    return Ok();
}

} // anonymous namespace

// =============================================================================
// Parsing
// =============================================================================

Result<CoreConfig> parse_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<CoreConfig>(parse_error("Configuration root must be an object"));
    }

    CoreConfig config;

    if (j.contains("log")) {
        auto r = parse_log_section(j["log"], config.log);
        if (!r) {
            return Err<CoreConfig>(r.error());
        }
    }

    if (j.contains("dispatch")) {
        auto r = parse_dispatch_section(j["dispatch"], config.dispatch);
        if (!r) {
            return Err<CoreConfig>(r.error());
        }
    }

    return Ok(std::move(config));
}

Result<CoreConfig> parse_config(const std::string& json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::exception& e) {
        return Err<CoreConfig>(parse_error("Failed to parse configuration JSON: " + std::string(e.what())));
    }
    return parse_config(j);
}

Result<CoreConfig> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<CoreConfig>(Error(ErrorCode::IOError, "Failed to open configuration: " + path.string()));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    auto result = parse_config(content);
    if (!result) {
        result.error().with_context("path", path.string());
        core_logger()->warn("{}", build_error_chain(result.error()));
    }
    return result;
}

nlohmann::json config_to_json(const CoreConfig& config) {
    nlohmann::json j;
    j["log"]["level"] = log_level_name(config.log.level);
    j["log"]["console"] = config.log.console_enabled;
    j["log"]["file"] = config.log.file_enabled;
    j["log"]["directory"] = config.log.log_directory;
    j["log"]["max_file_size"] = config.log.max_file_size;
    j["log"]["max_files"] = config.log.max_files;
    j["dispatch"]["log_unhandled_events"] = config.dispatch.log_unhandled_events;
    j["dispatch"]["record_errors"] = config.dispatch.record_errors;
    return j;
}

void apply_config(const CoreConfig& config) {
    configure_logging(config.log);
    core_logger()->debug("Logging configured (level={}, console={}, file={})",
                         log_level_name(config.log.level),
                         config.log.console_enabled,
                         config.log.file_enabled);
}

} // namespace tessera_core
