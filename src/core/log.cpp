/// @file log.cpp
/// @brief Named logger registry and sink construction

#include <tessera/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <filesystem>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace tessera_core {

namespace {

constexpr const char* k_console_pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* k_file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

/// Canonical names first; aliases only parse
constexpr std::array<std::pair<const char*, LogLevel>, 10> k_level_names{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
    {"warning", spdlog::level::warn},
    {"err", spdlog::level::err},
    {"fatal", spdlog::level::critical},
}};

class LoggerRegistry {
public:
    static LoggerRegistry& instance() {
        static LoggerRegistry registry;
        return registry;
    }

    void configure(const LogConfig& config) {
        std::lock_guard lock(m_mutex);
        m_config = config;
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
            logger->sinks() = sinks_for(name);
            logger->set_level(config.level);
        }
        spdlog::set_level(config.level);
    }

    LogConfig config() {
        std::lock_guard lock(m_mutex);
        return m_config;
    }

    std::shared_ptr<spdlog::logger> get(const std::string& name) {
        std::lock_guard lock(m_mutex);
        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            return it->second;
        }

        // Adopt loggers registered directly with spdlog under the same name
        auto logger = spdlog::get(name);
        if (!logger) {
            auto sinks = sinks_for(name);
            logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            logger->set_level(m_config.level);
            spdlog::register_logger(logger);
        }
        m_loggers.emplace(name, logger);
        return logger;
    }

    void set_level(LogLevel level) {
        std::lock_guard lock(m_mutex);
        m_config.level = level;
        spdlog::set_level(level);
        for (auto& [name, logger] : m_loggers) {
            logger->set_level(level);
        }
    }

    void set_level(const std::string& name, LogLevel level) {
        std::lock_guard lock(m_mutex);
        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            it->second->set_level(level);
        }
    }

    void flush() {
        std::lock_guard lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
        }
        spdlog::default_logger()->flush();
    }

    void drop_all() {
        std::lock_guard lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
            spdlog::drop(name);
        }
        m_loggers.clear();
    }

private:
    // Caller holds m_mutex
    std::vector<spdlog::sink_ptr> sinks_for(const std::string& name) const {
        std::vector<spdlog::sink_ptr> sinks;

        if (m_config.console_enabled) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_pattern(k_console_pattern);
            sinks.push_back(std::move(console));
        }

        if (!m_config.file_enabled || m_config.log_directory.empty()) {
            return sinks;
        }

        std::filesystem::path directory(m_config.log_directory);
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            spdlog::warn("Cannot create log directory '{}': {}", directory.string(), ec.message());
            return sinks;
        }

        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (directory / (name + ".log")).string(), m_config.max_file_size, m_config.max_files);
            file->set_pattern(k_file_pattern);
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file for '{}': {}", name, e.what());
        }
        return sinks;
    }

    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> m_loggers;
    LogConfig m_config;
};

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    LoggerRegistry::instance().configure(config);
}

LogConfig current_log_config() {
    return LoggerRegistry::instance().config();
}

// =============================================================================
// Named Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    return LoggerRegistry::instance().get(name);
}

std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("tessera_core");
}

std::shared_ptr<spdlog::logger> ecs_logger() {
    return get_logger("tessera_ecs");
}

std::shared_ptr<spdlog::logger> event_logger() {
    return get_logger("tessera_event");
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(LogLevel level) {
    LoggerRegistry::instance().set_level(level);
}

void set_logger_level(const std::string& name, LogLevel level) {
    LoggerRegistry::instance().set_level(name, level);
}

LogLevel global_log_level() {
    return LoggerRegistry::instance().config().level;
}

std::optional<LogLevel> parse_log_level(const std::string& str) {
    for (const auto& [name, level] : k_level_names) {
        if (str == name) {
            return level;
        }
    }
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    for (const auto& [name, value] : k_level_names) {
        if (value == level) {
            return name;
        }
    }
    return "unknown";
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    LoggerRegistry::instance().flush();
}

void shutdown_logging() {
    LoggerRegistry::instance().drop_all();
}

} // namespace tessera_core
