/// @file module.cpp
/// @brief tessera_core module initialization and version information

#include <tessera/core/core.hpp>

namespace tessera_core {

/// Module version
static constexpr const char* k_version = "0.1.0";

/// Module name
static constexpr const char* k_module_name = "tessera_core";

const char* version() noexcept {
    return k_version;
}

const char* module_name() noexcept {
    return k_module_name;
}

void init(const CoreConfig& config) {
    apply_config(config);
    core_logger()->info("{} {} initialized", k_module_name, k_version);
}

void shutdown() {
    core_logger()->debug("{} shutting down", k_module_name);
    shutdown_logging();
}

} // namespace tessera_core
