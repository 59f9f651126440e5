/// @file module.cpp
/// @brief Module information for tessera_ecs

#include <tessera/ecs/ecs.hpp>

namespace tessera_ecs {

// =============================================================================
// Module Information
// =============================================================================

const char* version() noexcept {
    return "0.1.0";
}

const char* module_name() noexcept {
    return "tessera_ecs";
}

} // namespace tessera_ecs
