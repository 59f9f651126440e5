/// @file module.cpp
/// @brief Module information for tessera_event

#include <tessera/event/event.hpp>

namespace tessera_event {

const char* version() noexcept {
    return "0.1.0";
}

const char* module_name() noexcept {
    return "tessera_event";
}

} // namespace tessera_event
