/// @file id.cpp
/// @brief Process-wide id sequences

#include <tessera/core/id.hpp>
#include <sstream>

namespace tessera_core {

namespace {

IdGenerator& system_ids() {
    static IdGenerator generator;
    return generator;
}

} // anonymous namespace

Id next_system_id() {
    return system_ids().next();
}

namespace debug {

std::string format_id(Id id) {
    std::ostringstream oss;
    oss << id;
    return oss.str();
}

} // namespace debug

} // namespace tessera_core
