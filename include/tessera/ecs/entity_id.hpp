#pragma once

/// @file entity_id.hpp
/// @brief 128-bit random entity identifiers

#include "fwd.hpp"

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace tessera_ecs {

// =============================================================================
// EntityId
// =============================================================================

/// Globally unique 128-bit identifier laid out as a version 4 UUID.
/// Only used as a map key; entities themselves compare by their components.
struct EntityId {
    std::uint64_t hi = 0;
    std::uint64_t lo = 0;

    constexpr EntityId() noexcept = default;
    constexpr EntityId(std::uint64_t high, std::uint64_t low) noexcept : hi(high), lo(low) {}

    /// Generate a fresh random identifier
    [[nodiscard]] static EntityId generate();

    [[nodiscard]] constexpr bool is_null() const noexcept { return hi == 0 && lo == 0; }

    /// Canonical 8-4-4-4-12 hexadecimal form
    [[nodiscard]] std::string to_string() const;

    constexpr auto operator<=>(const EntityId&) const noexcept = default;
    constexpr bool operator==(const EntityId&) const noexcept = default;
};

inline std::ostream& operator<<(std::ostream& os, const EntityId& id) {
    return os << id.to_string();
}

} // namespace tessera_ecs

template<>
struct std::hash<tessera_ecs::EntityId> {
    std::size_t operator()(const tessera_ecs::EntityId& id) const noexcept {
        // Random bits already; fold the halves
        return static_cast<std::size_t>(id.hi ^ (id.lo * 0x9e3779b97f4a7c15ULL));
    }
};
