#pragma once

/// @file id.hpp
/// @brief Serial identifiers for tessera_core

#include "fwd.hpp"
#include <atomic>
#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace tessera_core {

// =============================================================================
// Id
// =============================================================================

/// Process-unique serial number. Zero is the null id; ids are never reused.
struct Id {
    std::uint64_t value = 0;

    constexpr Id() noexcept = default;
    constexpr explicit Id(std::uint64_t serial) noexcept : value(serial) {}

    [[nodiscard]] static constexpr Id null() noexcept { return Id{}; }

    [[nodiscard]] constexpr bool is_null() const noexcept { return value == 0; }
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0; }

    constexpr auto operator<=>(const Id&) const noexcept = default;
    constexpr bool operator==(const Id&) const noexcept = default;

    explicit constexpr operator bool() const noexcept { return is_valid(); }
};

inline std::ostream& operator<<(std::ostream& os, Id id) {
    if (id.is_null()) {
        return os << "#null";
    }
    return os << '#' << id.value;
}

// =============================================================================
// IdGenerator
// =============================================================================

/// Hands out increasing ids starting at 1. Thread-safe.
class IdGenerator {
public:
    [[nodiscard]] Id next() noexcept {
        return Id(m_last.fetch_add(1, std::memory_order_relaxed) + 1);
    }

    /// Number of ids handed out so far
    [[nodiscard]] std::uint64_t issued() const noexcept {
        return m_last.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> m_last{0};
};

/// Next id from the process-wide system id sequence
Id next_system_id();

namespace debug {

/// "#<n>" or "#null"
std::string format_id(Id id);

} // namespace debug

} // namespace tessera_core

template<>
struct std::hash<tessera_core::Id> {
    std::size_t operator()(tessera_core::Id id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
