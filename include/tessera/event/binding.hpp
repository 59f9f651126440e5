#pragma once

/// @file binding.hpp
/// @brief Immutable handler binding metadata

#include "fwd.hpp"
#include "event_key.hpp"
#include <tessera/core/error.hpp>

#include <optional>
#include <typeindex>
#include <vector>

namespace tessera_event {

// =============================================================================
// BindOptions
// =============================================================================

/// Optional routing keys of a binding; `key` and `keys` are mutually exclusive
struct BindOptions {
    std::optional<EventKey> key;
    std::optional<std::vector<EventKey>> keys;

    [[nodiscard]] static BindOptions with_key(EventKey k) {
        BindOptions options;
        options.key = std::move(k);
        return options;
    }

    [[nodiscard]] static BindOptions with_keys(std::vector<EventKey> ks) {
        BindOptions options;
        options.keys = std::move(ks);
        return options;
    }
};

// =============================================================================
// Binding
// =============================================================================

/// (event type, priority, keys) attached to one callback.
///
/// Created only through create(), which validates the arguments: a NaN
/// priority, conflicting key arguments, or keys on an event type without a key
/// function are rejected before anything is registered.
class Binding {
public:
    [[nodiscard]] static tessera_core::Result<Binding> create(
        std::type_index event_type,
        Priority priority,
        const BindOptions& options,
        const EventKeyRegistry& key_registry);

    [[nodiscard]] std::type_index event_type() const noexcept { return m_event_type; }
    [[nodiscard]] Priority priority() const noexcept { return m_priority; }

    /// Distinct keys in declaration order; empty for unkeyed bindings
    [[nodiscard]] const std::vector<EventKey>& keys() const noexcept { return m_keys; }
    [[nodiscard]] bool keyed() const noexcept { return !m_keys.empty(); }

private:
    Binding(std::type_index event_type, Priority priority, std::vector<EventKey> keys)
        : m_event_type(event_type), m_priority(priority), m_keys(std::move(keys)) {}

    std::type_index m_event_type;
    Priority m_priority;
    std::vector<EventKey> m_keys;
};

} // namespace tessera_event
