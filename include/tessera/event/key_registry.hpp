#pragma once

/// @file key_registry.hpp
/// @brief Set-once table of per-event-type key functions

#include "fwd.hpp"
#include "types.hpp"
#include "event_key.hpp"
#include <tessera/core/error.hpp>
#include <tessera/core/type_registry.hpp>

#include <cstdint>
#include <optional>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tessera_event {

// =============================================================================
// EventKeyRegistry
// =============================================================================

/// Maps event types to the function extracting their routing keys.
///
/// Entries are inserted once and never replaced or removed. Lookups walk the
/// event type's ancestry, so a subtype inherits its nearest ancestor's key
/// function. generation() advances on every insert so holders of derived
/// data can tell when key-awareness of a type may have changed.
class EventKeyRegistry {
public:
    explicit EventKeyRegistry(const tessera_core::TypeRegistry& types)
        : m_types(&types) {}

    EventKeyRegistry(const EventKeyRegistry&) = delete;
    EventKeyRegistry& operator=(const EventKeyRegistry&) = delete;

    /// Install the key function for an event type
    tessera_core::Result<void> set(std::type_index event_type, KeyFunction fn);

    /// Install a typed key function; fn(const E&) -> KeyResult
    template<typename E, typename F>
    tessera_core::Result<void> set(F&& fn) {
        const tessera_core::TypeRegistry* types = m_types;
        KeyFunction wrapped = [types, fn = std::forward<F>(fn)](const Event& event) -> KeyResult {
            const E* typed = event.as<E>(*types);
            if (typed == nullptr) {
                return std::vector<EventKey>{};
            }
            return KeyResult(fn(*typed));
        };
        return set(std::type_index(typeid(E)), std::move(wrapped));
    }

    /// Whether the type or one of its ancestors has a key function
    [[nodiscard]] bool exists(std::type_index event_type) const {
        return resolve(event_type) != nullptr;
    }

    template<typename E>
    [[nodiscard]] bool exists() const {
        return exists(std::type_index(typeid(E)));
    }

    /// Nearest key function along the type's ancestry, or nullptr
    [[nodiscard]] const KeyFunction* resolve(std::type_index event_type) const;

    /// Evaluate the key function for an event instance; nullopt without one
    [[nodiscard]] std::optional<KeyResult> keys_for(const Event& event) const;

    /// Whether the exact type has its own entry
    [[nodiscard]] bool contains(std::type_index event_type) const {
        return m_functions.find(event_type) != m_functions.end();
    }

    /// Types with their own entry, in insertion order
    [[nodiscard]] const std::vector<std::type_index>& registered() const noexcept {
        return m_order;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_functions.size(); }

    /// Incremented on every successful insert
    [[nodiscard]] std::uint64_t generation() const noexcept { return m_generation; }

    /// Type registry used for ancestry walks and typed access
    [[nodiscard]] const tessera_core::TypeRegistry& types() const noexcept { return *m_types; }

private:
    const tessera_core::TypeRegistry* m_types;
    std::unordered_map<std::type_index, KeyFunction> m_functions;
    std::vector<std::type_index> m_order;
    std::uint64_t m_generation = 0;
};

} // namespace tessera_event
