#pragma once

/// @file event_key.hpp
/// @brief Routing keys produced by key functions

#include "fwd.hpp"
#include <tessera/core/id.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <typeindex>
#include <variant>
#include <vector>

namespace tessera_event {

// =============================================================================
// EventKey
// =============================================================================

/// Hashable routing key
using EventKey = std::variant<std::int64_t, std::string, std::type_index, SystemId>;

/// Output of a key function: one key, or a sequence of keys (possibly empty)
using KeyResult = std::variant<EventKey, std::vector<EventKey>>;

/// Key function, evaluated on an event instance
using KeyFunction = std::function<KeyResult(const Event&)>;

/// Build a key from a type
template<typename T>
[[nodiscard]] EventKey type_key() {
    return EventKey(std::type_index(typeid(T)));
}

/// Human-readable form of a key for logs and error messages
[[nodiscard]] std::string describe_key(const EventKey& key);

/// Flatten a key result into a list of keys (single key becomes a one-element list)
[[nodiscard]] std::vector<EventKey> flatten(const KeyResult& result);

} // namespace tessera_event
