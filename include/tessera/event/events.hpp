#pragma once

/// @file events.hpp
/// @brief Notifications posted by the dispatcher

#include "fwd.hpp"
#include "handler.hpp"
#include "event_key.hpp"
#include <tessera/core/error.hpp>

#include <memory>
#include <string>
#include <typeindex>
#include <vector>

namespace tessera_event {

// =============================================================================
// System Notifications
// =============================================================================

/// A system was registered
struct SystemAdded {
    std::shared_ptr<System> system;
};

/// A system was unregistered
struct SystemRemoved {
    std::shared_ptr<System> system;
};

// =============================================================================
// Handler Notifications
// =============================================================================

/// Common payload of handler notifications
struct HandlerChange {
    /// Event type named by the binding
    std::type_index event_type = typeid(void);
    /// Keys of the binding (empty when unkeyed)
    std::vector<EventKey> keys;
    HandlerPtr handler;
    std::shared_ptr<System> system;

    [[nodiscard]] const std::string& name() const { return handler->name; }
    [[nodiscard]] Priority priority() const { return handler->priority; }
    [[nodiscard]] const Callback& callback() const { return handler->callback; }
};

/// A binding became active
struct HandlerAdded : HandlerChange {};

/// A binding was withdrawn
struct HandlerRemoved : HandlerChange {};

/// Register key functions for the dispatcher notifications: handler
/// notifications are keyed by bound event type, system notifications by system id.
tessera_core::Result<void> register_dispatch_key_functions(EventKeyRegistry& key_registry);

} // namespace tessera_event
