#pragma once

/// @file system.hpp
/// @brief Named bundle of handler declarations

#include "fwd.hpp"
#include "types.hpp"
#include "binding.hpp"
#include "key_registry.hpp"
#include <tessera/core/error.hpp>

#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace tessera_event {

// =============================================================================
// Declarations
// =============================================================================

/// One binding of a handler together with the callback it invokes
struct BoundCallback {
    Binding binding;
    Callback callback;
};

/// A named handler and all its bindings (one per distinct event type)
struct HandlerDeclaration {
    std::string name;
    std::vector<BoundCallback> bindings;

    /// Binding for an exact event type, or nullptr
    [[nodiscard]] const BoundCallback* find(std::type_index event_type) const {
        for (const auto& bound : bindings) {
            if (bound.binding.event_type() == event_type) {
                return &bound;
            }
        }
        return nullptr;
    }
};

// =============================================================================
// System
// =============================================================================

/// A bundle of event handler callbacks, registered with a Dispatcher as a unit.
///
/// Declarations are made against an EventKeyRegistry so bindings can be
/// validated when declared. The declaration order of handler names breaks
/// priority ties between handlers of the same system.
///
/// Declarations are frozen while the system is registered with any dispatcher:
/// bind() fails until every dispatcher holding it has unregistered it.
class System {
public:
    System(std::string name, const EventKeyRegistry& key_registry);

    System(const System&) = delete;
    System& operator=(const System&) = delete;

    // =========================================================================
    // Declaration
    // =========================================================================

    /// Bind a handler to an event type; fails while registered
    tessera_core::Result<void> bind(
        const std::string& handler,
        std::type_index event_type,
        Priority priority,
        Callback callback,
        const BindOptions& options = {});

    /// Bind a typed handler; fn(DispatchContext&, const E&) -> bool
    template<typename E, typename F>
    tessera_core::Result<void> on(
        const std::string& handler,
        Priority priority,
        F&& fn,
        const BindOptions& options = {})
    {
        const tessera_core::TypeRegistry* types = &m_keys->types();
        Callback callback = [types, fn = std::forward<F>(fn)](DispatchContext& ctx, const Event& event) -> bool {
            const E* typed = event.as<E>(*types);
            return typed != nullptr && static_cast<bool>(fn(ctx, *typed));
        };
        return bind(handler, std::type_index(typeid(E)), priority, std::move(callback), options);
    }

    /// Hook run after the system was registered (when a context is attached)
    void on_added(LifecycleHook hook) { m_on_added = std::move(hook); }

    /// Hook run after the system was unregistered (when a context is attached)
    void on_removed(LifecycleHook hook) { m_on_removed = std::move(hook); }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] SystemId id() const noexcept { return m_id; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    /// Handler declarations in declaration order
    [[nodiscard]] const std::vector<HandlerDeclaration>& handlers() const noexcept { return m_handlers; }

    /// Number of bindings across all handlers
    [[nodiscard]] std::size_t binding_count() const noexcept;

    /// Whether any handler is bound to the exact event type
    [[nodiscard]] bool binds(std::type_index event_type) const;

    [[nodiscard]] const EventKeyRegistry& key_registry() const noexcept { return *m_keys; }

    /// Whether a dispatcher currently holds this system
    [[nodiscard]] bool registered() const noexcept { return m_registrations != 0; }

    [[nodiscard]] const LifecycleHook& added_hook() const noexcept { return m_on_added; }
    [[nodiscard]] const LifecycleHook& removed_hook() const noexcept { return m_on_removed; }

private:
    friend class Dispatcher;

    SystemId m_id;
    std::string m_name;
    const EventKeyRegistry* m_keys;
    std::vector<HandlerDeclaration> m_handlers;
    LifecycleHook m_on_added;
    LifecycleHook m_on_removed;
    std::size_t m_registrations = 0;  // Dispatchers holding this system
};

} // namespace tessera_event
