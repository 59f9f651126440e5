#pragma once

/// @file dispatcher.hpp
/// @brief Handler registry and event dispatch

#include "fwd.hpp"
#include "types.hpp"
#include "handler.hpp"
#include "system.hpp"
#include "key_registry.hpp"
#include <tessera/core/config.hpp>
#include <tessera/core/error.hpp>

#include <cstdint>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace tessera_event {

// =============================================================================
// Dispatcher
// =============================================================================

/// Routes events to the handlers of registered systems.
///
/// Per concrete event type the dispatcher caches a sorted handler list plus
/// one sorted sub-list per routing key. Entries are built the first time a
/// type is dispatched or bound, from every registered binding on the type or
/// one of its ancestors, and are then maintained incrementally by
/// register_system / unregister_system. Caches are dropped wholesale when the
/// key registry gained an entry since they were built.
///
/// Not thread-safe. Dispatch iterates a snapshot, so callbacks may register,
/// unregister or dispatch re-entrantly.
class Dispatcher {
public:
    explicit Dispatcher(const EventKeyRegistry& key_registry,
                        tessera_core::DispatchConfig config = {});
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // =========================================================================
    // Systems
    // =========================================================================

    /// Register a system and activate all its bindings
    tessera_core::Result<void> register_system(std::shared_ptr<System> system);

    /// Unregister a system and withdraw its handlers
    tessera_core::Result<void> unregister_system(const System& system);

    /// Register unless already registered
    tessera_core::Result<void> update(std::shared_ptr<System> system);

    /// Unregister if registered; returns whether it was
    bool discard(const System& system);

    [[nodiscard]] bool contains(const System& system) const {
        return contains(system.id());
    }

    [[nodiscard]] bool contains(SystemId id) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_systems.size(); }

    /// Registered systems in registration order
    [[nodiscard]] std::vector<std::shared_ptr<System>> systems() const;

    /// Drop every system and cache without notifications or hooks
    void clear();

    // =========================================================================
    // Dispatch
    // =========================================================================

    /// Invoke handlers in order until one returns true.
    /// Uses the attached context when none is given; fails without either.
    tessera_core::Result<bool> dispatch(const Event& event, DispatchContext* context = nullptr);

    /// Like dispatch, restricted to handlers of the listed systems
    tessera_core::Result<bool> dispatch_to(
        const Event& event,
        const std::vector<SystemId>& receivers,
        DispatchContext* context = nullptr);

    /// Handlers that dispatch would invoke for the event, in order
    [[nodiscard]] HandlerList handlers_for_event(const Event& event);

    // =========================================================================
    // Introspection
    // =========================================================================

    /// Snapshot of the unkeyed handler list of a bound type (empty when unbound)
    [[nodiscard]] HandlerList handlers_for(std::type_index event_type) const;

    /// Snapshot of a key sub-list (the unkeyed list when the key has none)
    [[nodiscard]] HandlerList handlers_for(std::type_index event_type, const EventKey& key) const;

    template<typename E>
    [[nodiscard]] HandlerList handlers_for() const {
        return handlers_for(std::type_index(typeid(E)));
    }

    /// Whether the exact type has a cache entry
    [[nodiscard]] bool is_bound(std::type_index event_type) const;

    template<typename E>
    [[nodiscard]] bool is_bound() const {
        return is_bound(std::type_index(typeid(E)));
    }

    /// Keys with a sub-list for a bound type
    [[nodiscard]] std::vector<EventKey> bound_keys(std::type_index event_type) const;

    /// Number of cached event types
    [[nodiscard]] std::size_t bound_type_count() const;

    // =========================================================================
    // Collaborators
    // =========================================================================

    void set_context(DispatchContext* context) noexcept { m_context = context; }
    [[nodiscard]] DispatchContext* context() const noexcept { return m_context; }

    void set_event_queue(EventQueue* queue) noexcept { m_queue = queue; }
    [[nodiscard]] EventQueue* event_queue() const noexcept { return m_queue; }

    [[nodiscard]] const EventKeyRegistry& key_registry() const noexcept { return *m_keys; }
    [[nodiscard]] const tessera_core::DispatchConfig& config() const noexcept { return m_config; }

private:
    struct SystemEntry {
        std::shared_ptr<System> system;
        std::uint64_t seq;
    };

    /// What one handler declaration adds to the entry of a concrete type
    struct Contribution {
        HandlerPtr unkeyed;
        std::vector<std::pair<EventKey, HandlerPtr>> keyed;
    };

    [[nodiscard]] Contribution contribution(
        const SystemEntry& entry,
        const HandlerDeclaration& decl,
        std::size_t decl_index,
        std::type_index event_type) const;

    [[nodiscard]] HandlerPtr make_handler(
        const SystemEntry& entry,
        const HandlerDeclaration& decl,
        std::size_t decl_index,
        const BoundCallback& bound) const;

    /// Build the entry of a type from every registered binding
    EventHandlers& bind_type(std::type_index event_type);

    /// Existing entry or a freshly built one
    EventHandlers& entry_for(std::type_index event_type);

    void insert_contribution(EventHandlers& handlers, const Contribution& contribution);

    /// Drop caches built under an older key registry generation
    void refresh_caches();

    [[nodiscard]] bool caches_current() const noexcept;

    /// Snapshot of the list routing applies to the event
    [[nodiscard]] HandlerList select(const EventHandlers& handlers, const Event& event) const;

    tessera_core::Result<bool> run(const HandlerList& handlers, const Event& event, DispatchContext& context);

    tessera_core::Error fail(tessera_core::DispatchError err) const;

    void post(Event event);

    const EventKeyRegistry* m_keys;
    tessera_core::DispatchConfig m_config;
    std::vector<SystemEntry> m_systems;
    std::unordered_map<std::type_index, EventHandlers> m_cache;
    std::uint64_t m_cache_generation;
    std::uint64_t m_next_seq = 0;
    DispatchContext* m_context = nullptr;
    EventQueue* m_queue = nullptr;
};

} // namespace tessera_event
