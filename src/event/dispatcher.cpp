/// @file dispatcher.cpp
/// @brief Handler cache maintenance and event dispatch

#include <tessera/event/dispatcher.hpp>
#include <tessera/event/events.hpp>
#include <tessera/core/log.hpp>

#include <algorithm>
#include <unordered_set>

namespace tessera_event {

using tessera_core::DispatchError;
using tessera_core::Err;
using tessera_core::Error;
using tessera_core::ErrorCode;
using tessera_core::Ok;
using tessera_core::Result;

Dispatcher::Dispatcher(const EventKeyRegistry& key_registry, tessera_core::DispatchConfig config)
    : m_keys(&key_registry)
    , m_config(config)
    , m_cache_generation(key_registry.generation())
{
}

Dispatcher::~Dispatcher() {
    // Systems outliving the dispatcher accept bindings again
    for (auto& entry : m_systems) {
        --entry.system->m_registrations;
    }
}

// =============================================================================
// Systems
// =============================================================================

Result<void> Dispatcher::register_system(std::shared_ptr<System> system) {
    if (!system) {
        return Err(Error(ErrorCode::InvalidArgument, "Cannot register a null system"));
    }
    if (contains(system->id())) {
        return Err(fail(DispatchError::system_already_registered(system->name())));
    }

    refresh_caches();

    const auto& types = m_keys->types();

    // Entries that already exist and may gain handlers, and bound types never seen
    std::vector<std::type_index> affected;
    std::vector<std::type_index> fresh;
    std::unordered_set<std::type_index> seen;

    for (const auto& decl : system->handlers()) {
        for (const auto& bound : decl.bindings) {
            auto event_type = bound.binding.event_type();
            for (const auto& subtype : types.subclasses(event_type)) {
                if (m_cache.count(subtype) != 0 && seen.insert(subtype).second) {
                    affected.push_back(subtype);
                }
            }
            if (m_cache.count(event_type) == 0 &&
                std::find(fresh.begin(), fresh.end(), event_type) == fresh.end()) {
                fresh.push_back(event_type);
            }
        }
    }

    m_systems.push_back(SystemEntry{system, m_next_seq++});
    const SystemEntry& entry = m_systems.back();
    ++system->m_registrations;

    for (const auto& event_type : affected) {
        auto& handlers = m_cache.at(event_type);
        const auto& decls = system->handlers();
        for (std::size_t i = 0; i < decls.size(); ++i) {
            insert_contribution(handlers, contribution(entry, decls[i], i, event_type));
        }
    }

    for (const auto& event_type : fresh) {
        bind_type(event_type);
    }

    tessera_core::event_logger()->debug("Registered system '{}' ({} binding(s), {} cached type(s) updated)",
        system->name(), system->binding_count(), affected.size());

    post(Event::make<SystemAdded>(SystemAdded{system}));
    const auto& decls = system->handlers();
    for (std::size_t i = 0; i < decls.size(); ++i) {
        for (const auto& bound : decls[i].bindings) {
            HandlerAdded added;
            added.event_type = bound.binding.event_type();
            added.keys = bound.binding.keys();
            added.handler = make_handler(entry, decls[i], i, bound);
            added.system = system;
            post(Event::make<HandlerAdded>(std::move(added)));
        }
    }

    if (m_context != nullptr && system->added_hook()) {
        system->added_hook()(*m_context);
    }

    return Ok();
}

Result<void> Dispatcher::unregister_system(const System& system) {
    auto it = std::find_if(m_systems.begin(), m_systems.end(),
        [&system](const SystemEntry& e) { return e.system->id() == system.id(); });
    if (it == m_systems.end()) {
        return Err(fail(DispatchError::system_not_found(system.name())));
    }

    refresh_caches();

    SystemEntry entry = *it;
    const auto id = system.id();
    const auto& types = m_keys->types();
    auto owned = [id](const HandlerPtr& handler) { return handler->system == id; };

    std::unordered_set<std::type_index> visited;
    std::size_t pruned = 0;

    for (const auto& decl : system.handlers()) {
        for (const auto& bound : decl.bindings) {
            for (const auto& subtype : types.subclasses(bound.binding.event_type())) {
                if (!visited.insert(subtype).second) {
                    continue;
                }
                auto cached = m_cache.find(subtype);
                if (cached == m_cache.end()) {
                    continue;
                }

                auto& handlers = cached->second;
                std::erase_if(handlers.unkeyed, owned);
                for (auto key = handlers.by_key.begin(); key != handlers.by_key.end();) {
                    std::erase_if(key->second, owned);
                    if (key->second.empty()) {
                        key = handlers.by_key.erase(key);
                    } else {
                        ++key;
                    }
                }
                if (handlers.empty()) {
                    m_cache.erase(cached);
                    ++pruned;
                }
            }
        }
    }

    m_systems.erase(it);
    --entry.system->m_registrations;

    tessera_core::event_logger()->debug("Unregistered system '{}' ({} cached type(s) pruned)",
        system.name(), pruned);

    const auto& decls = system.handlers();
    for (std::size_t i = 0; i < decls.size(); ++i) {
        for (const auto& bound : decls[i].bindings) {
            HandlerRemoved removed;
            removed.event_type = bound.binding.event_type();
            removed.keys = bound.binding.keys();
            removed.handler = make_handler(entry, decls[i], i, bound);
            removed.system = entry.system;
            post(Event::make<HandlerRemoved>(std::move(removed)));
        }
    }
    post(Event::make<SystemRemoved>(SystemRemoved{entry.system}));

    if (m_context != nullptr && system.removed_hook()) {
        system.removed_hook()(*m_context);
    }

    return Ok();
}

Result<void> Dispatcher::update(std::shared_ptr<System> system) {
    if (system && contains(system->id())) {
        return Ok();
    }
    return register_system(std::move(system));
}

bool Dispatcher::discard(const System& system) {
    if (!contains(system.id())) {
        return false;
    }
    return unregister_system(system).is_ok();
}

bool Dispatcher::contains(SystemId id) const {
    return std::any_of(m_systems.begin(), m_systems.end(),
        [id](const SystemEntry& e) { return e.system->id() == id; });
}

std::vector<std::shared_ptr<System>> Dispatcher::systems() const {
    std::vector<std::shared_ptr<System>> result;
    result.reserve(m_systems.size());
    for (const auto& entry : m_systems) {
        result.push_back(entry.system);
    }
    return result;
}

void Dispatcher::clear() {
    tessera_core::event_logger()->debug("Clearing dispatcher ({} system(s), {} cached type(s))",
        m_systems.size(), m_cache.size());
    for (auto& entry : m_systems) {
        --entry.system->m_registrations;
    }
    m_systems.clear();
    m_cache.clear();
    m_cache_generation = m_keys->generation();
}

// =============================================================================
// Dispatch
// =============================================================================

Result<bool> Dispatcher::dispatch(const Event& event, DispatchContext* context) {
    DispatchContext* ctx = context != nullptr ? context : m_context;
    if (ctx == nullptr) {
        return Err<bool>(fail(DispatchError::no_context(m_keys->types().name(event.type()))));
    }
    if (event.is_null()) {
        return Err<bool>(Error(ErrorCode::InvalidArgument, "Cannot dispatch a null event"));
    }

    auto handlers = handlers_for_event(event);
    return run(handlers, event, *ctx);
}

Result<bool> Dispatcher::dispatch_to(
    const Event& event,
    const std::vector<SystemId>& receivers,
    DispatchContext* context)
{
    DispatchContext* ctx = context != nullptr ? context : m_context;
    if (ctx == nullptr) {
        return Err<bool>(fail(DispatchError::no_context(m_keys->types().name(event.type()))));
    }
    if (event.is_null()) {
        return Err<bool>(Error(ErrorCode::InvalidArgument, "Cannot dispatch a null event"));
    }

    auto handlers = handlers_for_event(event);
    std::erase_if(handlers, [&receivers](const HandlerPtr& handler) {
        return std::find(receivers.begin(), receivers.end(), handler->system) == receivers.end();
    });
    return run(handlers, event, *ctx);
}

HandlerList Dispatcher::handlers_for_event(const Event& event) {
    refresh_caches();
    return select(entry_for(event.type()), event);
}

Result<bool> Dispatcher::run(const HandlerList& handlers, const Event& event, DispatchContext& context) {
    for (const auto& handler : handlers) {
        if ((*handler)(context, event)) {
            tessera_core::event_logger()->trace("'{}' handled by {}.{}",
                m_keys->types().name(event.type()), handler->system_name, handler->name);
            return Ok(true);
        }
    }

    if (m_config.log_unhandled_events) {
        tessera_core::event_logger()->debug("No handler for '{}'", m_keys->types().name(event.type()));
    }
    return Ok(false);
}

HandlerList Dispatcher::select(const EventHandlers& handlers, const Event& event) const {
    if (!handlers.keyed) {
        return handlers.unkeyed;
    }

    auto keys = m_keys->keys_for(event);
    if (!keys) {
        return handlers.unkeyed;
    }

    if (const auto* single = std::get_if<EventKey>(&*keys)) {
        auto it = handlers.by_key.find(*single);
        return it != handlers.by_key.end() ? it->second : handlers.unkeyed;
    }

    std::vector<const HandlerList*> present;
    std::vector<EventKey> seen;
    for (const auto& key : std::get<std::vector<EventKey>>(*keys)) {
        if (std::find(seen.begin(), seen.end(), key) != seen.end()) {
            continue;
        }
        seen.push_back(key);
        auto it = handlers.by_key.find(key);
        if (it != handlers.by_key.end()) {
            present.push_back(&it->second);
        }
    }

    if (present.empty()) {
        return handlers.unkeyed;
    }
    if (present.size() == 1) {
        return *present.front();
    }

    // Sub-lists are sorted independently; merge, keep the first of equal handlers, re-sort
    HandlerList merged;
    for (const auto* list : present) {
        for (const auto& handler : *list) {
            bool duplicate = std::any_of(merged.begin(), merged.end(),
                [&handler](const HandlerPtr& other) { return *other == *handler; });
            if (!duplicate) {
                merged.push_back(handler);
            }
        }
    }
    sort_handlers(merged);
    return merged;
}

// =============================================================================
// Introspection
// =============================================================================

HandlerList Dispatcher::handlers_for(std::type_index event_type) const {
    if (!caches_current()) {
        return {};
    }
    auto it = m_cache.find(event_type);
    return it != m_cache.end() ? it->second.unkeyed : HandlerList{};
}

HandlerList Dispatcher::handlers_for(std::type_index event_type, const EventKey& key) const {
    if (!caches_current()) {
        return {};
    }
    auto it = m_cache.find(event_type);
    if (it == m_cache.end()) {
        return {};
    }
    auto sub = it->second.by_key.find(key);
    return sub != it->second.by_key.end() ? sub->second : it->second.unkeyed;
}

bool Dispatcher::is_bound(std::type_index event_type) const {
    return caches_current() && m_cache.count(event_type) != 0;
}

std::vector<EventKey> Dispatcher::bound_keys(std::type_index event_type) const {
    std::vector<EventKey> keys;
    if (!caches_current()) {
        return keys;
    }
    auto it = m_cache.find(event_type);
    if (it != m_cache.end()) {
        for (const auto& [key, list] : it->second.by_key) {
            keys.push_back(key);
        }
    }
    return keys;
}

std::size_t Dispatcher::bound_type_count() const {
    return caches_current() ? m_cache.size() : 0;
}

// =============================================================================
// Cache Construction
// =============================================================================

HandlerPtr Dispatcher::make_handler(
    const SystemEntry& entry,
    const HandlerDeclaration& decl,
    std::size_t decl_index,
    const BoundCallback& bound) const
{
    auto handler = std::make_shared<Handler>();
    handler->system = entry.system->id();
    handler->system_name = entry.system->name();
    handler->name = decl.name;
    handler->callback = bound.callback;
    handler->priority = bound.binding.priority();
    handler->bound_type = bound.binding.event_type();
    handler->system_seq = entry.seq;
    handler->decl_index = decl_index;
    return handler;
}

Dispatcher::Contribution Dispatcher::contribution(
    const SystemEntry& entry,
    const HandlerDeclaration& decl,
    std::size_t decl_index,
    std::type_index event_type) const
{
    Contribution result;
    const auto& ancestry = m_keys->types().mro(event_type);

    // The binding on the nearest ancestor decides callback and priority
    const BoundCallback* nearest = nullptr;
    for (const auto& ancestor : ancestry) {
        nearest = decl.find(ancestor);
        if (nearest != nullptr) {
            break;
        }
    }
    if (nearest == nullptr) {
        return result;
    }

    if (!nearest->binding.keyed() || !m_keys->exists(event_type)) {
        result.unkeyed = make_handler(entry, decl, decl_index, *nearest);
        return result;
    }

    // Keys accumulate over every keyed ancestor binding; nearer bindings win per key
    for (const auto& ancestor : ancestry) {
        const BoundCallback* bound = decl.find(ancestor);
        if (bound == nullptr || !bound->binding.keyed()) {
            continue;
        }
        HandlerPtr handler;
        for (const auto& key : bound->binding.keys()) {
            bool taken = std::any_of(result.keyed.begin(), result.keyed.end(),
                [&key](const auto& item) { return item.first == key; });
            if (taken) {
                continue;
            }
            if (!handler) {
                handler = make_handler(entry, decl, decl_index, *bound);
            }
            result.keyed.emplace_back(key, handler);
        }
    }
    return result;
}

EventHandlers& Dispatcher::bind_type(std::type_index event_type) {
    EventHandlers handlers;
    handlers.keyed = m_keys->exists(event_type);

    for (const auto& entry : m_systems) {
        const auto& decls = entry.system->handlers();
        for (std::size_t i = 0; i < decls.size(); ++i) {
            auto part = contribution(entry, decls[i], i, event_type);
            if (part.unkeyed) {
                handlers.unkeyed.push_back(std::move(part.unkeyed));
            }
            for (auto& [key, handler] : part.keyed) {
                handlers.by_key[key].push_back(std::move(handler));
            }
        }
    }

    sort_handlers(handlers.unkeyed);
    for (auto& [key, list] : handlers.by_key) {
        list.insert(list.end(), handlers.unkeyed.begin(), handlers.unkeyed.end());
        sort_handlers(list);
    }

    tessera_core::event_logger()->debug("Bound event type '{}' ({} handler(s), {} key(s))",
        m_keys->types().name(event_type), handlers.unkeyed.size(), handlers.by_key.size());

    return m_cache.insert_or_assign(event_type, std::move(handlers)).first->second;
}

EventHandlers& Dispatcher::entry_for(std::type_index event_type) {
    auto it = m_cache.find(event_type);
    if (it != m_cache.end()) {
        return it->second;
    }
    return bind_type(event_type);
}

void Dispatcher::insert_contribution(EventHandlers& handlers, const Contribution& part) {
    if (part.unkeyed) {
        insert_sorted(handlers.unkeyed, part.unkeyed);
        for (auto& [key, list] : handlers.by_key) {
            insert_sorted(list, part.unkeyed);
        }
    }

    for (const auto& [key, handler] : part.keyed) {
        auto it = handlers.by_key.find(key);
        if (it == handlers.by_key.end()) {
            // A new key starts from everything reachable without narrowing
            it = handlers.by_key.emplace(key, handlers.unkeyed).first;
        }
        insert_sorted(it->second, handler);
    }
}

void Dispatcher::refresh_caches() {
    if (caches_current()) {
        return;
    }
    if (!m_cache.empty()) {
        tessera_core::event_logger()->debug("Key functions changed (generation {} -> {}), dropping {} cached type(s)",
            m_cache_generation, m_keys->generation(), m_cache.size());
    }
    m_cache.clear();
    m_cache_generation = m_keys->generation();
}

bool Dispatcher::caches_current() const noexcept {
    return m_cache_generation == m_keys->generation();
}

// =============================================================================
// Helpers
// =============================================================================

Error Dispatcher::fail(DispatchError err) const {
    Error error(std::move(err));
    if (m_config.record_errors) {
        tessera_core::debug::record_error(error);
    }
    tessera_core::event_logger()->warn("{}", error.message());
    return error;
}

void Dispatcher::post(Event event) {
    if (m_queue != nullptr) {
        m_queue->push_back(std::move(event));
    }
}

} // namespace tessera_event
