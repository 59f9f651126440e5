/// @file events.cpp
/// @brief Key functions for dispatcher notifications

#include <tessera/event/events.hpp>
#include <tessera/event/key_registry.hpp>
#include <tessera/event/system.hpp>

namespace tessera_event {

tessera_core::Result<void> register_dispatch_key_functions(EventKeyRegistry& key_registry) {
    auto by_event_type = [](const HandlerChange& change) -> KeyResult {
        return EventKey(change.event_type);
    };

    if (auto r = key_registry.set<HandlerAdded>(by_event_type); !r) return r;
    if (auto r = key_registry.set<HandlerRemoved>(by_event_type); !r) return r;

    if (auto r = key_registry.set<SystemAdded>([](const SystemAdded& added) -> KeyResult {
            return EventKey(added.system->id());
        }); !r) {
        return r;
    }
    if (auto r = key_registry.set<SystemRemoved>([](const SystemRemoved& removed) -> KeyResult {
            return EventKey(removed.system->id());
        }); !r) {
        return r;
    }

    return tessera_core::Ok();
}

} // namespace tessera_event
