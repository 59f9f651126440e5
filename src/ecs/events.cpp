/// @file events.cpp
/// @brief Key functions for entity store notifications

#include <tessera/ecs/events.hpp>
#include <tessera/ecs/entity.hpp>
#include <tessera/event/key_registry.hpp>

namespace tessera_ecs {

using tessera_event::EventKey;
using tessera_event::KeyResult;

tessera_core::Result<void> register_store_key_functions(tessera_event::EventKeyRegistry& key_registry) {
    if (auto r = key_registry.set<ComponentAdded>([](const ComponentAdded& added) -> KeyResult {
            return EventKey(added.component.type());
        }); !r) {
        return r;
    }
    if (auto r = key_registry.set<ComponentRemoved>([](const ComponentRemoved& removed) -> KeyResult {
            return EventKey(removed.component.type());
        }); !r) {
        return r;
    }
    return tessera_core::Ok();
}

} // namespace tessera_ecs
