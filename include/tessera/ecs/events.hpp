#pragma once

/// @file events.hpp
/// @brief Notifications posted by the entity store

#include "fwd.hpp"
#include <tessera/core/error.hpp>
#include <tessera/core/object.hpp>

namespace tessera_ecs {

/// An entity joined a store
struct EntityAdded {
    EntityPtr entity;
};

/// An entity left a store
struct EntityRemoved {
    EntityPtr entity;
};

/// A component was added to an entity in a store
struct ComponentAdded {
    EntityPtr entity;
    Component component;
};

/// A component was removed from an entity in a store
struct ComponentRemoved {
    EntityPtr entity;
    Component component;
};

/// Register key functions keying component notifications by the component's runtime type
tessera_core::Result<void> register_store_key_functions(tessera_event::EventKeyRegistry& key_registry);

} // namespace tessera_ecs
