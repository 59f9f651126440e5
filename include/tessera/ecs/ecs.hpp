#pragma once

/// @file ecs.hpp
/// @brief Main include file for tessera_ecs module

#include "fwd.hpp"
#include "entity_id.hpp"
#include "entity.hpp"
#include "query.hpp"
#include "entity_store.hpp"
#include "events.hpp"

/// @namespace tessera_ecs
/// @brief Entities, the type-indexed entity store and queries
///
/// Example usage:
/// @code
/// tessera_core::TypeRegistry types;
/// tessera_ecs::EntityStore store(types);
///
/// auto player = store.create(Position{0, 0}, Velocity{1, 0});
/// store.create(Position{5, 5});
///
/// auto moving = store.query<Position, Velocity>().unwrap();
/// for (auto [pos, vel] : moving.zip<Position, Velocity>()) {
///     pos->x += vel->dx;
/// }
/// @endcode

namespace tessera_ecs {

/// Get module version string
const char* version() noexcept;

/// Get module name
const char* module_name() noexcept;

} // namespace tessera_ecs
