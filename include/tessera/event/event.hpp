#pragma once

/// @file event.hpp
/// @brief Main include file for tessera_event module

#include "fwd.hpp"
#include "types.hpp"
#include "event_key.hpp"
#include "key_registry.hpp"
#include "binding.hpp"
#include "system.hpp"
#include "handler.hpp"
#include "dispatcher.hpp"
#include "events.hpp"

/// @namespace tessera_event
/// @brief Priority-ordered, subtype-aware, key-narrowed event dispatch
///
/// Example usage:
/// @code
/// tessera_core::TypeRegistry types;
/// types.register_type<Moved>("Moved").unwrap();
/// types.register_type<PlayerMoved, Moved>("PlayerMoved").unwrap();
///
/// tessera_event::EventKeyRegistry keys(types);
/// tessera_event::Dispatcher dispatcher(keys);
///
/// auto movement = std::make_shared<tessera_event::System>("movement", keys);
/// movement->on<Moved>("track", 10.0, [](auto& ctx, const Moved& moved) {
///     return false;
/// }).unwrap();
/// dispatcher.register_system(movement).unwrap();
///
/// MyContext ctx;
/// dispatcher.dispatch(tessera_core::Object::make<PlayerMoved>(), &ctx);
/// @endcode

namespace tessera_event {

/// Get module version string
const char* version() noexcept;

/// Get module name
const char* module_name() noexcept;

} // namespace tessera_event
