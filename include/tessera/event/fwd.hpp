#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tessera_event

#include <tessera/core/fwd.hpp>

namespace tessera_event {

// IDs
using SystemId = tessera_core::Id;

// Values
using Event = tessera_core::Object;
using Priority = double;

// Routing
class EventKeyRegistry;
struct BindOptions;
class Binding;

// Runtime
class DispatchContext;
class System;
struct Handler;
struct EventHandlers;
class Dispatcher;

// Notifications
struct SystemAdded;
struct SystemRemoved;
struct HandlerAdded;
struct HandlerRemoved;

} // namespace tessera_event
