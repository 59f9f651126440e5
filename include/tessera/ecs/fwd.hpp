#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tessera_ecs

#include <tessera/core/fwd.hpp>
#include <tessera/event/fwd.hpp>

#include <functional>
#include <memory>
#include <unordered_set>
#include <vector>

namespace tessera_ecs {

// =============================================================================
// Core Types
// =============================================================================

/// 128-bit unique entity identifier
struct EntityId;

/// Ordered bag of components keyed by exact runtime type
class Entity;

/// Owner of entities with a type-to-ids index
class EntityStore;

// =============================================================================
// Query Types
// =============================================================================

/// Self-describing query (types, tags and merge function)
struct Query;

/// Single tag or tag list of a query
struct TagOptions;

/// Point-in-time result of a query
class QueryResult;

// =============================================================================
// Notifications
// =============================================================================

struct EntityAdded;
struct EntityRemoved;
struct ComponentAdded;
struct ComponentRemoved;

// =============================================================================
// Common Type Aliases
// =============================================================================

using Component = tessera_core::Object;
using EntityPtr = std::shared_ptr<Entity>;

} // namespace tessera_ecs
