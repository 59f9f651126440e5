#pragma once

/// @file core.hpp
/// @brief Main include file for tessera_core module
///
/// This header includes all tessera_core components in dependency order.

// Forward declarations
#include "fwd.hpp"

// Core types
#include "error.hpp"
#include "log.hpp"
#include "config.hpp"
#include "id.hpp"

// Type system
#include "type_registry.hpp"
#include "object.hpp"

/// @namespace tessera_core
/// @brief Foundations shared by the entity store and the dispatcher
///
/// - **Error Handling**: Result<T> with typed error kinds
/// - **Logging**: spdlog named loggers configured from LogConfig
/// - **Configuration**: JSON configuration via nlohmann::json
/// - **Type Registry**: declared supertypes, ancestry and subtype walks
/// - **Object**: shared runtime-typed values (components and events)
///
/// Example usage:
/// @code
/// #include <tessera/core/core.hpp>
///
/// struct Shape { float area = 0; };
/// struct Circle : Shape { float radius = 1; };
///
/// tessera_core::TypeRegistry types;
/// types.register_type<Shape>("Shape").unwrap();
/// types.register_type<Circle, Shape>("Circle").unwrap();
///
/// auto obj = tessera_core::Object::make<Circle>();
/// Shape* shape = obj.as<Shape>(types);
/// @endcode

namespace tessera_core {

/// Get module version string
const char* version() noexcept;

/// Get module name
const char* module_name() noexcept;

/// Initialize the core module from a configuration
void init(const CoreConfig& config = {});

/// Flush and release loggers
void shutdown();

} // namespace tessera_core
