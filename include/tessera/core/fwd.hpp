#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tessera_core module

#include <cstdint>

namespace tessera_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// ID Types
// =============================================================================

struct Id;

// =============================================================================
// Configuration
// =============================================================================

struct LogConfig;
struct DispatchConfig;
struct CoreConfig;

// =============================================================================
// Runtime Types
// =============================================================================

struct TypeRecord;
class TypeRegistry;
class Object;

} // namespace tessera_core
