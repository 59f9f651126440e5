#pragma once

/// @file types.hpp
/// @brief Basic dispatch types shared by systems and the dispatcher

#include "fwd.hpp"
#include <tessera/core/id.hpp>
#include <tessera/core/object.hpp>

#include <deque>
#include <functional>

namespace tessera_event {

// =============================================================================
// DispatchContext
// =============================================================================

/// Object handed to every callback during dispatch.
/// Its shape is owned by the application (typically the object owning the
/// store, the dispatcher and the queue).
class DispatchContext {
public:
    virtual ~DispatchContext() = default;
};

// =============================================================================
// Callbacks and Queue
// =============================================================================

/// Handler callback; returning true stops dispatch of the current event
using Callback = std::function<bool(DispatchContext&, const Event&)>;

/// System lifecycle hook
using LifecycleHook = std::function<void(DispatchContext&)>;

/// Append-only notification sink owned by the caller
using EventQueue = std::deque<Event>;

} // namespace tessera_event
