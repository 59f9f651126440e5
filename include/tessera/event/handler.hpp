#pragma once

/// @file handler.hpp
/// @brief Runtime handler records and their dispatch order

#include "fwd.hpp"
#include "types.hpp"
#include "event_key.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace tessera_event {

// =============================================================================
// Handler
// =============================================================================

/// The dispatcher's record for one active binding.
/// Identity is (name, system); callback and priority do not take part.
struct Handler {
    SystemId system;
    std::string system_name;
    std::string name;
    Callback callback;
    Priority priority = 0.0;
    /// Event type of the binding this handler came from
    std::type_index bound_type = typeid(void);
    /// Registration sequence of the owning system within its dispatcher
    std::uint64_t system_seq = 0;
    /// Declaration index of the handler name within its system
    std::size_t decl_index = 0;

    bool operator()(DispatchContext& ctx, const Event& event) const {
        return callback(ctx, event);
    }

    friend bool operator==(const Handler& lhs, const Handler& rhs) {
        return lhs.name == rhs.name && lhs.system == rhs.system;
    }
};

using HandlerPtr = std::shared_ptr<const Handler>;
using HandlerList = std::vector<HandlerPtr>;

/// Dispatch order: higher priority first, then older system, then earlier declaration
[[nodiscard]] inline bool dispatches_before(const Handler& lhs, const Handler& rhs) noexcept {
    if (lhs.priority != rhs.priority) {
        return lhs.priority > rhs.priority;
    }
    if (lhs.system_seq != rhs.system_seq) {
        return lhs.system_seq < rhs.system_seq;
    }
    return lhs.decl_index < rhs.decl_index;
}

/// Insert keeping dispatch order; equal handlers land after existing ones
void insert_sorted(HandlerList& list, HandlerPtr handler);

/// Sort a list into dispatch order
void sort_handlers(HandlerList& list);

// =============================================================================
// EventHandlers
// =============================================================================

/// Cached handlers of one concrete event type
struct EventHandlers {
    /// Whether the type had a key function when the entry was built
    bool keyed = false;
    /// Handlers reached without key narrowing
    HandlerList unkeyed;
    /// Per-key lists; each also contains every unkeyed handler
    std::unordered_map<EventKey, HandlerList> by_key;

    [[nodiscard]] bool empty() const noexcept {
        return unkeyed.empty() && by_key.empty();
    }
};

} // namespace tessera_event
