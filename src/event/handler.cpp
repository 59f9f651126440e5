/// @file handler.cpp
/// @brief Ordered handler lists

#include <tessera/event/handler.hpp>

#include <algorithm>

namespace tessera_event {

void insert_sorted(HandlerList& list, HandlerPtr handler) {
    auto pos = std::upper_bound(list.begin(), list.end(), handler,
        [](const HandlerPtr& lhs, const HandlerPtr& rhs) {
            return dispatches_before(*lhs, *rhs);
        });
    list.insert(pos, std::move(handler));
}

void sort_handlers(HandlerList& list) {
    std::stable_sort(list.begin(), list.end(),
        [](const HandlerPtr& lhs, const HandlerPtr& rhs) {
            return dispatches_before(*lhs, *rhs);
        });
}

} // namespace tessera_event
