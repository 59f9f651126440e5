/// @file event_key.cpp
/// @brief Routing key helpers

#include <tessera/event/event_key.hpp>
#include <tessera/core/object.hpp>

#include <sstream>
#include <type_traits>

namespace tessera_event {

std::string describe_key(const EventKey& key) {
    return std::visit([](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(value);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + value + "\"";
        } else if constexpr (std::is_same_v<T, std::type_index>) {
            return std::string("type:") + value.name();
        } else {
            std::ostringstream oss;
            oss << "system:" << value;
            return oss.str();
        }
    }, key);
}

std::vector<EventKey> flatten(const KeyResult& result) {
    if (const auto* single = std::get_if<EventKey>(&result)) {
        return {*single};
    }
    return std::get<std::vector<EventKey>>(result);
}

} // namespace tessera_event
