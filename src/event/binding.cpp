/// @file binding.cpp
/// @brief Binding validation

#include <tessera/event/binding.hpp>
#include <tessera/event/key_registry.hpp>
#include <tessera/core/log.hpp>

#include <algorithm>
#include <cmath>

namespace tessera_event {

namespace {

tessera_core::Error reject(tessera_core::DispatchError err) {
    tessera_core::Error error(std::move(err));
    tessera_core::debug::record_error(error);
    tessera_core::event_logger()->warn("{}", error.message());
    return error;
}

} // anonymous namespace

tessera_core::Result<Binding> Binding::create(
    std::type_index event_type,
    Priority priority,
    const BindOptions& options,
    const EventKeyRegistry& key_registry)
{
    const auto type_name = key_registry.types().name(event_type);

    if (std::isnan(priority)) {
        return tessera_core::Err<Binding>(reject(tessera_core::DispatchError::invalid_priority(type_name)));
    }

    if (options.key.has_value() && options.keys.has_value()) {
        return tessera_core::Err<Binding>(reject(tessera_core::DispatchError::conflicting_key_arguments()));
    }

    std::vector<EventKey> keys;
    if (options.key.has_value()) {
        keys.push_back(*options.key);
    } else if (options.keys.has_value()) {
        for (const auto& key : *options.keys) {
            if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
                keys.push_back(key);
            }
        }
    }

    if (!keys.empty() && !key_registry.exists(event_type)) {
        return tessera_core::Err<Binding>(reject(tessera_core::DispatchError::key_function_missing(type_name)));
    }

    return tessera_core::Ok(Binding(event_type, priority, std::move(keys)));
}

} // namespace tessera_event
