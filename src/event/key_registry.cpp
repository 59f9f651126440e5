/// @file key_registry.cpp
/// @brief Key function table

#include <tessera/event/key_registry.hpp>
#include <tessera/core/log.hpp>

namespace tessera_event {

tessera_core::Result<void> EventKeyRegistry::set(std::type_index event_type, KeyFunction fn) {
    if (contains(event_type)) {
        tessera_core::Error error(tessera_core::DispatchError::key_function_already_set(m_types->name(event_type)));
        tessera_core::debug::record_error(error);
        tessera_core::event_logger()->warn("{}", error.message());
        return tessera_core::Err(std::move(error));
    }

    m_functions.emplace(event_type, std::move(fn));
    m_order.push_back(event_type);
    ++m_generation;

    tessera_core::event_logger()->debug("Key function set for '{}' (generation {})",
                                        m_types->name(event_type), m_generation);
    return tessera_core::Ok();
}

const KeyFunction* EventKeyRegistry::resolve(std::type_index event_type) const {
    if (m_functions.empty()) {
        return nullptr;
    }
    for (const auto& ancestor : m_types->mro(event_type)) {
        auto it = m_functions.find(ancestor);
        if (it != m_functions.end()) {
            return &it->second;
        }
    }
    return nullptr;
}

std::optional<KeyResult> EventKeyRegistry::keys_for(const Event& event) const {
    const KeyFunction* fn = resolve(event.type());
    if (fn == nullptr) {
        return std::nullopt;
    }
    return (*fn)(event);
}

} // namespace tessera_event
