/// @file system.cpp
/// @brief Handler declarations of a system

#include <tessera/event/system.hpp>
#include <tessera/core/log.hpp>

#include <algorithm>
#include <iterator>

namespace tessera_event {

System::System(std::string name, const EventKeyRegistry& key_registry)
    : m_id(tessera_core::next_system_id())
    , m_name(std::move(name))
    , m_keys(&key_registry)
{
}

tessera_core::Result<void> System::bind(
    const std::string& handler,
    std::type_index event_type,
    Priority priority,
    Callback callback,
    const BindOptions& options)
{
    if (registered()) {
        tessera_core::Error error(tessera_core::DispatchError::system_locked(
            m_name, m_keys->types().name(event_type)));
        error.with_context("handler", handler);
        tessera_core::debug::record_error(error);
        tessera_core::event_logger()->warn("{}", error.message());
        return tessera_core::Err(std::move(error));
    }

    auto decl = std::find_if(m_handlers.begin(), m_handlers.end(),
        [&handler](const HandlerDeclaration& d) { return d.name == handler; });

    if (decl != m_handlers.end() && decl->find(event_type) != nullptr) {
        tessera_core::Error error(tessera_core::DispatchError::duplicate_binding(
            handler, m_keys->types().name(event_type)));
        error.with_context("system", m_name);
        tessera_core::debug::record_error(error);
        tessera_core::event_logger()->warn("{}", error.message());
        return tessera_core::Err(std::move(error));
    }

    auto binding = Binding::create(event_type, priority, options, *m_keys);
    if (!binding) {
        binding.error().with_context("system", m_name).with_context("handler", handler);
        return tessera_core::Err(std::move(binding.error()));
    }

    if (decl == m_handlers.end()) {
        m_handlers.push_back(HandlerDeclaration{handler, {}});
        decl = std::prev(m_handlers.end());
    }
    decl->bindings.push_back(BoundCallback{std::move(*binding), std::move(callback)});

    tessera_core::event_logger()->trace("System '{}' bound '{}' to '{}' (priority {})",
        m_name, handler, m_keys->types().name(event_type), priority);
    return tessera_core::Ok();
}

std::size_t System::binding_count() const noexcept {
    std::size_t count = 0;
    for (const auto& decl : m_handlers) {
        count += decl.bindings.size();
    }
    return count;
}

bool System::binds(std::type_index event_type) const {
    return std::any_of(m_handlers.begin(), m_handlers.end(),
        [event_type](const HandlerDeclaration& decl) { return decl.find(event_type) != nullptr; });
}

} // namespace tessera_event
