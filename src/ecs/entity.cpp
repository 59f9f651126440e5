/// @file entity.cpp
/// @brief Entity component management

#include <tessera/ecs/entity.hpp>
#include <tessera/ecs/entity_store.hpp>
#include <tessera/core/log.hpp>

#include <algorithm>
#include <memory>

namespace tessera_ecs {

using tessera_core::Err;
using tessera_core::Error;
using tessera_core::ErrorCode;
using tessera_core::Ok;
using tessera_core::Result;
using tessera_core::StoreError;

namespace {

Error reject(Error error) {
    tessera_core::debug::record_error(error);
    tessera_core::ecs_logger()->warn("{}", error.message());
    return error;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

EntityPtr Entity::from_components(std::vector<Component> components) {
    auto entity = std::make_shared<Entity>(Passkey{}, EntityId::generate());
    auto& stored = entity->m_components;
    stored.reserve(components.size());

    for (auto& component : components) {
        if (component.is_null()) {
            continue;
        }
        auto it = entity->find_exact(component.type());
        if (it == stored.end()) {
            stored.push_back(std::move(component));
        } else if (!(*it == component)) {
            *it = std::move(component);
        }
    }
    return entity;
}

// =============================================================================
// Mutation
// =============================================================================

Result<void> Entity::add(Component component) {
    if (component.is_null()) {
        return Err(reject(Error(ErrorCode::InvalidArgument, "Cannot add a null component")));
    }
    if (find_exact(component.type()) != m_components.end()) {
        auto type_name = m_types != nullptr ? m_types->name(component.type())
                                            : std::string(component.type().name());
        return Err(reject(StoreError::duplicate_component(m_id.to_string(), type_name)));
    }

    m_components.push_back(component);
    if (m_store != nullptr) {
        m_store->component_added(*this, component);
    }
    return Ok();
}

Result<void> Entity::add(std::vector<Component> components) {
    for (auto& component : components) {
        auto result = add(std::move(component));
        if (!result) {
            return result;
        }
    }
    return Ok();
}

void Entity::update(Component component) {
    if (component.is_null()) {
        return;
    }

    auto it = find_exact(component.type());
    if (it == m_components.end()) {
        m_components.push_back(component);
        if (m_store != nullptr) {
            m_store->component_added(*this, component);
        }
        return;
    }

    if (*it == component) {
        return;
    }

    // Replace in place so the component keeps its position
    Component previous = std::move(*it);
    *it = component;
    if (m_store != nullptr) {
        m_store->component_removed(*this, previous);
        m_store->component_added(*this, component);
    }
}

void Entity::update(std::vector<Component> components) {
    for (auto& component : components) {
        update(std::move(component));
    }
}

Result<void> Entity::remove(const Component& component) {
    auto it = find_exact(component.type());
    if (it == m_components.end() || !(*it == component)) {
        auto type_name = m_types != nullptr ? m_types->name(component.type())
                                            : std::string(component.type().name());
        return Err(reject(StoreError::component_not_found(m_id.to_string(), type_name)));
    }

    Component removed = std::move(*it);
    m_components.erase(it);
    if (m_store != nullptr) {
        m_store->component_removed(*this, removed);
    }
    return Ok();
}

Result<void> Entity::remove(const std::vector<Component>& components) {
    for (const auto& component : components) {
        auto result = remove(component);
        if (!result) {
            return result;
        }
    }
    return Ok();
}

Result<Component> Entity::pop(std::type_index type_id) {
    auto it = find_exact(type_id);
    if (it == m_components.end()) {
        auto type_name = m_types != nullptr ? m_types->name(type_id) : std::string(type_id.name());
        return Err<Component>(reject(StoreError::component_not_found(m_id.to_string(), type_name)));
    }

    Component removed = std::move(*it);
    m_components.erase(it);
    if (m_store != nullptr) {
        m_store->component_removed(*this, removed);
    }
    return Ok(std::move(removed));
}

bool Entity::discard(const Component& component) {
    auto it = find_exact(component.type());
    if (it == m_components.end() || !(*it == component)) {
        return false;
    }

    Component removed = std::move(*it);
    m_components.erase(it);
    if (m_store != nullptr) {
        m_store->component_removed(*this, removed);
    }
    return true;
}

void Entity::discard(const std::vector<Component>& components) {
    for (const auto& component : components) {
        discard(component);
    }
}

void Entity::clear() {
    while (!m_components.empty()) {
        Component removed = std::move(m_components.front());
        m_components.erase(m_components.begin());
        if (m_store != nullptr) {
            m_store->component_removed(*this, removed);
        }
    }
}

// =============================================================================
// Access
// =============================================================================

Component Entity::find(std::type_index type_id) const {
    if (m_types != nullptr) {
        return find(type_id, *m_types);
    }
    auto it = find_exact(type_id);
    return it != m_components.end() ? *it : Component();
}

Component Entity::find(std::type_index type_id, const tessera_core::TypeRegistry& types) const {
    auto it = find_exact(type_id);
    if (it != m_components.end()) {
        return *it;
    }
    for (const auto& component : m_components) {
        if (types.is_subclass(component.type(), type_id)) {
            return component;
        }
    }
    return Component();
}

bool Entity::contains(std::type_index type_id) const {
    return find_exact(type_id) != m_components.end();
}

std::vector<std::type_index> Entity::types() const {
    std::vector<std::type_index> result;
    result.reserve(m_components.size());
    for (const auto& component : m_components) {
        result.push_back(component.type());
    }
    return result;
}

std::vector<Component>::iterator Entity::find_exact(std::type_index type_id) {
    return std::find_if(m_components.begin(), m_components.end(),
        [type_id](const Component& c) { return c.type() == type_id; });
}

std::vector<Component>::const_iterator Entity::find_exact(std::type_index type_id) const {
    return std::find_if(m_components.begin(), m_components.end(),
        [type_id](const Component& c) { return c.type() == type_id; });
}

bool operator==(const Entity& lhs, const Entity& rhs) {
    if (&lhs == &rhs) {
        return true;
    }
    if (lhs.m_components.size() != rhs.m_components.size()) {
        return false;
    }
    return std::all_of(lhs.m_components.begin(), lhs.m_components.end(),
        [&rhs](const Component& component) {
            auto it = rhs.find_exact(component.type());
            return it != rhs.m_components.end() && *it == component;
        });
}

} // namespace tessera_ecs
