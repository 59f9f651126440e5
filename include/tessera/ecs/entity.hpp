#pragma once

/// @file entity.hpp
/// @brief Entities: identity plus an ordered set of typed components

#include "fwd.hpp"
#include "entity_id.hpp"
#include <tessera/core/error.hpp>
#include <tessera/core/object.hpp>
#include <tessera/core/type_registry.hpp>

#include <memory>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace tessera_ecs {

/// Wrap a value as a component (components pass through unchanged)
template<typename T>
[[nodiscard]] Component to_component(T&& value) {
    if constexpr (std::is_same_v<std::decay_t<T>, Component>) {
        return std::forward<T>(value);
    } else {
        return Component::of(std::forward<T>(value));
    }
}

// =============================================================================
// Entity
// =============================================================================

/// A mutable bag of components, at most one per exact runtime type.
///
/// Components keep their insertion order. While the entity belongs to a
/// store, every component change is reported back to it so the store's
/// index and notifications stay in step. The store reference is
/// non-owning and cleared when the entity leaves the store.
class Entity : public std::enable_shared_from_this<Entity> {
    /// Restricts construction to Entity while keeping make_shared usable
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    using iterator = std::vector<Component>::const_iterator;

    Entity(Passkey, EntityId id) : m_id(id) {}

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    // =========================================================================
    // Construction
    // =========================================================================

    /// Create a standalone entity; accepts components or plain values
    template<typename... Cs>
    [[nodiscard]] static EntityPtr create(Cs&&... components) {
        std::vector<Component> list;
        list.reserve(sizeof...(Cs));
        (list.push_back(to_component(std::forward<Cs>(components))), ...);
        return from_components(std::move(list));
    }

    /// Create a standalone entity. For repeated exact types the later
    /// component replaces the earlier one in its position.
    [[nodiscard]] static EntityPtr from_components(std::vector<Component> components);

    // =========================================================================
    // Identity
    // =========================================================================

    [[nodiscard]] const EntityId& id() const noexcept { return m_id; }

    /// Owning store, or nullptr when standalone
    [[nodiscard]] EntityStore* store() const noexcept { return m_store; }

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Add a component; fails if one of the same exact type is present
    tessera_core::Result<void> add(Component component);

    /// Add in order, stopping at the first failure (earlier ones stay added)
    tessera_core::Result<void> add(std::vector<Component> components);

    /// Construct and add a T
    template<typename T, typename... Args>
    tessera_core::Result<void> emplace(Args&&... args) {
        return add(Component::make<T>(std::forward<Args>(args)...));
    }

    /// Add or replace the component of the same exact type.
    /// Replacing an equal component is skipped without notifications.
    void update(Component component);

    void update(std::vector<Component> components);

    /// Remove the component of the same exact type, which must compare equal
    tessera_core::Result<void> remove(const Component& component);

    /// Remove in order, stopping at the first failure
    tessera_core::Result<void> remove(const std::vector<Component>& components);

    /// Remove the component of an exact type
    template<typename T>
    tessera_core::Result<void> remove() {
        auto popped = pop(std::type_index(typeid(T)));
        if (!popped) {
            return tessera_core::Err(std::move(popped.error()));
        }
        return tessera_core::Ok();
    }

    /// Remove and return the component of an exact type
    tessera_core::Result<Component> pop(std::type_index type_id);

    template<typename T>
    tessera_core::Result<Component> pop() {
        return pop(std::type_index(typeid(T)));
    }

    /// Remove if present; returns whether something was removed
    bool discard(const Component& component);

    void discard(const std::vector<Component>& components);

    /// Remove every component
    void clear();

    // =========================================================================
    // Access
    // =========================================================================

    /// Component of the exact type, else the first whose type derives from it.
    /// Supertype matches need a registry: the owning store's unless one is given.
    [[nodiscard]] Component find(std::type_index type_id) const;
    [[nodiscard]] Component find(std::type_index type_id, const tessera_core::TypeRegistry& types) const;

    template<typename T>
    [[nodiscard]] T* get() const {
        return m_types != nullptr ? get<T>(*m_types) : exact<T>();
    }

    template<typename T>
    [[nodiscard]] T* get(const tessera_core::TypeRegistry& types) const {
        if (T* found = exact<T>()) {
            return found;
        }
        for (const auto& component : m_components) {
            if (T* found = component.template as<T>(types)) {
                return found;
            }
        }
        return nullptr;
    }

    /// Whether a component of type T or a subtype is present
    template<typename T>
    [[nodiscard]] bool has() const {
        return get<T>() != nullptr;
    }

    /// Whether a component of the exact type is present
    [[nodiscard]] bool contains(std::type_index type_id) const;

    /// Exact component types in insertion order
    [[nodiscard]] std::vector<std::type_index> types() const;

    [[nodiscard]] const std::vector<Component>& components() const noexcept { return m_components; }

    [[nodiscard]] iterator begin() const noexcept { return m_components.begin(); }
    [[nodiscard]] iterator end() const noexcept { return m_components.end(); }

    [[nodiscard]] std::size_t size() const noexcept { return m_components.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_components.empty(); }

    /// Same component types with equal components (order-insensitive)
    friend bool operator==(const Entity& lhs, const Entity& rhs);

private:
    friend class EntityStore;

    template<typename T>
    [[nodiscard]] T* exact() const {
        for (const auto& component : m_components) {
            if (T* found = component.template get<T>()) {
                return found;
            }
        }
        return nullptr;
    }

    [[nodiscard]] std::vector<Component>::iterator find_exact(std::type_index type_id);
    [[nodiscard]] std::vector<Component>::const_iterator find_exact(std::type_index type_id) const;

    void attach(EntityStore* store, const tessera_core::TypeRegistry* types) noexcept {
        m_store = store;
        m_types = types;
    }

    void detach() noexcept {
        m_store = nullptr;
        m_types = nullptr;
    }

    EntityId m_id;
    std::vector<Component> m_components;
    EntityStore* m_store = nullptr;
    const tessera_core::TypeRegistry* m_types = nullptr;
};

} // namespace tessera_ecs
