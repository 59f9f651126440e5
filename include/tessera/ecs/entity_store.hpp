#pragma once

/// @file entity_store.hpp
/// @brief Entity storage with a type-hierarchy index

#include "fwd.hpp"
#include "entity_id.hpp"
#include "entity.hpp"
#include "query.hpp"
#include <tessera/core/error.hpp>
#include <tessera/core/type_registry.hpp>
#include <tessera/event/types.hpp>

#include <list>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace tessera_ecs {

// =============================================================================
// EntityStore
// =============================================================================

/// Owns entities and indexes them by component type.
///
/// For every component present the index records the entity under each type
/// of the component's ancestry, so a query for a base type finds entities
/// holding any subtype. A type key exists only while at least one entity
/// holds a matching component. Components of a tag type (see
/// TypeRegistry::register_tag) are also indexed by value; tag values must not
/// be mutated while indexed. Notifications go to the optional event queue.
class EntityStore {
public:
    using iterator = std::list<EntityPtr>::const_iterator;

    explicit EntityStore(const tessera_core::TypeRegistry& types,
                         tessera_event::EventQueue* queue = nullptr);
    ~EntityStore();

    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;
    EntityStore(EntityStore&&) = delete;
    EntityStore& operator=(EntityStore&&) = delete;

    // =========================================================================
    // Entities
    // =========================================================================

    /// Add an entity; already tracked entities are skipped
    tessera_core::Result<void> add(const EntityPtr& entity);

    /// Add in order, stopping at the first failure (earlier ones stay added)
    tessera_core::Result<void> add(const std::vector<EntityPtr>& entities);

    /// Create an entity from components and add it
    template<typename... Cs>
    EntityPtr create(Cs&&... components) {
        auto entity = Entity::create(std::forward<Cs>(components)...);
        adopt(entity);
        return entity;
    }

    /// Remove a tracked entity
    tessera_core::Result<void> remove(const Entity& entity);

    /// Remove in order, stopping at the first untracked entity (earlier ones stay removed)
    tessera_core::Result<void> remove(const std::vector<EntityPtr>& entities);

    /// Remove if tracked; returns whether it was
    bool discard(const Entity& entity);

    /// Remove and return the entity with the given id
    tessera_core::Result<EntityPtr> pop(const EntityId& id);

    /// Entity by id, or nullptr
    [[nodiscard]] EntityPtr get(const EntityId& id) const;

    [[nodiscard]] bool contains(const EntityId& id) const {
        return m_lookup.find(id) != m_lookup.end();
    }

    [[nodiscard]] bool contains(const Entity& entity) const {
        return entity.store() == this && contains(entity.id());
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_entities.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entities.empty(); }

    /// Insertion-ordered iteration
    [[nodiscard]] iterator begin() const noexcept { return m_entities.begin(); }
    [[nodiscard]] iterator end() const noexcept { return m_entities.end(); }

    /// Remove every entity, with notifications
    void clear();

    // =========================================================================
    // Index Access
    // =========================================================================

    /// All ids in insertion order
    [[nodiscard]] std::vector<EntityId> ids() const;

    /// Ids of entities holding the type or a subtype
    [[nodiscard]] std::vector<EntityId> ids(std::type_index type_id) const;

    /// Entities holding the type or a subtype
    [[nodiscard]] std::vector<EntityPtr> entities_with(std::type_index type_id) const;

    template<typename T>
    [[nodiscard]] std::vector<EntityPtr> entities_with() const {
        return entities_with(std::type_index(typeid(T)));
    }

    /// Every component of type T or a subtype, across all entities
    template<typename T>
    [[nodiscard]] std::vector<T*> components() const {
        std::vector<T*> result;
        for (const auto& id : ids(std::type_index(typeid(T)))) {
            for (const auto& component : get(id)->components()) {
                if (T* found = component.template as<T>(*m_types)) {
                    result.push_back(found);
                }
            }
        }
        return result;
    }

    /// Every type currently present in the index
    [[nodiscard]] std::vector<std::type_index> component_types() const;

    /// Read-only index set for a type, or nullptr when absent
    [[nodiscard]] const IdSet* indexed_ids(std::type_index type_id) const;

    /// Ids of entities holding a component equal to the tag
    [[nodiscard]] std::vector<EntityId> tagged_ids(const Component& tag) const;

    /// Entities holding a component equal to the tag
    [[nodiscard]] std::vector<EntityPtr> tagged(const Component& tag) const;

    template<typename T>
    [[nodiscard]] std::vector<EntityPtr> tagged(T value) const {
        return tagged(Component::of(std::move(value)));
    }

    /// Every tag value currently present in the index
    [[nodiscard]] std::vector<Component> tag_values() const;

    /// Read-only index set for a tag value, or nullptr when absent
    [[nodiscard]] const IdSet* indexed_tag(const Component& tag) const;

    // =========================================================================
    // Queries
    // =========================================================================

    /// Merge the index sets of the given types; needs at least one type
    [[nodiscard]] tessera_core::Result<QueryResult> query(
        std::vector<std::type_index> types,
        MergeFn merge_fn = merge::intersection) const;

    /// Merge the tag sets followed by the type sets; needs at least one
    /// type or tag. Every tag must be a value of a registered tag type.
    [[nodiscard]] tessera_core::Result<QueryResult> query(
        std::vector<std::type_index> types,
        const TagOptions& tags,
        MergeFn merge_fn = merge::intersection) const;

    /// Re-run a stored query
    [[nodiscard]] tessera_core::Result<QueryResult> query(const Query& query) const;

    template<typename... Ts>
    [[nodiscard]] tessera_core::Result<QueryResult> query(MergeFn merge_fn = merge::intersection) const {
        return query(std::vector<std::type_index>{std::type_index(typeid(Ts))...}, std::move(merge_fn));
    }

    // =========================================================================
    // Collaborators
    // =========================================================================

    void set_event_queue(tessera_event::EventQueue* queue) noexcept { m_queue = queue; }
    [[nodiscard]] tessera_event::EventQueue* event_queue() const noexcept { return m_queue; }

    [[nodiscard]] const tessera_core::TypeRegistry& types() const noexcept { return *m_types; }

private:
    friend class Entity;

    /// Add an entity known to be standalone
    void adopt(const EntityPtr& entity);

    /// Called by an entity after it gained a component
    void component_added(Entity& entity, const Component& component);

    /// Called by an entity after it lost a component
    void component_removed(Entity& entity, const Component& component);

    void index_component(const EntityId& id, const Component& component);

    /// Drop the entity from every type of the removed component's ancestry
    /// not still covered by one of its remaining components
    void unindex_component(const Entity& entity, const Component& removed);

    void unindex_tag(const EntityId& id, const Component& removed);

    void post(tessera_core::Object event);

    tessera_core::Error fail(tessera_core::Error error) const;

    const tessera_core::TypeRegistry* m_types;
    tessera_event::EventQueue* m_queue;
    std::list<EntityPtr> m_entities;
    std::unordered_map<EntityId, std::list<EntityPtr>::iterator> m_lookup;
    std::unordered_map<std::type_index, IdSet> m_index;
    std::unordered_map<Component, IdSet> m_tags;
};

} // namespace tessera_ecs
