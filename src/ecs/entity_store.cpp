/// @file entity_store.cpp
/// @brief EntityStore implementation

#include <tessera/ecs/entity_store.hpp>
#include <tessera/ecs/events.hpp>
#include <tessera/core/log.hpp>

#include <algorithm>

namespace tessera_ecs {

using tessera_core::Err;
using tessera_core::Error;
using tessera_core::ErrorCode;
using tessera_core::Object;
using tessera_core::Ok;
using tessera_core::Result;
using tessera_core::StoreError;
using tessera_core::TypeRegistryError;

EntityStore::EntityStore(const tessera_core::TypeRegistry& types, tessera_event::EventQueue* queue)
    : m_types(&types)
    , m_queue(queue) {}

EntityStore::~EntityStore() {
    for (auto& entity : m_entities) {
        entity->detach();
    }
}

// =============================================================================
// Entities
// =============================================================================

Result<void> EntityStore::add(const EntityPtr& entity) {
    if (entity == nullptr) {
        return Err(Error(ErrorCode::InvalidArgument, "Cannot add a null entity"));
    }
    if (entity->store() == this) {
        return Ok();
    }
    if (entity->store() != nullptr) {
        return Err(fail(StoreError::already_owned(entity->id().to_string())));
    }

    adopt(entity);
    return Ok();
}

Result<void> EntityStore::add(const std::vector<EntityPtr>& entities) {
    for (const auto& entity : entities) {
        auto result = add(entity);
        if (!result) {
            return result;
        }
    }
    return Ok();
}

void EntityStore::adopt(const EntityPtr& entity) {
    auto it = m_entities.insert(m_entities.end(), entity);
    m_lookup.emplace(entity->id(), it);
    entity->attach(this, m_types);

    for (const auto& component : entity->components()) {
        index_component(entity->id(), component);
    }

    tessera_core::ecs_logger()->trace("Added entity {} with {} component(s)",
        entity->id().to_string(), entity->size());

    post(Object::make<EntityAdded>(EntityAdded{entity}));
    for (const auto& component : entity->components()) {
        post(Object::make<ComponentAdded>(ComponentAdded{entity, component}));
    }
}

Result<void> EntityStore::remove(const Entity& entity) {
    auto found = m_lookup.find(entity.id());
    if (found == m_lookup.end() || found->second->get() != &entity) {
        return Err(fail(StoreError::entity_not_found(entity.id().to_string())));
    }

    // Hold the entity until the notifications are posted
    EntityPtr owned = *found->second;
    m_entities.erase(found->second);
    m_lookup.erase(found);

    for (const auto& component : owned->components()) {
        unindex_tag(owned->id(), component);
        for (const auto& type_id : m_types->mro(component.type())) {
            auto set = m_index.find(type_id);
            if (set == m_index.end()) {
                continue;
            }
            set->second.erase(owned->id());
            if (set->second.empty()) {
                m_index.erase(set);
            }
        }
    }
    owned->detach();

    tessera_core::ecs_logger()->trace("Removed entity {}", owned->id().to_string());

    for (const auto& component : owned->components()) {
        post(Object::make<ComponentRemoved>(ComponentRemoved{owned, component}));
    }
    post(Object::make<EntityRemoved>(EntityRemoved{owned}));
    return Ok();
}

Result<void> EntityStore::remove(const std::vector<EntityPtr>& entities) {
    for (const auto& entity : entities) {
        if (entity == nullptr) {
            return Err(Error(ErrorCode::InvalidArgument, "Cannot remove a null entity"));
        }
        auto result = remove(*entity);
        if (!result) {
            return result;
        }
    }
    return Ok();
}

bool EntityStore::discard(const Entity& entity) {
    if (!contains(entity)) {
        return false;
    }
    return remove(entity).is_ok();
}

Result<EntityPtr> EntityStore::pop(const EntityId& id) {
    EntityPtr entity = get(id);
    if (entity == nullptr) {
        return Err<EntityPtr>(fail(StoreError::entity_not_found(id.to_string())));
    }
    auto removed = remove(*entity);
    if (!removed) {
        return Err<EntityPtr>(std::move(removed.error()));
    }
    return Ok(std::move(entity));
}

EntityPtr EntityStore::get(const EntityId& id) const {
    auto it = m_lookup.find(id);
    return it != m_lookup.end() ? *it->second : nullptr;
}

void EntityStore::clear() {
    while (!m_entities.empty()) {
        EntityPtr entity = m_entities.front();
        auto result = remove(*entity);
        if (!result) {
            // Only reachable if the lookup and the list disagree
            tessera_core::ecs_logger()->error("Failed to clear entity {}: {}",
                entity->id().to_string(), result.error().message());
            m_entities.pop_front();
        }
    }
}

// =============================================================================
// Index Access
// =============================================================================

std::vector<EntityId> EntityStore::ids() const {
    std::vector<EntityId> result;
    result.reserve(m_entities.size());
    for (const auto& entity : m_entities) {
        result.push_back(entity->id());
    }
    return result;
}

std::vector<EntityId> EntityStore::ids(std::type_index type_id) const {
    const IdSet* set = indexed_ids(type_id);
    if (set == nullptr) {
        return {};
    }
    return std::vector<EntityId>(set->begin(), set->end());
}

std::vector<EntityPtr> EntityStore::entities_with(std::type_index type_id) const {
    std::vector<EntityPtr> result;
    const IdSet* set = indexed_ids(type_id);
    if (set == nullptr) {
        return result;
    }
    result.reserve(set->size());
    for (const auto& id : *set) {
        result.push_back(get(id));
    }
    return result;
}

std::vector<std::type_index> EntityStore::component_types() const {
    std::vector<std::type_index> result;
    result.reserve(m_index.size());
    for (const auto& [type_id, set] : m_index) {
        result.push_back(type_id);
    }
    return result;
}

const IdSet* EntityStore::indexed_ids(std::type_index type_id) const {
    auto it = m_index.find(type_id);
    return it != m_index.end() ? &it->second : nullptr;
}

std::vector<EntityId> EntityStore::tagged_ids(const Component& tag) const {
    const IdSet* set = indexed_tag(tag);
    if (set == nullptr) {
        return {};
    }
    return std::vector<EntityId>(set->begin(), set->end());
}

std::vector<EntityPtr> EntityStore::tagged(const Component& tag) const {
    std::vector<EntityPtr> result;
    const IdSet* set = indexed_tag(tag);
    if (set == nullptr) {
        return result;
    }
    result.reserve(set->size());
    for (const auto& id : *set) {
        result.push_back(get(id));
    }
    return result;
}

std::vector<Component> EntityStore::tag_values() const {
    std::vector<Component> result;
    result.reserve(m_tags.size());
    for (const auto& [tag, set] : m_tags) {
        result.push_back(tag);
    }
    return result;
}

const IdSet* EntityStore::indexed_tag(const Component& tag) const {
    if (tag.is_null()) {
        return nullptr;
    }
    auto it = m_tags.find(tag);
    return it != m_tags.end() ? &it->second : nullptr;
}

// =============================================================================
// Queries
// =============================================================================

Result<QueryResult> EntityStore::query(std::vector<std::type_index> types, MergeFn merge_fn) const {
    return query(std::move(types), TagOptions{}, std::move(merge_fn));
}

Result<QueryResult> EntityStore::query(std::vector<std::type_index> types,
                                       const TagOptions& tag_options,
                                       MergeFn merge_fn) const {
    if (tag_options.tag && tag_options.tags) {
        return Err<QueryResult>(fail(StoreError::conflicting_tag_arguments()));
    }

    std::vector<Component> tags;
    if (tag_options.tag) {
        tags.push_back(*tag_options.tag);
    } else if (tag_options.tags) {
        tags = *tag_options.tags;
    }

    if (types.empty() && tags.empty()) {
        return Err<QueryResult>(fail(StoreError::empty_query()));
    }
    if (!merge_fn) {
        return Err<QueryResult>(Error(ErrorCode::InvalidArgument, "Query needs a merge function"));
    }
    for (const auto& tag : tags) {
        if (tag.is_null()) {
            return Err<QueryResult>(Error(ErrorCode::InvalidArgument, "Query tags cannot be null"));
        }
        if (!m_types->is_tag(tag.type())) {
            return Err<QueryResult>(fail(TypeRegistryError::not_registered(m_types->name(tag.type()), "tag")));
        }
    }

    static const IdSet empty_set;

    std::vector<IdSetRef> sets;
    sets.reserve(tags.size() + types.size());
    for (const auto& tag : tags) {
        const IdSet* set = indexed_tag(tag);
        sets.emplace_back(set != nullptr ? *set : empty_set);
    }
    for (const auto& type_id : types) {
        const IdSet* set = indexed_ids(type_id);
        sets.emplace_back(set != nullptr ? *set : empty_set);
    }

    IdSet matched = merge_fn(sets);

    std::vector<EntityPtr> entities;
    entities.reserve(matched.size());
    for (const auto& id : matched) {
        if (EntityPtr entity = get(id)) {
            entities.push_back(std::move(entity));
        }
    }

    Query stored{std::move(types), std::move(merge_fn), std::move(tags)};
    return Ok(QueryResult(std::move(entities), std::move(stored), *m_types));
}

Result<QueryResult> EntityStore::query(const Query& query) const {
    return this->query(query.types, TagOptions::with_tags(query.tags), query.merge);
}

// =============================================================================
// Entity Callbacks
// =============================================================================

void EntityStore::component_added(Entity& entity, const Component& component) {
    index_component(entity.id(), component);
    post(Object::make<ComponentAdded>(ComponentAdded{entity.shared_from_this(), component}));
}

void EntityStore::component_removed(Entity& entity, const Component& component) {
    unindex_component(entity, component);
    post(Object::make<ComponentRemoved>(ComponentRemoved{entity.shared_from_this(), component}));
}

void EntityStore::index_component(const EntityId& id, const Component& component) {
    for (const auto& type_id : m_types->mro(component.type())) {
        m_index[type_id].insert(id);
    }
    if (m_types->is_tag(component.type())) {
        m_tags[component].insert(id);
    }
}

void EntityStore::unindex_component(const Entity& entity, const Component& removed) {
    unindex_tag(entity.id(), removed);

    for (const auto& type_id : m_types->mro(removed.type())) {
        // A sibling subtype may still cover this ancestor
        bool covered = std::any_of(entity.begin(), entity.end(), [&](const Component& remaining) {
            return m_types->is_subclass(remaining.type(), type_id);
        });
        if (covered) {
            continue;
        }

        auto set = m_index.find(type_id);
        if (set == m_index.end()) {
            continue;
        }
        set->second.erase(entity.id());
        if (set->second.empty()) {
            m_index.erase(set);
        }
    }
}

void EntityStore::unindex_tag(const EntityId& id, const Component& removed) {
    // Tag types are never unregistered, so a tag indexed earlier is still one
    if (!m_types->is_tag(removed.type())) {
        return;
    }
    auto set = m_tags.find(removed);
    if (set == m_tags.end()) {
        return;
    }
    set->second.erase(id);
    if (set->second.empty()) {
        m_tags.erase(set);
    }
}

void EntityStore::post(Object event) {
    if (m_queue != nullptr) {
        m_queue->push_back(std::move(event));
    }
}

Error EntityStore::fail(Error error) const {
    tessera_core::debug::record_error(error);
    tessera_core::ecs_logger()->warn("{}", error.message());
    return error;
}

} // namespace tessera_ecs
