#pragma once

/// @file query.hpp
/// @brief Multi-type queries over an entity store

#include "fwd.hpp"
#include "entity_id.hpp"
#include "entity.hpp"
#include <tessera/core/type_registry.hpp>

#include <functional>
#include <optional>
#include <tuple>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tessera_ecs {

// =============================================================================
// Id Sets and Merge Functions
// =============================================================================

using IdSet = std::unordered_set<EntityId>;
using IdSetRef = std::reference_wrapper<const IdSet>;

/// Reduces one id set per queried type into the result set
using MergeFn = std::function<IdSet(const std::vector<IdSetRef>&)>;

namespace merge {

/// Ids present in every set ("has all of")
IdSet intersection(const std::vector<IdSetRef>& sets);

/// Ids present in any set ("has any of")
IdSet union_of(const std::vector<IdSetRef>& sets);

/// Ids present in an odd number of sets (for two sets: "has exactly one of")
IdSet symmetric_difference(const std::vector<IdSetRef>& sets);

/// Ids of the first set absent from all others ("has the first but none of the rest")
IdSet difference(const std::vector<IdSetRef>& sets);

} // namespace merge

// =============================================================================
// Query
// =============================================================================

/// Optional tag values of a query; `tag` and `tags` are mutually exclusive
struct TagOptions {
    std::optional<Component> tag;
    std::optional<std::vector<Component>> tags;

    [[nodiscard]] static TagOptions with_tag(Component t) {
        TagOptions options;
        options.tag = std::move(t);
        return options;
    }

    [[nodiscard]] static TagOptions with_tags(std::vector<Component> ts) {
        TagOptions options;
        options.tags = std::move(ts);
        return options;
    }
};

/// Query parameters, enough to re-run or refine a query.
/// Tag sets precede type sets in the merge input.
struct Query {
    std::vector<std::type_index> types;
    MergeFn merge = merge::intersection;
    std::vector<Component> tags;
};

// =============================================================================
// QueryResult
// =============================================================================

/// Snapshot of the entities matched by a query.
/// Later store mutations do not change it; entity order is unspecified.
class QueryResult {
public:
    QueryResult(std::vector<EntityPtr> entities,
                Query query,
                const tessera_core::TypeRegistry& types);

    [[nodiscard]] std::vector<EntityId> ids() const;
    [[nodiscard]] const std::vector<EntityPtr>& entities() const noexcept { return m_entities; }

    /// Types passed to the query, in order
    [[nodiscard]] const std::vector<std::type_index>& types() const noexcept { return m_query.types; }

    /// Tags passed to the query, in order (a single tag becomes a list of one)
    [[nodiscard]] const std::vector<Component>& tags() const noexcept { return m_query.tags; }
    [[nodiscard]] const MergeFn& merge() const noexcept { return m_query.merge; }
    [[nodiscard]] const Query& query() const noexcept { return m_query; }

    [[nodiscard]] std::size_t size() const noexcept { return m_entities.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entities.empty(); }

    [[nodiscard]] bool contains(const EntityId& id) const {
        return m_by_id.find(id) != m_by_id.end();
    }

    /// Entity by id, or nullptr when not part of the result
    [[nodiscard]] EntityPtr get(const EntityId& id) const;

    [[nodiscard]] auto begin() const noexcept { return m_entities.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_entities.end(); }

    /// Component T (or a subtype) of each entity holding one
    template<typename T>
    [[nodiscard]] std::vector<T*> components() const {
        std::vector<T*> result;
        result.reserve(m_entities.size());
        for (const auto& entity : m_entities) {
            if (T* component = entity->template get<T>(*m_types)) {
                result.push_back(component);
            }
        }
        return result;
    }

    /// One tuple of components per entity holding all of Ts; others are skipped
    template<typename... Ts>
    [[nodiscard]] std::vector<std::tuple<Ts*...>> zip() const {
        static_assert(sizeof...(Ts) > 0, "zip needs at least one component type");
        std::vector<std::tuple<Ts*...>> result;
        for (const auto& entity : m_entities) {
            std::tuple<Ts*...> row{entity->template get<Ts>(*m_types)...};
            if (all_present(row)) {
                result.push_back(row);
            }
        }
        return result;
    }

    /// Like zip, with the entity leading each tuple
    template<typename... Ts>
    [[nodiscard]] std::vector<std::tuple<EntityPtr, Ts*...>> zip_entity() const {
        static_assert(sizeof...(Ts) > 0, "zip_entity needs at least one component type");
        std::vector<std::tuple<EntityPtr, Ts*...>> result;
        for (const auto& entity : m_entities) {
            std::tuple<Ts*...> row{entity->template get<Ts>(*m_types)...};
            if (all_present(row)) {
                result.push_back(std::tuple_cat(std::make_tuple(entity), row));
            }
        }
        return result;
    }

private:
    template<typename... Ts>
    static bool all_present(const std::tuple<Ts*...>& row) {
        return std::apply([](auto*... ptrs) { return ((ptrs != nullptr) && ...); }, row);
    }

    std::vector<EntityPtr> m_entities;
    std::unordered_map<EntityId, EntityPtr> m_by_id;
    Query m_query;
    const tessera_core::TypeRegistry* m_types;
};

} // namespace tessera_ecs
