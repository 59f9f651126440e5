/// @file query.cpp
/// @brief Merge functions and query results

#include <tessera/ecs/query.hpp>

#include <algorithm>
#include <unordered_map>

namespace tessera_ecs {

// =============================================================================
// Merge Functions
// =============================================================================

namespace merge {

IdSet intersection(const std::vector<IdSetRef>& sets) {
    if (sets.empty()) {
        return {};
    }

    // Scan the smallest set
    auto smallest = std::min_element(sets.begin(), sets.end(),
        [](const IdSetRef& a, const IdSetRef& b) { return a.get().size() < b.get().size(); });

    IdSet result;
    for (const auto& id : smallest->get()) {
        bool everywhere = std::all_of(sets.begin(), sets.end(),
            [&id](const IdSetRef& set) { return set.get().count(id) != 0; });
        if (everywhere) {
            result.insert(id);
        }
    }
    return result;
}

IdSet union_of(const std::vector<IdSetRef>& sets) {
    IdSet result;
    for (const auto& set : sets) {
        result.insert(set.get().begin(), set.get().end());
    }
    return result;
}

IdSet symmetric_difference(const std::vector<IdSetRef>& sets) {
    IdSet result;
    for (const auto& set : sets) {
        for (const auto& id : set.get()) {
            if (!result.insert(id).second) {
                result.erase(id);
            }
        }
    }
    return result;
}

IdSet difference(const std::vector<IdSetRef>& sets) {
    if (sets.empty()) {
        return {};
    }
    IdSet result;
    for (const auto& id : sets.front().get()) {
        bool elsewhere = std::any_of(sets.begin() + 1, sets.end(),
            [&id](const IdSetRef& set) { return set.get().count(id) != 0; });
        if (!elsewhere) {
            result.insert(id);
        }
    }
    return result;
}

} // namespace merge

// =============================================================================
// QueryResult
// =============================================================================

QueryResult::QueryResult(std::vector<EntityPtr> entities,
                         Query query,
                         const tessera_core::TypeRegistry& types)
    : m_entities(std::move(entities))
    , m_query(std::move(query))
    , m_types(&types)
{
    m_by_id.reserve(m_entities.size());
    for (const auto& entity : m_entities) {
        m_by_id.emplace(entity->id(), entity);
    }
}

std::vector<EntityId> QueryResult::ids() const {
    std::vector<EntityId> result;
    result.reserve(m_entities.size());
    for (const auto& entity : m_entities) {
        result.push_back(entity->id());
    }
    return result;
}

EntityPtr QueryResult::get(const EntityId& id) const {
    auto it = m_by_id.find(id);
    return it != m_by_id.end() ? it->second : nullptr;
}

} // namespace tessera_ecs
