/// @file type_registry.cpp
/// @brief Type hierarchy registry implementation for tessera_core

#include <tessera/core/type_registry.hpp>
#include <tessera/core/log.hpp>
#include <algorithm>
#include <unordered_set>

namespace tessera_core {

namespace {

Result<void> fail(TypeRegistryError err) {
    Error error(std::move(err));
    debug::record_error(error);
    core_logger()->warn("{}", error.message());
    return Err(std::move(error));
}

} // anonymous namespace

// =============================================================================
// Registration
// =============================================================================

Result<void> TypeRegistry::insert(TypeRecord record) {
    auto existing = m_records.find(record.type_id);
    if (existing != m_records.end()) {
        return fail(TypeRegistryError::already_registered(record.name));
    }

    for (const auto& base : record.bases) {
        if (!contains(base)) {
            return fail(TypeRegistryError::invalid_hierarchy(
                record.name, "base type " + std::string(base.name()) + " is not registered"));
        }
    }

    for (const auto& base : record.bases) {
        m_records.at(base).children.push_back(record.type_id);
    }

    core_logger()->debug("Registered type '{}' with {} direct base(s)", record.name, record.bases.size());

    auto type_id = record.type_id;
    m_records.emplace(type_id, std::move(record));
    return Ok();
}

Result<void> TypeRegistry::insert_tag(std::type_index type_id, const std::string& name) {
    if (!m_tags.insert(type_id).second) {
        return fail(TypeRegistryError::already_registered(name + " (as tag)"));
    }
    core_logger()->debug("Registered tag type '{}'", name);
    return Ok();
}

const TypeRecord& TypeRegistry::observe(std::type_index type_id) const {
    auto it = m_records.find(type_id);
    if (it != m_records.end()) {
        return it->second;
    }
    core_logger()->trace("Observed unregistered type '{}' as a root", type_id.name());
    return m_records.emplace(type_id, TypeRecord(type_id, type_id.name())).first->second;
}

// =============================================================================
// Hierarchy Queries
// =============================================================================

const std::vector<std::type_index>& TypeRegistry::mro(std::type_index type_id) const {
    auto cached = m_mro_cache.find(type_id);
    if (cached != m_mro_cache.end()) {
        return cached->second;
    }

    // Copy the bases: recursion below may insert into m_records
    std::vector<std::type_index> bases = observe(type_id).bases;

    std::vector<std::type_index> order{type_id};
    for (const auto& base : bases) {
        for (const auto& ancestor : mro(base)) {
            if (std::find(order.begin(), order.end(), ancestor) == order.end()) {
                order.push_back(ancestor);
            }
        }
    }

    return m_mro_cache.emplace(type_id, std::move(order)).first->second;
}

std::vector<std::type_index> TypeRegistry::subclasses(std::type_index type_id) const {
    observe(type_id);

    std::vector<std::type_index> result;
    std::unordered_set<std::type_index> seen;
    std::vector<std::type_index> stack{type_id};

    while (!stack.empty()) {
        auto current = stack.back();
        stack.pop_back();
        if (!seen.insert(current).second) {
            continue;
        }
        result.push_back(current);

        const auto& children = m_records.at(current).children;
        stack.insert(stack.end(), children.begin(), children.end());
    }

    return result;
}

bool TypeRegistry::is_subclass(std::type_index derived, std::type_index base) const {
    if (derived == base) {
        return true;
    }
    const auto& order = mro(derived);
    return std::find(order.begin(), order.end(), base) != order.end();
}

void* TypeRegistry::upcast(void* ptr, std::type_index from, std::type_index to) const {
    if (ptr == nullptr) {
        return nullptr;
    }
    if (from == to) {
        return ptr;
    }

    const TypeRecord* record = get(from);
    if (record == nullptr) {
        return nullptr;
    }

    for (std::size_t i = 0; i < record->bases.size(); ++i) {
        void* adjusted = record->upcasts[i](ptr);
        if (void* result = upcast(adjusted, record->bases[i], to)) {
            return result;
        }
    }
    return nullptr;
}

// =============================================================================
// Lookup
// =============================================================================

std::string TypeRegistry::name(std::type_index type_id) const {
    const TypeRecord* record = get(type_id);
    return record != nullptr ? record->name : std::string(type_id.name());
}

const TypeRecord* TypeRegistry::get(std::type_index type_id) const {
    auto it = m_records.find(type_id);
    return it != m_records.end() ? &it->second : nullptr;
}

} // namespace tessera_core
