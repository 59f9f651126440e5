#pragma once

/// @file type_registry.hpp
/// @brief Runtime type hierarchy registry for tessera_core

#include "fwd.hpp"
#include "error.hpp"
#include <cstdint>
#include <string>
#include <typeinfo>
#include <typeindex>
#include <type_traits>
#include <concepts>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tessera_core {

/// Types usable as hash keys by value
template<typename T>
concept ValueHashable = std::equality_comparable<T> && requires(const T& value) {
    { std::hash<T>{}(value) } -> std::convertible_to<std::size_t>;
};

// =============================================================================
// TypeRecord
// =============================================================================

/// Adjusts a pointer to a derived object into a pointer to one of its direct bases
using UpcastFn = void* (*)(void*);

/// Runtime information about one type and its direct supertypes
struct TypeRecord {
    std::type_index type_id;
    std::string name;
    std::size_t size = 0;
    std::size_t align = 0;
    /// Direct supertypes in declaration order
    std::vector<std::type_index> bases;
    /// Parallel to bases
    std::vector<UpcastFn> upcasts;
    /// Direct subtypes in registration order
    std::vector<std::type_index> children;
    /// False for types that were only observed through a lookup
    bool declared = false;

    TypeRecord() : type_id(typeid(void)) {}

    TypeRecord(std::type_index tid, std::string n)
        : type_id(tid), name(std::move(n)) {}
};

namespace detail {

template<typename Derived, typename Base>
void* upcast_to(void* ptr) {
    return static_cast<Base*>(static_cast<Derived*>(ptr));
}

} // namespace detail

// =============================================================================
// TypeRegistry
// =============================================================================

/// Explicit registry of declared supertypes, standing in for language reflection.
///
/// A type that was never registered behaves as a root. The first hierarchy
/// lookup of such a type records it, after which registering it fails with
/// TypeRegistryError::AlreadyRegistered; ancestry handed out is never revised.
class TypeRegistry {
public:
    TypeRegistry() = default;

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;
    TypeRegistry(TypeRegistry&&) = default;
    TypeRegistry& operator=(TypeRegistry&&) = default;

    /// Declare T with its direct supertypes (in declaration order).
    /// Every base must already be known to the registry.
    template<typename T, typename... Bases>
    Result<void> register_type(const std::string& name = {}) {
        static_assert((std::is_base_of_v<Bases, T> && ...),
            "Every declared base must be a base class of T");
        static_assert((!std::is_same_v<Bases, T> && ...),
            "A type cannot inherit itself");

        TypeRecord record(std::type_index(typeid(T)), name.empty() ? typeid(T).name() : name);
        record.size = sizeof(T);
        record.align = alignof(T);
        record.declared = true;
        (record.bases.push_back(std::type_index(typeid(Bases))), ...);
        (record.upcasts.push_back(&detail::upcast_to<T, Bases>), ...);

        return insert(std::move(record));
    }

    /// Mark T as a tag type: its components are also indexed by value.
    /// Tags match on the exact type; registering one twice fails.
    template<typename T>
    Result<void> register_tag(const std::string& name = {}) {
        static_assert(ValueHashable<T>, "Tag types need operator== and a std::hash specialization");
        return insert_tag(std::type_index(typeid(T)), name.empty() ? typeid(T).name() : name);
    }

    /// Whether components of this exact type are indexed by value
    [[nodiscard]] bool is_tag(std::type_index type_id) const {
        return m_tags.find(type_id) != m_tags.end();
    }

    template<typename T>
    [[nodiscard]] bool is_tag() const {
        return is_tag(std::type_index(typeid(T)));
    }

    /// Ancestry of a type: the type itself, then every ancestor depth-first
    /// in declaration order, each once. Memoized.
    [[nodiscard]] const std::vector<std::type_index>& mro(std::type_index type_id) const;

    template<typename T>
    [[nodiscard]] const std::vector<std::type_index>& mro() const {
        return mro(std::type_index(typeid(T)));
    }

    /// The type itself first, then every transitive subtype, each once
    [[nodiscard]] std::vector<std::type_index> subclasses(std::type_index type_id) const;

    template<typename T>
    [[nodiscard]] std::vector<std::type_index> subclasses() const {
        return subclasses(std::type_index(typeid(T)));
    }

    /// True when base appears in the ancestry of derived (including derived == base)
    [[nodiscard]] bool is_subclass(std::type_index derived, std::type_index base) const;

    template<typename Derived, typename Base>
    [[nodiscard]] bool is_subclass() const {
        return is_subclass(std::type_index(typeid(Derived)), std::type_index(typeid(Base)));
    }

    /// Convert a pointer to an object of type `from` into a pointer to its `to` subobject.
    /// Returns nullptr when `to` is not an ancestor of `from`.
    [[nodiscard]] void* upcast(void* ptr, std::type_index from, std::type_index to) const;

    /// Readable name (registered name, else the implementation type name)
    [[nodiscard]] std::string name(std::type_index type_id) const;

    template<typename T>
    [[nodiscard]] std::string name() const {
        return name(std::type_index(typeid(T)));
    }

    /// Get the record for a known type
    [[nodiscard]] const TypeRecord* get(std::type_index type_id) const;

    /// Check if the type was registered or observed
    [[nodiscard]] bool contains(std::type_index type_id) const {
        return m_records.find(type_id) != m_records.end();
    }

    template<typename T>
    [[nodiscard]] bool contains() const {
        return contains(std::type_index(typeid(T)));
    }

    /// Number of registered or observed types
    [[nodiscard]] std::size_t size() const noexcept { return m_records.size(); }

    [[nodiscard]] bool empty() const noexcept { return m_records.empty(); }

private:
    Result<void> insert(TypeRecord record);
    Result<void> insert_tag(std::type_index type_id, const std::string& name);

    /// Record an unknown type as a root
    const TypeRecord& observe(std::type_index type_id) const;

    mutable std::unordered_map<std::type_index, TypeRecord> m_records;
    mutable std::unordered_map<std::type_index, std::vector<std::type_index>> m_mro_cache;
    std::unordered_set<std::type_index> m_tags;
};

} // namespace tessera_core
