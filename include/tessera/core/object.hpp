#pragma once

/// @file object.hpp
/// @brief Shared, runtime-typed value holder used for components and events

#include "fwd.hpp"
#include "type_registry.hpp"
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <utility>

namespace tessera_core {

// =============================================================================
// Object
// =============================================================================

/// Type-erased handle to a value of any type.
///
/// Copies share the same value (shared_ptr semantics). The value is identified
/// by its exact runtime type; access through a supertype goes through a
/// TypeRegistry. Two objects compare equal when they hold the same exact type
/// and either share storage or, for equality-comparable types, compare equal.
class Object {
public:
    /// Null object
    Object() : m_type(typeid(void)) {}

    /// Construct a T in place
    template<typename T, typename... Args>
    [[nodiscard]] static Object make(Args&&... args) {
        static_assert(!std::is_same_v<std::decay_t<T>, Object>, "Cannot nest Object");
        Object obj;
        obj.m_ptr = std::make_shared<T>(std::forward<Args>(args)...);
        obj.m_type = std::type_index(typeid(T));
        obj.m_ops = &ops_for<T>();
        return obj;
    }

    /// Wrap a copy (or moved instance) of a value
    template<typename T>
    [[nodiscard]] static Object of(T&& value) {
        return make<std::decay_t<T>>(std::forward<T>(value));
    }

    /// Exact runtime type of the held value (typeid(void) when null)
    [[nodiscard]] std::type_index type() const noexcept { return m_type; }

    [[nodiscard]] bool is_null() const noexcept { return m_ptr == nullptr; }

    explicit operator bool() const noexcept { return m_ptr != nullptr; }

    /// Check for an exact type match
    template<typename T>
    [[nodiscard]] bool is() const noexcept {
        return m_ptr != nullptr && m_type == std::type_index(typeid(T));
    }

    /// Exact-type access; nullptr on mismatch
    template<typename T>
    [[nodiscard]] T* get() const noexcept {
        return is<T>() ? static_cast<T*>(m_ptr.get()) : nullptr;
    }

    /// Access as T or any registered supertype of the held type; nullptr otherwise
    template<typename T>
    [[nodiscard]] T* as(const TypeRegistry& types) const {
        if (m_ptr == nullptr) {
            return nullptr;
        }
        return static_cast<T*>(types.upcast(m_ptr.get(), m_type, std::type_index(typeid(T))));
    }

    /// Raw pointer to the held value
    [[nodiscard]] void* data() const noexcept { return m_ptr.get(); }

    /// Check whether both handles share the same value
    [[nodiscard]] bool same(const Object& other) const noexcept {
        return m_ptr == other.m_ptr;
    }

    [[nodiscard]] long use_count() const noexcept { return m_ptr.use_count(); }

    /// Hash consistent with ==. Values of types without std::hash collide
    /// per type.
    [[nodiscard]] std::size_t hash() const {
        std::size_t seed = std::hash<std::type_index>{}(m_type);
        if (m_ptr != nullptr) {
            seed ^= m_ops->hash(m_ptr.get()) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }

    friend bool operator==(const Object& lhs, const Object& rhs) {
        if (lhs.m_ptr == rhs.m_ptr) {
            return true;
        }
        if (lhs.m_ptr == nullptr || rhs.m_ptr == nullptr || lhs.m_type != rhs.m_type) {
            return false;
        }
        return lhs.m_ops->equals(lhs.m_ptr.get(), rhs.m_ptr.get());
    }

private:
    struct Ops {
        bool (*equals)(const void*, const void*);
        std::size_t (*hash)(const void*);
    };

    template<typename T>
    static const Ops& ops_for() {
        static const Ops ops{
            [](const void* a, const void* b) -> bool {
                if constexpr (std::equality_comparable<T>) {
                    return static_cast<bool>(*static_cast<const T*>(a) == *static_cast<const T*>(b));
                } else {
                    return a == b;
                }
            },
            [](const void* value) -> std::size_t {
                if constexpr (ValueHashable<T>) {
                    return std::hash<T>{}(*static_cast<const T*>(value));
                } else {
                    return 0;
                }
            }
        };
        return ops;
    }

    std::shared_ptr<void> m_ptr;
    std::type_index m_type;
    const Ops* m_ops = nullptr;
};

} // namespace tessera_core

template<>
struct std::hash<tessera_core::Object> {
    std::size_t operator()(const tessera_core::Object& object) const {
        return object.hash();
    }
};
