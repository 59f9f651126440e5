#pragma once

/// @file error.hpp
/// @brief Error kinds, Error and Result<T> for tessera

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tessera_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// Coarse category shared by every error kind
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
};

inline constexpr std::size_t k_error_code_count = static_cast<std::size_t>(ErrorCode::ParseError) + 1;

[[nodiscard]] const char* error_code_name(ErrorCode code) noexcept;

// =============================================================================
// Error Kinds
// =============================================================================

/// Runtime type registration and lookup
struct TypeRegistryError {
    enum class Kind : std::uint8_t {
        NotRegistered,
        AlreadyRegistered,  // Registered before, or its ancestry was already observed
        InvalidHierarchy,   // Unknown base or self-inheritance
    };

    Kind kind;
    std::string message;
    std::string type_name;

    [[nodiscard]] static TypeRegistryError not_registered(const std::string& name, const std::string& as = "type") {
        return {Kind::NotRegistered, "Type not registered as " + as + ": " + name, name};
    }

    [[nodiscard]] static TypeRegistryError already_registered(const std::string& name) {
        return {Kind::AlreadyRegistered, "Type already registered: " + name, name};
    }

    [[nodiscard]] static TypeRegistryError invalid_hierarchy(const std::string& name, const std::string& reason) {
        return {Kind::InvalidHierarchy, "Invalid hierarchy for '" + name + "': " + reason, name};
    }
};

/// Entity and entity store operations
struct StoreError {
    enum class Kind : std::uint8_t {
        AlreadyOwned,
        EntityNotFound,
        ComponentNotFound,
        DuplicateComponent,
        EmptyQuery,
        ConflictingTagArguments,  // Single tag and tag list both given
    };

    Kind kind;
    std::string message;
    std::string entity;
    std::string component_type;

    [[nodiscard]] static StoreError already_owned(const std::string& entity_id) {
        return {Kind::AlreadyOwned, "Entity already added to another store: " + entity_id, entity_id, {}};
    }

    [[nodiscard]] static StoreError entity_not_found(const std::string& entity_id) {
        return {Kind::EntityNotFound, "Entity not found: " + entity_id, entity_id, {}};
    }

    [[nodiscard]] static StoreError component_not_found(const std::string& entity_id, const std::string& type) {
        return {Kind::ComponentNotFound,
            "Entity " + entity_id + " has no matching component of type " + type, entity_id, type};
    }

    [[nodiscard]] static StoreError duplicate_component(const std::string& entity_id, const std::string& type) {
        return {Kind::DuplicateComponent,
            "Entity " + entity_id + " already has a component of type " + type, entity_id, type};
    }

    [[nodiscard]] static StoreError empty_query() {
        return {Kind::EmptyQuery, "Expected at least one component type or tag", {}, {}};
    }

    [[nodiscard]] static StoreError conflicting_tag_arguments() {
        return {Kind::ConflictingTagArguments, "Query cannot take both a single tag and a tag list", {}, {}};
    }
};

/// System registration, bindings and dispatch
struct DispatchError {
    enum class Kind : std::uint8_t {
        SystemAlreadyRegistered,
        SystemNotFound,
        KeyFunctionMissing,       // Keys bound to an event type without key function
        ConflictingKeyArguments,  // Single key and key set both given
        DuplicateBinding,         // Same handler bound twice to one event type
        InvalidPriority,          // NaN
        KeyFunctionAlreadySet,
        NoContext,
        SystemLocked,             // Binding added while the system is registered
    };

    Kind kind;
    std::string message;
    std::string system;
    std::string event_type;

    [[nodiscard]] static DispatchError system_already_registered(const std::string& name) {
        return {Kind::SystemAlreadyRegistered, "System already registered: " + name, name, {}};
    }

    [[nodiscard]] static DispatchError system_not_found(const std::string& name) {
        return {Kind::SystemNotFound, "System not registered: " + name, name, {}};
    }

    [[nodiscard]] static DispatchError key_function_missing(const std::string& event_type) {
        return {Kind::KeyFunctionMissing,
            "Keys were provided but no key function exists for " + event_type, {}, event_type};
    }

    [[nodiscard]] static DispatchError conflicting_key_arguments() {
        return {Kind::ConflictingKeyArguments, "Binding cannot take both a single key and a key set", {}, {}};
    }

    [[nodiscard]] static DispatchError duplicate_binding(const std::string& handler, const std::string& event_type) {
        return {Kind::DuplicateBinding,
            event_type + " is already bound to handler '" + handler + "'", handler, event_type};
    }

    [[nodiscard]] static DispatchError invalid_priority(const std::string& event_type) {
        return {Kind::InvalidPriority, "Priority for " + event_type + " is not comparable (NaN)", {}, event_type};
    }

    [[nodiscard]] static DispatchError key_function_already_set(const std::string& event_type) {
        return {Kind::KeyFunctionAlreadySet, "Cannot reassign key function for event type " + event_type, {}, event_type};
    }

    [[nodiscard]] static DispatchError no_context(const std::string& event_type) {
        return {Kind::NoContext, "Cannot dispatch " + event_type + ": no dispatch context attached", {}, event_type};
    }

    [[nodiscard]] static DispatchError system_locked(const std::string& name, const std::string& event_type) {
        return {Kind::SystemLocked,
            "Cannot bind " + event_type + " on registered system '" + name + "'; unregister it first",
            name, event_type};
    }
};

/// Category of each kind
[[nodiscard]] ErrorCode error_code_of(TypeRegistryError::Kind kind) noexcept;
[[nodiscard]] ErrorCode error_code_of(StoreError::Kind kind) noexcept;
[[nodiscard]] ErrorCode error_code_of(DispatchError::Kind kind) noexcept;

// =============================================================================
// Error
// =============================================================================

/// One of the module error kinds, or a plain message with a code
class Error {
public:
    using Variant = std::variant<std::string, TypeRegistryError, StoreError, DispatchError>;

    Error() : m_code(ErrorCode::Unknown), m_error(std::string("Unknown error")) {}
    Error(TypeRegistryError err) : m_code(error_code_of(err.kind)), m_error(std::move(err)) {}
    Error(StoreError err) : m_code(error_code_of(err.kind)), m_error(std::move(err)) {}
    Error(DispatchError err) : m_code(error_code_of(err.kind)), m_error(std::move(err)) {}
    Error(std::string msg) : m_code(ErrorCode::Unknown), m_error(std::move(msg)) {}
    Error(const char* msg) : Error(std::string(msg)) {}
    Error(ErrorCode code, std::string msg) : m_code(code), m_error(std::move(msg)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            if constexpr (std::is_same_v<std::decay_t<decltype(err)>, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    template<typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(m_error); }

    /// Kind payload, or null when the error holds something else
    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&m_error); }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

namespace detail {

[[noreturn]] void throw_bad_result(const std::string& what);

template<typename E>
std::string describe_error(const E& error) {
    if constexpr (std::is_same_v<E, Error>) {
        return error.message();
    } else {
        return "error";
    }
}

} // namespace detail

/// Either a value or an error. Accessing the wrong side is undefined except
/// through unwrap(), which throws std::runtime_error.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_data(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_data(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_data.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return *std::get_if<0>(&m_data); }
    [[nodiscard]] const T& value() const& { return *std::get_if<0>(&m_data); }
    [[nodiscard]] T&& value() && { return std::move(*std::get_if<0>(&m_data)); }

    [[nodiscard]] E& error() & { return *std::get_if<1>(&m_data); }
    [[nodiscard]] const E& error() const& { return *std::get_if<1>(&m_data); }

    [[nodiscard]] T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] T& unwrap() & {
        check();
        return value();
    }

    [[nodiscard]] T&& unwrap() && {
        check();
        return std::move(*this).value();
    }

    /// Transform the value, passing an error through
    template<typename F>
    auto map(F&& func) -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>(func(std::move(value())));
        }
        return Result<U, E>(std::move(error()));
    }

    /// Chain a fallible step
    template<typename F>
    auto and_then(F&& func) -> std::invoke_result_t<F, T> {
        if (is_ok()) {
            return func(std::move(value()));
        }
        return std::invoke_result_t<F, T>(std::move(error()));
    }

private:
    void check() const {
        if (is_err()) {
            detail::throw_bad_result(detail::describe_error(error()));
        }
    }

    std::variant<T, E> m_data;
};

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::in_place, std::move(error)) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }

    void unwrap() const {
        if (is_err()) {
            detail::throw_bad_result(detail::describe_error(*m_error));
        }
    }

private:
    std::optional<E> m_error;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (error.cpp)
// =============================================================================

/// "[Code] [Kind] message (details) {context}"
std::string build_error_chain(const Error& error);

namespace debug {

/// Count an error by code and by domain
void record_error(const Error& error);

std::uint64_t total_error_count();

std::uint64_t error_count(ErrorCode code);

void reset_error_stats();

/// Multi-line counts per domain
std::string error_stats_summary();

} // namespace debug

} // namespace tessera_core
