/// @file error.cpp
/// @brief Error categories, formatting and statistics

#include <tessera/core/error.hpp>
#include <array>
#include <atomic>
#include <sstream>

namespace tessera_core {

// =============================================================================
// Categories
// =============================================================================

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::Unknown: break;
    }
    return "Unknown";
}

ErrorCode error_code_of(TypeRegistryError::Kind kind) noexcept {
    using K = TypeRegistryError::Kind;
    switch (kind) {
        case K::NotRegistered: return ErrorCode::NotFound;
        case K::AlreadyRegistered: return ErrorCode::AlreadyExists;
        case K::InvalidHierarchy: return ErrorCode::InvalidArgument;
    }
    return ErrorCode::Unknown;
}

ErrorCode error_code_of(StoreError::Kind kind) noexcept {
    using K = StoreError::Kind;
    switch (kind) {
        case K::AlreadyOwned:
        case K::DuplicateComponent:
            return ErrorCode::AlreadyExists;
        case K::EntityNotFound:
        case K::ComponentNotFound:
            return ErrorCode::NotFound;
        case K::EmptyQuery:
        case K::ConflictingTagArguments:
            return ErrorCode::InvalidArgument;
    }
    return ErrorCode::Unknown;
}

ErrorCode error_code_of(DispatchError::Kind kind) noexcept {
    using K = DispatchError::Kind;
    switch (kind) {
        case K::SystemAlreadyRegistered:
        case K::DuplicateBinding:
        case K::KeyFunctionAlreadySet:
            return ErrorCode::AlreadyExists;
        case K::SystemNotFound:
            return ErrorCode::NotFound;
        case K::KeyFunctionMissing:
        case K::ConflictingKeyArguments:
        case K::InvalidPriority:
            return ErrorCode::InvalidArgument;
        case K::NoContext:
        case K::SystemLocked:
            return ErrorCode::InvalidState;
    }
    return ErrorCode::Unknown;
}

namespace detail {

void throw_bad_result(const std::string& what) {
    throw std::runtime_error("Result contains error: " + what);
}

} // namespace detail

// =============================================================================
// Formatting
// =============================================================================

namespace {

void append_detail(std::ostringstream& oss, const char* label, const std::string& value) {
    if (!value.empty()) {
        oss << " (" << label << ": " << value << ")";
    }
}

void describe(std::ostringstream& oss, const std::string& message) {
    oss << message;
}

void describe(std::ostringstream& oss, const TypeRegistryError& err) {
    oss << "[TypeRegistryError] " << err.message;
    append_detail(oss, "type", err.type_name);
}

void describe(std::ostringstream& oss, const StoreError& err) {
    oss << "[StoreError] " << err.message;
    append_detail(oss, "entity", err.entity);
    append_detail(oss, "component", err.component_type);
}

void describe(std::ostringstream& oss, const DispatchError& err) {
    oss << "[DispatchError] " << err.message;
    append_detail(oss, "system", err.system);
    append_detail(oss, "event", err.event_type);
}

} // anonymous namespace

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    oss << "[" << error_code_name(error.code()) << "] ";
    std::visit([&oss](const auto& err) { describe(oss, err); }, error.variant());
    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }
    return oss.str();
}

// =============================================================================
// Statistics
// =============================================================================

namespace debug {

namespace {

/// Indexed like Error::Variant
constexpr std::array<const char*, std::variant_size_v<Error::Variant>> k_domain_names{
    "Generic", "TypeRegistry", "Store", "Dispatch"};

struct ErrorStats {
    std::atomic<std::uint64_t> total{0};
    std::array<std::atomic<std::uint64_t>, k_error_code_count> by_code{};
    std::array<std::atomic<std::uint64_t>, k_domain_names.size()> by_domain{};
};

ErrorStats& stats() {
    static ErrorStats s;
    return s;
}

} // anonymous namespace

void record_error(const Error& error) {
    auto& s = stats();
    s.total.fetch_add(1, std::memory_order_relaxed);
    s.by_code[static_cast<std::size_t>(error.code())].fetch_add(1, std::memory_order_relaxed);
    s.by_domain[error.variant().index()].fetch_add(1, std::memory_order_relaxed);
}

std::uint64_t total_error_count() {
    return stats().total.load(std::memory_order_relaxed);
}

std::uint64_t error_count(ErrorCode code) {
    auto index = static_cast<std::size_t>(code);
    return index < k_error_code_count ? stats().by_code[index].load(std::memory_order_relaxed) : 0;
}

void reset_error_stats() {
    auto& s = stats();
    s.total.store(0, std::memory_order_relaxed);
    for (auto& counter : s.by_code) {
        counter.store(0, std::memory_order_relaxed);
    }
    for (auto& counter : s.by_domain) {
        counter.store(0, std::memory_order_relaxed);
    }
}

std::string error_stats_summary() {
    auto& s = stats();
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s.total.load() << "\n";
    for (std::size_t i = 0; i < k_domain_names.size(); ++i) {
        oss << "  " << k_domain_names[i] << ": " << s.by_domain[i].load() << "\n";
    }
    return oss.str();
}

} // namespace debug

} // namespace tessera_core
