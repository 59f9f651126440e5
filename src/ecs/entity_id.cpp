/// @file entity_id.cpp
/// @brief Random entity identifier generation

#include <tessera/ecs/entity_id.hpp>

#include <cstdio>
#include <random>

namespace tessera_ecs {

namespace {

std::mt19937_64& id_engine() {
    thread_local std::mt19937_64 engine = [] {
        std::random_device device;
        std::seed_seq seed{device(), device(), device(), device(),
                           device(), device(), device(), device()};
        return std::mt19937_64(seed);
    }();
    return engine;
}

} // anonymous namespace

EntityId EntityId::generate() {
    auto& engine = id_engine();
    std::uint64_t high = engine();
    std::uint64_t low = engine();

    // Version 4 (random) and RFC 4122 variant bits
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return EntityId(high, low);
}

std::string EntityId::to_string() const {
    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
        static_cast<unsigned>(hi >> 32),
        static_cast<unsigned>((hi >> 16) & 0xFFFF),
        static_cast<unsigned>(hi & 0xFFFF),
        static_cast<unsigned>(lo >> 48),
        static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buffer);
}

} // namespace tessera_ecs
