// tessera_core Id tests

#include <catch2/catch_test_macros.hpp>
#include <tessera/core/id.hpp>
#include <sstream>
#include <unordered_set>

using namespace tessera_core;

TEST_CASE("Id construction", "[core][id]") {
    SECTION("default is null") {
        Id id;
        REQUIRE(id.is_null());
        REQUIRE_FALSE(static_cast<bool>(id));
        REQUIRE(id == Id::null());
    }

    SECTION("serials order by value") {
        REQUIRE(Id(1) < Id(2));
        REQUIRE(Id(3).is_valid());
    }
}

TEST_CASE("IdGenerator", "[core][id]") {
    IdGenerator gen;
    REQUIRE(gen.issued() == 0);

    Id a = gen.next();
    Id b = gen.next();
    REQUIRE(a == Id(1));
    REQUIRE(b == Id(2));
    REQUIRE(gen.issued() == 2);

    SECTION("system ids are unique and never null") {
        std::unordered_set<Id> seen;
        for (int i = 0; i < 100; ++i) {
            Id id = next_system_id();
            REQUIRE(id.is_valid());
            REQUIRE(seen.insert(id).second);
        }
    }
}

TEST_CASE("Id formatting", "[core][id]") {
    std::ostringstream oss;
    oss << Id(7) << " " << Id::null();
    REQUIRE(oss.str() == "#7 #null");
    REQUIRE(debug::format_id(Id(12)) == "#12");
}
