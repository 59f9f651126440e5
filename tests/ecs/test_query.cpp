// tessera_ecs Query tests

#include <catch2/catch_test_macros.hpp>
#include <tessera/ecs/ecs.hpp>
#include <algorithm>
#include <string>
#include <vector>

using namespace tessera_ecs;
using tessera_core::ErrorCode;
using tessera_core::StoreError;
using tessera_core::TypeRegistry;
using tessera_core::TypeRegistryError;

namespace {

struct Position {
    float x = 0, y = 0;
    bool operator==(const Position&) const = default;
};

struct Velocity {
    float dx = 0, dy = 0;
    bool operator==(const Velocity&) const = default;
};

struct Health {
    int current = 100;
    bool operator==(const Health&) const = default;
};

struct Renderable {
    virtual ~Renderable() = default;
    int layer = 0;
    bool operator==(const Renderable&) const = default;
};

struct Sprite : Renderable {
    int frame = 0;
    bool operator==(const Sprite&) const = default;
};

enum class Faction { Red, Blue, Green };

struct Team {
    std::string name;
    bool operator==(const Team&) const = default;
};

} // anonymous namespace

template<>
struct std::hash<Team> {
    std::size_t operator()(const Team& team) const { return std::hash<std::string>{}(team.name); }
};

namespace {

std::vector<EntityId> sorted(std::vector<EntityId> ids) {
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // anonymous namespace

// =============================================================================
// Merge Functions
// =============================================================================

TEST_CASE("Merge functions", "[ecs][query]") {
    EntityId a(1, 1), b(1, 2), c(1, 3), d(1, 4);
    IdSet first{a, b, c};
    IdSet second{b, c, d};
    IdSet third{c};

    std::vector<IdSetRef> two{std::cref(first), std::cref(second)};
    std::vector<IdSetRef> three{std::cref(first), std::cref(second), std::cref(third)};

    REQUIRE(merge::intersection(two) == IdSet{b, c});
    REQUIRE(merge::intersection(three) == IdSet{c});
    REQUIRE(merge::union_of(two) == IdSet{a, b, c, d});
    REQUIRE(merge::symmetric_difference(two) == IdSet{a, d});
    REQUIRE(merge::symmetric_difference(three) == IdSet{a, c, d});
    REQUIRE(merge::difference(two) == IdSet{a});
    REQUIRE(merge::intersection({}).empty());
}

// =============================================================================
// Store Queries
// =============================================================================

TEST_CASE("Query scenario", "[ecs][query]") {
    TypeRegistry types;
    EntityStore store(types);

    auto e1 = store.create(Position{}, Velocity{});
    auto e2 = store.create(Position{});

    auto positioned = store.query<Position>();
    REQUIRE(positioned.is_ok());
    REQUIRE(sorted(positioned->ids()) == sorted({e1->id(), e2->id()}));

    auto moving = store.query<Position, Velocity>();
    REQUIRE(moving->ids() == std::vector<EntityId>{e1->id()});

    REQUIRE(store.remove(*e1));
    auto after = store.query<Position>();
    REQUIRE(after->ids() == std::vector<EntityId>{e2->id()});
}

TEST_CASE("Query merges", "[ecs][query]") {
    TypeRegistry types;
    EntityStore store(types);

    auto both = store.create(Position{}, Velocity{});
    auto only_position = store.create(Position{});
    auto only_velocity = store.create(Velocity{});
    store.create(Health{});

    SECTION("intersection by default") {
        auto result = store.query<Position, Velocity>();
        REQUIRE(result->size() == 1);
        REQUIRE(result->contains(both->id()));
    }

    SECTION("union") {
        auto result = store.query<Position, Velocity>(merge::union_of);
        REQUIRE(result->size() == 3);
        REQUIRE_FALSE(result->contains(EntityId(0, 1)));
    }

    SECTION("exactly one of") {
        auto result = store.query<Position, Velocity>(merge::symmetric_difference);
        REQUIRE(sorted(result->ids()) == sorted({only_position->id(), only_velocity->id()}));
    }

    SECTION("first but none of the rest") {
        auto result = store.query<Position, Velocity>(merge::difference);
        REQUIRE(result->ids() == std::vector<EntityId>{only_position->id()});
    }

    SECTION("custom reducer") {
        MergeFn nobody = [](const std::vector<IdSetRef>&) { return IdSet{}; };
        auto result = store.query<Position>(nobody);
        REQUIRE(result->empty());
    }

    SECTION("unseen type yields an empty set") {
        auto result = store.query<Position, Sprite>();
        REQUIRE(result.is_ok());
        REQUIRE(result->empty());
    }

    SECTION("no types is rejected") {
        auto result = store.query(std::vector<std::type_index>{});
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<StoreError>()->kind == StoreError::Kind::EmptyQuery);
    }
}

TEST_CASE("Query by supertype", "[ecs][query]") {
    TypeRegistry types;
    REQUIRE(types.register_type<Renderable>("Renderable"));
    REQUIRE(types.register_type<Sprite, Renderable>("Sprite"));
    EntityStore store(types);

    Sprite sprite;
    sprite.layer = 3;
    auto drawn = store.create(sprite, Position{1, 2});
    store.create(Position{});

    auto result = store.query<Renderable>();
    REQUIRE(result->size() == 1);
    REQUIRE(result->get(drawn->id()) == drawn);

    auto layers = result->components<Renderable>();
    REQUIRE(layers.size() == 1);
    REQUIRE(layers.front()->layer == 3);
}

TEST_CASE("Query results", "[ecs][query]") {
    TypeRegistry types;
    EntityStore store(types);

    auto mover = store.create(Position{1, 1}, Velocity{2, 0});
    auto idle = store.create(Position{5, 5});

    auto result = store.query<Position>().unwrap();

    SECTION("self-describing") {
        REQUIRE(result.types() == std::vector<std::type_index>{std::type_index(typeid(Position))});
        REQUIRE(static_cast<bool>(result.merge()));

        auto again = store.query(result.query());
        REQUIRE(again->size() == result.size());
    }

    SECTION("snapshot is not live") {
        REQUIRE(store.remove(*idle));
        store.create(Position{});
        REQUIRE(result.size() == 2);
        REQUIRE(result.contains(idle->id()));
        REQUIRE(result.get(EntityId(7, 7)) == nullptr);
    }

    SECTION("zip skips entities missing a type") {
        auto rows = result.zip<Position, Velocity>();
        REQUIRE(rows.size() == 1);
        auto [position, velocity] = rows.front();
        REQUIRE(position->x == 1);
        REQUIRE(velocity->dx == 2);

        auto with_entity = result.zip_entity<Position>();
        REQUIRE(with_entity.size() == 2);
        for (const auto& [entity, position_ptr] : with_entity) {
            REQUIRE(entity->get<Position>() == position_ptr);
        }
    }

    SECTION("iteration") {
        std::size_t count = 0;
        for (const auto& entity : result) {
            REQUIRE((entity == mover || entity == idle));
            ++count;
        }
        REQUIRE(count == 2);
    }
}

// =============================================================================
// Tags
// =============================================================================

TEST_CASE("Tag registration", "[ecs][query][tags]") {
    TypeRegistry types;
    REQUIRE(types.register_tag<Faction>("Faction"));
    REQUIRE(types.is_tag<Faction>());
    REQUIRE_FALSE(types.is_tag<Position>());

    auto again = types.register_tag<Faction>("Faction");
    REQUIRE(again.is_err());
    REQUIRE(again.error().as<TypeRegistryError>()->kind == TypeRegistryError::Kind::AlreadyRegistered);

    SECTION("equal values hash alike") {
        auto a = Component::of(Team{"north"});
        auto b = Component::of(Team{"north"});
        REQUIRE_FALSE(a.same(b));
        REQUIRE(a == b);
        REQUIRE(a.hash() == b.hash());
    }
}

TEST_CASE("Tag queries", "[ecs][query][tags]") {
    TypeRegistry types;
    REQUIRE(types.register_tag<Faction>("Faction"));
    REQUIRE(types.register_tag<Team>("Team"));
    EntityStore store(types);

    auto red_mover = store.create(Faction::Red, Position{}, Velocity{});
    auto red_idle = store.create(Faction::Red, Position{});
    auto blue = store.create(Faction::Blue, Position{}, Team{"north"});
    store.create(Position{});

    SECTION("a tag narrows a type query") {
        auto result = store.query({std::type_index(typeid(Position))}, TagOptions::with_tag(Component::of(Faction::Red)));
        REQUIRE(sorted(result->ids()) == sorted({red_mover->id(), red_idle->id()}));
        REQUIRE(result->tags().size() == 1);
        REQUIRE(result->tags().front() == Component::of(Faction::Red));
    }

    SECTION("tag sets come before type sets") {
        auto result = store.query({std::type_index(typeid(Velocity))},
            TagOptions::with_tag(Component::of(Faction::Red)), merge::difference);
        REQUIRE(result->ids() == std::vector<EntityId>{red_idle->id()});
    }

    SECTION("a tag list without types") {
        auto tags = TagOptions::with_tags({Component::of(Faction::Red), Component::of(Faction::Blue)});
        auto result = store.query({}, tags, merge::union_of);
        REQUIRE(result->size() == 3);
        REQUIRE(result->types().empty());
        REQUIRE(result->tags().size() == 2);

        auto again = store.query(result->query());
        REQUIRE(sorted(again->ids()) == sorted(result->ids()));
    }

    SECTION("tags match by value") {
        auto result = store.query({}, TagOptions::with_tag(Component::of(Team{"north"})));
        REQUIRE(result->ids() == std::vector<EntityId>{blue->id()});
        REQUIRE(store.tagged(Team{"south"}).empty());
        REQUIRE(store.tagged(Faction::Red).size() == 2);
    }

    SECTION("an unseen tag value yields an empty set") {
        auto result = store.query({std::type_index(typeid(Position))}, TagOptions::with_tag(Component::of(Faction::Green)));
        REQUIRE(result.is_ok());
        REQUIRE(result->empty());
    }

    SECTION("tag and tags together are rejected") {
        TagOptions both = TagOptions::with_tag(Component::of(Faction::Red));
        both.tags = std::vector<Component>{Component::of(Faction::Blue)};
        auto result = store.query({std::type_index(typeid(Position))}, both);
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<StoreError>()->kind == StoreError::Kind::ConflictingTagArguments);
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("no types and no tags is rejected") {
        auto result = store.query({}, TagOptions::with_tags({}));
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<StoreError>()->kind == StoreError::Kind::EmptyQuery);
    }

    SECTION("values of a non-tag type are rejected") {
        auto result = store.query({}, TagOptions::with_tag(Component::of(Health{})));
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<TypeRegistryError>()->kind == TypeRegistryError::Kind::NotRegistered);
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("Tag index follows component changes", "[ecs][query][tags]") {
    TypeRegistry types;
    REQUIRE(types.register_tag<Faction>("Faction"));
    EntityStore store(types);

    auto entity = store.create(Faction::Red, Position{});
    auto ally = store.create(Faction::Red);
    REQUIRE(store.tagged_ids(Component::of(Faction::Red)).size() == 2);

    SECTION("replacing the tag moves the entity") {
        entity->update(Component::of(Faction::Blue));
        REQUIRE(store.tagged_ids(Component::of(Faction::Red)) == std::vector<EntityId>{ally->id()});
        REQUIRE(store.tagged_ids(Component::of(Faction::Blue)) == std::vector<EntityId>{entity->id()});
    }

    SECTION("removing the last holder drops the tag value") {
        REQUIRE(entity->remove<Faction>());
        REQUIRE(store.remove(*ally));
        REQUIRE(store.indexed_tag(Component::of(Faction::Red)) == nullptr);
        REQUIRE(store.tag_values().empty());
        REQUIRE(store.indexed_ids(std::type_index(typeid(Position))) != nullptr);
    }

    SECTION("components added before registration are not tags") {
        TypeRegistry late_types;
        EntityStore late_store(late_types);
        auto early = late_store.create(Faction::Red);
        REQUIRE(late_types.register_tag<Faction>());
        REQUIRE(late_store.tagged(Faction::Red).empty());

        auto later = late_store.create(Faction::Red);
        REQUIRE(late_store.tagged(Faction::Red).size() == 1);
        REQUIRE(late_store.remove(*early));
        REQUIRE(late_store.tagged(Faction::Red).front() == later);
    }
}
