// tessera_event Dispatcher tests

#include <catch2/catch_test_macros.hpp>
#include <tessera/event/event.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace tessera_event;
using tessera_core::DispatchError;
using tessera_core::ErrorCode;
using tessera_core::TypeRegistry;

namespace {

// Events
struct Moved {
    virtual ~Moved() = default;
    int dx = 0;
};
struct PlayerMoved : Moved { };
struct EnemyMoved : Moved { };

struct Collision {
    std::string tag;
};

struct Contact {
    std::vector<std::string> tags;
};

struct Tick { };

/// Context recording which handlers ran
struct Recorder : DispatchContext {
    std::vector<std::string> calls;
};

template<typename T>
std::type_index tid() { return std::type_index(typeid(T)); }

Callback record(const std::string& label, bool stop = false) {
    return [label, stop](DispatchContext& ctx, const Event&) {
        static_cast<Recorder&>(ctx).calls.push_back(label);
        return stop;
    };
}

EventKey str(const char* s) { return EventKey(std::string(s)); }

struct Fixture {
    TypeRegistry types;
    EventKeyRegistry keys{types};
    Dispatcher dispatcher{keys};
    Recorder ctx;

    Fixture() {
        REQUIRE(types.register_type<Moved>("Moved"));
        REQUIRE(types.register_type<PlayerMoved, Moved>("PlayerMoved"));
        REQUIRE(types.register_type<EnemyMoved, Moved>("EnemyMoved"));
        REQUIRE(keys.set<Collision>([](const Collision& c) -> KeyResult { return EventKey(c.tag); }));
        REQUIRE(keys.set<Contact>([](const Contact& c) -> KeyResult {
            std::vector<EventKey> result;
            for (const auto& tag : c.tags) {
                result.emplace_back(tag);
            }
            return result;
        }));
        dispatcher.set_context(&ctx);
    }

    std::shared_ptr<System> system(const std::string& name) {
        return std::make_shared<System>(name, keys);
    }

    template<typename E>
    std::vector<std::string> run(E event) {
        ctx.calls.clear();
        auto result = dispatcher.dispatch(tessera_core::Object::of(std::move(event)));
        REQUIRE(result.is_ok());
        return ctx.calls;
    }
};

using Calls = std::vector<std::string>;

} // anonymous namespace

// =============================================================================
// Ordering
// =============================================================================

TEST_CASE("Dispatch follows priority order", "[event][dispatcher]") {
    Fixture f;

    auto low = f.system("low");
    REQUIRE(low->bind("h2", tid<Tick>(), 5, record("h2")));
    auto high = f.system("high");
    REQUIRE(high->bind("h1", tid<Tick>(), 10, record("h1")));

    REQUIRE(f.dispatcher.register_system(low));
    REQUIRE(f.dispatcher.register_system(high));

    REQUIRE(f.run(Tick{}) == Calls{"h1", "h2"});
}

TEST_CASE("Equal priorities keep registration and declaration order", "[event][dispatcher]") {
    Fixture f;

    auto first = f.system("first");
    REQUIRE(first->bind("a", tid<Tick>(), 1, record("first.a")));
    REQUIRE(first->bind("b", tid<Tick>(), 1, record("first.b")));
    auto second = f.system("second");
    REQUIRE(second->bind("a", tid<Tick>(), 1, record("second.a")));

    REQUIRE(f.dispatcher.register_system(first));
    REQUIRE(f.dispatcher.register_system(second));

    REQUIRE(f.run(Tick{}) == Calls{"first.a", "first.b", "second.a"});

    // A later registration lands after existing equal-priority handlers
    auto third = f.system("third");
    REQUIRE(third->bind("a", tid<Tick>(), 1, record("third.a")));
    REQUIRE(f.dispatcher.register_system(third));
    REQUIRE(f.run(Tick{}) == Calls{"first.a", "first.b", "second.a", "third.a"});
}

TEST_CASE("A stopping handler short-circuits dispatch", "[event][dispatcher]") {
    Fixture f;

    auto sys = f.system("sys");
    REQUIRE(sys->bind("stop", tid<Tick>(), 10, record("stop", true)));
    REQUIRE(sys->bind("never", tid<Tick>(), 1, record("never")));
    REQUIRE(f.dispatcher.register_system(sys));

    f.ctx.calls.clear();
    auto handled = f.dispatcher.dispatch(tessera_core::Object::of(Tick{}));
    REQUIRE(handled.is_ok());
    REQUIRE(handled.value());
    REQUIRE(f.ctx.calls == Calls{"stop"});
}

TEST_CASE("Unhandled events are a defined success", "[event][dispatcher]") {
    Fixture f;
    auto result = f.dispatcher.dispatch(tessera_core::Object::of(Tick{}));
    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.value());
    REQUIRE(f.dispatcher.is_bound<Tick>());
    REQUIRE(f.dispatcher.handlers_for<Tick>().empty());
}

// =============================================================================
// Event Type Hierarchy
// =============================================================================

TEST_CASE("Handlers bound to a base type receive subtypes", "[event][dispatcher]") {
    Fixture f;

    auto sys = f.system("movement");
    REQUIRE(sys->on<Moved>("track", 1, [](DispatchContext& ctx, const Moved& moved) {
        static_cast<Recorder&>(ctx).calls.push_back("moved " + std::to_string(moved.dx));
        return false;
    }));
    REQUIRE(f.dispatcher.register_system(sys));

    REQUIRE_FALSE(f.dispatcher.is_bound<PlayerMoved>());

    PlayerMoved event;
    event.dx = 4;
    REQUIRE(f.run(event) == Calls{"moved 4"});
    REQUIRE(f.dispatcher.is_bound<PlayerMoved>());

    SECTION("direct subtype bindings order by priority only") {
        auto player = f.system("player");
        REQUIRE(player->bind("direct", tid<PlayerMoved>(), 0, record("direct")));
        REQUIRE(f.dispatcher.register_system(player));

        REQUIRE(f.run(event) == Calls{"moved 4", "direct"});
        REQUIRE(f.run(Moved{}) == Calls{"moved 0"});
    }

    SECTION("systems registered later reach cached subtypes") {
        auto late = f.system("late");
        REQUIRE(late->bind("first", tid<Moved>(), 9, record("late")));
        REQUIRE(f.dispatcher.register_system(late));

        REQUIRE(f.run(event) == Calls{"late", "moved 4"});
    }
}

TEST_CASE("The nearest binding of a handler wins", "[event][dispatcher]") {
    Fixture f;

    auto sys = f.system("sys");
    REQUIRE(sys->bind("h", tid<Moved>(), 1, record("h.base")));
    REQUIRE(sys->bind("h", tid<PlayerMoved>(), 9, record("h.player")));
    REQUIRE(sys->bind("other", tid<Moved>(), 5, record("other")));
    REQUIRE(f.dispatcher.register_system(sys));

    REQUIRE(f.run(PlayerMoved{}) == Calls{"h.player", "other"});
    REQUIRE(f.run(Moved{}) == Calls{"other", "h.base"});
}

// =============================================================================
// Keys
// =============================================================================

TEST_CASE("Keyed bindings narrow dispatch", "[event][dispatcher][keys]") {
    Fixture f;

    auto sys = f.system("collisions");
    REQUIRE(sys->bind("player", tid<Collision>(), 5, record("player"), BindOptions::with_key(str("player"))));
    REQUIRE(sys->bind("any", tid<Collision>(), 1, record("any")));
    REQUIRE(f.dispatcher.register_system(sys));

    REQUIRE(f.run(Collision{"player"}) == Calls{"player", "any"});
    REQUIRE(f.run(Collision{"enemy"}) == Calls{"any"});

    auto keys = f.dispatcher.bound_keys(tid<Collision>());
    REQUIRE(keys == std::vector<EventKey>{str("player")});
    REQUIRE(f.dispatcher.handlers_for(tid<Collision>(), str("player")).size() == 2);
    REQUIRE(f.dispatcher.handlers_for(tid<Collision>()).size() == 1);
}

TEST_CASE("Multiple keys merge sub-lists in priority order", "[event][dispatcher][keys]") {
    Fixture f;

    auto sys = f.system("contacts");
    REQUIRE(sys->bind("a", tid<Contact>(), 1, record("a"), BindOptions::with_key(str("a"))));
    REQUIRE(sys->bind("b", tid<Contact>(), 3, record("b"), BindOptions::with_key(str("b"))));
    REQUIRE(sys->bind("ab", tid<Contact>(), 4, record("ab"), BindOptions::with_keys({str("a"), str("b")})));
    REQUIRE(sys->bind("any", tid<Contact>(), 2, record("any")));
    REQUIRE(f.dispatcher.register_system(sys));

    SECTION("union is re-sorted and deduplicated") {
        REQUIRE(f.run(Contact{{"a", "b"}}) == Calls{"ab", "b", "any", "a"});
    }

    SECTION("single present key") {
        REQUIRE(f.run(Contact{{"a", "zzz"}}) == Calls{"ab", "any", "a"});
        REQUIRE(f.run(Contact{{"a", "a"}}) == Calls{"ab", "any", "a"});
    }

    SECTION("no recognised key falls back to unkeyed handlers") {
        REQUIRE(f.run(Contact{{"zzz"}}) == Calls{"any"});
        REQUIRE(f.run(Contact{}) == Calls{"any"});
    }
}

TEST_CASE("Key functions added later invalidate cached types", "[event][dispatcher][keys]") {
    TypeRegistry types;
    EventKeyRegistry keys(types);
    Dispatcher dispatcher(keys);
    Recorder ctx;

    auto plain = std::make_shared<System>("plain", keys);
    REQUIRE(plain->bind("all", tid<Tick>(), 1, record("all")));
    REQUIRE(dispatcher.register_system(plain));

    REQUIRE(dispatcher.dispatch(tessera_core::Object::of(Tick{}), &ctx).is_ok());
    REQUIRE(dispatcher.bound_type_count() == 1);

    REQUIRE(keys.set<Tick>([](const Tick&) -> KeyResult { return EventKey(std::string("even")); }));
    REQUIRE(dispatcher.bound_type_count() == 0);

    auto keyed = std::make_shared<System>("keyed", keys);
    REQUIRE(keyed->bind("even", tid<Tick>(), 5, record("even"), BindOptions::with_key(str("even"))));
    REQUIRE(dispatcher.register_system(keyed));

    ctx.calls.clear();
    REQUIRE(dispatcher.dispatch(tessera_core::Object::of(Tick{}), &ctx).is_ok());
    REQUIRE(ctx.calls == Calls{"even", "all"});
}

// =============================================================================
// Registration
// =============================================================================

TEST_CASE("System registration errors", "[event][dispatcher]") {
    Fixture f;
    auto sys = f.system("sys");
    REQUIRE(f.dispatcher.register_system(sys));

    auto again = f.dispatcher.register_system(sys);
    REQUIRE(again.is_err());
    REQUIRE(again.error().as<DispatchError>()->kind == DispatchError::Kind::SystemAlreadyRegistered);

    auto stranger = f.system("stranger");
    auto missing = f.dispatcher.unregister_system(*stranger);
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code() == ErrorCode::NotFound);

    REQUIRE(f.dispatcher.update(sys));
    REQUIRE(f.dispatcher.size() == 1);
    REQUIRE_FALSE(f.dispatcher.discard(*stranger));
    REQUIRE(f.dispatcher.discard(*sys));
    REQUIRE(f.dispatcher.size() == 0);
    REQUIRE(f.dispatcher.register_system(nullptr).is_err());
}

TEST_CASE("Registered systems reject new bindings", "[event][dispatcher]") {
    Fixture f;
    auto sys = f.system("s");
    REQUIRE(sys->bind("a", tid<Moved>(), 1, record("a")));
    REQUIRE_FALSE(sys->registered());
    REQUIRE(f.dispatcher.register_system(sys));
    REQUIRE(sys->registered());

    // Builds the PlayerMoved entry before the late bind
    REQUIRE(f.run(PlayerMoved{}) == Calls{"a"});

    auto late = sys->bind("b", tid<Moved>(), 2, record("b"));
    REQUIRE(late.is_err());
    REQUIRE(late.error().as<DispatchError>()->kind == DispatchError::Kind::SystemLocked);
    REQUIRE(late.error().code() == ErrorCode::InvalidState);
    REQUIRE(sys->binding_count() == 1);

    // Cached and uncached subtypes agree
    REQUIRE(f.run(PlayerMoved{}) == Calls{"a"});
    REQUIRE(f.run(EnemyMoved{}) == Calls{"a"});

    SECTION("unregistering unlocks the system") {
        REQUIRE(f.dispatcher.unregister_system(*sys));
        REQUIRE_FALSE(sys->registered());
        REQUIRE(sys->bind("b", tid<Moved>(), 2, record("b")));
        REQUIRE(f.dispatcher.register_system(sys));
        REQUIRE(f.run(PlayerMoved{}) == Calls{"b", "a"});
        REQUIRE(f.run(EnemyMoved{}) == Calls{"b", "a"});
    }

    SECTION("the lock holds until every dispatcher releases it") {
        Dispatcher other{f.keys};
        REQUIRE(other.register_system(sys));
        REQUIRE(f.dispatcher.unregister_system(*sys));
        REQUIRE(sys->registered());
        REQUIRE(sys->bind("b", tid<Moved>(), 2, record("b")).is_err());
        other.clear();
        REQUIRE_FALSE(sys->registered());
        REQUIRE(sys->bind("b", tid<Moved>(), 2, record("b")));
    }

    SECTION("destroying the dispatcher unlocks the system") {
        auto scoped = std::make_unique<Dispatcher>(f.keys);
        auto spare = f.system("spare");
        REQUIRE(scoped->register_system(spare));
        REQUIRE(spare->registered());
        scoped.reset();
        REQUIRE_FALSE(spare->registered());
        REQUIRE(spare->bind("c", tid<Tick>(), 0, record("c")));
    }
}

TEST_CASE("Unregistering removes handlers everywhere", "[event][dispatcher]") {
    Fixture f;

    auto keep = f.system("keep");
    REQUIRE(keep->bind("keep", tid<Moved>(), 1, record("keep")));
    auto drop = f.system("drop");
    REQUIRE(drop->bind("drop", tid<Moved>(), 2, record("drop")));
    REQUIRE(drop->bind("hit", tid<Collision>(), 2, record("hit"), BindOptions::with_key(str("x"))));

    REQUIRE(f.dispatcher.register_system(keep));
    REQUIRE(f.dispatcher.register_system(drop));
    REQUIRE(f.run(PlayerMoved{}) == Calls{"drop", "keep"});
    REQUIRE(f.run(Collision{"x"}) == Calls{"hit"});

    REQUIRE(f.dispatcher.unregister_system(*drop));

    REQUIRE(f.run(PlayerMoved{}) == Calls{"keep"});
    REQUIRE(f.run(Moved{}) == Calls{"keep"});
    REQUIRE_FALSE(f.dispatcher.is_bound<Collision>());
    REQUIRE(f.run(Collision{"x"}).empty());
    REQUIRE(f.dispatcher.systems() == std::vector<std::shared_ptr<System>>{keep});
}

TEST_CASE("Dispatch without a context is rejected", "[event][dispatcher]") {
    TypeRegistry types;
    EventKeyRegistry keys(types);
    Dispatcher dispatcher(keys);

    auto sys = std::make_shared<System>("sys", keys);
    REQUIRE(sys->bind("h", tid<Tick>(), 0, record("h")));
    REQUIRE(dispatcher.register_system(sys));

    auto result = dispatcher.dispatch(tessera_core::Object::of(Tick{}));
    REQUIRE(result.is_err());
    REQUIRE(result.error().as<DispatchError>()->kind == DispatchError::Kind::NoContext);

    Recorder ctx;
    dispatcher.set_context(&ctx);
    REQUIRE(dispatcher.dispatch(tessera_core::Object::of(Tick{})).is_ok());
    REQUIRE(ctx.calls == Calls{"h"});

    REQUIRE(dispatcher.dispatch(tessera_core::Object()).is_err());
}

TEST_CASE("dispatch_to limits handlers to the given systems", "[event][dispatcher]") {
    Fixture f;
    auto a = f.system("a");
    REQUIRE(a->bind("h", tid<Tick>(), 2, record("a")));
    auto b = f.system("b");
    REQUIRE(b->bind("h", tid<Tick>(), 1, record("b")));
    REQUIRE(f.dispatcher.register_system(a));
    REQUIRE(f.dispatcher.register_system(b));

    f.ctx.calls.clear();
    auto result = f.dispatcher.dispatch_to(tessera_core::Object::of(Tick{}), {b->id()});
    REQUIRE(result.is_ok());
    REQUIRE(f.ctx.calls == Calls{"b"});
}

TEST_CASE("Lifecycle hooks run with the attached context", "[event][dispatcher]") {
    Fixture f;
    auto sys = f.system("hooked");
    sys->on_added([](DispatchContext& ctx) { static_cast<Recorder&>(ctx).calls.push_back("added"); });
    sys->on_removed([](DispatchContext& ctx) { static_cast<Recorder&>(ctx).calls.push_back("removed"); });

    f.ctx.calls.clear();
    REQUIRE(f.dispatcher.register_system(sys));
    REQUIRE(f.dispatcher.unregister_system(*sys));
    REQUIRE(f.ctx.calls == Calls{"added", "removed"});
}

// =============================================================================
// Reentrancy
// =============================================================================

TEST_CASE("Handlers may change registrations during dispatch", "[event][dispatcher]") {
    Fixture f;

    auto late = f.system("late");
    REQUIRE(late->bind("late", tid<Tick>(), 100, record("late")));

    auto self = f.system("self");
    auto* dispatcher = &f.dispatcher;
    REQUIRE(self->bind("register", tid<Tick>(), 10,
        [dispatcher, late](DispatchContext& ctx, const Event&) {
            static_cast<Recorder&>(ctx).calls.push_back("register");
            if (!dispatcher->contains(*late)) {
                REQUIRE(dispatcher->register_system(late));
            }
            return false;
        }));
    REQUIRE(self->bind("after", tid<Tick>(), 1, record("after")));
    REQUIRE(f.dispatcher.register_system(self));

    // The handler list in progress is a snapshot
    REQUIRE(f.run(Tick{}) == Calls{"register", "after"});
    REQUIRE(f.run(Tick{}) == Calls{"late", "register", "after"});

    SECTION("a handler can unregister its own system") {
        auto quitter = f.system("quitter");
        std::weak_ptr<System> weak = quitter;
        REQUIRE(quitter->bind("quit", tid<Moved>(), 5,
            [dispatcher, weak](DispatchContext& ctx, const Event&) {
                static_cast<Recorder&>(ctx).calls.push_back("quit");
                if (auto owner = weak.lock()) {
                    REQUIRE(dispatcher->unregister_system(*owner));
                }
                return false;
            }));
        REQUIRE(quitter->bind("tail", tid<Moved>(), 1, record("tail")));
        REQUIRE(f.dispatcher.register_system(quitter));
        quitter.reset();

        REQUIRE(f.run(Moved{}) == Calls{"quit", "tail"});
        REQUIRE(f.run(Moved{}).empty());
    }
}

// =============================================================================
// Notifications
// =============================================================================

TEST_CASE("Registration posts notifications", "[event][dispatcher][notifications]") {
    Fixture f;
    EventQueue queue;
    f.dispatcher.set_event_queue(&queue);

    auto sys = f.system("notify");
    REQUIRE(sys->bind("a", tid<Tick>(), 3, record("a")));
    REQUIRE(sys->bind("b", tid<Collision>(), 1, record("b"), BindOptions::with_key(str("k"))));

    REQUIRE(f.dispatcher.register_system(sys));
    REQUIRE(queue.size() == 3);
    REQUIRE(queue[0].is<SystemAdded>());
    REQUIRE(queue[0].get<SystemAdded>()->system == sys);
    REQUIRE(queue[1].is<HandlerAdded>());
    REQUIRE(queue[1].get<HandlerAdded>()->name() == "a");
    REQUIRE(queue[1].get<HandlerAdded>()->priority() == 3);
    REQUIRE(queue[2].get<HandlerAdded>()->event_type == tid<Collision>());
    REQUIRE(queue[2].get<HandlerAdded>()->keys == std::vector<EventKey>{str("k")});

    queue.clear();
    REQUIRE(f.dispatcher.unregister_system(*sys));
    REQUIRE(queue.size() == 3);
    REQUIRE(queue[0].is<HandlerRemoved>());
    REQUIRE(queue[1].is<HandlerRemoved>());
    REQUIRE(queue[2].is<SystemRemoved>());
}

TEST_CASE("Notifications can be dispatched by event type key", "[event][dispatcher][notifications]") {
    TypeRegistry types;
    REQUIRE(types.register_type<HandlerChange>("HandlerChange"));
    REQUIRE(types.register_type<HandlerAdded, HandlerChange>("HandlerAdded"));
    REQUIRE(types.register_type<HandlerRemoved, HandlerChange>("HandlerRemoved"));
    EventKeyRegistry keys(types);
    REQUIRE(register_dispatch_key_functions(keys));

    Dispatcher dispatcher(keys);
    Recorder ctx;
    dispatcher.set_context(&ctx);
    EventQueue queue;
    dispatcher.set_event_queue(&queue);

    auto watcher = std::make_shared<System>("watcher", keys);
    REQUIRE(watcher->on<HandlerAdded>("tick_handlers", 0,
        [](DispatchContext& c, const HandlerAdded& added) {
            static_cast<Recorder&>(c).calls.push_back("added " + added.name());
            return false;
        },
        BindOptions::with_key(type_key<Tick>())));
    REQUIRE(dispatcher.register_system(watcher));

    auto sys = std::make_shared<System>("sys", keys);
    REQUIRE(sys->bind("on_tick", tid<Tick>(), 0, record("tick")));
    REQUIRE(sys->bind("on_moved", tid<Moved>(), 0, record("moved")));
    REQUIRE(dispatcher.register_system(sys));

    // Drain the queue; posting never dispatches by itself
    REQUIRE(ctx.calls.empty());
    while (!queue.empty()) {
        auto event = queue.front();
        queue.pop_front();
        REQUIRE(dispatcher.dispatch(event).is_ok());
    }
    REQUIRE(ctx.calls == Calls{"added on_tick"});
}
