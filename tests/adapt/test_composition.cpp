// prism_adapt view composition tests

#include <catch2/catch_test_macros.hpp>
#include <prism/adapt/adapt.hpp>
#include <prism/ecs/ecs.hpp>

#include <string>
#include <type_traits>
#include <vector>

using namespace prism_adapt;
using namespace prism_ecs;

namespace {

struct Marker {};

/// Dereferences to an int; its own default is not the int default
struct Wrapped {
    int v = 20;
    const int& operator*() const { return v; }
};

/// Dereferences to an int; its own default dereferences to the int default
struct Counter {
    int v = 0;
    const int& operator*() const { return v; }
};

struct WrappedBool {
    bool value;
    const bool& operator*() const { return value; }
    bool& operator*() { return value; }
};

struct Tag {
    std::string name;
    const std::string& operator*() const { return name; }
};

/// Item of Q for the entity, which the query must match
template<typename Q>
auto item_of(World& world, Entity entity) {
    auto state = world.query<Q, Filters<With<Marker>>>();
    REQUIRE(state.is_ok());
    auto item = state->get(world, entity);
    REQUIRE(item.is_ok());
    return *item;
}

} // namespace

// =============================================================================
// Defaults Through Dereference
// =============================================================================

TEST_CASE("Dereferencing a defaulted clone uses the wrapper default", "[adapt][composition]") {
    World world;
    Entity absent = world.spawn();
    world.add_component(absent, Marker{});

    Entity present = world.spawn();
    world.add_component(present, Marker{});
    world.add_component(present, Wrapped{7});

    STATIC_REQUIRE(std::is_same_v<AsDerefCopiedOfClonedOrDefault<Wrapped>::Item, int>);
    STATIC_REQUIRE(std::is_same_v<AsDeref<ClonedOrDefault<Wrapped>>::Item, int>);

    REQUIRE(item_of<AsDerefCopiedOfClonedOrDefault<Wrapped>>(world, absent) == 20);
    REQUIRE(item_of<AsDeref<ClonedOrDefault<Wrapped>>>(world, absent) == 20);
    REQUIRE(item_of<AsDerefCopiedOfCopiedOrDefault<Wrapped>>(world, absent) == 20);

    REQUIRE(item_of<AsDerefCopiedOfClonedOrDefault<Wrapped>>(world, present) == 7);
    REQUIRE(item_of<AsDeref<ClonedOrDefault<Wrapped>>>(world, present) == 7);

    SECTION("defaulting after dereference uses the target default") {
        REQUIRE(item_of<AsDerefCopiedOrDefault<Wrapped>>(world, absent) == 0);
        REQUIRE(item_of<AsDerefCopiedOrDefault<Wrapped>>(world, present) == 7);
    }

    SECTION("cloned forms") {
        world.add_component(absent, Tag{});
        world.add_component(present, Tag{"boss"});
        REQUIRE(item_of<AsDerefClonedOfClonedOrDefault<Tag>>(world, present) == "boss");
        REQUIRE(item_of<AsDerefClonedOrDefault<Tag>>(world, absent).empty());
    }
}

// =============================================================================
// Mutable Then Read-only
// =============================================================================

TEST_CASE("Writes through AsDerefMut are visible to later reads", "[adapt][composition]") {
    World world;
    Entity e = world.spawn();
    world.add_component(e, Marker{});
    world.add_component(e, WrappedBool{false});

    auto writer = world.query<AsDerefMut<WrappedBool>>();
    auto reader = world.query<AsDeref<WrappedBool>>();
    REQUIRE(writer.is_ok());
    REQUIRE(reader.is_ok());

    SECTION("separate queries") {
        for (auto flag : writer->iter_mut(world)) {
            *flag = true;
        }
        auto seen = reader->get(world, e);
        REQUIRE(seen.is_ok());
        REQUIRE(seen->get());
    }

    SECTION("sequential handles from one query") {
        {
            auto first = writer->get_mut(world, e);
            REQUIRE(first.is_ok());
            first->set(true);
        }
        auto second = writer->get_mut(world, e);
        REQUIRE(second.is_ok());
        REQUIRE(second->get());
        *(*second) = false;
        REQUIRE_FALSE(reader->get(world, e)->get());
    }

    SECTION("inside one system") {
        SystemScheduler scheduler;
        bool observed = false;
        scheduler.add_system("toggle", [&](World& w) {
            for (auto flag : writer->iter_mut(w)) {
                *flag = !flag.get();
            }
            observed = reader->get(w, e)->get();
        });
        scheduler.run(world);
        REQUIRE(observed);
    }
}

// =============================================================================
// Nesting
// =============================================================================

TEST_CASE("Nested views compose", "[adapt][composition]") {
    World world;
    Entity e = world.spawn();
    world.add_component(e, Marker{});
    world.add_component(e, Wrapped{3});

    SECTION("grouping does not change the result") {
        int inner_first = item_of<Copied<AsDeref<Cloned<Wrapped>>>>(world, e);
        int outer_first = item_of<Copied<Cloned<AsDeref<Wrapped>>>>(world, e);
        REQUIRE(inner_first == 3);
        REQUIRE(outer_first == 3);
    }

    SECTION("nested views keep the base access") {
        auto base = query_access<Read<Wrapped>>(world);
        REQUIRE(query_access<Copied<AsDeref<Cloned<Wrapped>>>>(world) == base);
        REQUIRE(query_access<AsDerefCopied<Wrapped>>(world) == base);
        REQUIRE(query_access<OrI32<AsDeref<Wrapped>, 1>>(world)
                == query_access<Maybe<Read<Wrapped>>>(world));
    }

    SECTION("views inside a tuple") {
        auto state = world.query<All<EntityItem, AsDerefCopied<Wrapped>, CopiedOrDefault<Marker>>>();
        REQUIRE(state.is_ok());

        std::vector<int> values;
        for (auto [entity, value, marker] : state->iter(world)) {
            REQUIRE(entity == e);
            values.push_back(value);
        }
        REQUIRE(values == std::vector<int>{3});
    }
}

TEST_CASE("Grouping of default and dereference for an absent component", "[adapt][composition]") {
    World world;
    Entity absent = world.spawn();
    world.add_component(absent, Marker{});

    Entity present = world.spawn();
    world.add_component(present, Marker{});
    world.add_component(present, Counter{5});
    world.add_component(present, Wrapped{5});

    SECTION("wrapper default dereferences to the target default") {
        REQUIRE(*Counter{} == int{});
        REQUIRE(item_of<OrDefault<AsDeref<Cloned<Counter>>>>(world, absent) == 0);
        REQUIRE(item_of<AsDeref<OrDefault<Cloned<Counter>>>>(world, absent) == 0);

        REQUIRE(item_of<OrDefault<AsDeref<Cloned<Counter>>>>(world, present) == 5);
        REQUIRE(item_of<AsDeref<OrDefault<Cloned<Counter>>>>(world, present) == 5);
    }

    SECTION("wrapper default differs from the target default") {
        REQUIRE(item_of<OrDefault<AsDeref<Cloned<Wrapped>>>>(world, absent) == 0);
        REQUIRE(item_of<AsDeref<OrDefault<Cloned<Wrapped>>>>(world, absent) == 20);

        REQUIRE(item_of<OrDefault<AsDeref<Cloned<Wrapped>>>>(world, present) == 5);
        REQUIRE(item_of<AsDeref<OrDefault<Cloned<Wrapped>>>>(world, present) == 5);
    }
}

TEST_CASE("A row has one exclusive handle at a time", "[adapt][composition]") {
    World world;
    Entity e = world.spawn();
    world.add_component(e, Marker{});
    world.add_component(e, WrappedBool{false});

    auto writer = world.query<AsDerefMut<WrappedBool>>();
    auto reader = world.query<AsDeref<WrappedBool>>();
    REQUIRE(writer.is_ok());
    REQUIRE(reader.is_ok());

    SECTION("dereferencing one position twice") {
        auto it = writer->iter_mut(world);
        auto pos = it.begin();
        {
            auto first = *pos;
            REQUIRE_THROWS_AS(*pos, BorrowError);
            *first = true;
        }
        auto again = *pos;
        REQUIRE(again.get());
    }

    SECTION("get_mut while a handle is alive") {
        {
            auto first = writer->get_mut(world, e);
            REQUIRE(first.is_ok());

            auto second = writer->get_mut(world, e);
            REQUIRE(second.is_err());
            REQUIRE(second.error().code() == prism_core::ErrorCode::Conflict);
            REQUIRE(second.error().as<prism_core::QueryError>()->kind
                    == prism_core::QueryError::Kind::AlreadyBorrowed);
            REQUIRE_THROWS_AS((void)world.get_mut<WrappedBool>(e), BorrowError);

            REQUIRE_FALSE(reader->get(world, e)->get());
            first->set(true);
        }
        auto after = writer->get_mut(world, e);
        REQUIRE(after.is_ok());
        REQUIRE(after->get());
    }

    SECTION("a moved handle keeps the row") {
        auto first = writer->get_mut(world, e);
        REQUIRE(first.is_ok());
        Mut<bool> held = std::move(*first);
        REQUIRE(writer->get_mut(world, e).is_err());
    }

    STATIC_REQUIRE_FALSE(std::is_copy_constructible_v<AsDerefMut<WrappedBool>::Item>);
}

TEST_CASE("Defaults are stable across fetches", "[adapt][composition]") {
    World world;
    Entity e = world.spawn();
    world.add_component(e, Marker{});

    auto state = world.query<CopiedOrDefault<Wrapped>>();
    REQUIRE(state.is_ok());

    for (int i = 0; i < 3; ++i) {
        auto item = state->get(world, e);
        REQUIRE(item.is_ok());
        REQUIRE(item->v == 20);
    }

    world.add_component(e, Wrapped{4});
    REQUIRE(state->get(world, e)->v == 4);
}
