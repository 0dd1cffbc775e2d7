// prism_ecs change detection tests

#include <catch2/catch_test_macros.hpp>
#include <prism/ecs/ecs.hpp>

#include <type_traits>

using namespace prism_ecs;

namespace {

struct Transform {
    float x;
    float scale;
};

} // namespace

// =============================================================================
// Tick
// =============================================================================

TEST_CASE("Tick window", "[ecs][change][tick]") {
    SECTION("inside (last_run, this_run]") {
        REQUIRE(Tick{5}.is_newer_than(Tick{4}, Tick{6}));
        REQUIRE(Tick{6}.is_newer_than(Tick{4}, Tick{6}));
    }

    SECTION("at or before last_run") {
        REQUIRE_FALSE(Tick{4}.is_newer_than(Tick{4}, Tick{6}));
        REQUIRE_FALSE(Tick{1}.is_newer_than(Tick{4}, Tick{6}));
    }

    SECTION("wrapping counter") {
        Tick last_run{UINT32_MAX - 1};
        Tick this_run{3};
        REQUIRE(Tick{1}.is_newer_than(last_run, this_run));
        REQUIRE_FALSE(Tick{UINT32_MAX - 2}.is_newer_than(last_run, this_run));
    }
}

TEST_CASE("Tick clamping", "[ecs][change][tick]") {
    Tick old{0};
    Tick now{Tick::MAX_CHANGE_AGE + 10};

    REQUIRE(old.check_tick(now));
    REQUIRE(now.relative_to(old).get() == Tick::MAX_CHANGE_AGE);
    REQUIRE_FALSE(old.check_tick(now));

    Tick recent{Tick::MAX_CHANGE_AGE};
    REQUIRE_FALSE(recent.check_tick(now));
}

// =============================================================================
// Mut<T>
// =============================================================================

TEST_CASE("Mut is move-only", "[ecs][change][mut]") {
    STATIC_REQUIRE_FALSE(std::is_copy_constructible_v<Mut<Transform>>);
    STATIC_REQUIRE_FALSE(std::is_copy_assignable_v<Mut<Transform>>);
    STATIC_REQUIRE(std::is_nothrow_move_constructible_v<Mut<Transform>>);
}

TEST_CASE("Mut tracks writes", "[ecs][change][mut]") {
    Transform value{1.0f, 1.0f};
    ComponentTicks ticks(Tick{1});

    SECTION("read access leaves ticks alone") {
        const Mut<Transform> handle(&value, &ticks, Tick{1}, Tick{5});
        REQUIRE(handle->x == 1.0f);
        REQUIRE((*handle).scale == 1.0f);
        REQUIRE(ticks.changed == Tick{1});
        REQUIRE_FALSE(handle.is_changed());
    }

    SECTION("mutable access marks changed at this_run") {
        Mut<Transform> handle(&value, &ticks, Tick{1}, Tick{5});
        handle->x = 2.0f;
        REQUIRE(value.x == 2.0f);
        REQUIRE(ticks.changed == Tick{5});
        REQUIRE(ticks.added == Tick{1});
        REQUIRE(handle.is_changed());
        REQUIRE_FALSE(handle.is_added());
        REQUIRE(handle.last_changed() == Tick{5});
    }

    SECTION("set") {
        Mut<Transform> handle(&value, &ticks, Tick{0}, Tick{3});
        handle.set(Transform{7.0f, 2.0f});
        REQUIRE(value.scale == 2.0f);
        REQUIRE(ticks.changed == Tick{3});
    }

    SECTION("bypass_change_detection") {
        Mut<Transform> handle(&value, &ticks, Tick{1}, Tick{5});
        handle.bypass_change_detection().x = 9.0f;
        REQUIRE(value.x == 9.0f);
        REQUIRE(ticks.changed == Tick{1});
    }
}

TEST_CASE("Mut map_unchanged", "[ecs][change][mut]") {
    Transform value{1.0f, 1.0f};
    ComponentTicks ticks(Tick{1});

    Mut<Transform> handle(&value, &ticks, Tick{1}, Tick{4});
    Mut<float> scale = std::move(handle).map_unchanged([](Transform& t) -> float& { return t.scale; });

    SECTION("projecting does not mark changed") {
        REQUIRE(scale.get() == 1.0f);
        REQUIRE(ticks.changed == Tick{1});
        REQUIRE(scale.last_run() == Tick{1});
        REQUIRE(scale.this_run() == Tick{4});
    }

    SECTION("writing through the projection marks the component") {
        *scale = 3.0f;
        REQUIRE(value.scale == 3.0f);
        REQUIRE(ticks.changed == Tick{4});
    }
}

TEST_CASE("Mut holds the borrow until destroyed", "[ecs][change][mut]") {
    Transform value{1.0f, 1.0f};
    ComponentTicks ticks(Tick{1});
    REQUIRE_FALSE(ticks.borrowed);

    {
        Mut<Transform> handle(&value, &ticks, Tick{1}, Tick{4});
        REQUIRE(ticks.borrowed);
        REQUIRE_THROWS_AS(ensure_not_borrowed(ticks), BorrowError);

        Mut<Transform> moved = std::move(handle);
        REQUIRE(ticks.borrowed);

        Mut<float> scale = std::move(moved).map_unchanged([](Transform& t) -> float& { return t.scale; });
        REQUIRE(ticks.borrowed);
    }

    REQUIRE_FALSE(ticks.borrowed);
    REQUIRE_NOTHROW(ensure_not_borrowed(ticks));
}

TEST_CASE("World get_mut refuses a second live handle", "[ecs][change]") {
    World world;
    Entity e = world.spawn();
    world.add_component(e, Transform{0.0f, 1.0f});

    {
        auto handle = world.get_mut<Transform>(e);
        REQUIRE(handle.has_value());
        REQUIRE_THROWS_AS((void)world.get_mut<Transform>(e), BorrowError);
        REQUIRE(world.get_component<Transform>(e)->scale == 1.0f);
    }

    REQUIRE(world.get_mut<Transform>(e).has_value());
}

// =============================================================================
// World-level Tracking
// =============================================================================

TEST_CASE("World get_mut uses the tracker window", "[ecs][change]") {
    World world;
    Entity e = world.spawn();
    world.add_component(e, Transform{0.0f, 1.0f});

    {
        auto handle = world.get_mut<Transform>(e);
        REQUIRE(handle.has_value());
        REQUIRE(handle->is_added());
    }

    world.clear_trackers();

    auto handle = world.get_mut<Transform>(e);
    REQUIRE(handle.has_value());
    REQUIRE_FALSE(handle->is_added());
    REQUIRE_FALSE(handle->is_changed());

    handle->get_mut().x = 1.0f;
    REQUIRE(handle->is_changed());
    REQUIRE(world.component_ticks<Transform>(e)->changed == world.change_tick());
}

TEST_CASE("World check_change_ticks", "[ecs][change]") {
    WorldConfig config;
    config.change_tick_check_threshold = 4;
    World world(config);

    Entity e = world.spawn();
    world.add_component(e, Transform{});

    SECTION("below the threshold nothing runs") {
        world.increment_change_tick();
        REQUIRE_FALSE(world.maybe_check_change_ticks());
    }

    SECTION("at the threshold a pass runs") {
        for (int i = 0; i < 4; ++i) {
            world.increment_change_tick();
        }
        REQUIRE(world.maybe_check_change_ticks());
        REQUIRE_FALSE(world.maybe_check_change_ticks());
    }

    SECTION("explicit pass keeps recent ticks") {
        world.check_change_ticks();
        REQUIRE(world.component_ticks<Transform>(e)->added == Tick{1});
    }
}
