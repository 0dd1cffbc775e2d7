// prism_ecs World tests

#include <catch2/catch_test_macros.hpp>
#include <prism/ecs/ecs.hpp>
#include <prism/core/log.hpp>

#include <filesystem>
#include <string>

using namespace prism_ecs;

namespace {

struct Position { float x, y, z; };
struct Velocity { float x, y, z; };
struct Health { int current, max; };

} // namespace

// =============================================================================
// Entity Lifecycle
// =============================================================================

TEST_CASE("World construction", "[ecs][world]") {
    SECTION("default") {
        World world;
        REQUIRE(world.entity_count() == 0);
        REQUIRE(world.change_tick() == Tick{1});
        REQUIRE(world.last_change_tick() == Tick{0});
    }

    SECTION("with capacity") {
        World world(1000);
        REQUIRE(world.entity_count() == 0);
    }

    SECTION("from config") {
        WorldConfig config;
        config.entity_capacity = 64;
        config.change_tick_check_threshold = 10;
        World world(config);
        REQUIRE(world.change_tick_check_threshold() == 10);
    }

    SECTION("config log level reaches the loggers") {
        auto previous = prism_core::get_global_log_level();

        WorldConfig config;
        config.log_level = spdlog::level::warn;
        World world(config);
        REQUIRE(prism_core::get_global_log_level() == spdlog::level::warn);
        REQUIRE(prism_core::ecs_logger()->level() == spdlog::level::warn);
        REQUIRE(prism_core::schedule_logger()->level() == spdlog::level::warn);

        prism_core::set_global_log_level(previous);
    }

    SECTION("config log directory adds file sinks") {
        auto dir = std::filesystem::temp_directory_path() / "prism_world_log_test";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);

        WorldConfig config;
        config.log_level = spdlog::level::debug;
        config.log_directory = dir.string();
        {
            World world(config);
            REQUIRE(prism_core::ecs_logger()->level() == spdlog::level::debug);
        }
        prism_core::flush_all_loggers();

        REQUIRE(std::filesystem::exists(dir / "prism_ecs.log"));
        REQUIRE(std::filesystem::file_size(dir / "prism_ecs.log") > 0);

        prism_core::configure_logging(prism_core::LogConfig{});
        std::filesystem::remove_all(dir);
    }
}

TEST_CASE("World spawn and despawn", "[ecs][world]") {
    World world;
    Entity e1 = world.spawn();
    Entity e2 = world.spawn();

    REQUIRE(world.entity_count() == 2);
    REQUIRE(world.is_alive(e1));
    REQUIRE(world.entity_location(e1)->archetype_id == world.archetypes().empty());

    REQUIRE(world.despawn(e1));
    REQUIRE_FALSE(world.is_alive(e1));
    REQUIRE_FALSE(world.despawn(e1));
    REQUIRE_FALSE(world.entity_location(e1).has_value());
    REQUIRE(world.entity_location(e2)->row == 0);
    REQUIRE(world.entity_count() == 1);
}

// =============================================================================
// Components
// =============================================================================

TEST_CASE("World add and get components", "[ecs][world]") {
    World world;
    Entity e = world.spawn();

    REQUIRE(world.add_component(e, Position{1.0f, 2.0f, 3.0f}));
    REQUIRE(world.add_component(e, Velocity{0.5f, 0.0f, 0.0f}));

    REQUIRE(world.has_component<Position>(e));
    REQUIRE(world.has_component<Velocity>(e));
    REQUIRE_FALSE(world.has_component<Health>(e));

    const Position* pos = world.get_component<Position>(e);
    REQUIRE(pos != nullptr);
    REQUIRE(pos->y == 2.0f);

    SECTION("replace keeps the entity in its archetype") {
        auto before = world.entity_location(e)->archetype_id;
        REQUIRE(world.add_component(e, Position{9.0f, 9.0f, 9.0f}));
        REQUIRE(world.entity_location(e)->archetype_id == before);
        REQUIRE(world.get_component<Position>(e)->x == 9.0f);
    }

    SECTION("dead entities are rejected") {
        world.despawn(e);
        REQUIRE_FALSE(world.add_component(e, Health{1, 1}));
        REQUIRE(world.get_component<Position>(e) == nullptr);
    }
}

TEST_CASE("World remove_component", "[ecs][world]") {
    World world;
    Entity e = world.spawn();
    world.add_component(e, Position{1.0f, 0.0f, 0.0f});
    world.add_component(e, std::string("tag"));

    auto removed = world.remove_component<std::string>(e);
    REQUIRE(removed.has_value());
    REQUIRE(*removed == "tag");
    REQUIRE_FALSE(world.has_component<std::string>(e));
    REQUIRE(world.get_component<Position>(e)->x == 1.0f);

    REQUIRE_FALSE(world.remove_component<std::string>(e).has_value());
    REQUIRE_FALSE(world.remove_component<Health>(e).has_value());
}

TEST_CASE("World keeps locations consistent across moves", "[ecs][world]") {
    World world;
    Entity a = world.spawn();
    Entity b = world.spawn();
    Entity c = world.spawn();

    for (Entity e : {a, b, c}) {
        world.add_component(e, Health{static_cast<int>(e.index), 10});
    }

    world.add_component(a, Position{});
    world.despawn(b);

    REQUIRE(world.get_component<Health>(a)->current == 0);
    REQUIRE(world.get_component<Health>(c)->current == 2);
    REQUIRE(world.has_component<Position>(a));
    REQUIRE_FALSE(world.has_component<Position>(c));
}

TEST_CASE("EntityBuilder", "[ecs][world]") {
    World world;
    Entity e = build_entity(world)
        .with(Position{1.0f, 0.0f, 0.0f})
        .with(Health{5, 5})
        .build();

    REQUIRE(world.is_alive(e));
    REQUIRE(world.get_component<Health>(e)->max == 5);
}

// =============================================================================
// Change Tick
// =============================================================================

TEST_CASE("World change tick", "[ecs][world][change]") {
    World world;

    SECTION("increment returns the previous tick") {
        REQUIRE(world.increment_change_tick() == Tick{1});
        REQUIRE(world.change_tick() == Tick{2});
    }

    SECTION("clear_trackers starts a new window") {
        world.clear_trackers();
        REQUIRE(world.last_change_tick() == Tick{1});
        REQUIRE(world.change_tick() == Tick{2});
    }

    SECTION("inserted components carry the current tick") {
        Entity e = world.spawn();
        world.clear_trackers();
        world.add_component(e, Health{1, 1});
        auto ticks = world.component_ticks<Health>(e);
        REQUIRE(ticks.has_value());
        REQUIRE(ticks->added == Tick{2});
        REQUIRE(ticks->changed == Tick{2});
    }
}

TEST_CASE("World clear", "[ecs][world]") {
    World world;
    Entity e = world.spawn();
    world.add_component(e, Position{});
    auto archetype_count = world.archetypes().size();

    world.clear();

    REQUIRE(world.entity_count() == 0);
    REQUIRE_FALSE(world.is_alive(e));
    REQUIRE(world.archetypes().size() == archetype_count);
    REQUIRE(world.component_id<Position>().has_value());
}
