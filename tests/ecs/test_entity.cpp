// prism_ecs Entity tests

#include <catch2/catch_test_macros.hpp>
#include <prism/ecs/entity.hpp>
#include <unordered_set>

using namespace prism_ecs;

// =============================================================================
// Entity Tests
// =============================================================================

TEST_CASE("Entity null and valid handles", "[ecs][entity]") {
    Entity null_entity;
    REQUIRE(null_entity.is_null());
    REQUIRE_FALSE(static_cast<bool>(null_entity));
    REQUIRE(Entity::null() == null_entity);

    Entity e(5, 3);
    REQUIRE(e.index == 5);
    REQUIRE(e.generation == 3);
    REQUIRE(e.is_valid());
}

TEST_CASE("Entity bit encoding", "[ecs][entity]") {
    Entity original(1234, 5678);
    std::uint64_t bits = original.to_bits();

    REQUIRE((bits >> 32) == 5678);
    REQUIRE((bits & 0xFFFFFFFF) == 1234);
    REQUIRE(Entity::from_bits(bits) == original);
}

TEST_CASE("Entity ordering and hashing", "[ecs][entity]") {
    Entity a(1, 1);
    Entity c(2, 1);
    Entity d(1, 2);

    REQUIRE(a != c);
    REQUIRE(a < c);
    REQUIRE(a < d);

    std::unordered_set<Entity> set{a};
    REQUIRE(set.count(Entity(1, 1)) == 1);
    REQUIRE(set.count(c) == 0);
}

TEST_CASE("Entity to_string", "[ecs][entity]") {
    REQUIRE(Entity(42, 7).to_string() == "Entity(42v7)");
    REQUIRE(Entity::null().to_string() == "Entity(null)");
}

// =============================================================================
// EntityAllocator Tests
// =============================================================================

TEST_CASE("EntityAllocator allocate and deallocate", "[ecs][entity]") {
    EntityAllocator alloc;
    REQUIRE(alloc.empty());

    Entity e1 = alloc.allocate();
    Entity e2 = alloc.allocate();
    REQUIRE(e1.index == 0);
    REQUIRE(e2.index == 1);
    REQUIRE(alloc.alive_count() == 2);
    REQUIRE(alloc.capacity() == 2);

    REQUIRE(alloc.deallocate(e1));
    REQUIRE_FALSE(alloc.is_alive(e1));
    REQUIRE_FALSE(alloc.deallocate(e1));
    REQUIRE(alloc.alive_count() == 1);
}

TEST_CASE("EntityAllocator recycles slots with a new generation", "[ecs][entity]") {
    EntityAllocator alloc;

    Entity first = alloc.allocate();
    alloc.deallocate(first);
    REQUIRE(alloc.current_generation(first.index) == first.generation + 1);
    REQUIRE_FALSE(alloc.is_alive(Entity(first.index, first.generation + 1)));

    Entity reused = alloc.allocate();
    REQUIRE(reused.index == first.index);
    REQUIRE(reused.generation == first.generation + 1);
    REQUIRE_FALSE(alloc.is_alive(first));
    REQUIRE(alloc.is_alive(reused));
}

TEST_CASE("EntityAllocator is_alive edge cases", "[ecs][entity]") {
    EntityAllocator alloc;
    Entity e = alloc.allocate();

    REQUIRE_FALSE(alloc.is_alive(Entity::null()));
    REQUIRE_FALSE(alloc.is_alive(Entity(1000, 0)));
    REQUIRE_FALSE(alloc.is_alive(Entity(e.index, e.generation + 1)));
    REQUIRE_FALSE(alloc.current_generation(1000).has_value());

    alloc.clear();
    REQUIRE(alloc.empty());
    REQUIRE(alloc.capacity() == 0);
    REQUIRE_FALSE(alloc.is_alive(e));
}

// =============================================================================
// ArchetypeId / EntityLocation
// =============================================================================

TEST_CASE("ArchetypeId and EntityLocation validity", "[ecs][entity]") {
    REQUIRE_FALSE(ArchetypeId::invalid().is_valid());
    REQUIRE(ArchetypeId{0}.is_valid());
    REQUIRE(ArchetypeId{3} == ArchetypeId{3});

    REQUIRE_FALSE(EntityLocation::invalid().is_valid());
    EntityLocation loc{ArchetypeId{1}, 4};
    REQUIRE(loc.is_valid());
    REQUIRE(loc.row == 4);
}
