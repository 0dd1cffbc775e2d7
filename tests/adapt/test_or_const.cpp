// prism_adapt OrConst tests

#include <catch2/catch_test_macros.hpp>
#include <prism/adapt/adapt.hpp>
#include <prism/ecs/ecs.hpp>

#include <cstddef>
#include <cstdint>
#include <type_traits>

using namespace prism_adapt;
using namespace prism_ecs;

namespace {

struct Marker {};

struct Speed {
    std::int32_t value;
    const std::int32_t& operator*() const { return value; }
};

struct Visible {
    bool value;
    const bool& operator*() const { return value; }
};

struct Glyph {
    char32_t value;
    const char32_t& operator*() const { return value; }
};

struct Layer {
    std::uint8_t value;
    const std::uint8_t& operator*() const { return value; }
};

struct Offset {
    std::int64_t value;
    const std::int64_t& operator*() const { return value; }
};

struct Slot {
    std::size_t value;
    const std::size_t& operator*() const { return value; }
};

template<typename Q, typename S, S V>
concept CanOrConst = requires { typename OrConstQ<Q, S, V>; };

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
// Descriptor Properties
// =============================================================================

TEST_CASE("OrConst item types", "[adapt][or_const]") {
    STATIC_REQUIRE(std::is_same_v<OrI32<AsDeref<Speed>, 5>::Item, std::int32_t>);
    STATIC_REQUIRE(std::is_same_v<AsDerefOrBool<Visible, true>::Item, bool>);
    STATIC_REQUIRE(std::is_same_v<OrConst<AsDeref<Speed>, std::int32_t{3}>::Item, std::int32_t>);
    STATIC_REQUIRE(ReadOnlyQueryData<AsDerefOrI32<Speed, 5>>);

    STATIC_REQUIRE(CanOrConst<AsDeref<Speed>, std::int32_t, 1>);
    STATIC_REQUIRE(CanOrConst<Copied<AsDeref<Speed>>, std::int32_t, 1>);
    STATIC_REQUIRE_FALSE(CanOrConst<AsDeref<Speed>, std::int64_t, 1>);
    STATIC_REQUIRE_FALSE(CanOrConst<Read<Speed>, std::int32_t, 1>);
}

TEST_CASE("OrConst declares the wrapped Maybe access", "[adapt][or_const]") {
    World world;
    REQUIRE(query_access<AsDerefOrI32<Speed, 5>>(world) == query_access<Maybe<Read<Speed>>>(world));
}

// =============================================================================
// Substitution
// =============================================================================

TEST_CASE("OrConst substitutes the constant", "[adapt][or_const]") {
    World world;
    Entity full = world.spawn();
    world.add_component(full, Marker{});
    world.add_component(full, Speed{12});
    world.add_component(full, Visible{false});
    world.add_component(full, Glyph{U'q'});
    world.add_component(full, Layer{3});
    world.add_component(full, Offset{-40});
    world.add_component(full, Slot{9});

    Entity bare = world.spawn();
    world.add_component(bare, Marker{});

    SECTION("i32") {
        REQUIRE(item_of<OrI32<AsDeref<Speed>, 5>>(world, full) == 12);
        REQUIRE(item_of<OrI32<AsDeref<Speed>, 5>>(world, bare) == 5);
        REQUIRE(item_of<AsDerefOrI32<Speed, -1>>(world, bare) == -1);
    }

    SECTION("bool") {
        REQUIRE_FALSE(item_of<AsDerefOrBool<Visible, true>>(world, full));
        REQUIRE(item_of<AsDerefOrBool<Visible, true>>(world, bare));
    }

    SECTION("char") {
        REQUIRE(item_of<AsDerefOrChar<Glyph, U'x'>>(world, full) == U'q');
        REQUIRE(item_of<AsDerefOrChar<Glyph, U'x'>>(world, bare) == U'x');
    }

    SECTION("u8") {
        REQUIRE(item_of<AsDerefOrU8<Layer, 255>>(world, full) == 3);
        REQUIRE(item_of<AsDerefOrU8<Layer, 255>>(world, bare) == 255);
    }

    SECTION("i64") {
        REQUIRE(item_of<AsDerefOrI64<Offset, -7>>(world, full) == -40);
        REQUIRE(item_of<AsDerefOrI64<Offset, -7>>(world, bare) == -7);
    }

    SECTION("usize") {
        REQUIRE(item_of<AsDerefOrUsize<Slot, 100>>(world, full) == 9);
        REQUIRE(item_of<AsDerefOrUsize<Slot, 100>>(world, bare) == 100);
    }

    SECTION("generic form") {
        REQUIRE(item_of<OrConst<AsDeref<Speed>, std::int32_t{42}>>(world, bare) == 42);
    }

    SECTION("owned inner item") {
        REQUIRE(item_of<OrI32<Copied<AsDeref<Speed>>, 0>>(world, full) == 12);
        REQUIRE(item_of<OrI32<Copied<AsDeref<Speed>>, 0>>(world, bare) == 0);
    }

    SECTION("iteration visits every entity") {
        auto state = world.query<AsDerefOrI32<Speed, 5>, Filters<With<Marker>>>();
        REQUIRE(state.is_ok());

        std::int32_t sum = 0;
        for (std::int32_t speed : state->iter(world)) {
            sum += speed;
        }
        REQUIRE(sum == 17);
    }
}

#ifdef __SIZEOF_INT128__
namespace {

struct Wide {
    __int128 value;
    const __int128& operator*() const { return value; }
};

} // namespace

TEST_CASE("OrConst 128-bit", "[adapt][or_const]") {
    World world;
    Entity e = world.spawn();
    world.add_component(e, Marker{});

    constexpr __int128 big = static_cast<__int128>(1) << 100;
    REQUIRE((item_of<AsDerefOrI128<Wide, big>>(world, e) == big));

    world.add_component(e, Wide{-big});
    REQUIRE((item_of<AsDerefOrI128<Wide, big>>(world, e) == -big));
}
#endif
