#pragma once

/// @file ecs.hpp
/// @brief Main include for prism_ecs module
///
/// This header includes all prism_ecs components:
/// - Entity: Generational entity handles
/// - Tick: Change detection and the Mut<T> handle
/// - Component: Type-erased column storage
/// - Archetype: Cache-efficient entity grouping
/// - Fetch/Filter: Query descriptors
/// - Query: Cached query state and iteration
/// - System: Scheduling by declared access
/// - World: Main ECS container
///
/// @example Basic usage:
/// @code
/// #include <prism/ecs/ecs.hpp>
///
/// using namespace prism_ecs;
///
/// struct Position { float x, y; };
/// struct Velocity { float x, y; };
///
/// int main() {
///     World world;
///
///     Entity e = build_entity(world)
///         .with(Position{0, 0})
///         .with(Velocity{1, 0})
///         .build();
///
///     auto movers = world.query<All<Write<Position>, Read<Velocity>>>();
///     for (auto [pos, vel] : movers->iter_mut(world)) {
///         pos->x += vel.x;
///         pos->y += vel.y;
///     }
/// }
/// @endcode

#include "fwd.hpp"
#include "entity.hpp"
#include "tick.hpp"
#include "component.hpp"
#include "archetype.hpp"
#include "access.hpp"
#include "config.hpp"
#include "world.hpp"
#include "fetch.hpp"
#include "filter.hpp"
#include "query.hpp"
#include "system.hpp"

namespace prism_ecs {

/// Version information
struct Version {
    static constexpr int MAJOR = 0;
    static constexpr int MINOR = 1;
    static constexpr int PATCH = 0;
};

} // namespace prism_ecs
