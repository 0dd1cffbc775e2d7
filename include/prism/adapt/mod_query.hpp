#pragma once

/// @file mod_query.hpp
/// @brief Adapter descriptors that transform another descriptor's items
///
/// A modifier names the descriptor it reads from and the transformation to
/// apply to each item:
///
/// @code
/// struct HalfHealth {
///     using FromQuery = prism_ecs::Read<Health>;
///     using Item = float;
///     static Item modify(const Health& h) { return h.value * 0.5f; }
///     static Item shrink(Item item) noexcept { return item; }
/// };
///
/// auto state = world.query<prism_adapt::Mod<HalfHealth>>();
/// @endcode
///
/// Mod<M> and ModMut<M> are query descriptors in their own right. Every step
/// of the fetch cycle is forwarded to M::FromQuery unchanged, with the same
/// State and Fetch types, so the access they declare and the archetypes they
/// match are exactly those of the wrapped descriptor. Only fetch differs: it
/// returns M::modify of the wrapped item.
///
/// A mutable modifier (for ModMut) additionally names a ReadOnly descriptor
/// sharing FromQuery's State; read-only iteration goes through it.

#include "fwd.hpp"
#include <prism/ecs/fetch.hpp>

#include <concepts>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>

namespace prism_adapt {

using prism_ecs::Archetype;
using prism_ecs::ComponentRegistry;
using prism_ecs::ComponentSetContains;
using prism_ecs::Entity;
using prism_ecs::FilteredAccess;
using prism_ecs::Table;
using prism_ecs::Tick;
using prism_ecs::World;
using prism_ecs::WorldCell;

// =============================================================================
// Modifier Concepts
// =============================================================================

/// A transformation of FromQuery's items
template<typename M>
concept Modifier = requires {
    typename M::FromQuery;
    typename M::Item;
} && prism_ecs::QueryData<typename M::FromQuery>
  && requires(typename M::FromQuery::Item item) {
    { M::modify(std::forward<typename M::FromQuery::Item>(item)) } -> std::same_as<typename M::Item>;
    { M::shrink(std::declval<typename M::Item>()) } -> std::same_as<typename M::Item>;
};

/// A modifier over a read-only descriptor
template<typename M>
concept ReadOnlyModifier = Modifier<M> && prism_ecs::ReadOnlyQueryData<typename M::FromQuery>;

/// A modifier that also names the read-only descriptor to fall back to
template<typename M>
concept MutModifier = Modifier<M> && requires {
    typename M::ReadOnly;
} && prism_ecs::ReadOnlyQueryData<typename M::ReadOnly>;

namespace detail {

/// Fetch cycle shared by Mod and ModMut, forwarded verbatim to FromQuery
template<typename FromQuery>
struct Forwarding {
    using State = typename FromQuery::State;
    using Fetch = typename FromQuery::Fetch;

    static State init_state(World& world) {
        return FromQuery::init_state(world);
    }

    static std::optional<State> get_state(const ComponentRegistry& registry) {
        return FromQuery::get_state(registry);
    }

    static Fetch init_fetch(WorldCell world, const State& state, Tick last_run, Tick this_run) {
        return FromQuery::init_fetch(world, state, last_run, this_run);
    }

    static void set_archetype(Fetch& fetch, const State& state, const Archetype& archetype, Table& table) {
        FromQuery::set_archetype(fetch, state, archetype, table);
    }

    static void set_table(Fetch& fetch, const State& state, Table& table) {
        FromQuery::set_table(fetch, state, table);
    }

    static void update_component_access(const State& state, FilteredAccess& access) {
        FromQuery::update_component_access(state, access);
    }

    static bool matches_component_set(const State& state, const ComponentSetContains& contains) {
        return FromQuery::matches_component_set(state, contains);
    }
};

} // namespace detail

// =============================================================================
// Mod<M>
// =============================================================================

/// Read-only adapter: M::modify applied to every item of M::FromQuery
template<typename M>
struct Mod : detail::Forwarding<typename M::FromQuery> {
    static_assert(ReadOnlyModifier<M>,
        "Mod<M> requires a modifier whose FromQuery is read-only query data");

    using FromQuery = typename M::FromQuery;
    using State = typename FromQuery::State;
    using Fetch = typename FromQuery::Fetch;
    using Item = typename M::Item;
    using ReadOnly = Mod<M>;
    static constexpr bool IS_READ_ONLY = true;

    static Item fetch(Fetch& fetch, Entity entity, std::size_t row) {
        return M::modify(FromQuery::fetch(fetch, entity, row));
    }

    static Item shrink(Item item) {
        return M::shrink(std::forward<Item>(item));
    }
};

// =============================================================================
// ModMut<M>
// =============================================================================

/// Adapter whose item may grant exclusive access
///
/// Read-only iteration uses M::ReadOnly, which must read the same state.
/// An exclusive item must be derived from the wrapped exclusive item by
/// consuming it (Mut<T>::map_unchanged), so one fetch never yields two
/// live handles to the same value.
template<typename M>
struct ModMut : detail::Forwarding<typename M::FromQuery> {
    static_assert(MutModifier<M>,
        "ModMut<M> requires a modifier naming FromQuery, Item and a read-only ReadOnly");
    static_assert(std::is_same_v<typename M::ReadOnly::State, typename M::FromQuery::State>,
        "ModMut<M>: M::ReadOnly must share M::FromQuery's State");

    using FromQuery = typename M::FromQuery;
    using State = typename FromQuery::State;
    using Fetch = typename FromQuery::Fetch;
    using Item = typename M::Item;
    using ReadOnly = typename M::ReadOnly;
    static constexpr bool IS_READ_ONLY = FromQuery::IS_READ_ONLY;

    static Item fetch(Fetch& fetch, Entity entity, std::size_t row) {
        return M::modify(FromQuery::fetch(fetch, entity, row));
    }

    static Item shrink(Item item) {
        return M::shrink(std::forward<Item>(item));
    }
};

} // namespace prism_adapt
