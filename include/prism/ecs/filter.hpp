#pragma once

/// @file filter.hpp
/// @brief Query filters for prism_ecs
///
/// Filters run through the same fetch cycle as query data but produce a
/// bool per row instead of an item. Archetypal filters (With, Without) are
/// decided entirely by matches_component_set; the query skips their
/// per-row check. Added and Changed look at the row's ticks.

#include "fetch.hpp"

#include <optional>
#include <tuple>
#include <utility>

namespace prism_ecs {

// =============================================================================
// Concept
// =============================================================================

/// A WorldQuery that accepts or rejects rows
template<typename F>
concept QueryFilter = WorldQuery<F> && requires {
    { F::IS_ARCHETYPAL } -> std::convertible_to<bool>;
} && requires(typename F::Fetch& fetch, Entity entity, std::size_t row) {
    { F::filter_fetch(fetch, entity, row) } -> std::convertible_to<bool>;
};

// =============================================================================
// With<T> / Without<T>
// =============================================================================

/// Only archetypes that contain T
template<typename T>
struct With {
    using State = ComponentId;
    struct Fetch {};
    static constexpr bool IS_ARCHETYPAL = true;

    static State init_state(World& world) { return world.register_component<T>(); }

    static std::optional<State> get_state(const ComponentRegistry& registry) {
        return registry.get_id<T>();
    }

    static Fetch init_fetch(WorldCell, const State&, Tick, Tick) { return {}; }
    static void set_archetype(Fetch&, const State&, const Archetype&, Table&) {}
    static void set_table(Fetch&, const State&, Table&) {}
    static bool filter_fetch(Fetch&, Entity, std::size_t) { return true; }

    static void update_component_access(const State& state, FilteredAccess& access) {
        access.and_with(state);
    }

    static bool matches_component_set(const State& state, const ComponentSetContains& contains) {
        return contains(state);
    }
};

/// Only archetypes that lack T
template<typename T>
struct Without {
    using State = ComponentId;
    struct Fetch {};
    static constexpr bool IS_ARCHETYPAL = true;

    static State init_state(World& world) { return world.register_component<T>(); }

    /// An unregistered T is absent everywhere, so the filter still has a state
    static std::optional<State> get_state(const ComponentRegistry& registry) {
        return registry.get_id<T>().value_or(ComponentId::invalid());
    }

    static Fetch init_fetch(WorldCell, const State&, Tick, Tick) { return {}; }
    static void set_archetype(Fetch&, const State&, const Archetype&, Table&) {}
    static void set_table(Fetch&, const State&, Table&) {}
    static bool filter_fetch(Fetch&, Entity, std::size_t) { return true; }

    static void update_component_access(const State& state, FilteredAccess& access) {
        if (state.is_valid()) {
            access.and_without(state);
        }
    }

    static bool matches_component_set(const State& state, const ComponentSetContains& contains) {
        return !state.is_valid() || !contains(state);
    }
};

// =============================================================================
// Added<T> / Changed<T>
// =============================================================================

namespace detail {

/// Shared fetch cycle of the tick filters; Derived picks the tick to test
template<typename T, typename Derived>
struct TickFilter {
    using State = ComponentId;
    struct Fetch {
        const Column* column{nullptr};
        Tick last_run;
        Tick this_run;
    };
    static constexpr bool IS_ARCHETYPAL = false;

    static State init_state(World& world) { return world.register_component<T>(); }

    static std::optional<State> get_state(const ComponentRegistry& registry) {
        return registry.get_id<T>();
    }

    static Fetch init_fetch(WorldCell, const State&, Tick last_run, Tick this_run) {
        return Fetch{nullptr, last_run, this_run};
    }

    static void set_archetype(Fetch& fetch, const State& state, const Archetype&, Table& table) {
        set_table(fetch, state, table);
    }

    static void set_table(Fetch& fetch, const State& state, Table& table) {
        fetch.column = table.get_column(state);
    }

    static bool filter_fetch(Fetch& fetch, Entity, std::size_t row) {
        return Derived::test(fetch.column->ticks(row), fetch.last_run, fetch.this_run);
    }

    static void update_component_access(const State& state, FilteredAccess& access) {
        access.add_read(state);
    }

    static bool matches_component_set(const State& state, const ComponentSetContains& contains) {
        return contains(state);
    }
};

} // namespace detail

/// Rows whose T was inserted inside the change window
template<typename T>
struct Added : detail::TickFilter<T, Added<T>> {
    static bool test(const ComponentTicks& ticks, Tick last_run, Tick this_run) noexcept {
        return ticks.is_added(last_run, this_run);
    }
};

/// Rows whose T was inserted or mutably accessed inside the change window
template<typename T>
struct Changed : detail::TickFilter<T, Changed<T>> {
    static bool test(const ComponentTicks& ticks, Tick last_run, Tick this_run) noexcept {
        return ticks.is_changed(last_run, this_run);
    }
};

// =============================================================================
// Filters<Fs...>
// =============================================================================

/// Conjunction of filters; Filters<> accepts every row
template<typename... Fs>
struct Filters {
    static_assert((QueryFilter<Fs> && ...), "Filters<Fs...> requires query filters");

    using State = std::tuple<typename Fs::State...>;
    using Fetch = std::tuple<typename Fs::Fetch...>;
    static constexpr bool IS_ARCHETYPAL = (Fs::IS_ARCHETYPAL && ...);

    static State init_state(World& world) {
        return State{Fs::init_state(world)...};
    }

    static std::optional<State> get_state(const ComponentRegistry& registry) {
        std::tuple<std::optional<typename Fs::State>...> parts{Fs::get_state(registry)...};
        bool complete = std::apply([](const auto&... p) { return (p.has_value() && ...); }, parts);
        if (!complete) {
            return std::nullopt;
        }
        return std::apply([](auto&... p) { return State{std::move(*p)...}; }, parts);
    }

    static Fetch init_fetch(WorldCell world, const State& state, Tick last_run, Tick this_run) {
        return init_fetch_impl(world, state, last_run, this_run, std::index_sequence_for<Fs...>{});
    }

    static void set_archetype(Fetch& fetch, const State& state, const Archetype& archetype, Table& table) {
        set_archetype_impl(fetch, state, archetype, table, std::index_sequence_for<Fs...>{});
    }

    static void set_table(Fetch& fetch, const State& state, Table& table) {
        set_table_impl(fetch, state, table, std::index_sequence_for<Fs...>{});
    }

    static bool filter_fetch(Fetch& fetch, Entity entity, std::size_t row) {
        return filter_impl(fetch, entity, row, std::index_sequence_for<Fs...>{});
    }

    static void update_component_access(const State& state, FilteredAccess& access) {
        access_impl(state, access, std::index_sequence_for<Fs...>{});
    }

    static bool matches_component_set(const State& state, const ComponentSetContains& contains) {
        return matches_impl(state, contains, std::index_sequence_for<Fs...>{});
    }

private:
    template<std::size_t... Is>
    static Fetch init_fetch_impl(WorldCell world, const State& state, Tick last_run, Tick this_run,
                                 std::index_sequence<Is...>) {
        return Fetch{Fs::init_fetch(world, std::get<Is>(state), last_run, this_run)...};
    }

    template<std::size_t... Is>
    static void set_archetype_impl(Fetch& fetch, const State& state, const Archetype& archetype,
                                   Table& table, std::index_sequence<Is...>) {
        (Fs::set_archetype(std::get<Is>(fetch), std::get<Is>(state), archetype, table), ...);
    }

    template<std::size_t... Is>
    static void set_table_impl(Fetch& fetch, const State& state, Table& table, std::index_sequence<Is...>) {
        (Fs::set_table(std::get<Is>(fetch), std::get<Is>(state), table), ...);
    }

    template<std::size_t... Is>
    static bool filter_impl(Fetch& fetch, Entity entity, std::size_t row, std::index_sequence<Is...>) {
        return (Fs::filter_fetch(std::get<Is>(fetch), entity, row) && ...);
    }

    template<std::size_t... Is>
    static void access_impl(const State& state, FilteredAccess& access, std::index_sequence<Is...>) {
        (Fs::update_component_access(std::get<Is>(state), access), ...);
    }

    template<std::size_t... Is>
    static bool matches_impl(const State& state, const ComponentSetContains& contains,
                             std::index_sequence<Is...>) {
        return (Fs::matches_component_set(std::get<Is>(state), contains) && ...);
    }
};

} // namespace prism_ecs
