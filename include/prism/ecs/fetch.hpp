#pragma once

/// @file fetch.hpp
/// @brief Fetch protocol and native query descriptors for prism_ecs
///
/// A query descriptor is a tag type with static functions and nested types.
/// It is never instantiated; the query state drives it through this cycle:
///
///   init_state / get_state      once, when the query state is built
///   update_component_access     once, to declare reads and writes
///   matches_component_set       once per archetype, to cache matches
///   init_fetch                  once per execution, with the change window
///   set_archetype / set_table   once per matched archetype
///   fetch                       once per row
///
/// Descriptors nest: Maybe<Q> and All<Qs...> forward each step to their
/// parts. Every QueryData names a ReadOnly counterpart that shares its State
/// type, so a state built for the mutable form serves the read-only form.

#include "fwd.hpp"
#include "entity.hpp"
#include "tick.hpp"
#include "component.hpp"
#include "archetype.hpp"
#include "access.hpp"
#include "world.hpp"

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace prism_ecs {

// =============================================================================
// WorldCell
// =============================================================================

/// Non-owning world view handed to fetches for one query execution
///
/// A cell made from a const World only ever feeds read-only descriptors;
/// the query state picks D::ReadOnly for it. Descriptors reach storage
/// through the Table they are bound to, never through the cell.
class WorldCell {
private:
    World* world_;
    bool allows_mutation_;

    WorldCell(World* world, bool allows_mutation) noexcept
        : world_(world), allows_mutation_(allows_mutation) {}

public:
    [[nodiscard]] static WorldCell read_write(World& world) noexcept {
        return WorldCell(&world, true);
    }

    [[nodiscard]] static WorldCell read_only(const World& world) noexcept {
        return WorldCell(const_cast<World*>(&world), false);
    }

    [[nodiscard]] bool allows_mutation() const noexcept { return allows_mutation_; }

    [[nodiscard]] const World& world() const noexcept { return *world_; }

    /// Storage access for binding fetches to tables
    [[nodiscard]] Archetypes& archetypes() const noexcept { return world_->archetypes(); }

    [[nodiscard]] Tick change_tick() const noexcept { return world_->change_tick(); }

    [[nodiscard]] Tick last_change_tick() const noexcept { return world_->last_change_tick(); }
};

/// Predicate telling a descriptor whether a component is in the set
using ComponentSetContains = std::function<bool(ComponentId)>;

// =============================================================================
// Concepts
// =============================================================================

/// Anything the query state can drive through the fetch cycle
template<typename Q>
concept WorldQuery = requires {
    typename Q::State;
    typename Q::Fetch;
} && requires(World& world,
              const ComponentRegistry& registry,
              WorldCell cell,
              const typename Q::State& state,
              typename Q::Fetch& fetch,
              const Archetype& archetype,
              Table& table,
              FilteredAccess& access,
              const ComponentSetContains& contains,
              Tick tick) {
    { Q::init_state(world) } -> std::same_as<typename Q::State>;
    { Q::get_state(registry) } -> std::same_as<std::optional<typename Q::State>>;
    { Q::init_fetch(cell, state, tick, tick) } -> std::same_as<typename Q::Fetch>;
    Q::set_archetype(fetch, state, archetype, table);
    Q::set_table(fetch, state, table);
    Q::update_component_access(state, access);
    { Q::matches_component_set(state, contains) } -> std::convertible_to<bool>;
};

/// A WorldQuery that produces an item per row
template<typename Q>
concept QueryData = WorldQuery<Q> && requires {
    typename Q::Item;
    typename Q::ReadOnly;
    { Q::IS_READ_ONLY } -> std::convertible_to<bool>;
} && std::same_as<typename Q::ReadOnly::State, typename Q::State>
  && requires(typename Q::Fetch& fetch, Entity entity, std::size_t row) {
    { Q::fetch(fetch, entity, row) } -> std::same_as<typename Q::Item>;
    { Q::shrink(std::declval<typename Q::Item>()) } -> std::same_as<typename Q::Item>;
};

/// QueryData that never hands out mutable access
template<typename Q>
concept ReadOnlyQueryData = QueryData<Q> && Q::IS_READ_ONLY;

namespace detail {

/// Item of Maybe<Q>: a pointer for borrowed items, an optional otherwise
template<typename I>
struct MaybeItem {
    using type = std::optional<I>;
};

template<typename I>
struct MaybeItem<I&> {
    using type = I*;
};

} // namespace detail

template<typename I>
using maybe_item_t = typename detail::MaybeItem<I>::type;

// =============================================================================
// EntityItem
// =============================================================================

/// Yields the entity of each row; touches no components
struct EntityItem {
    struct State {};
    struct Fetch {};
    using Item = Entity;
    using ReadOnly = EntityItem;
    static constexpr bool IS_READ_ONLY = true;

    static State init_state(World&) { return {}; }
    static std::optional<State> get_state(const ComponentRegistry&) { return State{}; }
    static Fetch init_fetch(WorldCell, const State&, Tick, Tick) { return {}; }
    static void set_archetype(Fetch&, const State&, const Archetype&, Table&) {}
    static void set_table(Fetch&, const State&, Table&) {}
    static Item fetch(Fetch&, Entity entity, std::size_t) { return entity; }
    static void update_component_access(const State&, FilteredAccess&) {}
    static bool matches_component_set(const State&, const ComponentSetContains&) { return true; }
    static Item shrink(Item item) noexcept { return item; }
};

// =============================================================================
// Read<T>
// =============================================================================

/// Shared borrow of component T
template<typename T>
struct Read {
    using State = ComponentId;
    struct Fetch {
        const Column* column{nullptr};
    };
    using Item = const T&;
    using ReadOnly = Read<T>;
    static constexpr bool IS_READ_ONLY = true;

    static State init_state(World& world) { return world.register_component<T>(); }

    static std::optional<State> get_state(const ComponentRegistry& registry) {
        return registry.get_id<T>();
    }

    static Fetch init_fetch(WorldCell, const State&, Tick, Tick) { return Fetch{}; }

    static void set_archetype(Fetch& fetch, const State& state, const Archetype&, Table& table) {
        set_table(fetch, state, table);
    }

    static void set_table(Fetch& fetch, const State& state, Table& table) {
        fetch.column = table.get_column(state);
    }

    static Item fetch(Fetch& fetch, Entity, std::size_t row) {
        return fetch.column->template get<T>(row);
    }

    static void update_component_access(const State& state, FilteredAccess& access) {
        access.add_read(state);
    }

    static bool matches_component_set(const State& state, const ComponentSetContains& contains) {
        return contains(state);
    }

    static Item shrink(Item item) noexcept { return item; }
};

// =============================================================================
// Write<T>
// =============================================================================

/// Exclusive, change-tracked borrow of component T
template<typename T>
struct Write {
    using State = ComponentId;
    struct Fetch {
        Column* column{nullptr};
        Tick last_run;
        Tick this_run;
    };
    using Item = Mut<T>;
    using ReadOnly = Read<T>;
    static constexpr bool IS_READ_ONLY = false;

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

    /// @throws BorrowError if a Mut to this row is still alive
    static Item fetch(Fetch& fetch, Entity, std::size_t row) {
        ComponentTicks& ticks = fetch.column->ticks(row);
        ensure_not_borrowed(ticks);
        return Mut<T>(&fetch.column->template get<T>(row), &ticks, fetch.last_run, fetch.this_run);
    }

    static void update_component_access(const State& state, FilteredAccess& access) {
        access.add_write(state);
    }

    static bool matches_component_set(const State& state, const ComponentSetContains& contains) {
        return contains(state);
    }

    static Item shrink(Item item) noexcept { return item; }
};

// =============================================================================
// Maybe<Q>
// =============================================================================

/// Q's item if the entity has Q's components, nothing otherwise
///
/// Matches every archetype. Declares Q's reads and writes but not Q's
/// filters, since rows without Q's components are still visited.
template<typename Q>
struct Maybe {
    static_assert(QueryData<Q>, "Maybe<Q> requires Q to be a query descriptor");

    using State = typename Q::State;
    struct Fetch {
        typename Q::Fetch inner;
        bool matches{false};
    };
    using Item = maybe_item_t<typename Q::Item>;
    using ReadOnly = Maybe<typename Q::ReadOnly>;
    static constexpr bool IS_READ_ONLY = Q::IS_READ_ONLY;

    static State init_state(World& world) { return Q::init_state(world); }

    static std::optional<State> get_state(const ComponentRegistry& registry) {
        return Q::get_state(registry);
    }

    static Fetch init_fetch(WorldCell world, const State& state, Tick last_run, Tick this_run) {
        return Fetch{Q::init_fetch(world, state, last_run, this_run), false};
    }

    static void set_archetype(Fetch& fetch, const State& state, const Archetype& archetype, Table& table) {
        fetch.matches = Q::matches_component_set(state,
            [&archetype](ComponentId id) { return archetype.has_component(id); });
        if (fetch.matches) {
            Q::set_archetype(fetch.inner, state, archetype, table);
        }
    }

    static void set_table(Fetch& fetch, const State& state, Table& table) {
        fetch.matches = Q::matches_component_set(state,
            [&table](ComponentId id) { return table.has_column(id); });
        if (fetch.matches) {
            Q::set_table(fetch.inner, state, table);
        }
    }

    static Item fetch(Fetch& fetch, Entity entity, std::size_t row) {
        if (!fetch.matches) {
            return Item{};
        }
        if constexpr (std::is_reference_v<typename Q::Item>) {
            return &Q::fetch(fetch.inner, entity, row);
        } else {
            return Item(Q::fetch(fetch.inner, entity, row));
        }
    }

    static void update_component_access(const State& state, FilteredAccess& access) {
        FilteredAccess intermediate = access;
        Q::update_component_access(state, intermediate);
        access.extend_access(intermediate);
    }

    static bool matches_component_set(const State&, const ComponentSetContains&) { return true; }

    static Item shrink(Item item) noexcept { return item; }
};

// =============================================================================
// All<Qs...>
// =============================================================================

/// Several descriptors fetched together; the item is a tuple
template<typename... Qs>
struct All {
    static_assert((QueryData<Qs> && ...), "All<Qs...> requires query descriptors");

    using State = std::tuple<typename Qs::State...>;
    using Fetch = std::tuple<typename Qs::Fetch...>;
    using Item = std::tuple<typename Qs::Item...>;
    using ReadOnly = All<typename Qs::ReadOnly...>;
    static constexpr bool IS_READ_ONLY = (Qs::IS_READ_ONLY && ...);

    static State init_state(World& world) {
        return State{Qs::init_state(world)...};
    }

    static std::optional<State> get_state(const ComponentRegistry& registry) {
        std::tuple<std::optional<typename Qs::State>...> parts{Qs::get_state(registry)...};
        bool complete = std::apply([](const auto&... p) { return (p.has_value() && ...); }, parts);
        if (!complete) {
            return std::nullopt;
        }
        return std::apply([](auto&... p) { return State{std::move(*p)...}; }, parts);
    }

    static Fetch init_fetch(WorldCell world, const State& state, Tick last_run, Tick this_run) {
        return init_fetch_impl(world, state, last_run, this_run, std::index_sequence_for<Qs...>{});
    }

    static void set_archetype(Fetch& fetch, const State& state, const Archetype& archetype, Table& table) {
        set_archetype_impl(fetch, state, archetype, table, std::index_sequence_for<Qs...>{});
    }

    static void set_table(Fetch& fetch, const State& state, Table& table) {
        set_table_impl(fetch, state, table, std::index_sequence_for<Qs...>{});
    }

    static Item fetch(Fetch& fetch, Entity entity, std::size_t row) {
        return fetch_impl(fetch, entity, row, std::index_sequence_for<Qs...>{});
    }

    static void update_component_access(const State& state, FilteredAccess& access) {
        access_impl(state, access, std::index_sequence_for<Qs...>{});
    }

    static bool matches_component_set(const State& state, const ComponentSetContains& contains) {
        return matches_impl(state, contains, std::index_sequence_for<Qs...>{});
    }

    static Item shrink(Item item) noexcept { return item; }

private:
    template<std::size_t... Is>
    static Fetch init_fetch_impl(WorldCell world, const State& state, Tick last_run, Tick this_run,
                                 std::index_sequence<Is...>) {
        return Fetch{Qs::init_fetch(world, std::get<Is>(state), last_run, this_run)...};
    }

    template<std::size_t... Is>
    static void set_archetype_impl(Fetch& fetch, const State& state, const Archetype& archetype,
                                   Table& table, std::index_sequence<Is...>) {
        (Qs::set_archetype(std::get<Is>(fetch), std::get<Is>(state), archetype, table), ...);
    }

    template<std::size_t... Is>
    static void set_table_impl(Fetch& fetch, const State& state, Table& table, std::index_sequence<Is...>) {
        (Qs::set_table(std::get<Is>(fetch), std::get<Is>(state), table), ...);
    }

    template<std::size_t... Is>
    static Item fetch_impl(Fetch& fetch, Entity entity, std::size_t row, std::index_sequence<Is...>) {
        return Item{Qs::fetch(std::get<Is>(fetch), entity, row)...};
    }

    template<std::size_t... Is>
    static void access_impl(const State& state, FilteredAccess& access, std::index_sequence<Is...>) {
        (Qs::update_component_access(std::get<Is>(state), access), ...);
    }

    template<std::size_t... Is>
    static bool matches_impl(const State& state, const ComponentSetContains& contains,
                             std::index_sequence<Is...>) {
        return (Qs::matches_component_set(std::get<Is>(state), contains) && ...);
    }
};

// =============================================================================
// Item Helpers
// =============================================================================

/// Storable form of an item: references become reference wrappers
template<typename I>
using item_holder_t = std::conditional_t<std::is_reference_v<I>,
    std::reference_wrapper<std::remove_reference_t<I>>, I>;

} // namespace prism_ecs
