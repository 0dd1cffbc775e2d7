#pragma once

/// @file query.hpp
/// @brief Query state and iteration for prism_ecs
///
/// A QueryState pairs a data descriptor D with a filter F, caches the
/// archetypes they match, and drives the fetch cycle over those archetypes.
/// Matching is incremental: archetypes are only ever appended, so an update
/// scans just the ones created since the previous update.
///
/// Example:
/// @code
/// auto state = world.query<All<EntityItem, Write<Position>>, Filters<Without<Frozen>>>();
/// for (auto [entity, pos] : state->iter_mut(world)) {
///     pos->x += 1.0f;
/// }
/// @endcode

#include "fwd.hpp"
#include "fetch.hpp"
#include "filter.hpp"
#include "world.hpp"
#include <prism/core/error.hpp>
#include <prism/core/log.hpp>
#include <prism/structures/bitset.hpp>

#include <iterator>
#include <optional>
#include <string>
#include <typeinfo>
#include <vector>

namespace prism_ecs {

namespace detail {

template<typename D, typename F>
[[nodiscard]] std::string query_name() {
    return std::string(typeid(D).name()) + " / " + typeid(F).name();
}

inline std::string join_component_ids(const std::vector<ComponentId>& ids) {
    std::string out;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += std::to_string(ids[i].value());
    }
    return out;
}

} // namespace detail

/// Access declared by data D and filter F for the given states
///
/// Filter access is gathered separately and merged, so a filter reading a
/// component the data writes is not a conflict.
template<typename D, typename F>
[[nodiscard]] FilteredAccess build_query_access(const typename D::State& fetch_state,
                                                const typename F::State& filter_state) {
    FilteredAccess access;
    D::update_component_access(fetch_state, access);

    FilteredAccess filter_access;
    F::update_component_access(filter_state, filter_access);
    access.extend(filter_access);
    return access;
}

/// Access of query <D, F>, registering its components in the world
template<typename D, typename F = Filters<>>
[[nodiscard]] FilteredAccess query_access(World& world) {
    return build_query_access<D, F>(D::init_state(world), F::init_state(world));
}

// =============================================================================
// QueryIter
// =============================================================================

/// Iterator over the rows of the matched archetypes
///
/// Binds the fetches once per non-empty archetype and skips rows the filter
/// rejects. Items are produced on demand; an item must not outlive a
/// structural change to the world.
template<typename D, typename F>
class QueryIter {
    static_assert(QueryData<D>, "QueryIter<D, F> requires D to be query data");
    static_assert(QueryFilter<F>, "QueryIter<D, F> requires F to be a query filter");

public:
    using size_type = std::size_t;
    using Item = typename D::Item;

private:
    Archetypes* archetypes_;
    const typename D::State* fetch_state_;
    const typename F::State* filter_state_;
    const std::vector<ArchetypeId>* matched_;
    typename D::Fetch fetch_;
    typename F::Fetch filter_;
    Archetype* current_{nullptr};
    size_type archetype_index_{0};
    size_type row_{0};

public:
    QueryIter(WorldCell world,
              const typename D::State& fetch_state,
              const typename F::State& filter_state,
              const std::vector<ArchetypeId>& matched,
              Tick last_run,
              Tick this_run)
        : archetypes_(&world.archetypes())
        , fetch_state_(&fetch_state)
        , filter_state_(&filter_state)
        , matched_(&matched)
        , fetch_(D::init_fetch(world, fetch_state, last_run, this_run))
        , filter_(F::init_fetch(world, filter_state, last_run, this_run))
    {
        bind_from(0);
        settle();
    }

    /// Check if exhausted
    [[nodiscard]] bool empty() const noexcept { return current_ == nullptr; }

    /// Entity of the current row
    [[nodiscard]] Entity entity() const noexcept {
        if (!current_) return Entity::null();
        return current_->entity_at(row_);
    }

    [[nodiscard]] size_type row() const noexcept { return row_; }

    /// Fetch the item of the current row
    [[nodiscard]] Item item() {
        return D::fetch(fetch_, current_->entity_at(row_), row_);
    }

    /// Move to the next accepted row
    void advance() {
        if (current_) {
            ++row_;
            settle();
        }
    }

    /// Fetch the current item and advance
    std::optional<item_holder_t<Item>> next() {
        if (empty()) {
            return std::nullopt;
        }
        std::optional<item_holder_t<Item>> result(item());
        advance();
        return result;
    }

    // =========================================================================
    // Range Interface
    // =========================================================================

    class iterator {
    private:
        QueryIter* iter_{nullptr};

    public:
        using value_type = item_holder_t<Item>;
        using difference_type = std::ptrdiff_t;

        iterator() = default;
        explicit iterator(QueryIter* iter) noexcept : iter_(iter) {}

        Item operator*() const { return iter_->item(); }

        iterator& operator++() {
            iter_->advance();
            return *this;
        }

        void operator++(int) { iter_->advance(); }

        friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
            return it.iter_->empty();
        }
    };

    [[nodiscard]] iterator begin() noexcept { return iterator(this); }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

private:
    /// Bind the fetches to the first non-empty matched archetype at or after index
    void bind_from(size_type index) {
        current_ = nullptr;
        row_ = 0;
        for (archetype_index_ = index; archetype_index_ < matched_->size(); ++archetype_index_) {
            Archetype* arch = archetypes_->get((*matched_)[archetype_index_]);
            if (!arch || arch->empty()) {
                continue;
            }
            D::set_archetype(fetch_, *fetch_state_, *arch, arch->table());
            F::set_archetype(filter_, *filter_state_, *arch, arch->table());
            current_ = arch;
            return;
        }
    }

    /// Stay on the current row if the filter accepts it, else move forward
    void settle() {
        while (current_) {
            if constexpr (F::IS_ARCHETYPAL) {
                if (row_ < current_->len()) {
                    return;
                }
            } else {
                for (; row_ < current_->len(); ++row_) {
                    if (F::filter_fetch(filter_, current_->entity_at(row_), row_)) {
                        return;
                    }
                }
            }
            bind_from(archetype_index_ + 1);
        }
    }
};

// =============================================================================
// QueryState
// =============================================================================

/// Cached state of a query for data D and filter F
template<typename D, typename F>
class QueryState {
    static_assert(QueryData<D>, "QueryState<D, F> requires D to be query data");
    static_assert(QueryFilter<F>, "QueryState<D, F> requires F to be a query filter");

    template<typename, typename>
    friend class QueryState;

public:
    using size_type = std::size_t;
    using Data = D;
    using Filter = F;
    using Item = typename D::Item;
    using ReadOnlyItem = typename D::ReadOnly::Item;

private:
    typename D::State fetch_state_;
    typename F::State filter_state_;
    FilteredAccess component_access_;
    std::vector<ArchetypeId> matched_archetypes_;
    prism_structures::BitSet matched_;
    size_type archetype_generation_{0};

    QueryState(typename D::State fetch_state, typename F::State filter_state)
        : fetch_state_(std::move(fetch_state))
        , filter_state_(std::move(filter_state))
        , component_access_(build_query_access<D, F>(fetch_state_, filter_state_)) {}

    [[nodiscard]] static prism_core::Result<QueryState> validated(QueryState state, const World& world) {
        if (state.component_access_.has_self_conflicts()) {
            auto error = prism_core::QueryError::conflicting_access(
                detail::query_name<D, F>(),
                detail::join_component_ids(state.component_access_.self_conflicts()));
            prism_core::ecs_logger()->warn("{}", error.message);
            return prism_core::Error(std::move(error));
        }

        state.update_archetypes(world);
        prism_core::ecs_logger()->debug("Created query state {} matching {} archetypes",
            detail::query_name<D, F>(), state.matched_archetypes_.size());
        return state;
    }

public:
    // =========================================================================
    // Construction
    // =========================================================================

    /// Build the state, registering any component the query names
    /// @return ConflictingAccess if the query reads and writes one component
    [[nodiscard]] static prism_core::Result<QueryState> create(World& world) {
        return validated(QueryState(D::init_state(world), F::init_state(world)), world);
    }

    /// Build the state without registering components
    /// @return NotFound if a component the query needs was never registered
    [[nodiscard]] static prism_core::Result<QueryState> try_create(const World& world) {
        auto fetch_state = D::get_state(world.component_registry());
        auto filter_state = F::get_state(world.component_registry());
        if (!fetch_state || !filter_state) {
            return prism_core::Error(prism_core::ErrorCode::NotFound,
                "Query " + detail::query_name<D, F>() + " names an unregistered component");
        }
        return validated(QueryState(std::move(*fetch_state), std::move(*filter_state)), world);
    }

    /// Same fetch state, viewed through D::ReadOnly
    [[nodiscard]] QueryState<typename D::ReadOnly, F> as_readonly() const {
        QueryState<typename D::ReadOnly, F> readonly(fetch_state_, filter_state_);
        readonly.matched_archetypes_ = matched_archetypes_;
        readonly.matched_ = matched_;
        readonly.archetype_generation_ = archetype_generation_;
        return readonly;
    }

    // =========================================================================
    // Archetype Matching
    // =========================================================================

    [[nodiscard]] bool matches_archetype(const Archetype& archetype) const {
        ComponentSetContains contains = [&archetype](ComponentId id) {
            return archetype.has_component(id);
        };
        return D::matches_component_set(fetch_state_, contains)
            && F::matches_component_set(filter_state_, contains);
    }

    /// Cache matches for archetypes created since the last update
    void update_archetypes(const World& world) {
        const Archetypes& archetypes = world.archetypes();
        for (size_type i = archetype_generation_; i < archetypes.size(); ++i) {
            ArchetypeId id{static_cast<std::uint32_t>(i)};
            const Archetype* arch = archetypes.get(id);
            if (arch && matches_archetype(*arch)) {
                matched_archetypes_.push_back(id);
                matched_.insert(i);
            }
        }
        archetype_generation_ = archetypes.size();
    }

    [[nodiscard]] bool is_matched(ArchetypeId id) const noexcept {
        return matched_.contains(id.value());
    }

    // =========================================================================
    // Iteration
    // =========================================================================

    /// Iterate with the world's current change window
    [[nodiscard]] QueryIter<D, F> iter_mut(World& world) {
        return iter_mut(world, world.last_change_tick(), world.change_tick());
    }

    /// Iterate with an explicit change window
    [[nodiscard]] QueryIter<D, F> iter_mut(World& world, Tick last_run, Tick this_run) {
        update_archetypes(world);
        return QueryIter<D, F>(WorldCell::read_write(world), fetch_state_, filter_state_,
                               matched_archetypes_, last_run, this_run);
    }

    /// Read-only iteration; items come from D::ReadOnly
    [[nodiscard]] QueryIter<typename D::ReadOnly, F> iter(const World& world) {
        return iter(world, world.last_change_tick(), world.change_tick());
    }

    [[nodiscard]] QueryIter<typename D::ReadOnly, F> iter(const World& world, Tick last_run, Tick this_run) {
        update_archetypes(world);
        return QueryIter<typename D::ReadOnly, F>(WorldCell::read_only(world), fetch_state_,
                                                  filter_state_, matched_archetypes_, last_run, this_run);
    }

    /// Call func with every item; items are passed as lvalues
    template<typename Func>
    void for_each_mut(World& world, Func&& func) {
        for (auto&& item : iter_mut(world)) {
            func(item);
        }
    }

    template<typename Func>
    void for_each(const World& world, Func&& func) {
        for (auto&& item : iter(world)) {
            func(item);
        }
    }

    /// Number of rows the query yields, without fetching items
    [[nodiscard]] size_type count(const World& world) {
        size_type n = 0;
        for (auto it = iter(world); !it.empty(); it.advance()) {
            ++n;
        }
        return n;
    }

    // =========================================================================
    // Lookup
    // =========================================================================

    /// Item of one entity
    /// @return NoSuchEntity or QueryDoesNotMatch on failure, and
    /// AlreadyBorrowed from get_mut while a Mut to the entity's row is alive
    [[nodiscard]] prism_core::Result<item_holder_t<Item>> get_mut(World& world, Entity entity) {
        return get_impl<D>(WorldCell::read_write(world), entity);
    }

    [[nodiscard]] prism_core::Result<item_holder_t<ReadOnlyItem>> get(const World& world, Entity entity) {
        return get_impl<typename D::ReadOnly>(WorldCell::read_only(world), entity);
    }

    /// The item of the only row the query yields
    /// @return NoEntities or MultipleEntities on failure
    [[nodiscard]] prism_core::Result<item_holder_t<Item>> single_mut(World& world) {
        return single_impl(iter_mut(world));
    }

    [[nodiscard]] prism_core::Result<item_holder_t<ReadOnlyItem>> single(const World& world) {
        return single_impl(iter(world));
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] const typename D::State& fetch_state() const noexcept { return fetch_state_; }

    [[nodiscard]] const typename F::State& filter_state() const noexcept { return filter_state_; }

    [[nodiscard]] const FilteredAccess& component_access() const noexcept { return component_access_; }

    [[nodiscard]] const std::vector<ArchetypeId>& matched_archetypes() const noexcept {
        return matched_archetypes_;
    }

private:
    template<typename Q>
    [[nodiscard]] prism_core::Result<item_holder_t<typename Q::Item>> get_impl(WorldCell cell, Entity entity) {
        const World& world = cell.world();
        auto loc = world.entity_location(entity);
        if (!loc) {
            return prism_core::Error(prism_core::QueryError::no_such_entity(entity.to_bits()));
        }

        update_archetypes(world);
        if (!is_matched(loc->archetype_id)) {
            return prism_core::Error(prism_core::QueryError::query_does_not_match(entity.to_bits()));
        }

        Tick last_run = world.last_change_tick();
        Tick this_run = world.change_tick();
        Archetype* arch = cell.archetypes().get(loc->archetype_id);

        auto filter = F::init_fetch(cell, filter_state_, last_run, this_run);
        F::set_archetype(filter, filter_state_, *arch, arch->table());
        if (!F::filter_fetch(filter, entity, loc->row)) {
            return prism_core::Error(prism_core::QueryError::query_does_not_match(entity.to_bits()));
        }

        auto fetch = Q::init_fetch(cell, fetch_state_, last_run, this_run);
        Q::set_archetype(fetch, fetch_state_, *arch, arch->table());
        if constexpr (Q::IS_READ_ONLY) {
            return item_holder_t<typename Q::Item>(Q::fetch(fetch, entity, loc->row));
        } else {
            try {
                return item_holder_t<typename Q::Item>(Q::fetch(fetch, entity, loc->row));
            } catch (const BorrowError&) {
                return prism_core::Error(prism_core::QueryError::already_borrowed(entity.to_bits()));
            }
        }
    }

    template<typename Q>
    [[nodiscard]] prism_core::Result<item_holder_t<typename Q::Item>> single_impl(QueryIter<Q, F> it) {
        auto first = it.next();
        if (!first) {
            return prism_core::Error(prism_core::QueryError::no_entities(detail::query_name<D, F>()));
        }
        if (!it.empty()) {
            return prism_core::Error(prism_core::QueryError::multiple_entities(detail::query_name<D, F>()));
        }
        return std::move(*first);
    }
};

// =============================================================================
// World::query
// =============================================================================

template<typename D, typename F>
prism_core::Result<QueryState<D, F>> World::query() {
    return QueryState<D, F>::create(*this);
}

} // namespace prism_ecs
