#pragma once

/// @file world.hpp
/// @brief Main ECS container for prism_ecs
///
/// World is the central container that manages entities, components, their
/// storage in archetypes, and the change-detection clock.

#include "fwd.hpp"
#include "entity.hpp"
#include "tick.hpp"
#include "component.hpp"
#include "archetype.hpp"
#include "config.hpp"
#include <prism/core/error.hpp>

#include <optional>
#include <vector>

namespace prism_ecs {

// =============================================================================
// World
// =============================================================================

/// The main ECS container
///
/// The change tick starts at 1 and last_change_tick at 0, so everything
/// inserted before the first clear_trackers() counts as added.
class World {
public:
    using size_type = std::size_t;

private:
    EntityAllocator entities_;
    std::vector<EntityLocation> locations_;  // entity.index -> location
    ComponentRegistry components_;
    Archetypes archetypes_;

    Tick change_tick_{1};
    Tick last_change_tick_{0};
    Tick last_check_tick_{0};
    std::uint32_t check_threshold_{Tick::CHECK_TICK_THRESHOLD};

public:
    // =========================================================================
    // Constructors
    // =========================================================================

    World() = default;

    /// Create with pre-allocated entity capacity
    explicit World(size_type entity_capacity);

    /// Create from configuration
    ///
    /// Applies the config's logging settings to every prism logger.
    explicit World(const WorldConfig& config);

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // =========================================================================
    // Entity Management
    // =========================================================================

    /// Spawn a new entity in the empty archetype
    [[nodiscard]] Entity spawn();

    /// Despawn an entity, dropping its components
    /// @return true if entity was alive and is now dead
    bool despawn(Entity entity);

    [[nodiscard]] bool is_alive(Entity entity) const noexcept {
        return entities_.is_alive(entity);
    }

    [[nodiscard]] size_type entity_count() const noexcept {
        return entities_.alive_count();
    }

    [[nodiscard]] std::optional<EntityLocation> entity_location(Entity entity) const noexcept {
        if (!is_alive(entity) || entity.index >= locations_.size()) {
            return std::nullopt;
        }
        EntityLocation loc = locations_[entity.index];
        if (!loc.is_valid()) {
            return std::nullopt;
        }
        return loc;
    }

    // =========================================================================
    // Component Registration
    // =========================================================================

    template<Component T>
    ComponentId register_component() {
        return components_.register_component<T>();
    }

    template<typename T>
    [[nodiscard]] std::optional<ComponentId> component_id() const {
        return components_.get_id<T>();
    }

    [[nodiscard]] const ComponentInfo* component_info(ComponentId id) const noexcept {
        return components_.get_info(id);
    }

    [[nodiscard]] const ComponentRegistry& component_registry() const noexcept {
        return components_;
    }

    // =========================================================================
    // Component Access
    // =========================================================================

    /// Add or replace a component on an entity
    ///
    /// A new component gets added and changed ticks set to the current
    /// change tick; a replaced one only gets its changed tick updated.
    /// @return true if component was added/updated
    template<Component T>
    bool add_component(Entity entity, T component) {
        if (!is_alive(entity)) {
            return false;
        }

        ComponentId comp_id = register_component<T>();
        EntityLocation loc = locations_[entity.index];
        Archetype* current = archetypes_.get(loc.archetype_id);

        if (current->has_component(comp_id)) {
            Column* column = current->table().get_column(comp_id);
            column->template get<T>(loc.row) = std::move(component);
            column->ticks(loc.row).set_changed(change_tick_);
            return true;
        }

        ArchetypeId target = archetype_with(loc.archetype_id, comp_id);
        relocate(entity, loc, target);

        Column* column = archetypes_.get(target)->table().get_column(comp_id);
        column->push(std::move(component), ComponentTicks(change_tick_));
        return true;
    }

    /// Remove a component from an entity
    /// @return The removed component if it existed
    template<typename T>
    std::optional<T> remove_component(Entity entity) {
        if (!is_alive(entity)) {
            return std::nullopt;
        }

        auto comp_id = components_.get_id<T>();
        if (!comp_id) {
            return std::nullopt;
        }

        EntityLocation loc = locations_[entity.index];
        Archetype* current = archetypes_.get(loc.archetype_id);
        T* comp_ptr = current->template get_component<T>(*comp_id, loc.row);
        if (!comp_ptr) {
            return std::nullopt;
        }

        // The moved-from value is dropped when the row leaves this archetype
        std::optional<T> value(std::move(*comp_ptr));
        relocate(entity, loc, archetype_without(loc.archetype_id, *comp_id));
        return value;
    }

    template<typename T>
    [[nodiscard]] const T* get_component(Entity entity) const {
        auto loc = entity_location(entity);
        auto comp_id = components_.get_id<T>();
        if (!loc || !comp_id) {
            return nullptr;
        }
        return archetypes_.get(loc->archetype_id)->template get_component<T>(*comp_id, loc->row);
    }

    /// Mutable access that does not touch change ticks
    template<typename T>
    [[nodiscard]] T* get_component(Entity entity) {
        auto loc = entity_location(entity);
        auto comp_id = components_.get_id<T>();
        if (!loc || !comp_id) {
            return nullptr;
        }
        return archetypes_.get(loc->archetype_id)->template get_component<T>(*comp_id, loc->row);
    }

    /// Change-tracked mutable access within (last_change_tick, change_tick]
    /// @throws BorrowError if a Mut to the same value is still alive
    template<typename T>
    [[nodiscard]] std::optional<Mut<T>> get_mut(Entity entity) {
        auto loc = entity_location(entity);
        auto comp_id = components_.get_id<T>();
        if (!loc || !comp_id) {
            return std::nullopt;
        }
        Column* column = archetypes_.get(loc->archetype_id)->table().get_column(*comp_id);
        if (!column) {
            return std::nullopt;
        }
        ComponentTicks& ticks = column->ticks(loc->row);
        ensure_not_borrowed(ticks);
        return Mut<T>(&column->template get<T>(loc->row), &ticks, last_change_tick_, change_tick_);
    }

    template<typename T>
    [[nodiscard]] std::optional<ComponentTicks> component_ticks(Entity entity) const {
        auto loc = entity_location(entity);
        auto comp_id = components_.get_id<T>();
        if (!loc || !comp_id) {
            return std::nullopt;
        }
        const Column* column = archetypes_.get(loc->archetype_id)->table().get_column(*comp_id);
        if (!column) {
            return std::nullopt;
        }
        return column->ticks(loc->row);
    }

    template<typename T>
    [[nodiscard]] bool has_component(Entity entity) const {
        auto loc = entity_location(entity);
        auto comp_id = components_.get_id<T>();
        if (!loc || !comp_id) {
            return false;
        }
        return archetypes_.get(loc->archetype_id)->has_component(*comp_id);
    }

    // =========================================================================
    // Queries (defined in query.hpp)
    // =========================================================================

    /// Build a query state for data D and filter F
    template<typename D, typename F = Filters<>>
    [[nodiscard]] prism_core::Result<QueryState<D, F>> query();

    // =========================================================================
    // Change Detection
    // =========================================================================

    /// Current change tick
    [[nodiscard]] Tick change_tick() const noexcept { return change_tick_; }

    /// Tick of the last clear_trackers() call
    [[nodiscard]] Tick last_change_tick() const noexcept { return last_change_tick_; }

    /// Advance the change tick
    /// @return The tick before the increment
    Tick increment_change_tick() noexcept;

    /// Start a new change window for direct world queries
    void clear_trackers() noexcept;

    /// Clamp stale ticks in every column
    void check_change_ticks();

    /// Clamp stale ticks once the configured threshold has passed
    /// @return true if a clamping pass ran
    bool maybe_check_change_ticks();

    [[nodiscard]] std::uint32_t change_tick_check_threshold() const noexcept {
        return check_threshold_;
    }

    // =========================================================================
    // Archetype Access
    // =========================================================================

    [[nodiscard]] const Archetypes& archetypes() const noexcept { return archetypes_; }

    [[nodiscard]] Archetypes& archetypes() noexcept { return archetypes_; }

    // =========================================================================
    // Maintenance
    // =========================================================================

    /// Despawn every entity; archetypes and component ids are kept
    void clear();

private:
    /// Archetype reached by adding comp_id to from (cached on the edge)
    ArchetypeId archetype_with(ArchetypeId from, ComponentId comp_id);

    /// Archetype reached by removing comp_id from from (cached on the edge)
    ArchetypeId archetype_without(ArchetypeId from, ComponentId comp_id);

    /// Move an entity's row to another archetype and update locations
    EntityLocation relocate(Entity entity, EntityLocation old_loc, ArchetypeId target);
};

// =============================================================================
// EntityBuilder
// =============================================================================

/// Fluent API for building entities with components
template<typename WorldT = World>
class EntityBuilder {
private:
    WorldT* world_;
    Entity entity_;

public:
    explicit EntityBuilder(WorldT* world)
        : world_(world)
        , entity_(world->spawn()) {}

    template<typename T>
    EntityBuilder& with(T component) {
        world_->add_component(entity_, std::move(component));
        return *this;
    }

    [[nodiscard]] Entity id() const noexcept {
        return entity_;
    }

    [[nodiscard]] Entity build() {
        return entity_;
    }

    operator Entity() const noexcept {
        return entity_;
    }
};

inline EntityBuilder<World> build_entity(World& world) {
    return EntityBuilder<World>(&world);
}

} // namespace prism_ecs
