/// @file world.cpp
/// @brief World entity lifecycle, archetype transitions and change clock

#include <prism/ecs/world.hpp>
#include <prism/core/log.hpp>

#include <algorithm>

namespace prism_ecs {

// =============================================================================
// Construction
// =============================================================================

World::World(size_type entity_capacity)
    : entities_(entity_capacity)
{
    locations_.reserve(entity_capacity);
}

World::World(const WorldConfig& config)
    : entities_(config.entity_capacity)
    , check_threshold_(config.change_tick_check_threshold)
{
    locations_.reserve(config.entity_capacity);
    prism_core::configure_logging(config.log_config());
    prism_core::ecs_logger()->debug("World created (capacity {}, tick check threshold {})",
        config.entity_capacity, config.change_tick_check_threshold);
}

// =============================================================================
// Entity Management
// =============================================================================

Entity World::spawn() {
    Entity entity = entities_.allocate();

    if (entity.index >= locations_.size()) {
        locations_.resize(entity.index + 1, EntityLocation::invalid());
    }

    Archetype* empty_arch = archetypes_.get(archetypes_.empty());
    size_type row = empty_arch->push_entity(entity);
    locations_[entity.index] = EntityLocation{archetypes_.empty(), row};

    return entity;
}

bool World::despawn(Entity entity) {
    if (!is_alive(entity)) {
        return false;
    }

    EntityLocation loc = locations_[entity.index];
    Archetype* arch = archetypes_.get(loc.archetype_id);

    auto swapped = arch->remove_entity(loc.row);
    if (swapped.has_value()) {
        locations_[swapped->index].row = loc.row;
    }

    locations_[entity.index] = EntityLocation::invalid();
    entities_.deallocate(entity);
    return true;
}

void World::clear() {
    for (auto& arch : archetypes_) {
        while (!arch->empty()) {
            arch->remove_entity(arch->len() - 1);
        }
    }

    entities_.clear();
    locations_.clear();
}

// =============================================================================
// Archetype Transitions
// =============================================================================

ArchetypeId World::archetype_with(ArchetypeId from, ComponentId comp_id) {
    Archetype* source = archetypes_.get(from);
    if (const ArchetypeEdge* edge = source->edge(comp_id); edge && edge->add.is_valid()) {
        return edge->add;
    }

    std::vector<ComponentId> ids = source->components();
    ids.push_back(comp_id);
    ArchetypeId target = archetypes_.get_or_create(std::move(ids), components_);

    // get_or_create may have grown the archetype list; re-fetch both ends
    archetypes_.get(from)->edge_mut(comp_id).add = target;
    archetypes_.get(target)->edge_mut(comp_id).remove = from;
    return target;
}

ArchetypeId World::archetype_without(ArchetypeId from, ComponentId comp_id) {
    Archetype* source = archetypes_.get(from);
    if (const ArchetypeEdge* edge = source->edge(comp_id); edge && edge->remove.is_valid()) {
        return edge->remove;
    }

    std::vector<ComponentId> ids;
    for (ComponentId id : source->components()) {
        if (id != comp_id) {
            ids.push_back(id);
        }
    }
    ArchetypeId target = archetypes_.get_or_create(std::move(ids), components_);

    archetypes_.get(from)->edge_mut(comp_id).remove = target;
    archetypes_.get(target)->edge_mut(comp_id).add = from;
    return target;
}

EntityLocation World::relocate(Entity entity, EntityLocation old_loc, ArchetypeId target) {
    Archetype* source = archetypes_.get(old_loc.archetype_id);
    Archetype* dest = archetypes_.get(target);

    auto [new_row, swapped] = source->move_entity_to(old_loc.row, *dest);
    if (swapped.has_value()) {
        locations_[swapped->index].row = old_loc.row;
    }

    EntityLocation new_loc{target, new_row};
    locations_[entity.index] = new_loc;
    return new_loc;
}

// =============================================================================
// Change Detection
// =============================================================================

Tick World::increment_change_tick() noexcept {
    Tick previous = change_tick_;
    change_tick_ = Tick{change_tick_.get() + 1};
    return previous;
}

void World::clear_trackers() noexcept {
    last_change_tick_ = increment_change_tick();
}

void World::check_change_ticks() {
    for (auto& arch : archetypes_) {
        arch->table().check_change_ticks(change_tick_);
    }
    last_check_tick_ = change_tick_;
    prism_core::ecs_logger()->trace("Clamped change ticks at tick {}", change_tick_.get());
}

bool World::maybe_check_change_ticks() {
    if (change_tick_.relative_to(last_check_tick_).get() < check_threshold_) {
        return false;
    }
    check_change_ticks();
    return true;
}

} // namespace prism_ecs
