#pragma once

/// @file archetype.hpp
/// @brief Archetype and table storage for prism_ecs
///
/// Archetypes group entities with identical component sets for cache-efficient
/// iteration. Each archetype owns a Table holding one Column per component
/// (SoA layout); row N of every column belongs to entities()[N].

#include "fwd.hpp"
#include "entity.hpp"
#include "component.hpp"
#include <prism/core/log.hpp>
#include <prism/structures/bitset.hpp>

#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <algorithm>
#include <cassert>

namespace prism_ecs {

// =============================================================================
// ArchetypeEdge
// =============================================================================

/// Edge in the archetype graph for fast component add/remove transitions
struct ArchetypeEdge {
    ArchetypeId add{ArchetypeId::INVALID_ID};     // Archetype when adding this component
    ArchetypeId remove{ArchetypeId::INVALID_ID};  // Archetype when removing this component
};

// =============================================================================
// Table
// =============================================================================

/// Columns of one archetype, keyed by component
class Table {
public:
    using size_type = std::size_t;

private:
    std::vector<Column> columns_;
    std::map<ComponentId, size_type> column_indices_;

public:
    Table() = default;

    /// Create one column per component info
    explicit Table(const std::vector<ComponentInfo>& infos) {
        columns_.reserve(infos.size());
        for (size_type i = 0; i < infos.size(); ++i) {
            column_indices_[infos[i].id] = i;
            columns_.emplace_back(infos[i]);
        }
    }

    [[nodiscard]] bool has_column(ComponentId id) const noexcept {
        return column_indices_.count(id) > 0;
    }

    [[nodiscard]] Column* get_column(ComponentId id) noexcept {
        auto it = column_indices_.find(id);
        if (it == column_indices_.end()) return nullptr;
        return &columns_[it->second];
    }

    [[nodiscard]] const Column* get_column(ComponentId id) const noexcept {
        auto it = column_indices_.find(id);
        if (it == column_indices_.end()) return nullptr;
        return &columns_[it->second];
    }

    [[nodiscard]] std::vector<Column>& columns() noexcept { return columns_; }
    [[nodiscard]] const std::vector<Column>& columns() const noexcept { return columns_; }

    void reserve(size_type additional) {
        for (auto& column : columns_) {
            column.reserve(additional);
        }
    }

    void swap_remove(size_type row) {
        for (auto& column : columns_) {
            column.swap_remove(row);
        }
    }

    void check_change_ticks(Tick this_run) noexcept {
        for (auto& column : columns_) {
            column.check_change_ticks(this_run);
        }
    }

    void clear() noexcept {
        for (auto& column : columns_) {
            column.clear();
        }
    }
};

// =============================================================================
// Archetype
// =============================================================================

/// Container for entities with identical component sets
///
/// Uses swap-remove for O(1) entity removal.
class Archetype {
public:
    using size_type = std::size_t;

private:
    ArchetypeId id_;
    std::vector<ComponentId> components_;             // Sorted component IDs
    prism_structures::BitSet component_mask_;         // For fast matching
    Table table_;
    std::vector<Entity> entities_;
    std::map<ComponentId, ArchetypeEdge> edges_;

public:
    /// Create archetype with given component set
    Archetype(ArchetypeId arch_id, std::vector<ComponentInfo> component_infos)
        : id_(arch_id)
    {
        std::sort(component_infos.begin(), component_infos.end(),
            [](const auto& a, const auto& b) { return a.id < b.id; });

        components_.reserve(component_infos.size());
        for (const auto& info : component_infos) {
            components_.push_back(info.id);
            component_mask_.insert(info.id.id);
        }
        table_ = Table(component_infos);
    }

    /// Create empty archetype
    explicit Archetype(ArchetypeId arch_id)
        : id_(arch_id) {}

    Archetype(const Archetype&) = delete;
    Archetype& operator=(const Archetype&) = delete;

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] ArchetypeId id() const noexcept { return id_; }

    /// Sorted component IDs
    [[nodiscard]] const std::vector<ComponentId>& components() const noexcept {
        return components_;
    }

    [[nodiscard]] const prism_structures::BitSet& component_mask() const noexcept {
        return component_mask_;
    }

    [[nodiscard]] bool has_component(ComponentId id) const noexcept {
        return component_mask_.contains(id.id);
    }

    [[nodiscard]] size_type len() const noexcept { return entities_.size(); }

    [[nodiscard]] size_type size() const noexcept { return len(); }

    [[nodiscard]] bool empty() const noexcept { return entities_.empty(); }

    [[nodiscard]] const std::vector<Entity>& entities() const noexcept {
        return entities_;
    }

    [[nodiscard]] Entity entity_at(size_type row) const noexcept {
        if (row >= entities_.size()) return Entity::null();
        return entities_[row];
    }

    [[nodiscard]] Table& table() noexcept { return table_; }
    [[nodiscard]] const Table& table() const noexcept { return table_; }

    // =========================================================================
    // Entity Operations
    // =========================================================================

    void reserve(size_type additional) {
        entities_.reserve(entities_.size() + additional);
        table_.reserve(additional);
    }

    /// Append an entity row; the caller pushes one value into every column
    size_type push_entity(Entity entity) {
        entities_.push_back(entity);
        return entities_.size() - 1;
    }

    /// Remove entity at row, dropping its components (swap-remove)
    /// @return Entity that was swapped into this row (if any)
    std::optional<Entity> remove_entity(size_type row) {
        if (row >= entities_.size()) return std::nullopt;

        table_.swap_remove(row);
        return swap_remove_entity(row);
    }

    /// Move the entity at row into dst
    ///
    /// Components present in both archetypes are moved; components dst lacks
    /// are dropped. Columns dst has that this archetype lacks are left for the
    /// caller to fill.
    /// @return Row in dst and the entity swapped into row here (if any)
    std::pair<size_type, std::optional<Entity>> move_entity_to(size_type row, Archetype& dst) {
        assert(row < entities_.size());
        Entity entity = entities_[row];

        for (auto& column : table_.columns()) {
            Column* target = dst.table_.get_column(column.component_id());
            if (target) {
                column.swap_remove_into(row, *target);
            } else {
                column.swap_remove(row);
            }
        }

        size_type new_row = dst.push_entity(entity);
        return {new_row, swap_remove_entity(row)};
    }

    // =========================================================================
    // Component Access
    // =========================================================================

    template<typename T>
    [[nodiscard]] const T* get_component(ComponentId id, size_type row) const {
        const Column* column = table_.get_column(id);
        if (!column || row >= column->size()) return nullptr;
        return &column->template get<T>(row);
    }

    template<typename T>
    [[nodiscard]] T* get_component(ComponentId id, size_type row) {
        Column* column = table_.get_column(id);
        if (!column || row >= column->size()) return nullptr;
        return &column->template get<T>(row);
    }

    // =========================================================================
    // Graph Edges
    // =========================================================================

    [[nodiscard]] const ArchetypeEdge* edge(ComponentId id) const noexcept {
        auto it = edges_.find(id);
        if (it == edges_.end()) return nullptr;
        return &it->second;
    }

    ArchetypeEdge& edge_mut(ComponentId id) {
        return edges_[id];
    }

private:
    std::optional<Entity> swap_remove_entity(size_type row) {
        size_type last_row = entities_.size() - 1;
        std::optional<Entity> swapped;

        if (row != last_row) {
            swapped = entities_[last_row];
            entities_[row] = entities_[last_row];
        }

        entities_.pop_back();
        return swapped;
    }
};

// =============================================================================
// Archetypes
// =============================================================================

/// Manager for all archetypes
///
/// Archetype ids are dense and stable; new archetypes are only ever appended,
/// which lets query states scan just the ones added since their last update.
class Archetypes {
public:
    using size_type = std::size_t;

private:
    std::vector<std::unique_ptr<Archetype>> archetypes_;
    std::map<std::vector<ComponentId>, ArchetypeId> signature_map_;

public:
    /// Create with the empty archetype at id 0
    Archetypes() {
        archetypes_.push_back(std::make_unique<Archetype>(ArchetypeId{0}));
        signature_map_[{}] = ArchetypeId{0};
    }

    [[nodiscard]] ArchetypeId empty() const noexcept {
        return ArchetypeId{0};
    }

    [[nodiscard]] size_type size() const noexcept {
        return archetypes_.size();
    }

    [[nodiscard]] Archetype* get(ArchetypeId id) noexcept {
        if (id.id >= archetypes_.size()) return nullptr;
        return archetypes_[id.id].get();
    }

    [[nodiscard]] const Archetype* get(ArchetypeId id) const noexcept {
        if (id.id >= archetypes_.size()) return nullptr;
        return archetypes_[id.id].get();
    }

    /// Find archetype by component signature
    [[nodiscard]] std::optional<ArchetypeId> find(std::vector<ComponentId> components) const {
        std::sort(components.begin(), components.end());

        auto it = signature_map_.find(components);
        if (it != signature_map_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    /// Get or create the archetype for a set of component ids
    ArchetypeId get_or_create(std::vector<ComponentId> component_ids,
                              const ComponentRegistry& registry) {
        std::sort(component_ids.begin(), component_ids.end());

        auto it = signature_map_.find(component_ids);
        if (it != signature_map_.end()) {
            return it->second;
        }

        std::vector<ComponentInfo> infos;
        infos.reserve(component_ids.size());
        for (ComponentId id : component_ids) {
            const ComponentInfo* info = registry.get_info(id);
            assert(info != nullptr);
            infos.push_back(*info);
        }

        ArchetypeId new_id{static_cast<std::uint32_t>(archetypes_.size())};
        archetypes_.push_back(std::make_unique<Archetype>(new_id, std::move(infos)));
        signature_map_[component_ids] = new_id;

        prism_core::ecs_logger()->debug("Created archetype {} with {} components",
            new_id.value(), component_ids.size());

        return new_id;
    }

    [[nodiscard]] auto begin() noexcept { return archetypes_.begin(); }
    [[nodiscard]] auto end() noexcept { return archetypes_.end(); }
    [[nodiscard]] auto begin() const noexcept { return archetypes_.begin(); }
    [[nodiscard]] auto end() const noexcept { return archetypes_.end(); }
};

} // namespace prism_ecs
