#pragma once

/// @file entity.hpp
/// @brief Entity and EntityAllocator for prism_ecs
///
/// Entity uses generational indices to detect use-after-free errors.
/// When an entity is despawned, its generation is incremented so old
/// references become invalid.

#include "fwd.hpp"
#include <vector>
#include <limits>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace prism_ecs {

// =============================================================================
// Entity
// =============================================================================

/// Entity handle with generational index
///
/// Combines a slot index with a generation counter to detect stale references.
/// When an entity is destroyed and its slot reused, the generation increments,
/// making old Entity handles invalid.
struct Entity {
    EntityIndex index;
    Generation generation;

    /// Create entity with explicit index and generation
    constexpr Entity(EntityIndex idx, Generation gen) noexcept
        : index(idx), generation(gen) {}

    /// Create null entity
    constexpr Entity() noexcept
        : index(std::numeric_limits<EntityIndex>::max())
        , generation(std::numeric_limits<Generation>::max()) {}

    [[nodiscard]] static constexpr Entity null() noexcept {
        return Entity{};
    }

    [[nodiscard]] constexpr bool is_null() const noexcept {
        return index == std::numeric_limits<EntityIndex>::max() &&
               generation == std::numeric_limits<Generation>::max();
    }

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return !is_null();
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept {
        return is_valid();
    }

    // =========================================================================
    // Bit Encoding
    // =========================================================================

    /// Encode as 64-bit value (generation in high 32 bits, index in low 32)
    [[nodiscard]] constexpr std::uint64_t to_bits() const noexcept {
        return (static_cast<std::uint64_t>(generation) << 32) |
               static_cast<std::uint64_t>(index);
    }

    /// Decode from 64-bit value
    [[nodiscard]] static constexpr Entity from_bits(std::uint64_t bits) noexcept {
        return Entity{
            static_cast<EntityIndex>(bits & 0xFFFFFFFF),
            static_cast<Generation>(bits >> 32)
        };
    }

    // =========================================================================
    // Comparison
    // =========================================================================

    [[nodiscard]] constexpr bool operator==(const Entity& other) const noexcept {
        return index == other.index && generation == other.generation;
    }

    [[nodiscard]] constexpr bool operator!=(const Entity& other) const noexcept {
        return !(*this == other);
    }

    [[nodiscard]] constexpr bool operator<(const Entity& other) const noexcept {
        if (index != other.index) return index < other.index;
        return generation < other.generation;
    }

    /// Format as string (e.g., "Entity(5v2)" or "Entity(null)")
    [[nodiscard]] std::string to_string() const {
        if (is_null()) {
            return "Entity(null)";
        }
        return "Entity(" + std::to_string(index) + "v" + std::to_string(generation) + ")";
    }
};

} // namespace prism_ecs

template<>
struct std::hash<prism_ecs::Entity> {
    [[nodiscard]] std::size_t operator()(const prism_ecs::Entity& e) const noexcept {
        return std::hash<std::uint64_t>{}(e.to_bits());
    }
};

namespace prism_ecs {

// =============================================================================
// EntityAllocator
// =============================================================================

/// Allocates and tracks entity lifetimes
///
/// Uses a free list to recycle entity indices. When an entity is deallocated,
/// its generation is incremented so old references become invalid.
class EntityAllocator {
public:
    using size_type = std::size_t;

private:
    std::vector<Generation> generations_;  // Generation for each index
    std::vector<EntityIndex> free_list_;   // Available indices
    std::vector<bool> alive_;              // Slot currently handed out
    size_type alive_count_{0};

public:
    EntityAllocator() = default;

    explicit EntityAllocator(size_type capacity) {
        reserve(capacity);
    }

    [[nodiscard]] size_type alive_count() const noexcept {
        return alive_count_;
    }

    /// Total allocated slots
    [[nodiscard]] size_type capacity() const noexcept {
        return generations_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return alive_count_ == 0;
    }

    void reserve(size_type additional) {
        generations_.reserve(generations_.size() + additional);
        alive_.reserve(alive_.size() + additional);
    }

    /// Allocate a new entity, reusing a freed slot when one exists
    [[nodiscard]] Entity allocate() {
        EntityIndex index;
        Generation generation;

        if (!free_list_.empty()) {
            index = free_list_.back();
            free_list_.pop_back();
            generation = generations_[index];
        } else {
            index = static_cast<EntityIndex>(generations_.size());
            generations_.push_back(0);
            alive_.push_back(false);
            generation = 0;
        }

        alive_[index] = true;
        ++alive_count_;
        return Entity{index, generation};
    }

    /// Deallocate an entity
    /// @return true if entity was alive and is now dead
    bool deallocate(Entity entity) {
        if (!is_alive(entity)) {
            return false;
        }

        // Invalidate old handles
        ++generations_[entity.index];
        alive_[entity.index] = false;
        free_list_.push_back(entity.index);

        --alive_count_;
        return true;
    }

    [[nodiscard]] bool is_alive(Entity entity) const noexcept {
        if (entity.is_null()) {
            return false;
        }
        if (entity.index >= generations_.size()) {
            return false;
        }
        return alive_[entity.index] && generations_[entity.index] == entity.generation;
    }

    /// Current generation for an index, or nullopt if out of range
    [[nodiscard]] std::optional<Generation> current_generation(EntityIndex index) const noexcept {
        if (index >= generations_.size()) {
            return std::nullopt;
        }
        return generations_[index];
    }

    void clear() {
        generations_.clear();
        free_list_.clear();
        alive_.clear();
        alive_count_ = 0;
    }
};

// =============================================================================
// ArchetypeId
// =============================================================================

/// Unique identifier for an archetype
struct ArchetypeId {
    std::uint32_t id;

    static constexpr std::uint32_t INVALID_ID = std::numeric_limits<std::uint32_t>::max();

    constexpr explicit ArchetypeId(std::uint32_t i = INVALID_ID) noexcept : id(i) {}

    [[nodiscard]] constexpr std::uint32_t value() const noexcept { return id; }

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != INVALID_ID; }

    [[nodiscard]] static constexpr ArchetypeId invalid() noexcept {
        return ArchetypeId{INVALID_ID};
    }

    [[nodiscard]] constexpr bool operator==(const ArchetypeId& other) const noexcept {
        return id == other.id;
    }
    [[nodiscard]] constexpr bool operator!=(const ArchetypeId& other) const noexcept {
        return id != other.id;
    }
    [[nodiscard]] constexpr bool operator<(const ArchetypeId& other) const noexcept {
        return id < other.id;
    }
};

// =============================================================================
// EntityLocation
// =============================================================================

/// Location of an entity within archetype storage
struct EntityLocation {
    ArchetypeId archetype_id;
    std::size_t row;

    constexpr EntityLocation(ArchetypeId arch, std::size_t r) noexcept
        : archetype_id(arch), row(r) {}

    [[nodiscard]] static constexpr EntityLocation invalid() noexcept {
        return EntityLocation{ArchetypeId::invalid(), std::numeric_limits<std::size_t>::max()};
    }

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return archetype_id.is_valid();
    }
};

} // namespace prism_ecs

template<>
struct std::hash<prism_ecs::ArchetypeId> {
    [[nodiscard]] std::size_t operator()(const prism_ecs::ArchetypeId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.id);
    }
};
