#pragma once

/// @file access.hpp
/// @brief Component access declarations for prism_ecs
///
/// Every query descriptor reports the components it reads and writes into a
/// FilteredAccess before it runs. The scheduler only ever looks at these
/// declarations to decide which systems may run side by side.

#include "fwd.hpp"
#include "component.hpp"
#include <prism/structures/bitset.hpp>

#include <string>
#include <vector>

namespace prism_ecs {

// =============================================================================
// Access
// =============================================================================

/// Set of components read and written
class Access {
private:
    prism_structures::BitSet reads_and_writes_;
    prism_structures::BitSet writes_;

public:
    Access() = default;

    void add_read(ComponentId id) {
        reads_and_writes_.insert(id.id);
    }

    void add_write(ComponentId id) {
        reads_and_writes_.insert(id.id);
        writes_.insert(id.id);
    }

    /// True if the component is read or written
    [[nodiscard]] bool has_read(ComponentId id) const noexcept {
        return reads_and_writes_.contains(id.id);
    }

    [[nodiscard]] bool has_write(ComponentId id) const noexcept {
        return writes_.contains(id.id);
    }

    [[nodiscard]] bool has_any_read() const noexcept { return !reads_and_writes_.empty(); }

    [[nodiscard]] bool has_any_write() const noexcept { return !writes_.empty(); }

    [[nodiscard]] bool is_read_only() const noexcept { return writes_.empty(); }

    /// True when neither side writes anything the other touches
    [[nodiscard]] bool is_compatible(const Access& other) const noexcept {
        return !writes_.intersects(other.reads_and_writes_)
            && !other.writes_.intersects(reads_and_writes_);
    }

    /// Components accessed incompatibly by this and other
    [[nodiscard]] std::vector<ComponentId> get_conflicts(const Access& other) const {
        std::vector<ComponentId> conflicts;
        prism_structures::BitSet overlap = (writes_ & other.reads_and_writes_)
                                         | (other.writes_ & reads_and_writes_);
        for (auto index : overlap.iter_ones()) {
            conflicts.emplace_back(static_cast<std::uint32_t>(index));
        }
        return conflicts;
    }

    void extend(const Access& other) {
        reads_and_writes_ |= other.reads_and_writes_;
        writes_ |= other.writes_;
    }

    void clear() noexcept {
        reads_and_writes_.clear();
        writes_.clear();
    }

    [[nodiscard]] const prism_structures::BitSet& reads_and_writes() const noexcept {
        return reads_and_writes_;
    }

    [[nodiscard]] const prism_structures::BitSet& writes() const noexcept {
        return writes_;
    }

    [[nodiscard]] bool operator==(const Access& other) const noexcept {
        return reads_and_writes_ == other.reads_and_writes_ && writes_ == other.writes_;
    }

    [[nodiscard]] bool operator!=(const Access& other) const noexcept {
        return !(*this == other);
    }
};

// =============================================================================
// FilteredAccess
// =============================================================================

/// Access plus the archetype filters a query applies
///
/// Required components go into the with set; Without<T> filters go into the
/// without set. Two accesses whose filters exclude each other can never see
/// the same entity and are compatible even when their component access
/// overlaps. Reads and writes of the same component declared within one
/// query are recorded as self conflicts.
class FilteredAccess {
private:
    Access access_;
    prism_structures::BitSet with_;
    prism_structures::BitSet without_;
    prism_structures::BitSet self_conflicts_;

public:
    FilteredAccess() = default;

    /// Declare a required read
    void add_read(ComponentId id) {
        if (access_.has_write(id)) {
            self_conflicts_.insert(id.id);
        }
        access_.add_read(id);
        and_with(id);
    }

    /// Declare a required write
    void add_write(ComponentId id) {
        if (access_.has_read(id)) {
            self_conflicts_.insert(id.id);
        }
        access_.add_write(id);
        and_with(id);
    }

    void and_with(ComponentId id) {
        with_.insert(id.id);
    }

    void and_without(ComponentId id) {
        without_.insert(id.id);
    }

    /// Merge access and filters
    void extend(const FilteredAccess& other) {
        access_.extend(other.access_);
        with_ |= other.with_;
        without_ |= other.without_;
        self_conflicts_ |= other.self_conflicts_;
    }

    /// Merge access only, leaving filters untouched
    void extend_access(const FilteredAccess& other) {
        access_.extend(other.access_);
        self_conflicts_ |= other.self_conflicts_;
    }

    /// Compatible access, or filters that make the entity sets disjoint
    [[nodiscard]] bool is_compatible(const FilteredAccess& other) const noexcept {
        if (access_.is_compatible(other.access_)) {
            return true;
        }
        return with_.intersects(other.without_) || without_.intersects(other.with_);
    }

    [[nodiscard]] std::vector<ComponentId> get_conflicts(const FilteredAccess& other) const {
        if (is_compatible(other)) {
            return {};
        }
        return access_.get_conflicts(other.access_);
    }

    [[nodiscard]] bool has_self_conflicts() const noexcept {
        return !self_conflicts_.empty();
    }

    [[nodiscard]] std::vector<ComponentId> self_conflicts() const {
        std::vector<ComponentId> ids;
        for (auto index : self_conflicts_.iter_ones()) {
            ids.emplace_back(static_cast<std::uint32_t>(index));
        }
        return ids;
    }

    [[nodiscard]] const Access& access() const noexcept { return access_; }

    [[nodiscard]] const prism_structures::BitSet& with_filters() const noexcept { return with_; }

    [[nodiscard]] const prism_structures::BitSet& without_filters() const noexcept { return without_; }

    [[nodiscard]] bool operator==(const FilteredAccess& other) const noexcept {
        return access_ == other.access_ && with_ == other.with_ && without_ == other.without_;
    }

    [[nodiscard]] bool operator!=(const FilteredAccess& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace prism_ecs
