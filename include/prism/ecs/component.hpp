#pragma once

/// @file component.hpp
/// @brief Component types and column storage for prism_ecs
///
/// Components are stored as type-erased bytes with metadata for size,
/// alignment, move and destruction. Each column also keeps the added and
/// changed ticks of every row.

#include "fwd.hpp"
#include "tick.hpp"
#include <vector>
#include <string>
#include <typeinfo>
#include <typeindex>
#include <unordered_map>
#include <optional>
#include <memory>
#include <new>
#include <cassert>
#include <cstddef>
#include <functional>
#include <limits>
#include <utility>

namespace prism_ecs {

// =============================================================================
// ComponentId
// =============================================================================

/// Unique identifier for a component type
struct ComponentId {
    std::uint32_t id;

    static constexpr std::uint32_t INVALID_ID = std::numeric_limits<std::uint32_t>::max();

    constexpr explicit ComponentId(std::uint32_t i = INVALID_ID) noexcept : id(i) {}

    [[nodiscard]] constexpr std::uint32_t value() const noexcept { return id; }

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != INVALID_ID; }

    [[nodiscard]] static constexpr ComponentId invalid() noexcept {
        return ComponentId{INVALID_ID};
    }

    [[nodiscard]] constexpr bool operator==(const ComponentId& other) const noexcept {
        return id == other.id;
    }
    [[nodiscard]] constexpr bool operator!=(const ComponentId& other) const noexcept {
        return id != other.id;
    }
    [[nodiscard]] constexpr bool operator<(const ComponentId& other) const noexcept {
        return id < other.id;
    }
};

} // namespace prism_ecs

template<>
struct std::hash<prism_ecs::ComponentId> {
    [[nodiscard]] std::size_t operator()(const prism_ecs::ComponentId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.id);
    }
};

namespace prism_ecs {

// =============================================================================
// Component Concept
// =============================================================================

/// Valid component types: movable objects, not pointers or references
template<typename T>
concept Component = std::is_object_v<T> && !std::is_pointer_v<T> && !std::is_const_v<T>
    && std::is_move_constructible_v<T> && std::is_destructible_v<T>;

// =============================================================================
// ComponentInfo
// =============================================================================

/// Metadata for a component type
struct ComponentInfo {
    ComponentId id{ComponentId::INVALID_ID};
    std::string name;
    std::size_t size{0};
    std::size_t align{0};
    std::type_index type_id{typeid(void)};

    /// Destruct a component at the given address
    void (*drop_fn)(void*) = nullptr;

    /// Move-construct a component from src into uninitialized dst
    void (*move_fn)(void* src, void* dst) = nullptr;

    /// Create info for a typed component
    template<Component T>
    [[nodiscard]] static ComponentInfo of() {
        ComponentInfo info;
        info.name = typeid(T).name();
        info.size = sizeof(T);
        info.align = alignof(T);
        info.type_id = std::type_index(typeid(T));

        info.drop_fn = [](void* ptr) {
            static_cast<T*>(ptr)->~T();
        };

        info.move_fn = [](void* src, void* dst) {
            ::new (dst) T(std::move(*static_cast<T*>(src)));
        };

        return info;
    }
};

// =============================================================================
// ComponentRegistry
// =============================================================================

/// Registry of all component types
///
/// Maps type information to component IDs and stores metadata.
class ComponentRegistry {
public:
    using size_type = std::size_t;

private:
    std::vector<ComponentInfo> components_;
    std::unordered_map<std::type_index, ComponentId> type_map_;

public:
    /// Register a component type
    /// @return Component ID (existing ID if already registered)
    template<Component T>
    ComponentId register_component() {
        std::type_index type_idx = std::type_index(typeid(T));

        auto it = type_map_.find(type_idx);
        if (it != type_map_.end()) {
            return it->second;
        }

        ComponentInfo info = ComponentInfo::of<T>();
        ComponentId id{static_cast<std::uint32_t>(components_.size())};
        info.id = id;

        type_map_[type_idx] = id;
        components_.push_back(std::move(info));
        return id;
    }

    /// Get component ID by type, without registering
    template<typename T>
    [[nodiscard]] std::optional<ComponentId> get_id() const {
        auto it = type_map_.find(std::type_index(typeid(T)));
        if (it != type_map_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] const ComponentInfo* get_info(ComponentId id) const noexcept {
        if (id.id >= components_.size()) {
            return nullptr;
        }
        return &components_[id.id];
    }

    [[nodiscard]] size_type size() const noexcept {
        return components_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return components_.empty();
    }
};

// =============================================================================
// Column
// =============================================================================

/// Type-erased storage for components of a single type
///
/// Values live in an aligned buffer; relocation always goes through the
/// component's move function, so non-trivially-movable types are safe.
/// Rows are removed by swap-remove.
class Column {
public:
    using size_type = std::size_t;

private:
    ComponentInfo info_;
    std::byte* data_{nullptr};
    size_type len_{0};
    size_type capacity_{0};
    std::vector<ComponentTicks> ticks_;

    [[nodiscard]] std::byte* slot(size_type row) const noexcept {
        return data_ + row * info_.size;
    }

    void grow(size_type min_capacity) {
        size_type new_capacity = capacity_ == 0 ? 4 : capacity_ * 2;
        if (new_capacity < min_capacity) {
            new_capacity = min_capacity;
        }

        auto* new_data = static_cast<std::byte*>(
            ::operator new(new_capacity * info_.size, std::align_val_t(info_.align)));

        for (size_type i = 0; i < len_; ++i) {
            info_.move_fn(slot(i), new_data + i * info_.size);
            info_.drop_fn(slot(i));
        }

        release();
        data_ = new_data;
        capacity_ = new_capacity;
    }

    void release() noexcept {
        if (data_) {
            ::operator delete(data_, std::align_val_t(info_.align));
            data_ = nullptr;
        }
    }

    /// Make room for the next row; the row is not live until commit_slot
    void* prepare_slot() {
        if (len_ == capacity_) {
            grow(len_ + 1);
        }
        ticks_.reserve(capacity_);
        return slot(len_);
    }

    /// Record the ticks of a row constructed in the prepared slot
    void commit_slot(ComponentTicks ticks) {
        ticks_.push_back(ticks);
        ++len_;
    }

public:
    explicit Column(ComponentInfo info)
        : info_(std::move(info)) {}

    ~Column() {
        clear();
        release();
    }

    Column(const Column&) = delete;
    Column& operator=(const Column&) = delete;

    Column(Column&& other) noexcept
        : info_(std::move(other.info_))
        , data_(std::exchange(other.data_, nullptr))
        , len_(std::exchange(other.len_, 0))
        , capacity_(std::exchange(other.capacity_, 0))
        , ticks_(std::move(other.ticks_)) {}

    Column& operator=(Column&& other) noexcept {
        if (this != &other) {
            clear();
            release();
            info_ = std::move(other.info_);
            data_ = std::exchange(other.data_, nullptr);
            len_ = std::exchange(other.len_, 0);
            capacity_ = std::exchange(other.capacity_, 0);
            ticks_ = std::move(other.ticks_);
        }
        return *this;
    }

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] const ComponentInfo& info() const noexcept { return info_; }

    [[nodiscard]] ComponentId component_id() const noexcept { return info_.id; }

    [[nodiscard]] size_type size() const noexcept { return len_; }

    [[nodiscard]] bool empty() const noexcept { return len_ == 0; }

    [[nodiscard]] size_type capacity() const noexcept { return capacity_; }

    void reserve(size_type additional) {
        if (len_ + additional > capacity_) {
            grow(len_ + additional);
        }
        ticks_.reserve(len_ + additional);
    }

    // =========================================================================
    // Typed Operations
    // =========================================================================

    /// Construct a value at the end of the column
    template<typename T>
    void push(T&& value, ComponentTicks ticks) {
        using V = std::remove_cvref_t<T>;
        assert(info_.type_id == std::type_index(typeid(V)));
        ::new (prepare_slot()) V(std::forward<T>(value));
        commit_slot(ticks);
    }

    template<typename T>
    [[nodiscard]] const T& get(size_type row) const {
        assert(info_.type_id == std::type_index(typeid(T)));
        assert(row < len_);
        return *std::launder(reinterpret_cast<const T*>(slot(row)));
    }

    template<typename T>
    [[nodiscard]] T& get(size_type row) {
        assert(info_.type_id == std::type_index(typeid(T)));
        assert(row < len_);
        return *std::launder(reinterpret_cast<T*>(slot(row)));
    }

    // =========================================================================
    // Ticks
    // =========================================================================

    [[nodiscard]] ComponentTicks& ticks(size_type row) noexcept {
        assert(row < len_);
        return ticks_[row];
    }

    [[nodiscard]] const ComponentTicks& ticks(size_type row) const noexcept {
        assert(row < len_);
        return ticks_[row];
    }

    /// Clamp stale ticks of every row
    void check_change_ticks(Tick this_run) noexcept {
        for (auto& t : ticks_) {
            t.check_ticks(this_run);
        }
    }

    // =========================================================================
    // Raw Operations
    // =========================================================================

    [[nodiscard]] void* get_raw(size_type row) noexcept {
        if (row >= len_) return nullptr;
        return slot(row);
    }

    [[nodiscard]] const void* get_raw(size_type row) const noexcept {
        if (row >= len_) return nullptr;
        return slot(row);
    }

    /// Move-construct a value from src at the end of the column
    ///
    /// The caller still owns src and must destroy it.
    void push_moved(void* src, ComponentTicks ticks) {
        info_.move_fn(src, prepare_slot());
        commit_slot(ticks);
    }

    /// Drop the value at row and move the last row into its place
    void swap_remove(size_type row) {
        assert(row < len_);
        size_type last = len_ - 1;

        info_.drop_fn(slot(row));
        if (row != last) {
            info_.move_fn(slot(last), slot(row));
            info_.drop_fn(slot(last));
            ticks_[row] = ticks_[last];
        }

        ticks_.pop_back();
        --len_;
    }

    /// Move the value at row to the end of dst, then swap-remove the row
    void swap_remove_into(size_type row, Column& dst) {
        assert(row < len_);
        assert(dst.info_.id == info_.id);
        dst.push_moved(slot(row), ticks_[row]);
        swap_remove(row);
    }

    /// Drop all values
    void clear() noexcept {
        for (size_type i = 0; i < len_; ++i) {
            info_.drop_fn(slot(i));
        }
        len_ = 0;
        ticks_.clear();
    }
};

} // namespace prism_ecs
