#pragma once

/// @file tick.hpp
/// @brief Change-detection ticks and the Mut<T> handle for prism_ecs
///
/// The world keeps a 32-bit change counter that wraps. A value counts as
/// added or changed for a query execution when its tick lies inside the
/// window (last_run, this_run]. Ticks further back than MAX_CHANGE_AGE are
/// clamped periodically so that wrapping never makes an old change look new.

#include "fwd.hpp"
#include <cstdint>
#include <algorithm>
#include <concepts>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace prism_ecs {

// =============================================================================
// Tick
// =============================================================================

/// Wrapping change-detection counter
struct Tick {
    std::uint32_t tick{0};

    /// Interval between clamping passes over all stored ticks
    static constexpr std::uint32_t CHECK_TICK_THRESHOLD = 518'400'000;

    /// Oldest age a tick may reach before it is clamped
    static constexpr std::uint32_t MAX_CHANGE_AGE = UINT32_MAX - (2 * CHECK_TICK_THRESHOLD - 1);

    constexpr Tick() noexcept = default;
    constexpr explicit Tick(std::uint32_t t) noexcept : tick(t) {}

    [[nodiscard]] constexpr std::uint32_t get() const noexcept { return tick; }

    /// Wrapping distance from other to this
    [[nodiscard]] constexpr Tick relative_to(Tick other) const noexcept {
        return Tick{tick - other.tick};
    }

    /// True when this tick happened after last_run, as seen from this_run
    [[nodiscard]] constexpr bool is_newer_than(Tick last_run, Tick this_run) const noexcept {
        std::uint32_t since_insert = std::min(this_run.relative_to(*this).tick, MAX_CHANGE_AGE);
        std::uint32_t since_system = std::min(this_run.relative_to(last_run).tick, MAX_CHANGE_AGE);
        return since_system > since_insert;
    }

    /// Clamp the tick to MAX_CHANGE_AGE behind this_run
    /// @return true if the tick was clamped
    constexpr bool check_tick(Tick this_run) noexcept {
        if (this_run.relative_to(*this).tick > MAX_CHANGE_AGE) {
            tick = this_run.relative_to(Tick{MAX_CHANGE_AGE}).tick;
            return true;
        }
        return false;
    }

    [[nodiscard]] constexpr bool operator==(const Tick& other) const noexcept {
        return tick == other.tick;
    }
    [[nodiscard]] constexpr bool operator!=(const Tick& other) const noexcept {
        return tick != other.tick;
    }
};

// =============================================================================
// ComponentTicks
// =============================================================================

/// Added and last-changed ticks of one stored component value
///
/// `borrowed` is set while a Mut handle to the value is alive.
struct ComponentTicks {
    Tick added;
    Tick changed;
    bool borrowed{false};

    constexpr ComponentTicks() noexcept = default;

    /// Ticks of a value inserted at the given tick
    constexpr explicit ComponentTicks(Tick inserted) noexcept
        : added(inserted), changed(inserted) {}

    [[nodiscard]] constexpr bool is_added(Tick last_run, Tick this_run) const noexcept {
        return added.is_newer_than(last_run, this_run);
    }

    [[nodiscard]] constexpr bool is_changed(Tick last_run, Tick this_run) const noexcept {
        return changed.is_newer_than(last_run, this_run);
    }

    constexpr void set_changed(Tick change_tick) noexcept {
        changed = change_tick;
    }

    /// @return true if either tick was clamped
    constexpr bool check_ticks(Tick this_run) noexcept {
        bool a = added.check_tick(this_run);
        bool c = changed.check_tick(this_run);
        return a || c;
    }
};

// =============================================================================
// BorrowError
// =============================================================================

/// Thrown when a Mut is requested for a value that already has a live one
class BorrowError : public std::runtime_error {
public:
    BorrowError() : std::runtime_error("Component value is already mutably borrowed") {}
};

/// Throws BorrowError if a live Mut holds the value behind ticks
inline void ensure_not_borrowed(const ComponentTicks& ticks) {
    if (ticks.borrowed) {
        throw BorrowError();
    }
}

// =============================================================================
// Mut<T>
// =============================================================================

/// Exclusive handle to a component value with change tracking
///
/// Non-const access marks the value changed at this_run. The handle is
/// move-only and holds the value's borrow flag until it is destroyed;
/// map_unchanged hands the flag to the projection.
template<typename T>
class Mut {
private:
    T* value_;
    ComponentTicks* ticks_;
    Tick last_run_;
    Tick this_run_;

    template<typename U>
    friend class Mut;

    void release() noexcept {
        if (ticks_) {
            ticks_->borrowed = false;
        }
    }

public:
    using value_type = T;

    Mut(T* value, ComponentTicks* ticks, Tick last_run, Tick this_run) noexcept
        : value_(value), ticks_(ticks), last_run_(last_run), this_run_(this_run) {
        if (ticks_) {
            ticks_->borrowed = true;
        }
    }

    ~Mut() { release(); }

    Mut(const Mut&) = delete;
    Mut& operator=(const Mut&) = delete;

    Mut(Mut&& other) noexcept
        : value_(std::exchange(other.value_, nullptr))
        , ticks_(std::exchange(other.ticks_, nullptr))
        , last_run_(other.last_run_)
        , this_run_(other.this_run_) {}

    Mut& operator=(Mut&& other) noexcept {
        if (this != &other) {
            release();
            value_ = std::exchange(other.value_, nullptr);
            ticks_ = std::exchange(other.ticks_, nullptr);
            last_run_ = other.last_run_;
            this_run_ = other.this_run_;
        }
        return *this;
    }

    // =========================================================================
    // Access
    // =========================================================================

    /// Read without marking the value changed
    [[nodiscard]] const T& get() const noexcept { return *value_; }

    /// Mutable access; marks the value changed
    [[nodiscard]] T& get_mut() noexcept {
        set_changed();
        return *value_;
    }

    [[nodiscard]] T& operator*() noexcept { return get_mut(); }
    [[nodiscard]] const T& operator*() const noexcept { return *value_; }

    [[nodiscard]] T* operator->() noexcept { return &get_mut(); }
    [[nodiscard]] const T* operator->() const noexcept { return value_; }

    /// Overwrite the value and mark it changed
    void set(T value) {
        *value_ = std::move(value);
        set_changed();
    }

    /// Overwrite only when the new value differs
    /// @return true if the value was written
    bool set_if_neq(T value) requires std::equality_comparable<T> {
        if (*value_ == value) {
            return false;
        }
        set(std::move(value));
        return true;
    }

    /// Mutable access that leaves the change tick untouched
    [[nodiscard]] T& bypass_change_detection() noexcept { return *value_; }

    // =========================================================================
    // Change Detection
    // =========================================================================

    void set_changed() noexcept { ticks_->set_changed(this_run_); }

    [[nodiscard]] bool is_added() const noexcept {
        return ticks_->is_added(last_run_, this_run_);
    }

    [[nodiscard]] bool is_changed() const noexcept {
        return ticks_->is_changed(last_run_, this_run_);
    }

    [[nodiscard]] Tick last_changed() const noexcept { return ticks_->changed; }

    [[nodiscard]] Tick last_run() const noexcept { return last_run_; }
    [[nodiscard]] Tick this_run() const noexcept { return this_run_; }

    // =========================================================================
    // Projection
    // =========================================================================

    /// Project to a sub-object without marking the value changed
    ///
    /// The projection shares this handle's ticks and keeps the borrow;
    /// writes through it mark the whole component changed. Consumes the
    /// handle.
    template<typename F>
    [[nodiscard]] auto map_unchanged(F&& f) && {
        using U = std::remove_reference_t<std::invoke_result_t<F&, T&>>;
        static_assert(std::is_lvalue_reference_v<std::invoke_result_t<F&, T&>>,
                      "map_unchanged projection must return an lvalue reference");
        U* projected = &std::invoke(f, *value_);
        Mut<U> result(projected, ticks_, last_run_, this_run_);
        value_ = nullptr;
        ticks_ = nullptr;
        return result;
    }
};

} // namespace prism_ecs
