#pragma once

/// @file views.hpp
/// @brief Copy, clone, dereference and default-substitution views
///
/// Each view is a modifier plugged into Mod or ModMut. Copied, Cloned and
/// AsDeref accept either a component type T (read through Read<T>) or a
/// read-only query descriptor, so views nest:
///
/// @code
/// struct Temperature {
///     float degrees{20.0f};
///     const float& operator*() const { return degrees; }
/// };
///
/// // Copy of the stored temperature, or of Temperature{} when absent
/// world.query<Copied<AsDeref<OrDefault<Cloned<Temperature>>>>>();
/// @endcode
///
/// Capability requirements are constraints on the modifiers; a view over a
/// type that lacks the capability does not compile.

#include "fwd.hpp"
#include "mod_query.hpp"
#include <prism/ecs/fetch.hpp>
#include <prism/ecs/tick.hpp>

#include <concepts>
#include <type_traits>
#include <utility>

namespace prism_adapt {

// =============================================================================
// Capability Concepts
// =============================================================================

/// Has an empty state in which *t is invalid: pointers, optionals, smart pointers
template<typename T>
concept Nullable = requires(const T& t) { static_cast<bool>(t); };

/// *t on a const T yields an lvalue reference, and T is never empty
template<typename T>
concept Dereferenceable = !Nullable<T> && requires(const T& t) {
    *t;
} && std::is_lvalue_reference_v<decltype(*std::declval<const T&>())>;

/// Type reached by dereferencing a const T
template<Dereferenceable T>
using deref_target_t = std::remove_cvref_t<decltype(*std::declval<const T&>())>;

/// *t on a non-const T yields a non-const lvalue reference to the same target
template<typename T>
concept MutDereferenceable = Dereferenceable<T> && requires(T& t) {
    { *t } -> std::same_as<deref_target_t<T>&>;
};

/// Copyable by plain bitwise copy
template<typename T>
concept BitwiseCopyable = std::is_trivially_copyable_v<T> && std::copy_constructible<T>;

template<typename T>
concept Cloneable = std::copy_constructible<T>;

/// Item I reads as a scalar S
template<typename I, typename S>
concept BorrowsAs = std::same_as<std::remove_cvref_t<I>, S>;

/// Primary DefaultItem: a value-initialized I
///
/// Reference items have no default of their own. Specialize for them,
/// returning a reference to storage that outlives every query:
///
/// @code
/// template<>
/// struct prism_adapt::DefaultItem<const Velocity&> {
///     static const Velocity& get() {
///         static const Velocity zero{};
///         return zero;
///     }
/// };
/// @endcode
template<typename I>
struct DefaultItem {
    static I get() requires std::default_initializable<I> { return I{}; }
};

/// A default item is available for I
template<typename I>
concept HasDefaultItem = requires {
    { DefaultItem<I>::get() } -> std::same_as<I>;
};

namespace detail {

/// Descriptor a view reads from: T itself if it is query data, else Read<T>
template<typename T>
using source_t = std::conditional_t<prism_ecs::QueryData<T>, T, prism_ecs::Read<T>>;

/// Item of the descriptor a view reads from
template<typename T>
using source_item_t = typename source_t<T>::Item;

} // namespace detail

// =============================================================================
// Copied<T>
// =============================================================================

/// Modifier: bitwise copy of the item
template<typename T>
    requires BitwiseCopyable<std::remove_cvref_t<detail::source_item_t<T>>>
struct CopiedQ {
    using FromQuery = detail::source_t<T>;
    using Item = std::remove_cvref_t<typename FromQuery::Item>;

    static Item modify(typename FromQuery::Item item) { return item; }
    static Item shrink(Item item) noexcept { return item; }
};

/// Copy of component T (or of descriptor T's item)
template<typename T>
using Copied = Mod<CopiedQ<T>>;

// =============================================================================
// Cloned<T>
// =============================================================================

/// Modifier: copy-constructed item
template<typename T>
    requires Cloneable<std::remove_cvref_t<detail::source_item_t<T>>>
struct ClonedQ {
    using FromQuery = detail::source_t<T>;
    using Item = std::remove_cvref_t<typename FromQuery::Item>;

    static Item modify(typename FromQuery::Item item) { return Item(item); }
    static Item shrink(Item item) { return item; }
};

/// Clone of component T (or of descriptor T's item)
template<typename T>
using Cloned = Mod<ClonedQ<T>>;

// =============================================================================
// AsDeref<T>
// =============================================================================

namespace detail {

/// Borrowed items deref to a borrow; owned items deref to an owned copy
template<typename Source>
using as_deref_item_t = std::conditional_t<std::is_reference_v<Source>,
    const deref_target_t<std::remove_cvref_t<Source>>&,
    deref_target_t<std::remove_cvref_t<Source>>>;

} // namespace detail

/// Modifier: the item's dereferenced value
template<typename T>
    requires Dereferenceable<std::remove_cvref_t<detail::source_item_t<T>>>
          && (std::is_reference_v<detail::source_item_t<T>>
              || std::copy_constructible<deref_target_t<std::remove_cvref_t<detail::source_item_t<T>>>>)
struct AsDerefQ {
    using FromQuery = detail::source_t<T>;
    using Item = detail::as_deref_item_t<typename FromQuery::Item>;

    static Item modify(typename FromQuery::Item item) {
        const auto& source = item;
        return *source;
    }

    static Item shrink(Item item) noexcept { return item; }
};

/// Dereferenced component T (or descriptor T's dereferenced item)
template<typename T>
using AsDeref = Mod<AsDerefQ<T>>;

// =============================================================================
// AsDerefMut<T>
// =============================================================================

/// Modifier: change-tracked handle to component T's dereferenced value
///
/// The handle is projected from Write<T>'s Mut<T>, which it consumes; writes
/// through it mark T changed. Read-only iteration falls back to AsDeref<T>.
template<typename T>
    requires MutDereferenceable<T>
struct AsDerefMutQ {
    using FromQuery = prism_ecs::Write<T>;
    using Target = deref_target_t<T>;
    using Item = prism_ecs::Mut<Target>;
    using ReadOnly = AsDeref<T>;

    static Item modify(prism_ecs::Mut<T> item) {
        return std::move(item).map_unchanged([](T& value) -> Target& { return *value; });
    }

    static Item shrink(Item item) noexcept { return item; }
};

template<typename T>
using AsDerefMut = ModMut<AsDerefMutQ<T>>;

// =============================================================================
// OrDefault<Q>
// =============================================================================

/// Modifier: Q's item, or DefaultItem<Q::Item> when Q does not match the row
template<typename Q>
    requires prism_ecs::ReadOnlyQueryData<Q> && HasDefaultItem<typename Q::Item>
struct OrDefaultQ {
    using FromQuery = prism_ecs::Maybe<Q>;
    using Item = typename Q::Item;

    static Item modify(prism_ecs::maybe_item_t<Item> item) {
        if (!item) {
            return DefaultItem<Item>::get();
        }
        if constexpr (std::is_reference_v<Item>) {
            return *item;
        } else {
            return std::move(*item);
        }
    }

    static Item shrink(Item item) {
        return Q::shrink(std::forward<Item>(item));
    }
};

/// Q's item or a default; Q must be a read-only descriptor
template<typename Q>
using OrDefault = Mod<OrDefaultQ<Q>>;

} // namespace prism_adapt
