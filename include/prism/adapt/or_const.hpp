#pragma once

/// @file or_const.hpp
/// @brief Constant substitution for absent scalar items
///
/// OrConst<Q, V> yields Q's item as a scalar of V's type, or V itself when Q
/// does not match the row. Q's item must read as that scalar (S, const S&
/// or S&). Typical use dereferences a newtype-like component first:
///
/// @code
/// struct Speed {
///     std::int32_t value;
///     const std::int32_t& operator*() const { return value; }
/// };
///
/// world.query<AsDerefOrI32<Speed, 5>>();   // 5 for entities without Speed
/// @endcode

#include "fwd.hpp"
#include "mod_query.hpp"
#include "views.hpp"
#include <prism/ecs/fetch.hpp>

#include <cstddef>
#include <cstdint>

namespace prism_adapt {

// =============================================================================
// OrConstQ<Q, S, V>
// =============================================================================

/// Modifier: Q's item as S, or V when Q does not match the row
template<typename Q, typename S, S V>
    requires prism_ecs::ReadOnlyQueryData<Q> && BorrowsAs<typename Q::Item, S>
struct OrConstQ {
    using FromQuery = prism_ecs::Maybe<Q>;
    using Item = S;

    static Item modify(prism_ecs::maybe_item_t<typename Q::Item> item) {
        if (!item) {
            return V;
        }
        return *item;
    }

    static Item shrink(Item item) noexcept { return item; }
};

/// Q's scalar item or the constant V
template<typename Q, auto V>
using OrConst = Mod<OrConstQ<Q, decltype(V), V>>;

// =============================================================================
// Per-scalar Aliases
// =============================================================================

template<typename Q, bool V>
using OrBool = Mod<OrConstQ<Q, bool, V>>;

/// Unicode scalar value
template<typename Q, char32_t V>
using OrChar = Mod<OrConstQ<Q, char32_t, V>>;

template<typename Q, std::int8_t V>
using OrI8 = Mod<OrConstQ<Q, std::int8_t, V>>;

template<typename Q, std::int16_t V>
using OrI16 = Mod<OrConstQ<Q, std::int16_t, V>>;

template<typename Q, std::int32_t V>
using OrI32 = Mod<OrConstQ<Q, std::int32_t, V>>;

template<typename Q, std::int64_t V>
using OrI64 = Mod<OrConstQ<Q, std::int64_t, V>>;

template<typename Q, std::uint8_t V>
using OrU8 = Mod<OrConstQ<Q, std::uint8_t, V>>;

template<typename Q, std::uint16_t V>
using OrU16 = Mod<OrConstQ<Q, std::uint16_t, V>>;

template<typename Q, std::uint32_t V>
using OrU32 = Mod<OrConstQ<Q, std::uint32_t, V>>;

template<typename Q, std::uint64_t V>
using OrU64 = Mod<OrConstQ<Q, std::uint64_t, V>>;

template<typename Q, std::ptrdiff_t V>
using OrIsize = Mod<OrConstQ<Q, std::ptrdiff_t, V>>;

template<typename Q, std::size_t V>
using OrUsize = Mod<OrConstQ<Q, std::size_t, V>>;

#ifdef __SIZEOF_INT128__
template<typename Q, __int128 V>
using OrI128 = Mod<OrConstQ<Q, __int128, V>>;

template<typename Q, unsigned __int128 V>
using OrU128 = Mod<OrConstQ<Q, unsigned __int128, V>>;
#endif

// =============================================================================
// AsDeref Shorthands
// =============================================================================

template<typename T, bool V>
using AsDerefOrBool = OrBool<AsDeref<T>, V>;

template<typename T, char32_t V>
using AsDerefOrChar = OrChar<AsDeref<T>, V>;

template<typename T, std::int8_t V>
using AsDerefOrI8 = OrI8<AsDeref<T>, V>;

template<typename T, std::int16_t V>
using AsDerefOrI16 = OrI16<AsDeref<T>, V>;

template<typename T, std::int32_t V>
using AsDerefOrI32 = OrI32<AsDeref<T>, V>;

template<typename T, std::int64_t V>
using AsDerefOrI64 = OrI64<AsDeref<T>, V>;

template<typename T, std::uint8_t V>
using AsDerefOrU8 = OrU8<AsDeref<T>, V>;

template<typename T, std::uint16_t V>
using AsDerefOrU16 = OrU16<AsDeref<T>, V>;

template<typename T, std::uint32_t V>
using AsDerefOrU32 = OrU32<AsDeref<T>, V>;

template<typename T, std::uint64_t V>
using AsDerefOrU64 = OrU64<AsDeref<T>, V>;

template<typename T, std::ptrdiff_t V>
using AsDerefOrIsize = OrIsize<AsDeref<T>, V>;

template<typename T, std::size_t V>
using AsDerefOrUsize = OrUsize<AsDeref<T>, V>;

#ifdef __SIZEOF_INT128__
template<typename T, __int128 V>
using AsDerefOrI128 = OrI128<AsDeref<T>, V>;

template<typename T, unsigned __int128 V>
using AsDerefOrU128 = OrU128<AsDeref<T>, V>;
#endif

} // namespace prism_adapt
