#pragma once

/// @file adapt.hpp
/// @brief Main include for prism_adapt module
///
/// Views over query items, usable anywhere a query descriptor is:
/// - Copied / Cloned: owned copy of the item
/// - AsDeref / AsDerefMut: the component's dereferenced value
/// - OrDefault: the item or a default when the component is absent
/// - OrConst and the Or<Scalar> aliases: a scalar or a constant
/// - Mod / ModMut: custom views from a user modifier
///
/// @example
/// @code
/// #include <prism/adapt/adapt.hpp>
/// #include <prism/ecs/ecs.hpp>
///
/// struct Frozen {
///     bool value;
///     const bool& operator*() const { return value; }
/// };
///
/// auto frozen = world.query<prism_adapt::AsDerefCopiedOrDefault<Frozen>>();
/// for (bool is_frozen : frozen->iter(world)) {
///     // false for entities without Frozen
/// }
/// @endcode

#include "fwd.hpp"
#include "mod_query.hpp"
#include "views.hpp"
#include "or_const.hpp"

namespace prism_adapt {

// =============================================================================
// Composition Aliases
// =============================================================================

/// Copy of component T, or T{} when absent
template<typename T>
using CopiedOrDefault = OrDefault<Copied<T>>;

/// Clone of component T, or T{} when absent
template<typename T>
using ClonedOrDefault = OrDefault<Cloned<T>>;

/// Copy of component T's dereferenced value
template<typename T>
using AsDerefCopied = Copied<AsDeref<T>>;

/// Clone of component T's dereferenced value
template<typename T>
using AsDerefCloned = Cloned<AsDeref<T>>;

/// Copy of T's dereferenced value, or the target type's default when T is absent
template<typename T>
using AsDerefCopiedOrDefault = OrDefault<AsDerefCopied<T>>;

/// Clone of T's dereferenced value, or the target type's default when T is absent
template<typename T>
using AsDerefClonedOrDefault = OrDefault<AsDerefCloned<T>>;

/// Copy of the dereferenced value of T's clone, or of T{} when T is absent
///
/// Differs from AsDerefCopiedOrDefault when T{} dereferences to something
/// other than the target type's default.
template<typename T>
using AsDerefCopiedOfClonedOrDefault = Copied<AsDeref<OrDefault<Cloned<T>>>>;

/// Copy of the dereferenced value of T's copy, or of T{} when T is absent
template<typename T>
using AsDerefCopiedOfCopiedOrDefault = Copied<AsDeref<OrDefault<Copied<T>>>>;

/// Clone of the dereferenced value of T's clone, or of T{} when T is absent
template<typename T>
using AsDerefClonedOfClonedOrDefault = Cloned<AsDeref<OrDefault<Cloned<T>>>>;

} // namespace prism_adapt
