#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for prism_adapt

#include <prism/ecs/fwd.hpp>

namespace prism_adapt {

// =============================================================================
// Adapter Core
// =============================================================================

/// Read-only adapter applying modifier M to M::FromQuery's items
template<typename M>
struct Mod;

/// Possibly mutable adapter applying modifier M to M::FromQuery's items
template<typename M>
struct ModMut;

// =============================================================================
// Capabilities
// =============================================================================

/// Default value of a query item; specialize for reference items
template<typename I>
struct DefaultItem;

} // namespace prism_adapt
