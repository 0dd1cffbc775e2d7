#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for prism_ecs
///
/// All ECS types are declared here for header dependency management.

#include <cstdint>
#include <cstddef>

namespace prism_ecs {

// =============================================================================
// Core Types
// =============================================================================

/// Entity with generational index
struct Entity;

/// Entity allocation and lifetime management
class EntityAllocator;

/// Entity location within archetype storage
struct EntityLocation;

// =============================================================================
// Change Detection
// =============================================================================

/// Wrapping change-detection counter
struct Tick;

/// Added/changed ticks of one component value
struct ComponentTicks;

/// Exclusive, change-tracking handle to a component value
template<typename T>
class Mut;

// =============================================================================
// Component Types
// =============================================================================

/// Unique component type identifier
struct ComponentId;

/// Component metadata (size, alignment, drop function)
struct ComponentInfo;

/// Registry of all component types
class ComponentRegistry;

/// Type-erased column of component values with per-row ticks
class Column;

// =============================================================================
// Archetype Types
// =============================================================================

/// Unique archetype identifier
struct ArchetypeId;

/// Graph edge for archetype transitions
struct ArchetypeEdge;

/// Columns of one archetype
class Table;

/// Container for entities with identical component sets
class Archetype;

/// Manager for all archetypes
class Archetypes;

// =============================================================================
// Access
// =============================================================================

/// Read/write component set
class Access;

/// Access plus archetype-level with/without filters
class FilteredAccess;

// =============================================================================
// Query Types
// =============================================================================

/// World view handed to fetches for one query execution
class WorldCell;

/// Conjunction of query filters
template<typename... Fs>
struct Filters;

/// Cached query state
template<typename D, typename F = Filters<>>
class QueryState;

/// Iterator over matching rows
template<typename D, typename F = Filters<>>
class QueryIter;

// =============================================================================
// System Types
// =============================================================================

/// Unique system identifier
struct SystemId;

/// Execution stage for systems
enum class SystemStage : std::uint8_t;

/// System metadata
class SystemDescriptor;

/// System interface
class System;

/// System execution scheduler
class SystemScheduler;

/// Batch of parallel-safe systems
struct SystemBatch;

// =============================================================================
// World
// =============================================================================

/// World construction settings
struct WorldConfig;

/// The main ECS container
class World;

/// Fluent entity construction
template<typename WorldT>
class EntityBuilder;

// =============================================================================
// Common Type Aliases
// =============================================================================

using EntityIndex = std::uint32_t;
using Generation = std::uint32_t;

} // namespace prism_ecs
