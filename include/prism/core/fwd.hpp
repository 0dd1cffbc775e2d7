#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for prism_core module

#include <cstdint>

namespace prism_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct QueryError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace prism_core
