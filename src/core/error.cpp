/// @file error.cpp
/// @brief Error handling implementation for prism_core
///
/// The error system is primarily template-based and header-only.
/// This file provides error formatting and explicit template
/// instantiations for the common Result types.

#include <prism/core/error.hpp>
#include <sstream>

namespace prism_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* query_error_kind_name(QueryError::Kind kind) {
    switch (kind) {
        case QueryError::Kind::NoSuchEntity: return "NoSuchEntity";
        case QueryError::Kind::QueryDoesNotMatch: return "QueryDoesNotMatch";
        case QueryError::Kind::NoEntities: return "NoEntities";
        case QueryError::Kind::MultipleEntities: return "MultipleEntities";
        case QueryError::Kind::ConflictingAccess: return "ConflictingAccess";
        case QueryError::Kind::AlreadyBorrowed: return "AlreadyBorrowed";
        default: return "Unknown";
    }
}

/// Format query error with entity and query details
std::string format_query_error(const QueryError& err) {
    std::ostringstream oss;
    oss << "[QueryError::" << query_error_kind_name(err.kind) << "] " << err.message;

    if (err.kind == QueryError::Kind::NoSuchEntity ||
        err.kind == QueryError::Kind::QueryDoesNotMatch) {
        oss << " (entity bits: " << err.entity_bits << ")";
    }

    return oss.str();
}

/// Format config error
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    // Error code
    oss << "[" << error_code_name(error.code()) << "] ";

    // Main message based on variant type
    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, QueryError>) {
            oss << detail::format_query_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<int, Error>;
template class Result<std::uint32_t, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::string, Error>;

} // namespace prism_core
