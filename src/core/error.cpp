/// @file error.cpp
/// @brief Error handling implementation for dotver_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <dotver/core/error.hpp>
#include <sstream>
#include <vector>

namespace dotver_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format version error with full context
std::string format_version_error(const VersionError& err) {
    std::ostringstream oss;
    oss << "[VersionError:" << version_error_kind_name(err.kind) << "] " << err.message;

    if (err.kind == VersionError::Kind::UnsupportedCoercion) {
        oss << " (operand: " << err.literal << ")";
    } else if (err.position) {
        oss << " (literal: " << err.literal << ", offset: " << *err.position << ")";
    }

    return oss.str();
}

/// Format config error with full context
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }
    if (!err.path.empty() && err.kind != ConfigError::Kind::FileNotFound) {
        oss << " (file: " << err.path << ")";
    }

    return oss.str();
}

} // namespace detail

const char* version_error_kind_name(VersionError::Kind kind) {
    switch (kind) {
        case VersionError::Kind::MalformedLiteral: return "MalformedVersionLiteral";
        case VersionError::Kind::UnsupportedCoercion: return "UnsupportedCoercion";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, VersionError>) {
            oss << detail::format_version_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint64_t>, Error>;

} // namespace dotver_core
