#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for dotver_core module

#include <cstdint>

namespace dotver_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct VersionError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

// =============================================================================
// Configuration
// =============================================================================

enum class ConfigLayerPriority : std::int32_t;
class ConfigLayer;
class ConfigManager;
struct Settings;

} // namespace dotver_core
