#pragma once

/// @file core.hpp
/// @brief Main include file for dotver_core module
///
/// This header includes all dotver_core components in dependency order.

// Forward declarations
#include "fwd.hpp"

// Error handling (no dependencies on other dotver_core headers)
#include "error.hpp"

// Logging
#include "log.hpp"

// Layered configuration
#include "config.hpp"

/// @namespace dotver_core
/// @brief Shared infrastructure for dotver
///
/// - **Error Handling**: Result<T> monadic error handling with typed error kinds
/// - **Logging**: spdlog-backed named loggers with console and file sinks
/// - **Configuration**: Layered settings from defaults, JSON, environment and argv
