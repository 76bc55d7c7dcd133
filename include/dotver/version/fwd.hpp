#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for dotver_version module

#include <cstdint>

namespace dotver_version {

// =============================================================================
// Literals
// =============================================================================

struct NumericLiteral;
struct TextLiteral;
enum class LiteralForm : std::uint8_t;
struct ClassifiedLiteral;

// =============================================================================
// Version
// =============================================================================

struct Extraction;
struct ParseOptions;
class Version;

} // namespace dotver_version
