#pragma once

/// @file compare.hpp
/// @brief Total order over versions, with coercion of foreign operands
///
/// Ordering rules:
/// 1. The shorter component sequence is compared as if padded with zeros
/// 2. The first differing component decides
/// 3. On a full tie, an alpha value sorts below a non-alpha value
///
/// Operands that are not yet a Version go through parse() first, so a plain
/// decimal is grouped: compare(parse("v0.95.0"), 0.96) is less, because 0.96
/// is [0, 960].

#include "fwd.hpp"
#include "literal.hpp"
#include "version.hpp"
#include <dotver/core/error.hpp>

#include <nlohmann/json.hpp>

#include <compare>
#include <type_traits>
#include <variant>
#include <vector>

namespace dotver_version {

// =============================================================================
// Ordered Capability
// =============================================================================

/// Marks types whose ordering is defined by a single compare(a, b) function
/// returning std::weak_ordering; relational operators derive from it.
template<typename T>
struct is_ordered : std::false_type {};

template<>
struct is_ordered<Version> : std::true_type {};

template<typename T>
inline constexpr bool is_ordered_v = is_ordered<T>::value;

// =============================================================================
// Comparison
// =============================================================================

/// Any value a Version can be compared against
using Operand = std::variant<Version, NumericLiteral, TextLiteral>;

/// Total order between two versions
[[nodiscard]] std::weak_ordering compare(const Version& a, const Version& b) noexcept;

/// Compare against an operand, parsing it first if needed
[[nodiscard]] dotver_core::Result<std::weak_ordering> compare(const Version& a, const Operand& b);

/// Compare against a native floating-point number
[[nodiscard]] dotver_core::Result<std::weak_ordering> compare(const Version& a, double b);

/// Compare against a native integer; the full 64-bit value reaches parse()
template<typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
[[nodiscard]] dotver_core::Result<std::weak_ordering> compare(const Version& a, T b) {
    return compare(a, Operand{NumericLiteral{b}});
}

/// Compare against a JSON value (strings and numbers only)
[[nodiscard]] dotver_core::Result<std::weak_ordering> compare(const Version& a, const nlohmann::json& b);

// =============================================================================
// Coercion
// =============================================================================

/// Reduce an operand to a Version
[[nodiscard]] dotver_core::Result<Version> coerce(const Operand& operand);

/// Reduce a JSON value to a Version
///
/// Strings and numbers parse like text and numeric literals. Null, booleans,
/// arrays, objects and binary values fail with UnsupportedCoercion.
[[nodiscard]] dotver_core::Result<Version> coerce(const nlohmann::json& value);

// =============================================================================
// Utilities
// =============================================================================

/// Sort ascending; equivalent values keep their relative order
void sort_versions(std::vector<Version>& versions);

} // namespace dotver_version
