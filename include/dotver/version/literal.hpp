#pragma once

/// @file literal.hpp
/// @brief Version literal input types and the literal classifier
///
/// A literal is either a native number or a piece of text. Both are reduced
/// to text and classified into one of two grammars:
/// - DirectDotted: "v1.2.3", "1.2.3", "v1.2" (leading v, or two or more dots)
/// - DecimalGrouped: "1", "1.002003", "1.002_03" (at most one dot)

#include "fwd.hpp"
#include <dotver/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace dotver_version {

// =============================================================================
// Literal Inputs
// =============================================================================

/// A native decimal number (integer or floating point)
struct NumericLiteral {
    std::variant<std::int64_t, std::uint64_t, double> value;

    template<typename T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>, int> = 0>
    NumericLiteral(T v) : value(static_cast<std::int64_t>(v)) {}

    template<typename T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T>
                                          && !std::is_same_v<T, bool>, int> = 0>
    NumericLiteral(T v) : value(static_cast<std::uint64_t>(v)) {}

    template<typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    NumericLiteral(T v) : value(static_cast<double>(v)) {}

    /// Render as decimal text
    ///
    /// Integers print in plain decimal. Doubles print in the shortest
    /// fixed-notation form that round-trips, so 0.96 becomes "0.96" and
    /// 1.10 becomes "1.1". Negative and non-finite values are malformed.
    [[nodiscard]] dotver_core::Result<std::string> to_text() const;
};

/// A textual literal
struct TextLiteral {
    std::string text;

    explicit TextLiteral(std::string t) : text(std::move(t)) {}
};

/// Closed literal input type consumed by the classifier
using Literal = std::variant<NumericLiteral, TextLiteral>;

/// Reduce a literal to the text the classifier sees
[[nodiscard]] dotver_core::Result<std::string> literal_text(const Literal& literal);

// =============================================================================
// Classification
// =============================================================================

/// Grammar selected for a literal
enum class LiteralForm : std::uint8_t {
    DirectDotted,    ///< Components taken verbatim from each dotted segment
    DecimalGrouped,  ///< Fraction split into 3-digit groups
};

[[nodiscard]] const char* literal_form_name(LiteralForm form);

/// Result of classifying a literal
struct ClassifiedLiteral {
    LiteralForm form = LiteralForm::DecimalGrouped;
    bool has_v_prefix = false;
    std::string text;                          ///< Literal text, prefix included
    std::string body;                          ///< Digits and separators after the prefix
    std::size_t dot_count = 0;
    std::optional<std::size_t> alpha_position; ///< Index of '_' within body

    [[nodiscard]] bool is_alpha() const noexcept { return alpha_position.has_value(); }

    /// Offset of body[i] within text
    [[nodiscard]] std::size_t text_offset(std::size_t body_index) const noexcept {
        return body_index + (has_v_prefix ? 1 : 0);
    }
};

/// Classify literal text
///
/// Fails with VersionError::Kind::MalformedLiteral when there are no digits,
/// a separator lacks digits on either side, a 'v' appears anywhere but the
/// start, the alpha marker is duplicated or outside the final segment, or any
/// other character is present. Whitespace is not skipped.
[[nodiscard]] dotver_core::Result<ClassifiedLiteral> classify(const std::string& text);

/// Classify any literal
[[nodiscard]] dotver_core::Result<ClassifiedLiteral> classify(const Literal& literal);

} // namespace dotver_version
