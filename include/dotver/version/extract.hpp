#pragma once

/// @file extract.hpp
/// @brief Component extraction for classified literals

#include "fwd.hpp"
#include "literal.hpp"
#include <dotver/core/error.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace dotver_version {

/// Canonical component sequence derived from a literal
struct Extraction {
    std::vector<std::uint64_t> components;
    bool is_alpha = false;
};

/// Produce the ordered component sequence for a classified literal
///
/// DirectDotted: every '.' and the alpha marker split segments, each segment
/// is one component ("v1.2.3_4" -> [1, 2, 3, 4]).
///
/// DecimalGrouped: the integer part is the first component; the fraction,
/// with the alpha marker removed, is right-padded with '0' to a multiple of
/// three digits and split into 3-digit groups ("1.0023" -> [1, 2, 300]).
///
/// Fails with MalformedLiteral when a digit run exceeds 64 bits.
[[nodiscard]] dotver_core::Result<Extraction> extract_components(const ClassifiedLiteral& literal);

/// Split a fractional digit run into 3-digit groups (right-padded with '0')
[[nodiscard]] std::vector<std::uint64_t> group_fraction(std::string_view digits);

} // namespace dotver_version
