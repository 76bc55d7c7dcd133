#pragma once

/// @file validate.hpp
/// @brief Literal validation predicates

#include "fwd.hpp"

#include <string>

namespace dotver_version {

/// True if parse() accepts the text
[[nodiscard]] bool is_lax(const std::string& text);

/// True if the text is in the strict grammar
///
/// Strict decimal: "0" or a number without leading zeros, optionally
/// followed by '.' and a digit run ("1.002003").
/// Strict dotted: 'v', an integer without leading zeros, then two or more
/// '.'-separated components of 1-3 digits ("v1.2.3").
/// No alpha marker, no surrounding whitespace, no uppercase 'V'.
[[nodiscard]] bool is_strict(const std::string& text);

} // namespace dotver_version
