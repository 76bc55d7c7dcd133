#pragma once

/// @file format.hpp
/// @brief Textual projections of a Version

#include "fwd.hpp"

#include <string>

namespace dotver_version {

/// Canonical dotted form
///
/// "v" followed by the components joined with '.', padded with zero
/// components to at least three. An alpha value replaces the separator
/// before the last emitted component with '_' ("v1.2_3"), which keeps the
/// output inside the literal grammar so that parse(normal(v)) round-trips.
///
/// The last emitted component may be a padding zero: [1, 500] with alpha
/// renders "v1.500_0", not "v1_500.0". The marker never lands before a
/// non-final segment because the classifier rejects that form.
[[nodiscard]] std::string normal(const Version& version);

/// Canonical decimal form
///
/// First component, then '.', then every later component zero-padded to
/// three digits; trailing '0's of the fraction are dropped and an empty
/// fraction leaves the bare integer. The alpha marker is not rendered.
[[nodiscard]] std::string numify(const Version& version);

/// Closest rendering to the original literal
///
/// Returns the original literal (with a leading 'V' lowered to 'v') when it
/// re-parses to the same components and flags. Otherwise falls back to
/// normal() for dotted values and numify() for decimal ones.
[[nodiscard]] std::string stringify(const Version& version);

} // namespace dotver_version
