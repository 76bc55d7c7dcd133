#pragma once

/// @file version_module.hpp
/// @brief Main include file for dotver_version module
///
/// Data flows one way: literal -> classify() -> extract_components() ->
/// Version; Versions feed compare() pairwise and the formatters singly.

#include "fwd.hpp"
#include "literal.hpp"
#include "extract.hpp"
#include "version.hpp"
#include "compare.hpp"
#include "format.hpp"
#include "validate.hpp"

/// @namespace dotver_version
/// @brief Decimal and dotted-decimal versions behind one value type
///
/// Example usage:
/// @code
/// auto a = dotver_version::parse("1.002003");     // [1, 2, 3], decimal
/// auto b = dotver_version::parse("v1.2.3");       // [1, 2, 3], dotted
/// bool same = *a == *b;                          // true
/// std::string n = a->normal();                   // "v1.2.3"
/// std::string d = b->numify();                   // "1.002003"
/// @endcode
