#pragma once

/// @file version.hpp
/// @brief The Version value type and its parse/declare entry points
///
/// A Version unifies decimal versions ("1.002003") and dotted-decimal
/// versions ("v1.2.3"). Both parse to the same component sequence:
///
///   parse("1.002003").components() == parse("v1.2.3").components() == [1, 2, 3]
///
/// Values are immutable once built and safe to share across threads.

#include "fwd.hpp"
#include "literal.hpp"
#include "extract.hpp"
#include <dotver/core/error.hpp>
#include <dotver/core/config.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace dotver_version {

// =============================================================================
// Parse Options
// =============================================================================

/// Options shared by parse() and declare()
struct ParseOptions {
    /// Log a warning for single-component dotted literals such as "v7"
    bool warn_single_component = true;

    [[nodiscard]] static ParseOptions from_settings(const dotver_core::Settings& settings) {
        ParseOptions options;
        options.warn_single_component = settings.warn_single_component;
        return options;
    }
};

// =============================================================================
// Entry Points
// =============================================================================

/// Parse a literal; the classification decides is_qv()
[[nodiscard]] dotver_core::Result<Version> parse(const Literal& literal, const ParseOptions& options = {});
[[nodiscard]] dotver_core::Result<Version> parse(const std::string& text, const ParseOptions& options = {});

/// Parse a literal and force is_qv() to true
///
/// The component derivation is unchanged: declare("1.2") groups the fraction
/// exactly like parse("1.2") and yields [1, 200].
[[nodiscard]] dotver_core::Result<Version> declare(const Literal& literal, const ParseOptions& options = {});
[[nodiscard]] dotver_core::Result<Version> declare(const std::string& text, const ParseOptions& options = {});

/// Copy of an existing value with is_qv() forced to true
[[nodiscard]] Version declare(const Version& version);

// =============================================================================
// Version
// =============================================================================

/// Immutable version value
class Version {
public:
    /// Build a value by composition (no original literal)
    ///
    /// Fails with InvalidArgument when components is empty.
    [[nodiscard]] static dotver_core::Result<Version> from_components(
        std::vector<std::uint64_t> components, bool is_alpha = false, bool is_qv = true);

    /// Ordered components, most significant first (never empty)
    [[nodiscard]] const std::vector<std::uint64_t>& components() const noexcept { return m_components; }

    /// True if the source literal carried an alpha marker
    [[nodiscard]] bool is_alpha() const noexcept { return m_is_alpha; }

    /// True if the value is a dotted-decimal identity
    [[nodiscard]] bool is_qv() const noexcept { return m_is_qv; }

    /// Literal text this value was parsed from, if any
    [[nodiscard]] const std::optional<std::string>& original_literal() const noexcept { return m_original; }

    /// Canonical dotted form ("v1.2.3"), see format.hpp
    [[nodiscard]] std::string normal() const;

    /// Canonical decimal form ("1.002003"), see format.hpp
    [[nodiscard]] std::string numify() const;

    /// Closest rendering to the original literal, see format.hpp
    [[nodiscard]] std::string stringify() const;

    [[nodiscard]] std::string to_string() const { return stringify(); }

private:
    Version(std::vector<std::uint64_t> components, bool is_alpha, bool is_qv,
            std::optional<std::string> original)
        : m_components(std::move(components))
        , m_is_alpha(is_alpha)
        , m_is_qv(is_qv)
        , m_original(std::move(original)) {}

    friend dotver_core::Result<Version> parse(const Literal& literal, const ParseOptions& options);
    friend Version declare(const Version& version);

    std::vector<std::uint64_t> m_components;
    bool m_is_alpha = false;
    bool m_is_qv = false;
    std::optional<std::string> m_original;
};

// =============================================================================
// Ordering (Implemented in compare.cpp)
// =============================================================================

/// Three-way comparison, forwards to compare(const Version&, const Version&)
std::weak_ordering operator<=>(const Version& a, const Version& b) noexcept;

/// Structural equality: equal components (zero-padded) and alpha flag
bool operator==(const Version& a, const Version& b) noexcept;

/// Output stream operator (writes stringify())
inline std::ostream& operator<<(std::ostream& os, const Version& v) {
    return os << v.stringify();
}

} // namespace dotver_version

/// Hash specialization, consistent with operator==
template<>
struct std::hash<dotver_version::Version> {
    std::size_t operator()(const dotver_version::Version& v) const noexcept;
};
