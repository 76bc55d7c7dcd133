/// @file compare.cpp
/// @brief Version ordering and operand coercion

#include <dotver/version/compare.hpp>
#include <dotver/core/log.hpp>

#include <algorithm>

namespace dotver_version {

using dotver_core::Err;
using dotver_core::Ok;
using dotver_core::Result;
using dotver_core::VersionError;

static_assert(is_ordered_v<Version>, "Version must provide compare()");

// =============================================================================
// Comparison
// =============================================================================

std::weak_ordering compare(const Version& a, const Version& b) noexcept {
    const auto& lhs = a.components();
    const auto& rhs = b.components();
    const std::size_t n = std::max(lhs.size(), rhs.size());

    for (std::size_t i = 0; i < n; ++i) {
        std::uint64_t x = i < lhs.size() ? lhs[i] : 0;
        std::uint64_t y = i < rhs.size() ? rhs[i] : 0;
        if (x != y) {
            return x < y ? std::weak_ordering::less : std::weak_ordering::greater;
        }
    }

    // Alpha is a pre-release of the same components
    if (a.is_alpha() != b.is_alpha()) {
        return a.is_alpha() ? std::weak_ordering::less : std::weak_ordering::greater;
    }
    return std::weak_ordering::equivalent;
}

Result<std::weak_ordering> compare(const Version& a, const Operand& b) {
    auto other = coerce(b);
    if (!other) {
        return Err<std::weak_ordering>(other.error());
    }
    return Ok(compare(a, *other));
}

Result<std::weak_ordering> compare(const Version& a, double b) {
    return compare(a, Operand{NumericLiteral{b}});
}

Result<std::weak_ordering> compare(const Version& a, const nlohmann::json& b) {
    auto other = coerce(b);
    if (!other) {
        return Err<std::weak_ordering>(other.error());
    }
    return Ok(compare(a, *other));
}

std::weak_ordering operator<=>(const Version& a, const Version& b) noexcept {
    return compare(a, b);
}

bool operator==(const Version& a, const Version& b) noexcept {
    return compare(a, b) == 0;
}

// =============================================================================
// Coercion
// =============================================================================

Result<Version> coerce(const Operand& operand) {
    if (const auto* version = std::get_if<Version>(&operand)) {
        return Ok(*version);
    }
    if (const auto* numeric = std::get_if<NumericLiteral>(&operand)) {
        return parse(Literal{*numeric});
    }
    return parse(Literal{std::get<TextLiteral>(operand)});
}

Result<Version> coerce(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::string:
            return parse(value.get<std::string>());
        case nlohmann::json::value_t::number_integer:
            return parse(Literal{NumericLiteral{value.get<std::int64_t>()}});
        case nlohmann::json::value_t::number_unsigned:
            return parse(Literal{NumericLiteral{value.get<std::uint64_t>()}});
        case nlohmann::json::value_t::number_float:
            return parse(Literal{NumericLiteral{value.get<double>()}});
        default:
            break;
    }

    dotver_core::version_logger()->debug("cannot coerce JSON {} to a version", value.type_name());
    return Err<Version>(VersionError::unsupported_coercion(value.type_name()));
}

// =============================================================================
// Utilities
// =============================================================================

void sort_versions(std::vector<Version>& versions) {
    std::stable_sort(versions.begin(), versions.end(),
        [](const Version& a, const Version& b) { return compare(a, b) < 0; });
}

} // namespace dotver_version
