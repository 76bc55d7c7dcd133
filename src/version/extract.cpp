/// @file extract.cpp
/// @brief Component extraction for both literal grammars

#include <dotver/version/extract.hpp>

#include <charconv>
#include <string>

namespace dotver_version {

using dotver_core::Err;
using dotver_core::Ok;
using dotver_core::Result;
using dotver_core::VersionError;

namespace {

/// Digits per fractional group in the decimal form
constexpr std::size_t GROUP_WIDTH = 3;

Result<std::uint64_t> parse_digits(const ClassifiedLiteral& literal, std::size_t begin, std::size_t end) {
    const char* first = literal.body.data() + begin;
    const char* last = literal.body.data() + end;

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc::result_out_of_range) {
        return Err<std::uint64_t>(VersionError::malformed_at(literal.text, literal.text_offset(begin),
            "component does not fit in 64 bits"));
    }
    if (ec != std::errc{} || ptr != last) {
        return Err<std::uint64_t>(VersionError::malformed_at(literal.text, literal.text_offset(begin),
            "expected a run of digits"));
    }
    return Ok(value);
}

Result<Extraction> extract_dotted(const ClassifiedLiteral& literal) {
    Extraction result;
    result.is_alpha = literal.is_alpha();

    // The alpha marker splits segments exactly like '.'
    const std::string& body = literal.body;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= body.size(); ++i) {
        if (i < body.size() && body[i] != '.' && body[i] != '_') {
            continue;
        }
        auto component = parse_digits(literal, start, i);
        if (!component) {
            return Err<Extraction>(component.error());
        }
        result.components.push_back(*component);
        start = i + 1;
    }

    return Ok(std::move(result));
}

Result<Extraction> extract_decimal(const ClassifiedLiteral& literal) {
    Extraction result;
    result.is_alpha = literal.is_alpha();

    const std::string& body = literal.body;
    std::size_t dot = body.find('.');
    std::size_t integer_end = dot == std::string::npos ? body.size() : dot;

    auto integer = parse_digits(literal, 0, integer_end);
    if (!integer) {
        return Err<Extraction>(integer.error());
    }
    result.components.push_back(*integer);

    if (dot != std::string::npos) {
        std::string fraction;
        fraction.reserve(body.size() - dot);
        for (std::size_t i = dot + 1; i < body.size(); ++i) {
            if (body[i] != '_') {
                fraction.push_back(body[i]);
            }
        }
        for (std::uint64_t group : group_fraction(fraction)) {
            result.components.push_back(group);
        }
    }

    return Ok(std::move(result));
}

} // anonymous namespace

std::vector<std::uint64_t> group_fraction(std::string_view digits) {
    std::vector<std::uint64_t> groups;
    groups.reserve((digits.size() + GROUP_WIDTH - 1) / GROUP_WIDTH);

    for (std::size_t start = 0; start < digits.size(); start += GROUP_WIDTH) {
        std::uint64_t group = 0;
        for (std::size_t i = start; i < start + GROUP_WIDTH; ++i) {
            char digit = i < digits.size() ? digits[i] : '0';
            group = group * 10 + static_cast<std::uint64_t>(digit - '0');
        }
        groups.push_back(group);
    }

    return groups;
}

Result<Extraction> extract_components(const ClassifiedLiteral& literal) {
    switch (literal.form) {
        case LiteralForm::DirectDotted:
            return extract_dotted(literal);
        case LiteralForm::DecimalGrouped:
            return extract_decimal(literal);
        default:
            return Err<Extraction>(VersionError::malformed(literal.text, "unknown literal form"));
    }
}

} // namespace dotver_version
