/// @file literal.cpp
/// @brief Literal rendering and classification

#include <dotver/version/literal.hpp>

#include <array>
#include <charconv>
#include <cmath>

namespace dotver_version {

using dotver_core::Err;
using dotver_core::Ok;
using dotver_core::Result;
using dotver_core::VersionError;

namespace {

[[nodiscard]] bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

} // anonymous namespace

// =============================================================================
// Literal Inputs
// =============================================================================

Result<std::string> NumericLiteral::to_text() const {
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        if (*integer < 0) {
            return Err<std::string>(VersionError::malformed(std::to_string(*integer),
                "negative numbers are not versions"));
        }
        return Ok(std::to_string(*integer));
    }
    if (const auto* natural = std::get_if<std::uint64_t>(&value)) {
        return Ok(std::to_string(*natural));
    }

    double number = std::get<double>(value);
    if (!std::isfinite(number)) {
        return Err<std::string>(VersionError::malformed(std::isnan(number) ? "nan" : "inf",
            "non-finite numbers are not versions"));
    }

    // Fixed notation of the largest finite double needs 309 integral digits
    std::array<char, 512> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), number,
                                   std::chars_format::fixed);
    if (ec != std::errc{}) {
        return Err<std::string>(VersionError::malformed(std::to_string(number),
            "number cannot be rendered as decimal text"));
    }

    std::string text(buffer.data(), end);
    if (std::signbit(number) && number != 0.0) {
        return Err<std::string>(VersionError::malformed(text, "negative numbers are not versions"));
    }
    if (std::signbit(number)) {
        // -0.0
        text = "0";
    }
    return Ok(std::move(text));
}

Result<std::string> literal_text(const Literal& literal) {
    if (const auto* numeric = std::get_if<NumericLiteral>(&literal)) {
        return numeric->to_text();
    }
    return Ok(std::get<TextLiteral>(literal).text);
}

// =============================================================================
// Classification
// =============================================================================

const char* literal_form_name(LiteralForm form) {
    switch (form) {
        case LiteralForm::DirectDotted: return "DirectDotted";
        case LiteralForm::DecimalGrouped: return "DecimalGrouped";
        default: return "Unknown";
    }
}

Result<ClassifiedLiteral> classify(const std::string& text) {
    ClassifiedLiteral result;
    result.text = text;

    const std::string& t = result.text;
    if (t.empty()) {
        return Err<ClassifiedLiteral>(VersionError::malformed(t, "no digits"));
    }

    result.has_v_prefix = (t.front() == 'v' || t.front() == 'V');
    result.body = t.substr(result.has_v_prefix ? 1 : 0);

    const std::string& body = result.body;
    if (body.empty()) {
        return Err<ClassifiedLiteral>(VersionError::malformed(t, "no digits"));
    }

    std::optional<std::size_t> last_dot;
    for (std::size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (is_digit(c)) {
            continue;
        }

        std::size_t offset = result.text_offset(i);
        if (c == '.') {
            ++result.dot_count;
            last_dot = i;
        } else if (c == '_') {
            if (result.alpha_position) {
                return Err<ClassifiedLiteral>(VersionError::malformed_at(t, offset,
                    "duplicate alpha marker"));
            }
            result.alpha_position = i;
        } else if (c == 'v' || c == 'V') {
            return Err<ClassifiedLiteral>(VersionError::malformed_at(t, offset,
                "'v' is only allowed as the first character"));
        } else {
            return Err<ClassifiedLiteral>(VersionError::malformed_at(t, offset,
                std::string("unexpected character '") + c + "'"));
        }

        // Every separator needs digits on both sides
        bool digit_before = i > 0 && is_digit(body[i - 1]);
        bool digit_after = i + 1 < body.size() && is_digit(body[i + 1]);
        if (!digit_before || !digit_after) {
            return Err<ClassifiedLiteral>(VersionError::malformed_at(t, offset,
                std::string("'") + c + "' must have digits on both sides"));
        }
    }

    if (result.alpha_position) {
        if (!last_dot) {
            return Err<ClassifiedLiteral>(VersionError::malformed_at(t,
                result.text_offset(*result.alpha_position),
                "alpha marker must follow a '.' separator"));
        }
        if (*result.alpha_position < *last_dot) {
            return Err<ClassifiedLiteral>(VersionError::malformed_at(t,
                result.text_offset(*result.alpha_position),
                "alpha marker is only allowed in the final segment"));
        }
    }

    result.form = (result.has_v_prefix || result.dot_count >= 2)
        ? LiteralForm::DirectDotted
        : LiteralForm::DecimalGrouped;

    return Ok(std::move(result));
}

Result<ClassifiedLiteral> classify(const Literal& literal) {
    auto text = literal_text(literal);
    if (!text) {
        return Err<ClassifiedLiteral>(text.error());
    }
    return classify(*text);
}

} // namespace dotver_version
