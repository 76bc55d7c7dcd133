/// @file version.cpp
/// @brief Version construction: parse, declare and composition

#include <dotver/version/version.hpp>
#include <dotver/version/format.hpp>
#include <dotver/core/log.hpp>

namespace dotver_version {

using dotver_core::Err;
using dotver_core::Error;
using dotver_core::ErrorCode;
using dotver_core::Ok;
using dotver_core::Result;

// =============================================================================
// Entry Points
// =============================================================================

Result<Version> parse(const Literal& literal, const ParseOptions& options) {
    auto classified = classify(literal);
    if (!classified) {
        dotver_core::version_logger()->debug("parse failed: {}", classified.error().message());
        return Err<Version>(classified.error());
    }

    auto extracted = extract_components(*classified);
    if (!extracted) {
        dotver_core::version_logger()->debug("parse failed: {}", extracted.error().message());
        return Err<Version>(extracted.error());
    }

    bool dotted = classified->form == LiteralForm::DirectDotted;
    if (dotted && extracted->components.size() == 1 && options.warn_single_component) {
        dotver_core::version_logger()->warn(
            "Version literal '{}' has a single component; prefer the dotted form '{}.0.0'",
            classified->text, classified->text);
    }

    dotver_core::version_logger()->trace("parsed '{}' as {} with {} components",
        classified->text, literal_form_name(classified->form), extracted->components.size());

    return Ok(Version(std::move(extracted->components), extracted->is_alpha, dotted,
                      std::move(classified->text)));
}

Result<Version> parse(const std::string& text, const ParseOptions& options) {
    return parse(Literal{TextLiteral{text}}, options);
}

Result<Version> declare(const Literal& literal, const ParseOptions& options) {
    auto parsed = parse(literal, options);
    if (!parsed) {
        return parsed;
    }
    return Ok(declare(*parsed));
}

Result<Version> declare(const std::string& text, const ParseOptions& options) {
    return declare(Literal{TextLiteral{text}}, options);
}

Version declare(const Version& version) {
    return Version(version.m_components, version.m_is_alpha, true, version.m_original);
}

// =============================================================================
// Version
// =============================================================================

Result<Version> Version::from_components(std::vector<std::uint64_t> components, bool is_alpha, bool is_qv) {
    if (components.empty()) {
        return Err<Version>(Error(ErrorCode::InvalidArgument, "A version needs at least one component"));
    }
    return Ok(Version(std::move(components), is_alpha, is_qv, std::nullopt));
}

std::string Version::normal() const {
    return dotver_version::normal(*this);
}

std::string Version::numify() const {
    return dotver_version::numify(*this);
}

std::string Version::stringify() const {
    return dotver_version::stringify(*this);
}

} // namespace dotver_version

std::size_t std::hash<dotver_version::Version>::operator()(const dotver_version::Version& v) const noexcept {
    const auto& components = v.components();

    // Trailing zero components do not affect equality
    std::size_t significant = components.size();
    while (significant > 1 && components[significant - 1] == 0) {
        --significant;
    }

    std::size_t seed = std::hash<bool>{}(v.is_alpha());
    for (std::size_t i = 0; i < significant; ++i) {
        seed ^= std::hash<std::uint64_t>{}(components[i]) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}
