/// @file format.cpp
/// @brief normal(), numify() and stringify() renderings

#include <dotver/version/format.hpp>
#include <dotver/version/version.hpp>
#include <dotver/core/log.hpp>

namespace dotver_version {

namespace {

/// Components always shown by normal()
constexpr std::size_t NORMAL_MIN_COMPONENTS = 3;

/// Digits each non-leading component occupies in numify()
constexpr std::size_t DECIMAL_GROUP_WIDTH = 3;

std::string fallback(const Version& version) {
    return version.is_qv() ? normal(version) : numify(version);
}

} // anonymous namespace

std::string normal(const Version& version) {
    std::vector<std::uint64_t> components = version.components();
    if (components.size() < NORMAL_MIN_COMPONENTS) {
        components.resize(NORMAL_MIN_COMPONENTS, 0);
    }

    std::string out = "v";
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (i > 0) {
            bool alpha_slot = version.is_alpha() && i + 1 == components.size();
            out += alpha_slot ? '_' : '.';
        }
        out += std::to_string(components[i]);
    }
    return out;
}

std::string numify(const Version& version) {
    const auto& components = version.components();

    std::string fraction;
    for (std::size_t i = 1; i < components.size(); ++i) {
        std::string group = std::to_string(components[i]);
        if (group.size() > DECIMAL_GROUP_WIDTH) {
            dotver_core::version_logger()->warn(
                "component {} of {} exceeds {} digits; numify() is lossy",
                i, normal(version), DECIMAL_GROUP_WIDTH);
        } else {
            group.insert(0, DECIMAL_GROUP_WIDTH - group.size(), '0');
        }
        fraction += group;
    }

    auto last = fraction.find_last_not_of('0');
    fraction.erase(last == std::string::npos ? 0 : last + 1);

    std::string out = std::to_string(components.front());
    if (!fraction.empty()) {
        out += '.';
        out += fraction;
    }
    return out;
}

std::string stringify(const Version& version) {
    const auto& original = version.original_literal();
    if (!original) {
        return fallback(version);
    }

    ParseOptions quiet;
    quiet.warn_single_component = false;

    auto reparsed = parse(*original, quiet);
    if (!reparsed
        || reparsed->components() != version.components()
        || reparsed->is_alpha() != version.is_alpha()
        || reparsed->is_qv() != version.is_qv()) {
        dotver_core::version_logger()->trace("stringify: '{}' no longer matches the value, falling back",
                                             *original);
        return fallback(version);
    }

    std::string out = *original;
    if (!out.empty() && out.front() == 'V') {
        out.front() = 'v';
    }
    return out;
}

} // namespace dotver_version
