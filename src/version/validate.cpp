/// @file validate.cpp
/// @brief Lax and strict literal validation

#include <dotver/version/validate.hpp>
#include <dotver/version/version.hpp>

#include <regex>

namespace dotver_version {

bool is_lax(const std::string& text) {
    ParseOptions quiet;
    quiet.warn_single_component = false;
    return parse(text, quiet).is_ok();
}

bool is_strict(const std::string& text) {
    static const std::regex strict_decimal(R"(^(0|[1-9][0-9]*)(\.[0-9]+)?$)");
    static const std::regex strict_dotted(R"(^v(0|[1-9][0-9]*)(\.[0-9]{1,3}){2,}$)");

    return std::regex_match(text, strict_decimal) || std::regex_match(text, strict_dotted);
}

} // namespace dotver_version
