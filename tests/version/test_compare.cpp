// dotver_version ordering and coercion tests

#include <catch2/catch_test_macros.hpp>
#include <dotver/version/version_module.hpp>

#include <compare>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace dotver_version;
using dotver_core::ErrorCode;
using dotver_core::VersionError;

namespace {

Version make(std::vector<std::uint64_t> components, bool alpha = false) {
    return Version::from_components(std::move(components), alpha).unwrap();
}

/// Every sequence of length 1-3 over {0, 1, 2}, with and without alpha
std::vector<Version> ordering_corpus() {
    std::vector<Version> corpus;
    for (bool alpha : {false, true}) {
        for (std::uint64_t a = 0; a < 3; ++a) {
            corpus.push_back(make({a}, alpha));
            for (std::uint64_t b = 0; b < 3; ++b) {
                corpus.push_back(make({a, b}, alpha));
                for (std::uint64_t c = 0; c < 3; ++c) {
                    corpus.push_back(make({a, b, c}, alpha));
                }
            }
        }
    }
    return corpus;
}

std::weak_ordering reversed(std::weak_ordering order) {
    if (order < 0) return std::weak_ordering::greater;
    if (order > 0) return std::weak_ordering::less;
    return std::weak_ordering::equivalent;
}

} // namespace

// =============================================================================
// Version vs Version
// =============================================================================

TEST_CASE("Compare components", "[version][compare]") {
    SECTION("first difference decides") {
        REQUIRE(compare(make({1, 2, 3}), make({1, 3, 0})) == std::weak_ordering::less);
        REQUIRE(compare(make({2}), make({1, 999, 999})) == std::weak_ordering::greater);
    }

    SECTION("shorter sequence is zero-padded") {
        REQUIRE(compare(make({1, 2}), make({1, 2, 0, 0})) == std::weak_ordering::equivalent);
        REQUIRE(compare(make({1, 2}), make({1, 2, 0, 1})) == std::weak_ordering::less);
    }

    SECTION("decimal and dotted forms of one version are equal") {
        REQUIRE(compare(*parse("1.002003"), *parse("v1.2.3")) == std::weak_ordering::equivalent);
        REQUIRE(*parse("1.5") == *parse("v1.500"));
    }

    SECTION("is_qv does not take part in ordering") {
        REQUIRE(make({1, 2}) == *Version::from_components({1, 2}, false, false));
    }
}

TEST_CASE("Compare alpha values", "[version][compare]") {
    Version alpha = make({1, 2, 3}, true);
    Version release = make({1, 2, 3});
    Version previous = make({1, 2, 2});

    REQUIRE(compare(alpha, release) == std::weak_ordering::less);
    REQUIRE(compare(release, alpha) == std::weak_ordering::greater);
    REQUIRE(compare(alpha, previous) == std::weak_ordering::greater);
    REQUIRE(compare(release, previous) == std::weak_ordering::greater);
    REQUIRE(compare(alpha, make({1, 2, 3}, true)) == std::weak_ordering::equivalent);

    SECTION("parsed alpha literals") {
        REQUIRE(*parse("v1.2_3") < *parse("v1.2.3"));
        REQUIRE(*parse("1.002_003") < *parse("1.002003"));
        REQUIRE(*parse("1.002_003") > *parse("1.002002"));
    }
}

TEST_CASE("Relational operators", "[version][compare]") {
    Version v100 = *parse("v1.0.0");
    Version v110 = *parse("v1.1.0");
    Version v200 = *parse("v2.0.0");

    REQUIRE(v100 < v110);
    REQUIRE(v110 <= v110);
    REQUIRE(v200 > v110);
    REQUIRE(v200 >= v100);
    REQUIRE(v100 != v110);
    REQUIRE(v100 == *parse("1"));
    REQUIRE((v100 <=> v200) == std::weak_ordering::less);
}

TEST_CASE("Ordering is a total order", "[version][compare]") {
    const auto corpus = ordering_corpus();

    for (const auto& a : corpus) {
        REQUIRE(compare(a, a) == std::weak_ordering::equivalent);

        for (const auto& b : corpus) {
            auto ab = compare(a, b);
            REQUIRE(ab == reversed(compare(b, a)));

            if (ab == 0) {
                REQUIRE(std::hash<Version>{}(a) == std::hash<Version>{}(b));
            }

            if (ab > 0) {
                continue;
            }
            for (const auto& c : corpus) {
                if (compare(b, c) <= 0 && compare(a, c) > 0) {
                    FAIL("ordering is not transitive");
                }
            }
        }
    }
}

// =============================================================================
// Coercion
// =============================================================================

TEST_CASE("Compare against non-version operands", "[version][compare]") {
    Version v095 = *parse("v0.95.0");

    SECTION("decimal number is grouped before comparing") {
        auto r = compare(v095, 0.96);
        REQUIRE(r.is_ok());
        REQUIRE(*r == std::weak_ordering::less);

        auto explicit_parse = compare(v095, *parse("v0.96.0"));
        REQUIRE(explicit_parse == std::weak_ordering::less);

        // 0.96 is [0, 960], so even v0.959 sorts below it
        REQUIRE(*compare(*parse("v0.959"), 0.96) == std::weak_ordering::less);
        REQUIRE(*compare(*parse("v0.960"), 0.96) == std::weak_ordering::equivalent);
    }

    SECTION("integers") {
        REQUIRE(*compare(*parse("v1.0.0"), 1) == std::weak_ordering::equivalent);
        REQUIRE(*compare(*parse("v1.0.0"), 2) == std::weak_ordering::less);
        REQUIRE(*compare(*parse("v3"), std::uint8_t(3)) == std::weak_ordering::equivalent);
    }

    SECTION("integers beyond double precision are exact") {
        Version big = *parse("9007199254740993");
        REQUIRE(*compare(big, std::int64_t{9007199254740993}) == std::weak_ordering::equivalent);
        REQUIRE(*compare(big, std::int64_t{9007199254740992}) == std::weak_ordering::greater);
        REQUIRE(*compare(big, 9007199254740994ULL) == std::weak_ordering::less);

        Version max = *parse("18446744073709551615");
        REQUIRE(*compare(max, std::numeric_limits<std::uint64_t>::max())
                == std::weak_ordering::equivalent);
    }

    SECTION("negative integer") {
        auto r = compare(v095, -3);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::ParseError);
    }

    SECTION("operands") {
        REQUIRE(*compare(v095, Operand{TextLiteral{"v0.95"}}) == std::weak_ordering::equivalent);
        REQUIRE(*compare(v095, Operand{NumericLiteral{1}}) == std::weak_ordering::less);
        REQUIRE(*compare(v095, Operand{*parse("v0.94")}) == std::weak_ordering::greater);
    }

    SECTION("text") {
        REQUIRE(*compare(v095, "0.095") == std::weak_ordering::equivalent);
        REQUIRE(*compare(v095, std::string("v0.95.1")) == std::weak_ordering::less);
    }

    SECTION("malformed text") {
        auto r = compare(v095, "not a version");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::ParseError);
    }

    SECTION("negative number") {
        auto r = compare(v095, -1.0);
        REQUIRE(r.is_err());
        REQUIRE(r.error().as<VersionError>()->kind == VersionError::Kind::MalformedLiteral);
    }
}

TEST_CASE("Coerce JSON values", "[version][compare]") {
    using nlohmann::json;

    SECTION("strings and numbers") {
        REQUIRE(coerce(json("v1.2.3"))->components() == std::vector<std::uint64_t>{1, 2, 3});
        REQUIRE(coerce(json(1.5))->components() == std::vector<std::uint64_t>{1, 500});
        REQUIRE(coerce(json(7))->components() == std::vector<std::uint64_t>{7});
        REQUIRE(coerce(json(7u))->components() == std::vector<std::uint64_t>{7});
        REQUIRE(coerce(json(std::numeric_limits<std::uint64_t>::max()))->components()
                == std::vector<std::uint64_t>{std::numeric_limits<std::uint64_t>::max()});
        REQUIRE_FALSE(coerce(json("v1.2.3"))->original_literal().value().empty());
    }

    SECTION("unsupported kinds") {
        for (const json& value : {json(nullptr), json(true), json::array({1, 2}), json::object()}) {
            CAPTURE(value.dump());
            auto r = coerce(value);
            REQUIRE(r.is_err());
            REQUIRE(r.error().code() == ErrorCode::NotSupported);
            REQUIRE(r.error().as<VersionError>()->kind == VersionError::Kind::UnsupportedCoercion);
        }
    }

    SECTION("comparison propagates the coercion failure") {
        auto r = compare(*parse("v1.0.0"), json::array());
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotSupported);
    }
}

TEST_CASE("Coerce operands", "[version][compare]") {
    Version v = *parse("v1.2.3");
    REQUIRE(coerce(Operand{v})->original_literal() == v.original_literal());
    REQUIRE(coerce(Operand{TextLiteral{"1.5"}})->is_qv() == false);
    REQUIRE(coerce(Operand{TextLiteral{"x"}}).is_err());
}

// =============================================================================
// Sorting
// =============================================================================

TEST_CASE("Sort versions", "[version][compare]") {
    std::vector<Version> versions{
        *parse("v1.10.0"),
        *parse("1.002"),
        *parse("v1.2_0"),
        *parse("v1.2.0"),
        *parse("0.96"),
        *parse("v1.2"),
    };

    sort_versions(versions);

    std::vector<std::string> rendered;
    for (const auto& v : versions) {
        rendered.push_back(v.stringify());
    }

    // Equal values keep their input order
    REQUIRE(rendered == std::vector<std::string>{"0.96", "v1.2_0", "1.002", "v1.2.0", "v1.2", "v1.10.0"});
}
