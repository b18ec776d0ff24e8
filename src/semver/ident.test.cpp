#include <semver/ident.hpp>

#include <catch2/catch.hpp>

#include <cstdint>

TEST_CASE("Parse identifiers") {
    struct case_ {
        std::string        str;
        semver::ident_kind expect_kind;
    };
    case_ cases[] = {
        {"foo", semver::ident_kind::alphanumeric},
        {"12", semver::ident_kind::numeric},
        {"03412", semver::ident_kind::digits},
        {"0", semver::ident_kind::numeric},
        {"00", semver::ident_kind::digits},
        {"-", semver::ident_kind::alphanumeric},
        {"-1", semver::ident_kind::numeric},
        {"-0", semver::ident_kind::numeric},
        {"-007", semver::ident_kind::digits},
        {"--1", semver::ident_kind::alphanumeric},
        {"1-", semver::ident_kind::alphanumeric},
        {"x-1-y", semver::ident_kind::alphanumeric},
        // Does not fit in a signed 64-bit integer
        {"9223372036854775808", semver::ident_kind::alphanumeric},
        {"123456789012345678901234567890", semver::ident_kind::alphanumeric},
    };
    for (auto [str, expect] : cases) {
        INFO("Checking parsing of '" << str << "'");
        auto id = semver::ident(str);
        CHECK(id.string() == str);
        CHECK(id.kind() == expect);
    }
}

TEST_CASE("Numeric identifier values") {
    CHECK(semver::ident("42").numeric_value() == 42);
    CHECK(semver::ident("007").numeric_value() == 7);
    CHECK(semver::ident("-1").numeric_value() == -1);
    CHECK(semver::ident("9223372036854775807").numeric_value() == INT64_MAX);
    CHECK(semver::ident("-9223372036854775808").numeric_value() == INT64_MIN);
    CHECK_FALSE(semver::ident("9223372036854775808").numeric_value());
    CHECK_FALSE(semver::ident("18446744073709551615").numeric_value());
    CHECK_FALSE(semver::ident("beta").numeric_value());
}

TEST_CASE("Invalid identifiers") {
#define BAD_IDENT(x) CHECK_THROWS_AS(semver::ident(x), semver::invalid_version)
    BAD_IDENT("");
    BAD_IDENT("=");
    BAD_IDENT("_a");
    BAD_IDENT("asdf-_");
    BAD_IDENT(".");
    BAD_IDENT("  ");
    BAD_IDENT("124a[");
#undef BAD_IDENT
}

TEST_CASE("Invalid identifier diagnostics") {
    try {
        semver::ident("asdf-_", semver::version_part::build);
        FAIL("Identifier was accepted");
    } catch (const semver::invalid_version& e) {
        CHECK(e.offset() == 5);
        CHECK(e.code() == semver::parse_errc::trailing_characters);
        CHECK(e.part() == semver::version_part::build);
    }

    try {
        semver::ident("");
        FAIL("Identifier was accepted");
    } catch (const semver::invalid_version& e) {
        CHECK(e.offset() == 0);
        CHECK(e.code() == semver::parse_errc::empty_identifier);
        CHECK(e.part() == semver::version_part::prerelease);
    }

    try {
        semver::ident("=");
        FAIL("Identifier was accepted");
    } catch (const semver::invalid_version& e) {
        CHECK(e.offset() == 0);
        CHECK(e.code() == semver::parse_errc::unexpected_char);
        CHECK(e.error().message == "expected alphanumeric identifier, found '='");
    }
}

TEST_CASE("Ident comparison") {
    using semver::order;
    struct comp_test {
        std::string lhs;
        std::string rhs;
        order       expect_ordering;
    };
    comp_test comparisons[] = {
        {"foo", "bar", order::greater},
        {"foo", "foo", order::equivalent},
        {"bar", "foo", order::less},
        {"12", "333", order::less},
        {"2", "11", order::less},
        {"fooood", "3", order::greater},
        {"0", "0", order::equivalent},
        {"34", "f", order::less},
        {"99999", "-", order::less},
        {"aaaaaaaaaaa", "z", order::less},
        {"Z", "a", order::less},
        {"007", "7", order::equivalent},
        {"010", "9", order::greater},
        {"123456789012345678901234567890", "5", order::greater},
        // Negative integers are numbers too
        {"-1", "0", order::less},
        {"-2", "-1", order::less},
        {"-0", "0", order::equivalent},
        {"-1", "a", order::less},
        // Past the signed 64-bit range, compared as text
        {"9223372036854775807", "9223372036854775806", order::greater},
        {"9223372036854775808", "9223372036854775807", order::greater},
        {"9223372036854775808", "1", order::greater},
        {"9223372036854775808", "alpha", order::less},
    };
    for (auto [lhs, rhs, expect] : comparisons) {
        auto lhs_id = semver::ident(lhs);
        auto rhs_id = semver::ident(rhs);
        INFO("Comparing '" << lhs << "' to '" << rhs << "'");
        auto result = semver::compare(lhs_id, rhs_id);
        CHECK(result == expect);
        CHECK(semver::compare(rhs_id, lhs_id) == semver::reverse(expect));
    }
}

TEST_CASE("Identifier equality is textual") {
    CHECK(semver::ident("7") == semver::ident("7"));
    CHECK_FALSE(semver::ident("007") == semver::ident("7"));
    CHECK_FALSE(semver::ident("007") < semver::ident("7"));
    CHECK(semver::ident("007") <= semver::ident("7"));
}

TEST_CASE("Parse dotted sequence") {
    struct case_ {
        std::string              str;
        std::vector<std::string> expected;
    };
    case_ cases[] = {
        {"foo", {"foo"}},
        {"foo.bar", {"foo", "bar"}},
        {"1.2-3.x", {"1", "2-3", "x"}},
    };
    for (auto& [str, expected] : cases) {
        INFO("Parsing dotted-ident-sequence '" << str << "'");
        auto actual = semver::ident::parse_dotted_seq(str);
        REQUIRE(actual.size() == expected.size());
        for (auto i = 0u; i < actual.size(); ++i) {
            CHECK(actual[i].string() == expected[i]);
        }
        CHECK(semver::join_idents(actual) == str);
    }
}

TEST_CASE("Invalid dotted sequence") {
    struct case_ {
        std::string_view   str;
        std::size_t        offset;
        semver::parse_errc code;
    };
    case_ bad_seqs[] = {
        {"", 0, semver::parse_errc::empty_identifier},
        {".", 0, semver::parse_errc::empty_identifier},
        {".foo", 0, semver::parse_errc::empty_identifier},
        {"foo.bar.", 8, semver::parse_errc::empty_identifier},
        {"foo..bar", 4, semver::parse_errc::empty_identifier},
        {"foo.b@r", 5, semver::parse_errc::trailing_characters},
    };
    for (auto [s, offset, code] : bad_seqs) {
        INFO("Checking bad ident sequence '" << s << "'");
        try {
            semver::ident::parse_dotted_seq(s);
            FAIL_CHECK("Sequence was accepted");
        } catch (const semver::invalid_version& e) {
            CHECK(e.offset() == offset);
            CHECK(e.code() == code);
        }
    }
}
