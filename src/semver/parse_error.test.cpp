#include "./parse_error.hpp"

#include <catch2/catch.hpp>

TEST_CASE("Error code names") {
    CHECK(semver::name_of(semver::parse_errc::leading_zero) == "leading-zero");
    CHECK(semver::name_of(semver::parse_errc::trailing_characters) == "trailing-characters");
    CHECK(semver::name_of(semver::version_part::build) == "build metadata");
    CHECK(semver::name_of(semver::version_part::patch) == "patch version");
}

TEST_CASE("Render a parse error") {
    semver::parse_error err{6,
                            semver::parse_errc::empty_identifier,
                            semver::version_part::prerelease,
                            "expected alphanumeric identifier, found end of input"};
    CHECK(err.to_string()
          == "pre-release: expected alphanumeric identifier, found end of input (at position 6)");

    semver::invalid_version exc{"1.0.0-", err};
    CHECK(exc.offset() == 6);
    CHECK(exc.string() == "1.0.0-");
    CHECK(std::string(exc.what())
          == "Invalid semantic version \"1.0.0-\": pre-release: expected alphanumeric "
             "identifier, found end of input (at position 6)");
}
