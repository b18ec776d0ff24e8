#include "./parse_error.hpp"

#include <fmt/core.h>

#include <utility>

using namespace semver;

std::string_view semver::name_of(parse_errc ec) noexcept {
    switch (ec) {
    case parse_errc::unexpected_end:
        return "unexpected-end";
    case parse_errc::unexpected_char:
        return "unexpected-char";
    case parse_errc::leading_zero:
        return "leading-zero";
    case parse_errc::out_of_range:
        return "out-of-range";
    case parse_errc::missing_separator:
        return "missing-separator";
    case parse_errc::empty_identifier:
        return "empty-identifier";
    case parse_errc::trailing_characters:
        return "trailing-characters";
    }
    return "unknown";
}

std::string_view semver::name_of(version_part p) noexcept {
    switch (p) {
    case version_part::major:
        return "major version";
    case version_part::minor:
        return "minor version";
    case version_part::patch:
        return "patch version";
    case version_part::prerelease:
        return "pre-release";
    case version_part::build:
        return "build metadata";
    }
    return "version";
}

std::string parse_error::to_string() const {
    return fmt::format("{}: {} (at position {})", name_of(part), message, offset);
}

invalid_version::invalid_version(std::string string, parse_error err)
    : runtime_error(fmt::format("Invalid semantic version \"{}\": {}", string, err.to_string()))
    , _string(std::move(string))
    , _error(std::move(err)) {}
