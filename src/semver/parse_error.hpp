#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace semver {

/**
 * @brief The grammar violations that the version parser can report.
 */
enum class parse_errc {
    // Input ended where a numeric identifier was expected
    unexpected_end,
    // A numeric identifier was expected, but some other character was found
    unexpected_char,
    // A numeric identifier has more than one digit and starts with a zero
    leading_zero,
    // A numeric identifier is too large to be represented
    out_of_range,
    // The '.' between two version core components is missing
    missing_separator,
    // An identifier in a pre-release or build section is empty
    empty_identifier,
    // Characters remain after a complete version string
    trailing_characters,
};

/**
 * @brief The section of a version string that was being parsed when an error occurred.
 */
enum class version_part {
    major,
    minor,
    patch,
    prerelease,
    build,
};

std::string_view name_of(parse_errc) noexcept;
std::string_view name_of(version_part) noexcept;

/**
 * @brief Describes where and why a version string failed to parse.
 */
struct parse_error {
    // Byte offset into the original input
    std::size_t offset = 0;
    parse_errc  code   = parse_errc::unexpected_end;
    // The section being parsed
    version_part part = version_part::major;
    // Human-readable description of the violation
    std::string message;

    std::string to_string() const;
};

/**
 * @brief Exception thrown when a string is not a valid semantic version.
 */
class invalid_version : public std::runtime_error {
    std::string _string;
    parse_error _error;

public:
    invalid_version(std::string string, parse_error err);

    auto& string() const noexcept { return _string; }
    auto& error() const noexcept { return _error; }

    auto offset() const noexcept { return _error.offset; }
    auto code() const noexcept { return _error.code; }
    auto part() const noexcept { return _error.part; }
};

}  // namespace semver
