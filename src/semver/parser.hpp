#pragma once

#include <semver/ident.hpp>
#include <semver/parse_error.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace semver {

class version;

namespace detail {

constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
constexpr bool is_positive_digit(char c) noexcept { return c >= '1' && c <= '9'; }
constexpr bool is_letter(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}
constexpr bool is_ident_char(char c) noexcept { return is_digit(c) || is_letter(c) || c == '-'; }

/// Render a character for use in a diagnostic message
std::string describe_char(char c);

}  // namespace detail

/**
 * @brief A forward-only recursive-descent parser for the Semantic Versioning 2.0.0 grammar.
 *
 * Each rule either consumes a definite prefix of the input or throws invalid_version carrying
 * the offset of the first violation. The parser never looks more than one character ahead.
 *
 *     <valid semver>   ::= <version core> ["-" <pre-release>] ["+" <build>]
 *     <version core>   ::= <numeric identifier> "." <numeric identifier> "." <numeric identifier>
 *     <pre-release>    ::= <identifier> | <identifier> "." <pre-release>
 *     <build>          ::= <identifier> | <identifier> "." <build>
 *     <identifier>     ::= one or more of [0-9A-Za-z-]
 *     <numeric ident.> ::= "0" | [1-9] [0-9]*
 *
 * Identifiers in the pre-release and build sections share a single permissive character-class
 * rule. Whether an identifier is numeric only matters for precedence, not for validity.
 */
class parser {
    std::string_view _input;
    std::size_t      _pos = 0;

public:
    explicit parser(std::string_view input) noexcept
        : _input(input) {}

    /// Parse a complete version. The entire input must be consumed.
    version parse_version();

    /// Parse a major, minor, or patch number
    std::uint64_t parse_numeric_identifier(version_part part);

    /// Parse a single non-empty identifier of a pre-release or build section
    ident parse_identifier(version_part part);

    /// Parse one or more identifiers separated by '.'
    std::vector<ident> parse_dotted_identifiers(version_part part);

    /// Require that the whole input has been consumed
    void expect_end(version_part part) const;

    auto position() const noexcept { return _pos; }
    bool at_end() const noexcept { return _pos >= _input.size(); }

private:
    bool match(char c) const noexcept { return !at_end() && _input[_pos] == c; }
    bool consume(char c) noexcept {
        if (match(c)) {
            ++_pos;
            return true;
        }
        return false;
    }
    bool match_digit() const noexcept { return !at_end() && detail::is_digit(_input[_pos]); }

    void expect_dot_after(version_part part);

    [[noreturn]] void
    fail(std::size_t offset, parse_errc ec, version_part part, std::string message) const;
};

}  // namespace semver
