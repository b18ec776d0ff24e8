#include "./parser.hpp"

#include "./version.hpp"

#include <fmt/core.h>

#include <charconv>
#include <utility>

using namespace semver;

std::string detail::describe_char(char c) {
    if (c >= 0x20 && c < 0x7f) {
        return fmt::format("'{}'", c);
    }
    return fmt::format("byte 0x{:02x}", static_cast<unsigned char>(c));
}

void parser::fail(std::size_t offset, parse_errc ec, version_part part, std::string message) const {
    throw invalid_version(std::string(_input), parse_error{offset, ec, part, std::move(message)});
}

version parser::parse_version() {
    const auto major = parse_numeric_identifier(version_part::major);
    expect_dot_after(version_part::major);
    const auto minor = parse_numeric_identifier(version_part::minor);
    expect_dot_after(version_part::minor);
    const auto patch = parse_numeric_identifier(version_part::patch);

    auto last_part = version_part::patch;

    prerelease pre;
    if (consume('-')) {
        pre       = prerelease(parse_dotted_identifiers(version_part::prerelease));
        last_part = version_part::prerelease;
    }

    build_metadata build;
    if (consume('+')) {
        build     = build_metadata(parse_dotted_identifiers(version_part::build));
        last_part = version_part::build;
    }

    expect_end(last_part);
    return version(major, minor, patch, std::move(pre), std::move(build));
}

std::uint64_t parser::parse_numeric_identifier(version_part part) {
    if (at_end()) {
        fail(_pos, parse_errc::unexpected_end, part, "unexpected end of input");
    }

    const auto start = _pos;
    if (consume('0')) {
        // A lone zero is the only numeric identifier that may start with '0'
        if (match_digit()) {
            fail(_pos, parse_errc::leading_zero, part, "leading zero is not allowed");
        }
        return 0;
    }

    if (!detail::is_positive_digit(_input[_pos])) {
        fail(_pos,
             parse_errc::unexpected_char,
             part,
             fmt::format("expected a digit, found {}", detail::describe_char(_input[_pos])));
    }
    while (match_digit()) {
        ++_pos;
    }

    const auto    digits = _input.substr(start, _pos - start);
    std::uint64_t value  = 0;
    auto fc_res = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (fc_res.ec != std::errc{}) {
        fail(start,
             parse_errc::out_of_range,
             part,
             fmt::format("numeric identifier {} is too large", digits));
    }
    return value;
}

void parser::expect_dot_after(version_part part) {
    if (consume('.')) {
        return;
    }
    if (at_end()) {
        fail(_pos,
             parse_errc::missing_separator,
             part,
             fmt::format("missing '.' separator after the {}, found end of input", name_of(part)));
    }
    fail(_pos,
         parse_errc::missing_separator,
         part,
         fmt::format("missing '.' separator after the {}, found {}",
                     name_of(part),
                     detail::describe_char(_input[_pos])));
}

ident parser::parse_identifier(version_part part) {
    const auto start = _pos;
    while (!at_end() && detail::is_ident_char(_input[_pos])) {
        ++_pos;
    }
    if (_pos == start) {
        if (at_end()) {
            fail(_pos,
                 parse_errc::empty_identifier,
                 part,
                 "expected alphanumeric identifier, found end of input");
        }
        fail(_pos,
             parse_errc::empty_identifier,
             part,
             fmt::format("expected alphanumeric identifier, found {}",
                         detail::describe_char(_input[_pos])));
    }
    return ident(_input.substr(start, _pos - start), part);
}

std::vector<ident> parser::parse_dotted_identifiers(version_part part) {
    std::vector<ident> acc;
    acc.push_back(parse_identifier(part));
    while (consume('.')) {
        acc.push_back(parse_identifier(part));
    }
    return acc;
}

void parser::expect_end(version_part part) const {
    if (!at_end()) {
        fail(_pos,
             parse_errc::trailing_characters,
             part,
             fmt::format("unexpected trailing characters \"{}\"", _input.substr(_pos)));
    }
}
