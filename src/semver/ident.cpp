#include "./ident.hpp"

#include "./parser.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <charconv>

using namespace semver;

ident::ident(std::string_view str, version_part part) {
    if (str.empty()) {
        throw invalid_version(std::string(str),
                              parse_error{0,
                                          parse_errc::empty_identifier,
                                          part,
                                          "expected alphanumeric identifier, found end of input"});
    }
    auto bad_char = std::find_if_not(str.begin(), str.end(), detail::is_ident_char);
    if (bad_char == str.begin()) {
        throw invalid_version(std::string(str),
                              parse_error{0,
                                          parse_errc::unexpected_char,
                                          part,
                                          fmt::format("expected alphanumeric identifier, found {}",
                                                      detail::describe_char(str[0]))});
    } else if (bad_char != str.end()) {
        auto off = static_cast<std::size_t>(bad_char - str.begin());
        throw invalid_version(std::string(str),
                              parse_error{off,
                                          parse_errc::trailing_characters,
                                          part,
                                          fmt::format("unexpected trailing characters \"{}\"",
                                                      str.substr(off))});
    }

    _str.assign(str);

    auto digits = str;
    if (digits.front() == '-') {
        digits.remove_prefix(1);
    }
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), detail::is_digit)) {
        _kind = ident_kind::alphanumeric;
        return;
    }
    const auto str_end = str.data() + str.size();
    auto       fc_res  = std::from_chars(str.data(), str_end, _value);
    if (fc_res.ec != std::errc{} || fc_res.ptr != str_end) {
        // Too large to represent. Compared as text instead.
        _kind  = ident_kind::alphanumeric;
        _value = 0;
    } else if (digits.size() > 1 && digits[0] == '0') {
        _kind = ident_kind::digits;
    } else {
        _kind = ident_kind::numeric;
    }
}

std::vector<ident> ident::parse_dotted_seq(const std::string_view s, version_part part) {
    parser p{s};
    auto   acc = p.parse_dotted_identifiers(part);
    p.expect_end(part);
    return acc;
}

std::string semver::join_idents(const std::vector<ident>& ids) {
    std::string acc;
    auto        it   = ids.cbegin();
    auto        stop = ids.cend();
    while (it != stop) {
        acc += it->string();
        ++it;
        if (it != stop) {
            acc += ".";
        }
    }
    return acc;
}

order semver::compare(const ident& lhs, const ident& rhs) noexcept {
    if (lhs.is_numeric() && rhs.is_numeric()) {
        auto lhs_num = *lhs.numeric_value();
        auto rhs_num = *rhs.numeric_value();
        if (lhs_num == rhs_num) {
            return order::equivalent;
        } else if (lhs_num < rhs_num) {
            return order::less;
        } else {
            return order::greater;
        }
    } else if (lhs.is_numeric()) {
        // numeric is less than alnum
        return order::less;
    } else if (rhs.is_numeric()) {
        return order::greater;
    }
    auto comp = lhs.string().compare(rhs.string());
    if (comp == 0) {
        return order::equivalent;
    } else if (comp < 0) {
        return order::less;
    } else {
        return order::greater;
    }
}
