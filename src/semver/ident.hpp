#pragma once

#include <semver/order.hpp>
#include <semver/parse_error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace semver {

enum class ident_kind {
    // Contains a letter or an inner hyphen, or is too large to be a number
    alphanumeric,
    // An optional leading '-' and digits, without a leading zero (e.g. '12', '-1')
    numeric,
    // An optional leading '-' and digits, with a leading zero (e.g. '007')
    digits,
};

class ident;
order compare(const ident& lhs, const ident& rhs) noexcept;

/**
 * @brief A single dot-separated identifier from a pre-release or build metadata section.
 *
 * An identifier is a non-empty run of ASCII letters, digits, and hyphens. Identifiers that spell
 * an integer (digits with an optional leading '-') and fit in a signed 64-bit integer carry
 * their numeric value, which is used for precedence.
 */
class ident {
    std::string   _str;
    ident_kind    _kind  = ident_kind::alphanumeric;
    std::int64_t  _value = 0;

public:
    /**
     * @brief Validate and classify a single identifier.
     *
     * @throws invalid_version if the string is empty or has a character that may not appear in an
     * identifier. Errors are reported as occurring in the given section.
     */
    explicit ident(std::string_view str, version_part part = version_part::prerelease);

    auto        kind() const noexcept { return _kind; }
    const auto& string() const noexcept { return _str; }

    /// Whether this identifier is compared by numeric value
    bool is_numeric() const noexcept { return _kind != ident_kind::alphanumeric; }

    /// The numeric value of the identifier, if it has one
    std::optional<std::int64_t> numeric_value() const noexcept {
        if (is_numeric()) {
            return _value;
        }
        return std::nullopt;
    }

    // Equality is textual: '01' and '1' are different identifiers of the same precedence
    friend bool operator==(const ident& lhs, const ident& rhs) noexcept {
        return lhs._str == rhs._str;
    }

#define DEF_OP(op, expr)                                                                           \
    inline friend bool operator op(const ident& lhs, const ident& rhs) noexcept {                  \
        auto o = compare(lhs, rhs);                                                                \
        return (expr);                                                                             \
    }                                                                                              \
    static_assert(true)

    DEF_OP(<, (o == order::less));
    DEF_OP(>, (o == order::greater));
    DEF_OP(<=, (o == order::less || o == order::equivalent));
    DEF_OP(>=, (o == order::greater || o == order::equivalent));
#undef DEF_OP

    /**
     * @brief Parse a dot-separated sequence of one or more identifiers.
     *
     * @throws invalid_version if the sequence is empty, has an empty element, or contains an
     * invalid character.
     */
    static std::vector<ident> parse_dotted_seq(std::string_view s,
                                               version_part     part = version_part::prerelease);
};

/// Join the given identifiers with '.'
std::string join_idents(const std::vector<ident>& ids);

}  // namespace semver
