#pragma once

#include <semver/ident.hpp>
#include <semver/order.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace semver {

class prerelease;
order compare(const prerelease& lhs, const prerelease& rhs) noexcept;

/**
 * @brief The pre-release section of a version (the part following a '-').
 *
 * An empty prerelease denotes a version with no pre-release section, which has higher precedence
 * than any version that has one.
 */
class prerelease {
    std::vector<ident> _ids;

public:
    prerelease() = default;
    explicit prerelease(std::vector<ident> ids) noexcept
        : _ids(std::move(ids)) {}

    [[nodiscard]] bool empty() const noexcept { return _ids.empty(); }

    auto& idents() const noexcept { return _ids; }

    /// The dot-joined text of the section, without the leading '-'
    std::string string() const { return join_idents(_ids); }

    /**
     * @brief Parse a pre-release section, given without its leading '-'
     *
     * @throws invalid_version if the string is not a valid dotted identifier sequence.
     */
    static prerelease parse(std::string_view str);

    // Equality is textual, as for identifiers
    friend bool operator==(const prerelease& lhs, const prerelease& rhs) noexcept {
        return lhs._ids == rhs._ids;
    }

#define DEF_OP(op, expr)                                                                           \
    inline friend bool operator op(const prerelease& lhs, const prerelease& rhs) noexcept {        \
        auto o = compare(lhs, rhs);                                                                \
        return (expr);                                                                             \
    }                                                                                              \
    static_assert(true)

    DEF_OP(<, (o == order::less));
    DEF_OP(>, (o == order::greater));
    DEF_OP(<=, (o == order::less || o == order::equivalent));
    DEF_OP(>=, (o == order::greater || o == order::equivalent));
#undef DEF_OP
};

}  // namespace semver
