#include "./version.hpp"

#include "./parser.hpp"

#include <fmt/core.h>

#include <tuple>

using namespace semver;

version version::parse(std::string_view s) { return parser{s}.parse_version(); }

std::string version::to_string() const {
    auto main_ver = fmt::format("{}.{}.{}", _major, _minor, _patch);
    if (!_prerelease.empty()) {
        main_ver += "-" + _prerelease.string();
    }
    if (!_build_metadata.empty()) {
        main_ver += "+" + _build_metadata.string();
    }
    return main_ver;
}

bool version::equals(const version& other) const noexcept {
    return std::tie(_major, _minor, _patch) == std::tie(other._major, other._minor, other._patch)
        && _prerelease == other._prerelease;
}

bool version::before(const version& other) const noexcept {
    return compare(*this, other) == order::less;
}

order semver::compare(const version& lhs, const version& rhs) noexcept {
    auto lhs_tup = std::tuple(lhs.major(), lhs.minor(), lhs.patch());
    auto rhs_tup = std::tuple(rhs.major(), rhs.minor(), rhs.patch());
    if (lhs_tup < rhs_tup) {
        return order::less;
    } else if (lhs_tup > rhs_tup) {
        return order::greater;
    } else {
        // Versions with a prerelease tag sort before those without
        return compare(lhs.prerelease(), rhs.prerelease());
    }
}
