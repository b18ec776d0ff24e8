#pragma once

#include <semver/build_metadata.hpp>
#include <semver/order.hpp>
#include <semver/parse_error.hpp>
#include <semver/prerelease.hpp>

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace semver {

class parser;

class version;
order compare(const version& lhs, const version& rhs) noexcept;

/**
 * @brief An immutable Semantic Versioning 2.0.0 version.
 *
 * Obtain one using version::parse(). A default-constructed version is 0.0.0.
 */
class version {
    friend class parser;

    std::uint64_t _major = 0;
    std::uint64_t _minor = 0;
    std::uint64_t _patch = 0;
    // Prerelease tag is optional:
    class prerelease _prerelease = {};
    // Build metadata is optional:
    class build_metadata _build_metadata = {};

    version(std::uint64_t        major,
            std::uint64_t        minor,
            std::uint64_t        patch,
            class prerelease     pre,
            class build_metadata build) noexcept
        : _major(major)
        , _minor(minor)
        , _patch(patch)
        , _prerelease(std::move(pre))
        , _build_metadata(std::move(build)) {}

public:
    version() = default;

    /**
     * @brief Parse a version string.
     *
     * @throws invalid_version if the string does not match the grammar. The exception carries the
     * byte offset of the first violation and a description of it.
     */
    static version parse(std::string_view s);

    auto major() const noexcept { return _major; }
    auto minor() const noexcept { return _minor; }
    auto patch() const noexcept { return _patch; }

    auto& prerelease() const noexcept { return _prerelease; }
    auto& build_metadata() const noexcept { return _build_metadata; }

    bool is_prerelease() const noexcept { return !_prerelease.empty(); }

    /**
     * @brief Render as 'major.minor.patch', followed by '-<prerelease>' and '+<build>' when
     * present.
     */
    std::string to_string() const;

    /**
     * @brief Whether the versions have the same core and the same pre-release text.
     *
     * Build metadata is ignored.
     */
    bool equals(const version& other) const noexcept;

    /**
     * @brief Whether this version has lower precedence than `other`.
     *
     * Build metadata is ignored.
     */
    bool before(const version& other) const noexcept;

    inline friend bool operator==(const version& lhs, const version& rhs) noexcept {
        return lhs.equals(rhs);
    }
    inline friend bool operator<(const version& lhs, const version& rhs) noexcept {
        return lhs.before(rhs);
    }
    inline friend bool operator>(const version& lhs, const version& rhs) noexcept {
        return rhs.before(lhs);
    }
    inline friend bool operator<=(const version& lhs, const version& rhs) noexcept {
        return !rhs.before(lhs);
    }
    inline friend bool operator>=(const version& lhs, const version& rhs) noexcept {
        return !lhs.before(rhs);
    }

    friend inline std::string to_string(const version& ver) { return ver.to_string(); }
};

}  // namespace semver

namespace fmt {

template <>
struct formatter<semver::version> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const semver::version& ver, FormatContext& ctx) const {
        return formatter<std::string_view>::format(ver.to_string(), ctx);
    }
};

template <>
struct formatter<semver::prerelease> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const semver::prerelease& pre, FormatContext& ctx) const {
        return formatter<std::string_view>::format(pre.string(), ctx);
    }
};

template <>
struct formatter<semver::build_metadata> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const semver::build_metadata& bm, FormatContext& ctx) const {
        return formatter<std::string_view>::format(bm.string(), ctx);
    }
};

template <>
struct formatter<semver::ident> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const semver::ident& id, FormatContext& ctx) const {
        return formatter<std::string_view>::format(id.string(), ctx);
    }
};

}  // namespace fmt
