#pragma once

#include <semver/ident.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace semver {

/**
 * @brief The build metadata section of a version (the part following a '+').
 *
 * Build metadata never takes part in precedence or equality of versions.
 */
class build_metadata {
    std::vector<ident> _ids;

public:
    build_metadata() = default;
    explicit build_metadata(std::vector<ident> ids) noexcept
        : _ids(std::move(ids)) {}

    [[nodiscard]] bool empty() const noexcept { return _ids.empty(); }

    auto& idents() const noexcept { return _ids; }

    std::string string() const { return join_idents(_ids); }

    static build_metadata parse(std::string_view s) {
        return build_metadata(ident::parse_dotted_seq(s, version_part::build));
    }

    friend bool operator==(const build_metadata& lhs, const build_metadata& rhs) noexcept {
        return lhs._ids == rhs._ids;
    }
};

}  // namespace semver
