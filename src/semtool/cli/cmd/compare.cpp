#include "./commands.hpp"

#include "../options.hpp"

#include <semtool/error/errors.hpp>
#include <semtool/error/on_error.hpp>
#include <semtool/util/log.hpp>

#include <semver/version.hpp>

#include <fmt/ostream.h>

#include <iostream>
#include <string_view>

using namespace semtool;

namespace {

std::string_view relation_between(const semver::version& lhs, const semver::version& rhs) {
    if (lhs.equals(rhs)) {
        return "==";
    } else if (lhs.before(rhs)) {
        return "<";
    } else if (rhs.before(lhs)) {
        return ">";
    }
    // Same precedence, but the pre-release text differs, as in 'rc.01' and 'rc.1'
    return "~";
}

}  // namespace

namespace semtool::cli::cmd {

int compare(const options& opts) {
    auto lhs = [&] {
        SEMTOOL_E_SCOPE(e_version_arg{"<lhs>"});
        return semver::version::parse(opts.compare.lhs);
    }();
    auto rhs = [&] {
        SEMTOOL_E_SCOPE(e_version_arg{"<rhs>"});
        return semver::version::parse(opts.compare.rhs);
    }();

    auto rel = relation_between(lhs, rhs);
    if (rel == "~") {
        semtool_log(debug,
                    "Versions have equal precedence, but their pre-release tags are spelled "
                    "differently");
    }
    if (lhs.build_metadata() != rhs.build_metadata()) {
        semtool_log(debug, "Build metadata differs, and is ignored for comparison");
    }
    fmt::print(std::cout, "{} {} {}\n", lhs, rel, rhs);
    return 0;
}

}  // namespace semtool::cli::cmd
