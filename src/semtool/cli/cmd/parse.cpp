#include "./commands.hpp"

#include "../options.hpp"

#include <semtool/error/errors.hpp>
#include <semtool/error/on_error.hpp>
#include <semtool/util/log.hpp>

#include <semver/version.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fmt/ostream.h>

#include <cstddef>
#include <iostream>

using namespace semtool;

namespace {

void print_version(const semver::version& ver) {
    fmt::print(std::cout, "{}\n", ver);
    fmt::print(std::cout, "  major:       {}\n", ver.major());
    fmt::print(std::cout, "  minor:       {}\n", ver.minor());
    fmt::print(std::cout, "  patch:       {}\n", ver.patch());
    if (ver.is_prerelease()) {
        fmt::print(std::cout, "  pre-release: {}\n", ver.prerelease());
    }
    if (!ver.build_metadata().empty()) {
        fmt::print(std::cout, "  build:       {}\n", ver.build_metadata());
    }
    for (auto& id : ver.prerelease().idents()) {
        semtool_log(trace,
                    "Pre-release identifier '{}' is {}",
                    id,
                    id.is_numeric() ? "numeric" : "alphanumeric");
    }
}

}  // namespace

namespace semtool::cli::cmd {

int parse(const options& opts) {
    int n_failed = 0;
    for (std::size_t idx = 0; idx < opts.parse.versions.size(); ++idx) {
        auto& given = opts.parse.versions[idx];
        boost::leaf::try_catch(
            [&] {
                SEMTOOL_E_SCOPE(e_version_arg{fmt::format("<version> #{}", idx + 1)});
                semtool_log(debug, "Parsing version string \"{}\"", given);
                print_version(semver::version::parse(given));
            },
            [&](const semver::invalid_version& exc, const e_version_arg* arg) {
                log_invalid_version(exc, arg);
                ++n_failed;
            });
    }
    if (n_failed != 0) {
        semtool_log(error,
                    "{} of {} version strings are invalid",
                    n_failed,
                    opts.parse.versions.size());
        return 1;
    }
    return 0;
}

}  // namespace semtool::cli::cmd
