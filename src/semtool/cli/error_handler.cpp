#include "./error_handler.hpp"

#include <semtool/error/errors.hpp>
#include <semtool/util/log.hpp>

#include <semver/parse_error.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/handle_errors.hpp>
#include <fmt/ostream.h>

#include <system_error>
#include <tuple>

using namespace semtool;

namespace {

auto handlers = std::tuple(  //
    [](const semver::invalid_version& exc, const e_version_arg* arg) {
        log_invalid_version(exc, arg);
        return 1;
    },
    [](const std::system_error& exc, boost::leaf::verbose_diagnostic_info const& diag) {
        semtool_log(critical,
                    "An unhandled std::system_error arose. THIS IS A SEMTOOL BUG! Info: {}",
                    fmt::streamed(diag));
        semtool_log(critical,
                    "Exception message from std::system_error: {}",
                    exc.code().message());
        return 42;
    },
    [](boost::leaf::verbose_diagnostic_info const& diag) {
        semtool_log(critical,
                    "An unhandled error arose. THIS IS A SEMTOOL BUG! Info: {}",
                    fmt::streamed(diag));
        return 42;
    });

}  // namespace

int semtool::handle_cli_errors(std::function<int()> fn) noexcept {
    return boost::leaf::try_catch(fn, handlers);
}
