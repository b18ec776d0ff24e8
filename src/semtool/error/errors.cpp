#include "./errors.hpp"

#include <semtool/util/log.hpp>

#include <semver/parse_error.hpp>

#include <string>

void semtool::log_invalid_version(const semver::invalid_version& exc,
                                  const e_version_arg*           arg) noexcept {
    semtool_log(error, "Invalid semantic version \"{}\"", exc.string());
    if (arg) {
        semtool_log(error, "  (While parsing the {} argument)", arg->value);
    }
    // Mark the failing offset beneath the input
    semtool_log(error, "  {}", exc.string());
    semtool_log(error, "  {}^ {}", std::string(exc.offset(), ' '), exc.error().to_string());
    semtool_log(debug, "Parse error code: {}", semver::name_of(exc.code()));
}
