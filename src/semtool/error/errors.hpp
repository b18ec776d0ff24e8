#pragma once

#include <string>

namespace semver {
class invalid_version;
}  // namespace semver

namespace semtool {

/**
 * @brief The command-line argument that held a version string, e.g. '<lhs>'
 */
struct e_version_arg {
    std::string value;
};

/**
 * @brief Log a diagnostic for a version string that failed to parse, marking the offending
 * position with a caret.
 */
void log_invalid_version(const semver::invalid_version& exc, const e_version_arg* arg) noexcept;

}  // namespace semtool
