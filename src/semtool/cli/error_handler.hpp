#pragma once

#include <functional>

namespace semtool {

/**
 * @brief Invoke the given function, and handle any errors that escape it. Diagnostics for the
 * errors are logged.
 *
 * @return The return value of `fn`, or a non-zero exit code if an error was handled.
 */
int handle_cli_errors(std::function<int()> fn) noexcept;

}  // namespace semtool
