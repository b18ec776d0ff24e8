#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

#include <optional>
#include <string_view>

namespace semtool::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

inline level current_log_level = level::info;

void log_print(level l, std::string_view s) noexcept;

void init_logger() noexcept;

/// Parse the name of a log level, as given on the command line
std::optional<level> level_from_string(std::string_view name) noexcept;
std::string_view     level_name(level l) noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

inline bool level_enabled(level l) { return int(l) >= int(current_log_level); }

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (int(l) >= int(current_log_level)) {
        try {
            auto message = fmt::vformat(s, fmt::make_format_args(args...));
            log_print(l, message);
        } catch (const fmt::format_error& e) {
            log_print(level::critical, e.what());
        }
    }
}

#define semtool_log(Level, str, ...)                                                               \
    do {                                                                                           \
        if (int(semtool::log::level::Level) >= int(semtool::log::current_log_level)) {             \
            ::semtool::log::log(::semtool::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);     \
        }                                                                                          \
    } while (0)

}  // namespace semtool::log
