#include "./log.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<std::string_view, semtool::log::level>, 7> level_names = {{
    {"trace", semtool::log::level::trace},
    {"debug", semtool::log::level::debug},
    {"info", semtool::log::level::info},
    {"warn", semtool::log::level::warn},
    {"error", semtool::log::level::error},
    {"critical", semtool::log::level::critical},
    {"silent", semtool::log::level::silent},
}};

}  // namespace

void semtool::log::init_logger() noexcept {
    spdlog::set_pattern("[%^%-5l%$] %v");
    spdlog::set_level(spdlog::level::trace);
}

std::optional<semtool::log::level> semtool::log::level_from_string(std::string_view name) noexcept {
    for (auto& [str, lvl] : level_names) {
        if (str == name) {
            return lvl;
        }
    }
    return std::nullopt;
}

std::string_view semtool::log::level_name(level l) noexcept {
    for (auto& [str, lvl] : level_names) {
        if (lvl == l) {
            return str;
        }
    }
    return "unknown";
}

void semtool::log::log_print(semtool::log::level l, std::string_view msg) noexcept {
    const auto lvl = [&] {
        switch (l) {
        case level::trace:
            return spdlog::level::trace;
        case level::debug:
            return spdlog::level::debug;
        case level::info:
            return spdlog::level::info;
        case level::warn:
            return spdlog::level::warn;
        case level::error:
            return spdlog::level::err;
        case level::critical:
            return spdlog::level::critical;
        case level::silent:
            return spdlog::level::off;
        }
        return spdlog::level::info;
    }();

    spdlog::default_logger_raw()->log(lvl, "{}", msg);
}
