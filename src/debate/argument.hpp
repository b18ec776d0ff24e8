#pragma once

#include "./error.hpp"

#include <boost/leaf/exception.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace debate {

/**
 * @brief The callback invoked for each value given to an argument.
 *
 * Receives the value and the spelling of the argument as it appeared on the command line.
 */
using argument_action = std::function<void(std::string_view value, std::string_view spelling)>;

template <typename T>
class argument_value_putter {
    T& _dest;

public:
    explicit argument_value_putter(T& dest) noexcept
        : _dest(dest) {}

    void operator()(std::string_view value, std::string_view) { _dest = T(value); }
};

/**
 * @brief Stores the result of a parsing function that returns an optional. An empty optional is
 * reported as an invalid argument value.
 */
template <typename T, typename Parse>
class parsed_putter {
    T*    _dest;
    Parse _parse;

public:
    parsed_putter(T& dest, Parse parse)
        : _dest(&dest)
        , _parse(std::move(parse)) {}

    void operator()(std::string_view value, std::string_view spelling) const {
        std::optional<T> parsed = _parse(value);
        if (!parsed) {
            throw boost::leaf::exception(invalid_arguments("Invalid argument value"),
                                         e_invalid_arg_value{std::string(value)},
                                         e_arg_spelling{std::string(spelling)});
        }
        *_dest = std::move(*parsed);
    }
};

constexpr inline auto store_value = [](auto& dest, auto val) {
    return [&dest, val](std::string_view = {}, std::string_view = {}) { dest = val; };
};

constexpr inline auto put_into = [](auto& dest) { return argument_value_putter{dest}; };

constexpr inline auto parse_into = [](auto& dest, auto parse) {
    return parsed_putter<std::remove_cvref_t<decltype(dest)>, decltype(parse)>(dest, parse);
};

constexpr inline auto push_back_onto = [](auto& dest) {
    return [&dest](std::string_view value, std::string_view = {}) { dest.emplace_back(value); };
};

struct argument {
    std::vector<std::string> long_spellings{};
    std::vector<std::string> short_spellings{};

    std::string help{};
    std::string valname{};

    bool required   = false;
    int  nargs      = 1;
    bool can_repeat = false;

    argument_action action;

    std::string_view try_match_short(std::string_view arg) const noexcept;
    std::string_view try_match_long(std::string_view arg) const noexcept;
    std::string      preferred_spelling() const noexcept;
    std::string      syntax_string() const noexcept;
    std::string      help_string() const noexcept;
    bool             is_positional() const noexcept {
        return long_spellings.empty() && short_spellings.empty();
    }
};

}  // namespace debate
