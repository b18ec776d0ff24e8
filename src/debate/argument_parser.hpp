#pragma once

#include "./argument.hpp"

#include <functional>
#include <initializer_list>
#include <iterator>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace debate {

class argument_parser;
struct subparser;

struct subparser_group {
    std::string valname = "<subcommand>";

    std::string description{};

    bool required = true;

    std::function<void(std::string_view, std::string_view)> action{};

    const argument_parser* _p_parent_ = nullptr;
    std::list<subparser>   _p_subparsers{};

    argument_parser& add_parser(subparser);
};

/**
 * @brief A command-line argument parser with long/short options, positionals, and subcommands.
 *
 * Parsing invokes the `action` of each argument as it is matched. Errors are thrown as
 * boost::leaf::exception objects carrying the e_* error types from <debate/error.hpp>.
 */
class argument_parser {
    friend struct subparser_group;
    std::list<argument>            _arguments;
    std::optional<subparser_group> _subparsers;
    std::string                    _name;
    std::string                    _description;
    // The parent of this argument parser, if it was attached using a subparser_group
    const argument_parser* _parent = nullptr;

    void _parse_args(const std::vector<std::string_view>& args) const;

public:
    argument_parser() = default;

    explicit argument_parser(std::string description)
        : _description(std::move(description)) {}

    explicit argument_parser(std::string name, std::string description)
        : _name(std::move(name))
        , _description(std::move(description)) {}

    argument& add_argument(argument arg) noexcept;

    subparser_group& add_subparsers(subparser_group grp = {}) noexcept;

    std::string usage_string(std::string_view progname) const noexcept;

    std::string help_string(std::string_view progname) const noexcept;

    template <typename T>
    void parse_argv(const T& range) const {
        _parse_args(std::vector<std::string_view>(std::cbegin(range), std::cend(range)));
    }

    void parse_argv(std::initializer_list<std::string_view> ilist) const {
        _parse_args(std::vector<std::string_view>(ilist));
    }

    auto  parent() const noexcept { return _parent; }
    auto& name() const noexcept { return _name; }
    auto& arguments() const noexcept { return _arguments; }
    auto& subparsers() const noexcept { return _subparsers; }
};

struct subparser {
    std::string name;
    std::string help;

    std::function<void()> action{};

    argument_parser _p_parser{name, help};
};

}  // namespace debate
