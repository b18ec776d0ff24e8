#include "./argument_parser.hpp"

#include <boost/leaf/exception.hpp>
#include <boost/leaf/on_error.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cassert>
#include <set>

using strv = std::string_view;

using namespace debate;

namespace {

struct parse_engine {
    const std::vector<strv>& args;
    std::size_t              arg_idx = 0;

    // The parser for the most recently selected subcommand
    const argument_parser* bottom_parser;

    // Keep track of how many positional arguments we have seen
    int positional_index = 0;

    // Keep track of what we've seen
    std::set<const argument*> seen{};

    bool at_end() const noexcept { return arg_idx >= args.size(); }
    strv current_arg() const noexcept {
        assert(!at_end() && "Get argument past the final argument?");
        return args[arg_idx];
    }
    void shift() noexcept {
        assert(!at_end() && "Advancing argv parser past the end.");
        ++arg_idx;
    }

    void see(const argument& arg) {
        auto did_insert = seen.insert(&arg).second;
        if (!did_insert && !arg.can_repeat) {
            throw boost::leaf::exception(invalid_repetition("Invalid repetition"));
        }
    }

    void run() {
        auto _ = boost::leaf::on_error([this] { return e_argument_parser{*bottom_parser}; });
        while (!at_end()) {
            auto given = current_arg();
            if (!try_parse_given(given)) {
                throw boost::leaf::exception(unrecognized_argument("Unrecognized argument"),
                                             e_arg_spelling{std::string(given)});
            }
        }
        finalize();
    }

    bool try_parse_given(const strv given) {
        if (given.size() < 2 || given[0] != '-') {
            return try_parse_positional(given) || try_parse_subparser(given);
        } else if (given[1] == '-') {
            // Two hyphens is a long argument
            return try_parse_long(given.substr(2));
        } else {
            // A single hyphen, shorthand argument(s)
            return try_parse_short(given.substr(1));
        }
    }

    // Long arguments: '--name', '--name value', and '--name=value'

    bool try_parse_long(strv tail) {
        if (tail == "help") {
            throw boost::leaf::exception(help_request());
        }
        // Arguments of enclosing parsers are also accepted after a subcommand
        for (auto argset = bottom_parser; argset; argset = argset->parent()) {
            for (const argument& cand : argset->arguments()) {
                auto matched = cand.try_match_long(tail);
                if (matched.empty()) {
                    continue;
                }
                tail.remove_prefix(matched.size());
                shift();
                auto long_arg = fmt::format("--{}", matched);
                auto _        = boost::leaf::on_error(e_argument{cand}, e_arg_spelling{long_arg});
                see(cand);
                dispatch_long(cand, tail, long_arg);
                return true;
            }
        }
        return false;
    }

    void dispatch_long(const argument& arg, strv tail, strv spelling) {
        if (arg.nargs == 0) {
            if (!tail.empty()) {
                throw boost::leaf::exception(invalid_arguments("Argument does not expect a value"),
                                             e_wrong_val_num{1});
            }
            // Just a switch
            arg.action(spelling, spelling);
            return;
        }
        if (!tail.empty()) {
            // Given with an '=', as in: '--long-option=value'
            assert(tail[0] == '=');
            tail.remove_prefix(1);
            if (arg.nargs > 1) {
                throw boost::leaf::exception(invalid_arguments("Invalid number of values"),
                                             e_wrong_val_num{1});
            }
            arg.action(tail, spelling);
            return;
        }
        // Trailing words are the values
        take_values(arg, spelling);
    }

    // Short arguments: '-x', '-x value', '-xvalue', and groups of switches, as in '-abc'

    bool try_parse_short(strv tail) {
        if (tail == "h") {
            throw boost::leaf::exception(help_request());
        }
        auto argset = bottom_parser;
        while (argset) {
            auto new_tail = try_parse_short_1(*argset, tail);
            if (new_tail.size() == tail.size()) {
                // No characters were consumed. Try the enclosing parser.
                argset = argset->parent();
                continue;
            }
            if (new_tail.empty()) {
                return true;
            }
            // Matched a switch within a group. Restart at the bottom-most parser
            argset = bottom_parser;
            tail   = new_tail;
        }
        return false;
    }

    strv try_parse_short_1(const argument_parser& argset, const strv tail) {
        for (const argument& cand : argset.arguments()) {
            auto matched = cand.try_match_short(tail);
            if (matched.empty()) {
                continue;
            }
            auto short_tail = tail.substr(matched.size());
            auto short_arg  = fmt::format("-{}", matched);
            auto _          = boost::leaf::on_error(e_argument{cand}, e_arg_spelling{short_arg});
            see(cand);
            return dispatch_short(cand, short_tail, short_arg);
        }
        // Didn't match anything. Return the original group unmodified
        return tail;
    }

    strv dispatch_short(const argument& arg, strv tail, strv spelling) {
        if (arg.nargs == 0) {
            arg.action("", spelling);
            if (tail.empty()) {
                shift();
            }
            return tail;
        }
        if (!tail.empty()) {
            // The remainder of the group is the value, as in '-lwarn'
            if (arg.nargs > 1) {
                throw boost::leaf::exception(invalid_arguments(
                                                 "Wrong number of argument values given"),
                                             e_wrong_val_num{1});
            }
            arg.action(tail, spelling);
            shift();
            return "";
        }
        shift();
        take_values(arg, spelling);
        return "";
    }

    void take_values(const argument& arg, strv spelling) {
        for (auto i = 0; i < arg.nargs; ++i) {
            if (at_end()) {
                throw boost::leaf::exception(invalid_arguments("Wrong number of argument values"),
                                             e_wrong_val_num{i});
            }
            arg.action(current_arg(), spelling);
            shift();
        }
    }

    // Positional arguments of the bottom-most parser

    bool try_parse_positional(strv given) {
        int pos_idx = 0;
        for (auto& arg : bottom_parser->arguments()) {
            if (!arg.is_positional()) {
                continue;
            }
            if (pos_idx != positional_index) {
                ++pos_idx;
                continue;
            }
            assert(arg.nargs == 1 && "Positional arguments must have nargs=1");
            auto _ = boost::leaf::on_error(e_arg_spelling{arg.preferred_spelling()});
            see(arg);
            arg.action(given, given);
            if (!arg.can_repeat) {
                // A repeatable positional is always the next one to receive a value, so any
                // positionals that follow it are unreachable.
                ++positional_index;
            }
            shift();
            return true;
        }
        // We do not follow the chain of subcommands for positionals
        return false;
    }

    bool try_parse_subparser(const strv given) {
        if (!bottom_parser->subparsers()) {
            return false;
        }
        auto& group = *bottom_parser->subparsers();
        for (auto& cand : group._p_subparsers) {
            if (cand.name != given) {
                continue;
            }
            if (group.action) {
                group.action(given, group.valname);
            }
            if (cand.action) {
                cand.action();
            }
            // This parser is now the bottom of the chain
            bottom_parser    = &cand._p_parser;
            positional_index = 0;
            shift();
            return true;
        }
        return false;
    }

    void finalize() {
        for (auto argset = bottom_parser; argset; argset = argset->parent()) {
            for (auto& arg : argset->arguments()) {
                if (arg.required && !seen.contains(&arg)) {
                    throw boost::leaf::exception(missing_required("Required argument is missing"),
                                                 e_argument{arg});
                }
            }
        }
        if (bottom_parser->subparsers() && bottom_parser->subparsers()->required) {
            throw boost::leaf::exception(missing_required("Expected a subcommand"));
        }
    }
};

}  // namespace

void argument_parser::_parse_args(const std::vector<strv>& args) const {
    parse_engine{args, 0, this}.run();
}

argument& argument_parser::add_argument(argument arg) noexcept {
    _arguments.push_back(std::move(arg));
    return _arguments.back();
}

subparser_group& argument_parser::add_subparsers(subparser_group grp) noexcept {
    _subparsers.emplace(std::move(grp));
    _subparsers->_p_parent_ = this;
    return *_subparsers;
}

argument_parser& subparser_group::add_parser(subparser sub) {
    _p_subparsers.push_back(std::move(sub));
    auto& p   = _p_subparsers.back()._p_parser;
    p._parent = _p_parent_;
    return p;
}

std::string argument_parser::usage_string(std::string_view progname) const noexcept {
    std::string subcommand_suffix;
    for (auto tail_parser = this; tail_parser; tail_parser = tail_parser->_parent) {
        for (auto& arg : tail_parser->arguments()) {
            if (arg.is_positional() && arg.required && tail_parser != this) {
                subcommand_suffix = " " + arg.preferred_spelling() + subcommand_suffix;
            }
        }
        if (!tail_parser->_name.empty()) {
            subcommand_suffix = " " + tail_parser->_name + subcommand_suffix;
        }
    }
    auto ret    = fmt::format("Usage: {}{}", progname, subcommand_suffix);
    auto indent = ret.size() + 1;
    if (indent > 40) {
        ret.push_back('\n');
        indent = 10;
        ret.append(indent, ' ');
    }

    std::size_t col = indent;
    auto        put = [&](const std::string& part) {
        if (col + part.size() > 79 && col > indent) {
            ret.append("\n");
            ret.append(indent - 1, ' ');
            col = indent - 1;
        }
        ret.append(" " + part);
        col += part.size() + 1;
    };

    for (auto& arg : _arguments) {
        put(arg.syntax_string());
    }

    if (subparsers()) {
        std::string subcommand_str = "{";
        auto&       subs           = subparsers()->_p_subparsers;
        for (auto it = subs.cbegin(); it != subs.cend();) {
            subcommand_str.append(it->name);
            ++it;
            if (it != subs.cend()) {
                subcommand_str.append(",");
            }
        }
        subcommand_str.append("}");
        put(subcommand_str);
    }
    return ret;
}

std::string argument_parser::help_string(std::string_view progname) const noexcept {
    std::string ret;
    ret = usage_string(progname);
    ret.append("\n\n");
    if (!_description.empty()) {
        ret.append(_description);
        ret.append("\n\n");
    }
    auto append_group = [&](std::string_view heading, bool required) {
        bool any = false;
        for (auto& arg : arguments()) {
            if (arg.required != required) {
                continue;
            }
            if (!any) {
                ret.append(heading);
            }
            any = true;
            ret.append(arg.help_string());
            ret.append("\n");
        }
    };
    append_group("required arguments:\n\n", true);
    append_group("optional arguments:\n\n", false);

    if (subparsers()) {
        ret.append("Subcommands:\n\n");
        if (!subparsers()->description.empty()) {
            ret.append(fmt::format("  {}\n\n", subparsers()->description));
        }
        for (auto& sub : subparsers()->_p_subparsers) {
            ret.append(fmt::format(fmt::emphasis::bold, "{}", sub.name));
            ret.append("\n  ");
            ret.append(sub.help);
            ret.append("\n\n");
        }
    }
    return ret;
}
