#include <semtool/cli/dispatch_main.hpp>
#include <semtool/cli/options.hpp>
#include <semtool/util/log.hpp>

#include <debate/argument_parser.hpp>
#include <debate/error.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fmt/ostream.h>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

int main_fn(std::string_view program_name, const std::vector<std::string>& argv) {
    semtool::log::init_logger();

    semtool::cli::options   opts;
    debate::argument_parser parser{"Parse and compare Semantic Versioning 2.0.0 version strings"};
    opts.setup_parser(parser);

    auto result = boost::leaf::try_catch(
        [&]() -> std::optional<int> {
            parser.parse_argv(argv);
            return std::nullopt;
        },
        [&](const debate::help_request&, debate::e_argument_parser p) {
            std::cout << p.value.help_string(program_name);
            return 0;
        },
        [&](const debate::unrecognized_argument&,
            debate::e_argument_parser p,
            debate::e_arg_spelling    arg) {
            std::cerr << p.value.usage_string(program_name) << '\n';
            if (p.value.subparsers()) {
                fmt::print(std::cerr, "Unrecognized argument/subcommand: \"{}\"\n", arg.value);
            } else {
                fmt::print(std::cerr, "Unrecognized argument: \"{}\"\n", arg.value);
            }
            return 2;
        },
        [&](const debate::invalid_arguments&,
            debate::e_argument          arg,
            debate::e_argument_parser   p,
            debate::e_arg_spelling      spell,
            debate::e_invalid_arg_value val) {
            std::cerr << p.value.usage_string(program_name) << '\n';
            fmt::print(std::cerr,
                       "Invalid {} value '{}' given for '{}'\n",
                       arg.value.valname,
                       val.value,
                       spell.value);
            return 2;
        },
        [&](const debate::invalid_arguments&,
            debate::e_argument_parser p,
            debate::e_arg_spelling    spell,
            debate::e_argument        arg,
            debate::e_wrong_val_num   given) {
            std::cerr << p.value.usage_string(program_name) << '\n';
            if (arg.value.nargs == 0) {
                fmt::print(std::cerr,
                           "Argument '{}' does not expect any values, but was given one\n",
                           spell.value);
            } else if (arg.value.nargs == 1 && given.value == 0) {
                fmt::print(std::cerr,
                           "Argument '{}' expected to be given a value, but received none\n",
                           spell.value);
            } else {
                fmt::print(
                    std::cerr,
                    "Wrong number of arguments provided for '{}': Expected {}, but only got {}\n",
                    spell.value,
                    arg.value.nargs,
                    given.value);
            }
            return 2;
        },
        [&](const debate::missing_required&, debate::e_argument_parser p, debate::e_argument arg) {
            fmt::print(std::cerr,
                       "{}\nMissing required argument '{}'\n",
                       p.value.usage_string(program_name),
                       arg.value.preferred_spelling());
            return 2;
        },
        [&](const debate::missing_required&, debate::e_argument_parser p) {
            fmt::print(std::cerr,
                       "{}\nExpected a {}\n",
                       p.value.usage_string(program_name),
                       p.value.subparsers() ? p.value.subparsers()->valname : "subcommand");
            return 2;
        },
        [&](const debate::invalid_repetition&,
            debate::e_argument_parser p,
            debate::e_arg_spelling    sp) {
            fmt::print(std::cerr,
                       "{}\nArgument '{}' cannot be provided more than once\n",
                       p.value.usage_string(program_name),
                       sp.value);
            return 2;
        },
        [&](const debate::invalid_arguments& err, debate::e_argument_parser p) {
            fmt::print(std::cerr,
                       "{}\nError: {}\n",
                       p.value.usage_string(program_name),
                       err.what());
            return 2;
        });
    if (result) {
        // Non-null result from argument parsing, return that value immediately.
        return *result;
    }
    semtool::log::current_log_level = opts.log_level;
    return semtool::cli::dispatch_main(opts);
}

int main(int argc, char** argv) { return main_fn(argv[0], {argv + 1, argv + argc}); }
