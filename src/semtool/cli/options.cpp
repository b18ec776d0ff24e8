#include "./options.hpp"

#include <cstdlib>

using namespace semtool;
using namespace debate;

namespace {

struct setup {
    cli::options& opts;

    void do_setup(argument_parser& parser) noexcept {
        parser.add_argument({
            .long_spellings  = {"log-level"},
            .short_spellings = {"l"},
            .help            = "Set the semtool logging level. One of 'trace', 'debug', 'info', \n"
                               "'warn', 'error', 'critical', or 'silent'",
            .valname         = "<level>",
            .action          = parse_into(opts.log_level, log::level_from_string),
        });

        auto& group = parser.add_subparsers({
            .description = "The operation to perform",
        });
        setup_parse_cmd(group.add_parser({
            .name   = "parse",
            .help   = "Parse semantic versions and print their parts",
            .action = store_value(opts.subcommand, cli::subcommand::parse),
        }));
        setup_compare_cmd(group.add_parser({
            .name   = "compare",
            .help   = "Compare the precedence of two semantic versions",
            .action = store_value(opts.subcommand, cli::subcommand::compare),
        }));
    }

    void setup_parse_cmd(argument_parser& parse_cmd) noexcept {
        parse_cmd.add_argument({
            .help       = "A version string to parse, such as '1.0.0-alpha.1+001'",
            .valname    = "<version>",
            .required   = true,
            .can_repeat = true,
            .action     = push_back_onto(opts.parse.versions),
        });
    }

    void setup_compare_cmd(argument_parser& compare_cmd) noexcept {
        compare_cmd.add_argument({
            .help     = "The version on the left-hand side of the comparison",
            .valname  = "<lhs>",
            .required = true,
            .action   = put_into(opts.compare.lhs),
        });
        compare_cmd.add_argument({
            .help     = "The version on the right-hand side of the comparison",
            .valname  = "<rhs>",
            .required = true,
            .action   = put_into(opts.compare.rhs),
        });
    }
};

}  // namespace

void cli::options::setup_parser(debate::argument_parser& parser) noexcept {
    setup{*this}.do_setup(parser);
}

cli::options::options() noexcept {
    auto ll = std::getenv("SEMTOOL_LOG_LEVEL");
    if (ll) {
        auto llo = log::level_from_string(ll);
        if (llo.has_value()) {
            log_level = *llo;
        }
    }
}
