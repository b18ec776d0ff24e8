#include "./options.hpp"

#include <catch2/catch.hpp>

using namespace semtool;

TEST_CASE("Parse the 'parse' subcommand") {
    cli::options            opts;
    debate::argument_parser parser;
    opts.setup_parser(parser);

    parser.parse_argv({"parse", "1.0.0", "2.0.0-rc.1+b5"});
    CHECK(opts.subcommand == cli::subcommand::parse);
    CHECK(opts.parse.versions == std::vector<std::string>{"1.0.0", "2.0.0-rc.1+b5"});
}

TEST_CASE("Parse the 'compare' subcommand") {
    cli::options            opts;
    debate::argument_parser parser;
    opts.setup_parser(parser);

    parser.parse_argv({"-l", "debug", "compare", "1.0.0-alpha", "1.0.0"});
    CHECK(opts.subcommand == cli::subcommand::compare);
    CHECK(opts.log_level == log::level::debug);
    CHECK(opts.compare.lhs == "1.0.0-alpha");
    CHECK(opts.compare.rhs == "1.0.0");
}

TEST_CASE("Reject bad command lines") {
    cli::options            opts;
    debate::argument_parser parser;
    opts.setup_parser(parser);

    CHECK_THROWS_AS(parser.parse_argv({}), debate::missing_required);
    CHECK_THROWS_AS(parser.parse_argv({"parse"}), debate::missing_required);
    CHECK_THROWS_AS(parser.parse_argv({"compare", "1.0.0"}), debate::missing_required);
    CHECK_THROWS_AS(parser.parse_argv({"compare", "1.0.0", "2.0.0", "3.0.0"}),
                    debate::unrecognized_argument);
    CHECK_THROWS_AS(parser.parse_argv({"--log-level=loud", "parse", "1.0.0"}),
                    debate::invalid_arguments);
    CHECK_THROWS_AS(parser.parse_argv({"frobnicate"}), debate::unrecognized_argument);
}
