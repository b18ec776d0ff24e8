#include "./argument_parser.hpp"

#include <catch2/catch.hpp>

namespace {

enum class color {
    red,
    green,
    blue,
};

std::optional<color> color_from_string(std::string_view s) {
    if (s == "red") {
        return color::red;
    } else if (s == "green") {
        return color::green;
    } else if (s == "blue") {
        return color::blue;
    }
    return std::nullopt;
}

}  // namespace

TEST_CASE("Create an argument parser") {
    color       col = color::red;
    std::string file;

    debate::argument_parser parser;
    parser.add_argument(debate::argument{
        .long_spellings  = {"color"},
        .short_spellings = {"c"},
        .help            = "Set the color",
        .valname         = "<color>",
        .action          = debate::parse_into(col, color_from_string),
    });
    parser.add_argument(debate::argument{
        .help    = "A file to read",
        .valname = "<file>",
        .action  = debate::put_into(file),
    });
    parser.parse_argv({"--color=green"});
    CHECK(col == color::green);
    parser.parse_argv({"--color=blue"});
    CHECK(col == color::blue);
    parser.parse_argv({"--color", "red"});
    CHECK(col == color::red);
    parser.parse_argv({"-cgreen"});
    CHECK(col == color::green);
    CHECK_THROWS_AS(parser.parse_argv({"-cgreen", "--color=red"}), debate::invalid_repetition);
    CHECK_THROWS_AS(parser.parse_argv({"--color=purple"}), debate::invalid_arguments);

    parser.parse_argv({"-c", "blue"});
    CHECK(col == color::blue);

    parser.parse_argv({"-cred", "my-file.txt"});
    CHECK(col == color::red);
    CHECK(file == "my-file.txt");

    CHECK_THROWS_AS(parser.parse_argv({"--colour=red"}), debate::unrecognized_argument);
    CHECK_THROWS_AS(parser.parse_argv({"a.txt", "b.txt"}), debate::unrecognized_argument);
    CHECK_THROWS_AS(parser.parse_argv({"--color"}), debate::invalid_arguments);
    CHECK_THROWS_AS(parser.parse_argv({"--help"}), debate::help_request);
    CHECK_THROWS_AS(parser.parse_argv({"-h"}), debate::help_request);
}

TEST_CASE("Switches and repeated positionals") {
    bool                     verbose = false;
    bool                     quiet   = false;
    std::vector<std::string> files;

    debate::argument_parser parser;
    parser.add_argument({
        .short_spellings = {"v"},
        .nargs           = 0,
        .action          = debate::store_value(verbose, true),
    });
    parser.add_argument({
        .short_spellings = {"q"},
        .nargs           = 0,
        .action          = debate::store_value(quiet, true),
    });
    parser.add_argument({
        .valname    = "<file>",
        .required   = true,
        .can_repeat = true,
        .action     = debate::push_back_onto(files),
    });

    CHECK_THROWS_AS(parser.parse_argv({"-v"}), debate::missing_required);

    verbose = false;
    parser.parse_argv({"-vq", "a", "b", "c"});
    CHECK(verbose);
    CHECK(quiet);
    CHECK(files == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("Subcommands") {
    std::optional<bool> do_eat;
    std::optional<bool> scramble_eggs;
    std::string_view    subcommand;
    std::string         egg_name;

    debate::argument_parser parser;
    parser.add_argument({
        .long_spellings = {"eat"},
        .nargs          = 0,
        .action         = debate::store_value(do_eat, true),
    });

    auto& sub = parser.add_subparsers(debate::subparser_group{.valname = "<food>"});
    auto& egg_parser
        = sub.add_parser(debate::subparser{.name   = "egg",
                                           .help   = "It's an egg",
                                           .action = debate::store_value(subcommand, "egg")});
    egg_parser.add_argument(
        {.long_spellings = {"scramble"}, .nargs = 0, .action = debate::store_value(scramble_eggs, true)});
    egg_parser.add_argument({.valname = "<name>", .action = debate::put_into(egg_name)});

    parser.parse_argv({"egg"});
    parser.parse_argv({"--eat", "egg"});
    // Missing the subcommand:
    CHECK_THROWS_AS(parser.parse_argv({"--eat"}), debate::missing_required);
    CHECK_FALSE(scramble_eggs);
    parser.parse_argv({"egg", "--scramble"});
    CHECK(scramble_eggs);
    CHECK(subcommand == "egg");

    do_eat.reset();
    scramble_eggs.reset();
    subcommand = {};
    parser.parse_argv({"egg", "--scramble", "--eat", "humpty"});
    CHECK(do_eat);
    CHECK(scramble_eggs);
    CHECK(subcommand == "egg");
    CHECK(egg_name == "humpty");

    CHECK_THROWS_AS(parser.parse_argv({"bacon"}), debate::unrecognized_argument);
}

TEST_CASE("Usage and help text") {
    std::string             name;
    debate::argument_parser parser{"Greet someone"};
    parser.add_argument({
        .long_spellings = {"name"},
        .help           = "Who to greet",
        .valname        = "<who>",
        .action         = debate::put_into(name),
    });
    parser.parse_argv({"--name=joe"});
    CHECK(name == "joe");

    CHECK(parser.usage_string("prog") == "Usage: prog [--name=<who>]");
    auto help = parser.help_string("prog");
    CHECK(help.find("Greet someone") != help.npos);
    CHECK(help.find("Who to greet") != help.npos);
}
