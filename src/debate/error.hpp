#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace debate {

struct argument;
class argument_parser;

struct help_request : std::exception {
    const char* what() const noexcept override { return "Help was requested"; }
};

struct invalid_arguments : std::runtime_error {
    using runtime_error::runtime_error;
};

struct unrecognized_argument : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

struct missing_required : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

struct invalid_repetition : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

/// The argument that was being processed
struct e_argument {
    const debate::argument& value;
};

/// The parser (or subcommand parser) that was active
struct e_argument_parser {
    const debate::argument_parser& value;
};

/// A value that was rejected by an argument's action
struct e_invalid_arg_value {
    std::string value;
};

/// The number of values that were actually given to an argument
struct e_wrong_val_num {
    int value;
};

/// The argument as it was spelled on the command line
struct e_arg_spelling {
    std::string value;
};

}  // namespace debate
