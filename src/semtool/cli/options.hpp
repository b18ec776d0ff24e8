#pragma once

#include <semtool/util/log.hpp>

#include <debate/argument_parser.hpp>

#include <string>
#include <vector>

namespace semtool::cli {

/**
 * @brief Top-level semtool subcommands
 */
enum class subcommand {
    _none_,
    parse,
    compare,
};

/**
 * @brief Complete aggregate of all semtool command-line options
 */
struct options {
    options() noexcept;

    // The `--log-level` argument
    log::level log_level = log::level::info;

    // The top-most selected subcommand
    enum subcommand subcommand = subcommand::_none_;

    /**
     * @brief Parameters specific to 'semtool parse'
     */
    struct {
        /// The version strings given on the command line
        std::vector<std::string> versions;
    } parse;

    /**
     * @brief Parameters specific to 'semtool compare'
     */
    struct {
        std::string lhs;
        std::string rhs;
    } compare;

    /**
     * @brief Attach command-line arguments to the given argument parser. Parsing with the
     * argument parser will fill out the options object.
     */
    void setup_parser(debate::argument_parser& parser) noexcept;
};

}  // namespace semtool::cli
