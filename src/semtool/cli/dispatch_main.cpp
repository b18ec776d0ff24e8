#include "./dispatch_main.hpp"

#include "./cmd/commands.hpp"
#include "./error_handler.hpp"
#include "./options.hpp"

#include <semtool/util/log.hpp>

using namespace semtool;

namespace semtool::cli {

int dispatch_main(const options& opts) noexcept {
    return semtool::handle_cli_errors([&] {
        switch (opts.subcommand) {
        case subcommand::parse:
            return cmd::parse(opts);
        case subcommand::compare:
            return cmd::compare(opts);
        case subcommand::_none_:;
        }
        semtool_log(critical, "No subcommand was selected");
        return 2;
    });
}

}  // namespace semtool::cli
