#include "Help.hpp"

#include "Cli.hpp"

#include <rs/result.hpp>

namespace orcka {

static rs::Result<void> helpMain(CliArgsView args);

const Subcmd HELP_CMD = //
    Subcmd{ "help" }
        .setDesc("Displays help for an orcka subcommand")
        .setArg(Arg{ "COMMAND" }.setRequired(false))
        .setMainFn(helpMain);

static rs::Result<void> helpMain(const CliArgsView args) {
  return getCli().printHelp(args);
}

} // namespace orcka
