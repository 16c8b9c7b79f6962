#include "Cli.hpp"

#include "Algos.hpp"
#include "Cmd/Help.hpp"
#include "Cmd/Validate.hpp"
#include "Cmd/Version.hpp"
#include "Cmd/Write.hpp"
#include "Diag.hpp"

#include <algorithm>
#include <cstddef>
#include <fmt/core.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>

namespace orcka {

const Cli& getCli() {
  static const Cli cli = //
      Cli{ "Content-addressed image tags for docker bake targets" }
          .addOpt(Opt{ "--verbose" }
                      .setShort("-v")
                      .setDesc("Use verbose output (-vv very verbose output)"))
          .addOpt(Opt{ "-vv" }.setDesc("Use very verbose output"))
          .addOpt(Opt{ "--quiet" }
                      .setShort("-q")
                      .setDesc("Do not print orcka log messages"))
          .addOpt(Opt{ "--color" }
                      .setDesc("Coloring: auto, always, never")
                      .setPlaceholder("<WHEN>"))
          .addOpt(Opt{ "--help" }.setShort("-h").setDesc("Print help"))
          .addSubcmd(WRITE_CMD)
          .addSubcmd(VALIDATE_CMD)
          .addSubcmd(VERSION_CMD)
          .addSubcmd(HELP_CMD);
  return cli;
}

std::size_t Opt::leftSize() const {
  std::size_t size = name.size();
  if (!shortName.empty()) {
    size += shortName.size() + 2;
  }
  if (!placeholder.empty()) {
    size += placeholder.size() + 1;
  }
  return size;
}

std::string Opt::format(const std::size_t width) const {
  std::string left;
  if (!shortName.empty()) {
    left = fmt::format("{}, ", shortName);
  }
  left += name;
  if (!placeholder.empty()) {
    left += fmt::format(" {}", placeholder);
  }
  return fmt::format("  {:<{}}  {}\n", left, width, desc);
}

std::string Arg::usage() const {
  return required ? fmt::format("<{}>", name) : fmt::format("[{}]", name);
}

rs::Result<void> Subcmd::run(const CliArgsView args) const {
  rs_ensure(mainFn != nullptr, "`{}` has no entry point", name);
  return mainFn(args);
}

rs::Result<void> Subcmd::missingOptArgumentFor(const std::string_view arg) {
  rs_bail("Missing argument for `{}`", arg);
}

rs::Result<void> Subcmd::noSuchArg(const std::string_view arg) const {
  rs_bail("unexpected argument `{}` found\n\nFor more information, try "
          "`orcka help {}`",
          arg, name);
}

void Subcmd::printHelp() const {
  fmt::print("{}\n\n", desc);
  fmt::print("Usage: orcka {} [OPTIONS]{}\n\n", name,
             arg.has_value() ? fmt::format(" {}", arg->usage()) : "");

  std::size_t width = 0;
  for (const Opt& opt : getCli().globalOpts()) {
    width = std::max(width, opt.leftSize());
  }
  for (const Opt& opt : opts) {
    width = std::max(width, opt.leftSize());
  }

  fmt::print("Options:\n");
  for (const Opt& opt : getCli().globalOpts()) {
    fmt::print("{}", opt.format(width));
  }
  for (const Opt& opt : opts) {
    fmt::print("{}", opt.format(width));
  }

  if (arg.has_value()) {
    fmt::print("\nArguments:\n  {:<{}}  {}\n", arg->usage(), width,
               arg->getDesc());
  }
}

const Subcmd* Cli::findSubcmd(const std::string_view name) const {
  const auto itr = std::ranges::find_if(subcmds, [name](const Subcmd& cmd) {
    return cmd.getName() == name
           || (!cmd.getShort().empty() && cmd.getShort() == name);
  });
  if (itr == subcmds.end()) {
    return nullptr;
  }
  return &*itr;
}

bool Cli::hasSubcmd(const std::string_view name) const {
  return findSubcmd(name) != nullptr;
}

rs::Result<void> Cli::exec(const std::string_view subcmd,
                           const CliArgsView args) const {
  const Subcmd* cmd = findSubcmd(subcmd);
  rs_ensure(cmd != nullptr,
            "no such command: `{}`\n\nFor a list of commands, try "
            "`orcka help`",
            subcmd);
  return cmd->run(args);
}

void Cli::printMainHelp() const {
  fmt::print("{}\n\n", desc);
  fmt::print("Usage: orcka [OPTIONS] [COMMAND]\n\n");

  std::size_t width = 0;
  for (const Opt& opt : opts) {
    width = std::max(width, opt.leftSize());
  }
  for (const Subcmd& cmd : subcmds) {
    width = std::max(width, cmd.getName().size());
  }

  fmt::print("Options:\n");
  for (const Opt& opt : opts) {
    fmt::print("{}", opt.format(width));
  }
  fmt::print("\nCommands:\n");
  for (const Subcmd& cmd : subcmds) {
    fmt::print("  {:<{}}  {}\n", cmd.getName(), width, cmd.getDesc());
  }
  fmt::print("\nSee `orcka help <command>` for more information on a "
             "specific command.\n");
}

rs::Result<void> Cli::printHelp(const CliArgsView args) const {
  if (args.empty()) {
    printMainHelp();
    return rs::Ok();
  }

  const std::string_view name = args.front();
  const Subcmd* cmd = findSubcmd(name);
  rs_ensure(cmd != nullptr, "no such command: `{}`", name);
  cmd->printHelp();
  return rs::Ok();
}

rs::Result<Cli::ControlFlow>
Cli::handleGlobalOpts(CliArgsView::iterator& itr,
                      const CliArgsView::iterator end,
                      const std::string_view subcmd) {
  const std::string_view arg = *itr;

  if (matchesAny(arg, { "-h", "--help" })) {
    if (subcmd.empty()) {
      getCli().printMainHelp();
    } else if (const Subcmd* cmd = getCli().findSubcmd(subcmd)) {
      cmd->printHelp();
    }
    return rs::Ok(Return);
  } else if (matchesAny(arg, { "-v", "--verbose" })) {
    Diag::setLevel(Diag::isVerbose() ? DiagLevel::VeryVerbose
                                     : DiagLevel::Verbose);
    return rs::Ok(Continue);
  } else if (arg == "-vv") {
    Diag::setLevel(DiagLevel::VeryVerbose);
    return rs::Ok(Continue);
  } else if (matchesAny(arg, { "-q", "--quiet" })) {
    Diag::setLevel(DiagLevel::Error);
    return rs::Ok(Continue);
  } else if (arg.starts_with("--color=")) {
    setColorMode(arg.substr(std::string_view("--color=").size()));
    return rs::Ok(Continue);
  } else if (arg == "--color") {
    rs_ensure(itr + 1 != end, "Missing argument for `{}`", arg);
    setColorMode(*++itr);
    return rs::Ok(Continue);
  }
  return rs::Ok(Fallthrough);
}

} // namespace orcka
