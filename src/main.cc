#include "Cli.hpp"
#include "Diag.hpp"
#include "Driver.hpp"

#include <cstdlib>
#include <exception>
#include <rs/result.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string_view>
#include <utility>
#include <vector>

namespace orcka {

static void initLogger() {
  auto logger = spdlog::stderr_color_mt("orcka");
  logger->set_pattern("%^%l%$: %v");
  spdlog::set_default_logger(std::move(logger));
  Diag::setLevel(DiagLevel::Info);
}

static rs::Result<void> dispatch(const CliArgsView args) {
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    if (arg == "--version" || arg == "-V") {
      return getCli().exec("version", CliArgsView{ itr + 1, args.end() });
    }

    const auto control = rs_try(Cli::handleGlobalOpts(itr, args.end()));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (getCli().hasSubcmd(arg)) {
      return getCli().exec(arg, CliArgsView{ itr + 1, args.end() });
    } else if (arg.starts_with('-')) {
      // Options without a command belong to `write`.
      return getCli().exec("write", CliArgsView{ itr, args.end() });
    } else {
      return getCli().exec(arg, CliArgsView{ itr + 1, args.end() });
    }
  }
  return getCli().exec("write", CliArgsView{});
}

// NOLINTNEXTLINE(*-avoid-c-arrays)
rs::Result<void, void> run(const int argc, char* argv[]) noexcept {
  try {
    initLogger();
    const std::vector<const char*> args(argv + 1, argv + argc);
    if (const auto result = dispatch(args); result.is_err()) {
      Diag::error("{}", result.unwrap_err()->what());
      return rs::Err();
    }
    return rs::Ok();
  } catch (const std::exception& e) {
    Diag::error("{}", e.what());
    return rs::Err();
  }
}

} // namespace orcka

int main(int argc, char* argv[]) {
  return orcka::run(argc, argv).is_ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}
