#include "Version.hpp"

#include "Cli.hpp"
#include "Diag.hpp"

#include <fmt/core.h>
#include <openssl/crypto.h>
#include <rs/result.hpp>
#include <spdlog/version.h>
#include <string>
#include <string_view>
#include <tbb/version.h>

#ifndef ORCKA_VERSION
#  error "ORCKA_VERSION is not defined"
#endif

namespace orcka {

static rs::Result<void> versionMain(CliArgsView args);

const Subcmd VERSION_CMD = //
    Subcmd{ "version" }
        .setDesc("Show version information")
        .setMainFn(versionMain);

static std::string compilerVersion() {
#if defined(__clang__)
  return fmt::format("clang {}.{}.{}", __clang_major__, __clang_minor__,
                     __clang_patchlevel__);
#elif defined(__GNUC__)
  return fmt::format("gcc {}.{}.{}", __GNUC__, __GNUC_MINOR__,
                     __GNUC_PATCHLEVEL__);
#else
  return "unknown";
#endif
}

static rs::Result<void> versionMain(const CliArgsView args) {
  // Parse args
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), "version"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else {
      return VERSION_CMD.noSuchArg(*itr);
    }
  }

  fmt::print("orcka {}\n", ORCKA_VERSION);
  if (Diag::isVerbose()) {
    fmt::print("compiler: {}\n", compilerVersion());
    fmt::print("fmt: {}.{}.{}\n", FMT_VERSION / 10000,
               FMT_VERSION / 100 % 100, FMT_VERSION % 100);
    fmt::print("spdlog: {}.{}.{}\n", SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR,
               SPDLOG_VER_PATCH);
    fmt::print("oneTBB: {}\n", TBB_runtime_version());
    fmt::print("OpenSSL: {}\n", OpenSSL_version(OPENSSL_VERSION));
  }
  return rs::Ok();
}

} // namespace orcka
