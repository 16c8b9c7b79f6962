#include "Common.hpp"

#include "Algos.hpp"
#include "Bake/BakeCatalog.hpp"
#include "Bake/BakeParser.hpp"
#include "Cli.hpp"
#include "Diag.hpp"
#include "Manifest.hpp"
#include "Tag/ContextResolver.hpp"
#include "Tag/DepGraph.hpp"
#include "Validation/Validator.hpp"

#include <filesystem>
#include <fmt/core.h>
#include <memory>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace orcka {

rs::Result<bool> handleProjectOpts(CliArgsView::iterator& itr,
                                   const CliArgsView::iterator end,
                                   ProjectOptions& options) {
  const std::string_view arg = *itr;
  if (matchesAny(arg, { "-f", "--file" })) {
    rs_ensure(itr + 1 != end, "Missing argument for `{}`", arg);
    options.manifestPath = fs::path(*++itr);
    return rs::Ok(true);
  } else if (arg == "--parser") {
    rs_ensure(itr + 1 != end, "Missing argument for `{}`", arg);
    options.parser = std::string(*++itr);
    return rs::Ok(true);
  }
  return rs::Ok(false);
}

rs::Result<LoadedProject> loadProject(const ProjectOptions& options) {
  LoadedProject loaded;
  if (options.manifestPath.has_value()) {
    const fs::path manifestPath = fs::absolute(*options.manifestPath);
    rs_ensure(fs::is_regular_file(manifestPath), "manifest not found: `{}`",
              manifestPath.string());
    loaded.manifest =
        rs_try(Manifest::tryParse(manifestPath, /*findParents=*/false));
  } else {
    loaded.manifest = rs_try(Manifest::tryParse());
  }
  spdlog::debug("using manifest {}", loaded.manifest.path.string());

  std::vector<std::string> bakeFiles;
  std::string parserName = "tolerant";
  if (loaded.manifest.project.has_value()) {
    const Project& project = *loaded.manifest.project;
    loaded.projectContext = ContextResolver::resolveProjectContext(
        loaded.manifest.path, project);
    bakeFiles = project.bake;
    parserName = project.parser.value_or(parserName);
  } else {
    loaded.projectContext = normalizeDir(loaded.manifest.dir());
  }
  if (options.parser.has_value()) {
    parserName = *options.parser;
  }

  const BakeParserMode mode = rs_try(parseBakeParserMode(parserName));
  const std::unique_ptr<BakeParser> parser = makeBakeParser(mode);
  spdlog::debug("loading {} bake file(s) with the {} parser",
                bakeFiles.size(), toString(mode));

  loaded.catalog =
      BakeCatalog::load(loaded.projectContext, bakeFiles, *parser);
  loaded.graph = DepGraph::build(loaded.manifest, loaded.catalog);
  return rs::Ok(std::move(loaded));
}

static std::string describe(const Finding& finding) {
  if (finding.path.has_value() && finding.target.has_value()) {
    return fmt::format("{} [{}, {}]", finding.message, *finding.target,
                       *finding.path);
  }
  if (finding.path.has_value()) {
    return fmt::format("{} [{}]", finding.message, *finding.path);
  }
  return finding.message;
}

void printReport(const ValidationReport& report) {
  for (const Finding& warning : report.warnings) {
    Diag::warn("{}: {}", warning.type, describe(warning));
  }
  for (const Finding& error : report.errors) {
    Diag::error("{}: {}", error.type, describe(error));
  }
}

} // namespace orcka
