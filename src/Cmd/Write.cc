#include "Write.hpp"

#include "Algos.hpp"
#include "Cli.hpp"
#include "Common.hpp"
#include "Diag.hpp"
#include "Manifest.hpp"
#include "Parallelism.hpp"
#include "Render.hpp"
#include "Tag/ContextResolver.hpp"
#include "Tag/TagGenerator.hpp"
#include "Validation/Validator.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fmt/ranges.h>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace orcka {

static rs::Result<void> writeMain(CliArgsView args);

const Subcmd WRITE_CMD =
    Subcmd{ "write" }
        .setShort("w")
        .setDesc("Validate the project, calculate tags and write the variable "
                 "file")
        .addOpt(OPT_FILE)
        .addOpt(OPT_PARSER)
        .addOpt(Opt{ "--target" }
                    .setShort("-t")
                    .setDesc("Only tag this target and its dependencies "
                             "(repeatable)")
                    .setPlaceholder("<NAME>"))
        .addOpt(Opt{ "--dot" }
                    .setDesc("Also write the dependency graph as Graphviz DOT")
                    .setPlaceholder("<PATH>"))
        .addOpt(Opt{ "--jobs" }
                    .setShort("-j")
                    .setDesc("Number of targets hashed in parallel")
                    .setPlaceholder("<NUM>"))
        .addOpt(Opt{ "--pull-policy" }.setDesc(
            "Write <NAME>_PULL_POLICY variables (default value: never)"))
        .setMainFn(writeMain);

static rs::Result<void> writeMain(const CliArgsView args) {
  // Parse args
  ProjectOptions projectOptions;
  GenerateOptions generateOptions;
  std::optional<fs::path> dotPath;
  bool withPullPolicy = false;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), "write"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (rs_try(handleProjectOpts(itr, args.end(), projectOptions))) {
      continue;
    } else if (matchesAny(arg, { "-t", "--target" })) {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      generateOptions.targets.emplace_back(*++itr);
    } else if (arg == "--dot") {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      dotPath = fs::path(*++itr);
    } else if (matchesAny(arg, { "-j", "--jobs" })) {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      const std::string_view nextArg = *++itr;

      std::uint64_t numThreads{};
      auto [ptr, ec] =
          std::from_chars(nextArg.begin(), nextArg.end(), numThreads);
      rs_ensure(ec == std::errc() && ptr == nextArg.end() && numThreads > 0,
                "invalid number of threads: {}", nextArg);
      setParallelism(numThreads);
    } else if (arg == "--pull-policy") {
      withPullPolicy = true;
    } else {
      return WRITE_CMD.noSuchArg(arg);
    }
  }

  const auto start = std::chrono::steady_clock::now();
  const LoadedProject project = rs_try(loadProject(projectOptions));
  const ContextResolver resolver(project.projectContext, project.catalog);

  const ValidationReport report = validate(project.manifest, project.catalog,
                                           project.graph, resolver);
  printReport(report);
  rs_ensure(report.ok(), "validation failed with {} error(s)",
            report.errors.size());

  const std::vector<std::string> order = rs_try(project.graph.order());
  spdlog::debug("processing order: {}", fmt::join(order, ", "));
  spdlog::debug("hashing with {} of {} threads", getParallelism(),
                numThreads());

  const TagGenerator generator(project.manifest, project.catalog,
                               project.graph, project.projectContext);
  const GenerationResult result = rs_try(generator.generate(generateOptions));
  for (const SkippedTarget& skipped : result.skipped) {
    Diag::info("Skipped", "{} ({})", skipped.name, skipped.reason);
  }
  for (const GeneratedTag& tag : result.tags) {
    Diag::info("Calculated", "{} = \"{}\"", tag.varName, tag.version);
    if (tag.declaredReference.has_value()) {
      spdlog::debug("{} is also declared as {}", tag.imageReference,
                    *tag.declaredReference);
    }
  }

  // Validation guarantees a project section at this point.
  const Project& projectSection = *project.manifest.project;
  RenderOptions renderOptions;
  if (withPullPolicy || projectSection.pullPolicy.has_value()) {
    renderOptions.pullPolicy = projectSection.pullPolicy.value_or("never");
  }
  const fs::path outputPath =
      resolveOutputPath(project.projectContext, projectSection);
  rs_try(writeOutput(outputPath, renderHcl(result.tags, renderOptions)));
  Diag::info("Wrote", "{}", outputPath.string());

  if (dotPath.has_value()) {
    rs_try(writeOutput(*dotPath, renderDot(project.manifest, project.graph)));
    Diag::info("Wrote", "{}", dotPath->string());
  }

  const std::chrono::duration<double> elapsed =
      std::chrono::steady_clock::now() - start;
  Diag::info("Finished", "{} tag(s) in {:.2f}s", result.tags.size(),
             elapsed.count());
  return rs::Ok();
}

} // namespace orcka
