#include "Validate.hpp"

#include "Cli.hpp"
#include "Common.hpp"
#include "Diag.hpp"
#include "Tag/ContextResolver.hpp"
#include "Validation/Validator.hpp"

#include <rs/result.hpp>
#include <string_view>

namespace orcka {

static rs::Result<void> validateMain(CliArgsView args);

const Subcmd VALIDATE_CMD = //
    Subcmd{ "validate" }
        .setDesc("Check the manifest, bake files and dependency graph")
        .addOpt(OPT_FILE)
        .addOpt(OPT_PARSER)
        .setMainFn(validateMain);

static rs::Result<void> validateMain(const CliArgsView args) {
  // Parse args
  ProjectOptions projectOptions;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), "validate"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (rs_try(handleProjectOpts(itr, args.end(), projectOptions))) {
      continue;
    } else {
      return VALIDATE_CMD.noSuchArg(arg);
    }
  }

  const LoadedProject project = rs_try(loadProject(projectOptions));
  const ContextResolver resolver(project.projectContext, project.catalog);
  const ValidationReport report =
      validate(project.manifest, project.catalog, project.graph, resolver);
  printReport(report);

  rs_ensure(report.ok(), "validation failed with {} error(s)",
            report.errors.size());
  Diag::info("Validated", "{} ({} target(s), {} warning(s))",
             project.manifest.path.string(), project.manifest.targets.size(),
             report.warnings.size());
  return rs::Ok();
}

} // namespace orcka
