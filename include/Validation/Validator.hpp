#pragma once

#include "Algos.hpp"
#include "Bake/BakeCatalog.hpp"
#include "Finding.hpp"
#include "Manifest.hpp"
#include "Tag/ContextResolver.hpp"
#include "Tag/DepGraph.hpp"

#include <functional>
#include <string_view>
#include <vector>

namespace orcka {

struct ValidationReport {
  std::vector<Finding> errors;
  std::vector<Finding> warnings;

  bool ok() const noexcept { return errors.empty(); }
};

struct ValidateOptions {
  // Looks up external executables such as `jq`.
  std::function<bool(std::string_view)> commandExists = orcka::commandExists;
};

// Required sections and fields, `calculate_on` criteria, period and
// `context_of` values.  Shape issues recorded while loading the manifest
// come first.
std::vector<Finding> validateSchema(const Manifest& manifest);

// Duplicate bake targets, manifest targets missing from every bake file,
// cycles and dangling references.
std::vector<Finding> validateDependencies(const Manifest& manifest,
                                          const BakeCatalog& catalog,
                                          const DepGraph& graph);

// Dockerfiles of manifest targets and every `calculate_on` file, resolved
// through the target's context.  Bake files themselves are checked while the
// catalog loads.
std::vector<Finding> validateFiles(const Manifest& manifest,
                                   const BakeCatalog& catalog,
                                   const ContextResolver& resolver);

std::vector<Finding> validateExternalTools(const Manifest& manifest,
                                           const ValidateOptions& options);

std::vector<Finding> generateWarnings(const Manifest& manifest,
                                      const BakeCatalog& catalog);

// Runs every check; nothing short-circuits.
ValidationReport validate(const Manifest& manifest, const BakeCatalog& catalog,
                          const DepGraph& graph,
                          const ContextResolver& resolver,
                          const ValidateOptions& options = {});

} // namespace orcka
