#pragma once

#include "Bake/BakeTarget.hpp"
#include "Manifest.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace orcka {

namespace fs = std::filesystem;

// Target name to version token, for targets already processed in this run.
using ResolvedTags = std::unordered_map<std::string, std::string>;

struct HashPaths {
  // Dockerfiles are read relative to `projectContext / context`.
  fs::path projectContext;
  // `calculate_on` files are read relative to this.
  fs::path targetContext;
};

struct HashOptions {
  // Emitted as `period:<bucket>` when `calculate_on.period` is set.
  std::optional<std::string> periodBucket;
  // Emitted as `always:<runStamp>` when `calculate_on.always` is set.
  std::string runStamp;
  // The manifest's `resolves` names.  Hashed together with `depends_on`.
  std::vector<std::string> resolves;
};

// Assembles the digest input of one target: `category:payload` lines in a
// fixed order.  Paths in the payload are the declared relative ones, so
// moving the project does not change the result.  Unreadable files
// contribute their path instead of their content.
std::string buildHashInput(const BakeTarget& target,
                           const std::optional<CalculateOn>& calculateOn,
                           const ResolvedTags& resolvedTags,
                           const HashPaths& paths, const HashOptions& options);

} // namespace orcka
