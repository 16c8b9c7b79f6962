#pragma once

#include "Bake/BakeCatalog.hpp"
#include "Bake/BakeTarget.hpp"
#include "Manifest.hpp"
#include "Tag/ContextResolver.hpp"
#include "Tag/DepGraph.hpp"
#include "Tag/HashEngine.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace orcka {

namespace fs = std::filesystem;

inline constexpr std::size_t VERSION_TOKEN_WIDTH = 40;

struct GeneratedTag {
  std::string name;
  std::string varName;
  std::string version;
  // `<image>:<version>`
  std::string imageReference;
  std::optional<std::string> declaredTag;
  std::optional<std::string> declaredReference;
};

struct SkippedTarget {
  std::string name;
  std::string reason;
};

struct GenerateOptions {
  // Restricts generation to these targets and their dependencies.  Empty
  // means every target.
  std::vector<std::string> targets;
  // Target name to a tag declared elsewhere (e.g. a compose file).  Reported
  // alongside the generated tag, never hashed.
  std::unordered_map<std::string, std::string> declaredTags;
  std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
  // Defaults to a stamp derived from `now`.
  std::optional<std::string> runStamp;
};

struct GenerationResult {
  // In processing order.
  std::vector<GeneratedTag> tags;
  ResolvedTags resolvedTags;
  std::vector<SkippedTarget> skipped;
};

// `web-app` -> `WEB_APP_TAG_VER`
std::string makeVariableName(std::string_view targetName);

// `hexDigest` truncated to VERSION_TOKEN_WIDTH, prefixed by `<bucket>_` when
// the bucket is non-empty.  The result is never wider than
// VERSION_TOKEN_WIDTH.
std::string makeVersionToken(std::string_view hexDigest,
                             std::string_view bucket);

class TagGenerator {
public:
  TagGenerator(const Manifest& manifest, const BakeCatalog& catalog,
               const DepGraph& graph, fs::path projectContext);

  // Walks the graph level by level.  Tokens of one level are published to
  // the resolved-tag map before the next level starts; with parallelism
  // enabled the targets of a level are hashed concurrently.
  rs::Result<GenerationResult> generate(const GenerateOptions& options) const;

private:
  const Manifest& manifest;
  const BakeCatalog& catalog;
  const DepGraph& graph;
  ContextResolver resolver;

  rs::Result<GeneratedTag> hashTarget(const BakeTarget& target,
                                      const ResolvedTags& resolvedTags,
                                      const GenerateOptions& options,
                                      const std::string& runStamp) const;
};

} // namespace orcka
