#pragma once

#include "Manifest.hpp"
#include "Tag/DepGraph.hpp"
#include "Tag/TagGenerator.hpp"

#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace orcka {

namespace fs = std::filesystem;

inline constexpr std::string_view OUTPUT_DIR = ".orcka";

struct RenderOptions {
  // Adds a `<NAME>_PULL_POLICY` variable per tag.
  std::optional<std::string> pullPolicy;
};

// `WEB_TAG_VER = "..."` per tag, then the pull policy variables, with names
// padded to a common width.
std::string renderHcl(const std::vector<GeneratedTag>& tags,
                      const RenderOptions& options = {});

// Graphviz view of the dependency graph.  Manifest targets are labelled with
// their `calculate_on` criteria; edges point from a dependency to its
// dependent.
std::string renderDot(const Manifest& manifest, const DepGraph& graph);

// `<projectContext>/.orcka/<basename of project.write>`
fs::path resolveOutputPath(const fs::path& projectContext,
                           const Project& project);

// Creates missing parent directories.
rs::Result<void> writeOutput(const fs::path& path, std::string_view content);

} // namespace orcka
