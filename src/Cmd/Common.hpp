#pragma once

#include "Bake/BakeCatalog.hpp"
#include "Cli.hpp"
#include "Manifest.hpp"
#include "Tag/DepGraph.hpp"
#include "Validation/Validator.hpp"

#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>

namespace orcka {

namespace fs = std::filesystem;

inline const Opt OPT_FILE = //
    Opt{ "--file" }
        .setShort("-f")
        .setDesc("Path to orcka.toml (default: search upwards from the "
                 "current directory)")
        .setPlaceholder("<PATH>");
inline const Opt OPT_PARSER = //
    Opt{ "--parser" }
        .setDesc("Bake file parser: strict or tolerant")
        .setPlaceholder("<MODE>");

// Options shared by every command that loads a project.
struct ProjectOptions {
  std::optional<fs::path> manifestPath;
  std::optional<std::string> parser;
};

// Handles --file and --parser.  Returns true when `arg` was consumed.
rs::Result<bool> handleProjectOpts(CliArgsView::iterator& itr,
                                   CliArgsView::iterator end,
                                   ProjectOptions& options);

// Everything a command needs, loaded once per run.
struct LoadedProject {
  Manifest manifest;
  fs::path projectContext;
  BakeCatalog catalog;
  DepGraph graph;
};

rs::Result<LoadedProject> loadProject(const ProjectOptions& options);

// Prints warnings, then errors, through Diag.
void printReport(const ValidationReport& report);

} // namespace orcka
