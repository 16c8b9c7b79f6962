#pragma once

#include "Bake/BakeCatalog.hpp"
#include "Manifest.hpp"

#include <filesystem>
#include <string_view>

namespace orcka {

namespace fs = std::filesystem;

// Working directories used to read dockerfiles and `calculate_on` files.
// Lookups that cannot be satisfied fall back to the project context.
class ContextResolver {
public:
  ContextResolver(fs::path projectContext, const BakeCatalog& catalog);

  // `dirname(manifestPath) / project.context`, absolute and normalized.
  static fs::path resolveProjectContext(const fs::path& manifestPath,
                                        const Project& project);

  const fs::path& projectContext() const noexcept { return projectContext_; }

  fs::path resolveTargetContext(std::string_view targetName,
                                ContextOf contextOf) const;
  fs::path resolveFilePath(std::string_view targetName, ContextOf contextOf,
                           const fs::path& relativePath) const;

private:
  fs::path projectContext_;
  const BakeCatalog& catalog;
};

} // namespace orcka
