#pragma once

#include "Bake/BakeParser.hpp"
#include "Bake/BakeTarget.hpp"
#include "Finding.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace orcka {

namespace fs = std::filesystem;

// All bake targets of a project, merged across bake files.
class BakeCatalog {
public:
  BakeCatalog() = default;

  // Unreadable or unparsable files and duplicate target names are recorded
  // as issues; the remaining files still contribute their targets.
  static BakeCatalog load(const fs::path& projectContext,
                          const std::vector<std::string>& bakeFiles,
                          const BakeParser& parser);
  static BakeCatalog fromFiles(std::vector<BakeFile> files);

  const BakeTarget* find(std::string_view name) const;
  const std::map<std::string, BakeTarget>& targets() const noexcept {
    return targets_;
  }
  const std::vector<BakeFile>& files() const noexcept { return files_; }
  const std::vector<Finding>& issues() const noexcept { return issues_; }

  bool declaresVariable(std::string_view name) const;

private:
  void add(BakeFile file);

  std::vector<BakeFile> files_;
  std::map<std::string, BakeTarget> targets_;
  std::unordered_set<std::string> variables_;
  std::vector<Finding> issues_;
};

} // namespace orcka
