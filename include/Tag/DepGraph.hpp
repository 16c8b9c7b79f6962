#pragma once

#include "Bake/BakeCatalog.hpp"
#include "Manifest.hpp"

#include <map>
#include <rs/result.hpp>
#include <string>
#include <unordered_set>
#include <vector>

namespace orcka {

struct DepOrphan {
  std::string from;
  std::string missing;

  std::string message() const;
};

std::string formatCycle(const std::vector<std::string>& cycle);

// Graph over target names: manifest targets and bake targets are nodes;
// `depends_on`, `resolves` and `target:` contexts are edges.
class DepGraph {
public:
  DepGraph() = default;
  explicit DepGraph(std::map<std::string, std::vector<std::string>> edges);

  static DepGraph build(const Manifest& manifest, const BakeCatalog& catalog);

  const std::map<std::string, std::vector<std::string>>& edges() const noexcept {
    return edges_;
  }
  bool contains(const std::string& name) const;
  // Sorted, without duplicates.  Includes names that are not nodes.
  const std::vector<std::string>& dependenciesOf(const std::string& name) const;

  // Each cycle starts and ends with the same node.
  std::vector<std::vector<std::string>> findCycles() const;
  std::vector<DepOrphan> findOrphans() const;

  // Fails on the first cycle or orphan.
  rs::Result<void> checkStructure() const;

  // Level 0 holds nodes without known dependencies; level N holds nodes
  // whose deepest dependency is on level N - 1.  Names are sorted within a
  // level.
  rs::Result<std::vector<std::vector<std::string>>> levels() const;
  rs::Result<std::vector<std::string>> order() const;

  // `seeds` and everything they transitively depend on.
  std::unordered_set<std::string>
  closure(const std::vector<std::string>& seeds) const;

private:
  std::map<std::string, std::vector<std::string>> edges_;
};

} // namespace orcka
