#include "Tag/DepGraph.hpp"

#include "Bake/BakeCatalog.hpp"
#include "Bake/BakeTarget.hpp"
#include "Manifest.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <iterator>
#include <map>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace orcka {

std::string DepOrphan::message() const {
  return fmt::format("Target '{}' depends on '{}', which is not found in any "
                     "of the specified bake files.",
                     from, missing);
}

std::string formatCycle(const std::vector<std::string>& cycle) {
  return fmt::format("Cyclic dependency found: {}",
                     fmt::join(cycle, " → "));
}

DepGraph::DepGraph(std::map<std::string, std::vector<std::string>> edges)
    : edges_(std::move(edges)) {
  for (auto& [_, deps] : edges_) {
    std::ranges::sort(deps);
    deps.erase(std::ranges::unique(deps).begin(), deps.end());
  }
}

DepGraph DepGraph::build(const Manifest& manifest, const BakeCatalog& catalog) {
  std::map<std::string, std::vector<std::string>> edges;
  for (const auto& [name, target] : catalog.targets()) {
    std::vector<std::string>& deps = edges[name];
    deps.insert(deps.end(), target.dependsOn.begin(), target.dependsOn.end());
    for (std::string& ref : target.contextRefs()) {
      deps.push_back(std::move(ref));
    }
  }
  for (const auto& [name, spec] : manifest.targets) {
    std::vector<std::string>& deps = edges[name];
    deps.insert(deps.end(), spec.resolves.begin(), spec.resolves.end());
  }
  spdlog::debug("dependency graph has {} nodes", edges.size());
  return DepGraph(std::move(edges));
}

bool DepGraph::contains(const std::string& name) const {
  return edges_.contains(name);
}

const std::vector<std::string>&
DepGraph::dependenciesOf(const std::string& name) const {
  static const std::vector<std::string> none;
  const auto itr = edges_.find(name);
  if (itr == edges_.end()) {
    return none;
  }
  return itr->second;
}

enum class VisitState : std::uint8_t { Unvisited, OnStack, Done };

static void
visit(const std::string& node,
      const std::map<std::string, std::vector<std::string>>& edges,
      std::unordered_map<std::string, VisitState>& state,
      std::vector<std::string>& stack,
      std::vector<std::vector<std::string>>& cycles) {
  state[node] = VisitState::OnStack;
  stack.push_back(node);

  for (const std::string& dep : edges.at(node)) {
    if (!edges.contains(dep)) {
      continue;
    }
    const VisitState depState = state[dep];
    if (depState == VisitState::OnStack) {
      const auto start = std::ranges::find(stack, dep);
      std::vector<std::string> cycle(start, stack.end());
      cycle.push_back(dep);
      cycles.push_back(std::move(cycle));
    } else if (depState == VisitState::Unvisited) {
      visit(dep, edges, state, stack, cycles);
    }
  }

  stack.pop_back();
  state[node] = VisitState::Done;
}

std::vector<std::vector<std::string>> DepGraph::findCycles() const {
  std::unordered_map<std::string, VisitState> state;
  std::vector<std::string> stack;
  std::vector<std::vector<std::string>> cycles;
  for (const auto& [name, _] : edges_) {
    if (state[name] == VisitState::Unvisited) {
      visit(name, edges_, state, stack, cycles);
    }
  }
  return cycles;
}

std::vector<DepOrphan> DepGraph::findOrphans() const {
  std::vector<DepOrphan> orphans;
  for (const auto& [name, deps] : edges_) {
    for (const std::string& dep : deps) {
      if (!edges_.contains(dep)) {
        orphans.push_back(DepOrphan{ .from = name, .missing = dep });
      }
    }
  }
  return orphans;
}

rs::Result<void> DepGraph::checkStructure() const {
  const std::vector<std::vector<std::string>> cycles = findCycles();
  if (!cycles.empty()) {
    rs_bail("{}", formatCycle(cycles.front()));
  }
  const std::vector<DepOrphan> orphans = findOrphans();
  if (!orphans.empty()) {
    rs_bail("{}", orphans.front().message());
  }
  return rs::Ok();
}

static std::size_t
levelOf(const std::string& node,
        const std::map<std::string, std::vector<std::string>>& edges,
        std::unordered_map<std::string, std::size_t>& memo) {
  if (const auto itr = memo.find(node); itr != memo.end()) {
    return itr->second;
  }

  std::size_t level = 0;
  for (const std::string& dep : edges.at(node)) {
    if (edges.contains(dep)) {
      level = std::max(level, levelOf(dep, edges, memo) + 1);
    }
  }
  memo.emplace(node, level);
  return level;
}

rs::Result<std::vector<std::vector<std::string>>> DepGraph::levels() const {
  rs_try(checkStructure());

  std::unordered_map<std::string, std::size_t> memo;
  std::vector<std::vector<std::string>> levels;
  // edges_ is ordered by name, so every level comes out sorted.
  for (const auto& [name, _] : edges_) {
    const std::size_t level = levelOf(name, edges_, memo);
    if (levels.size() <= level) {
      levels.resize(level + 1);
    }
    levels[level].push_back(name);
  }
  return rs::Ok(std::move(levels));
}

rs::Result<std::vector<std::string>> DepGraph::order() const {
  std::vector<std::vector<std::string>> grouped = rs_try(levels());
  std::vector<std::string> order;
  for (std::vector<std::string>& level : grouped) {
    order.insert(order.end(), std::make_move_iterator(level.begin()),
                 std::make_move_iterator(level.end()));
  }
  return rs::Ok(std::move(order));
}

std::unordered_set<std::string>
DepGraph::closure(const std::vector<std::string>& seeds) const {
  std::unordered_set<std::string> reached;
  std::vector<std::string> pending(seeds.begin(), seeds.end());
  while (!pending.empty()) {
    std::string name = std::move(pending.back());
    pending.pop_back();
    if (!reached.insert(name).second) {
      continue;
    }
    for (const std::string& dep : dependenciesOf(name)) {
      if (!reached.contains(dep)) {
        pending.push_back(dep);
      }
    }
  }
  return reached;
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <rs/tests.hpp>

// NOLINTBEGIN
using namespace orcka;
// NOLINTEND

using Edges = std::map<std::string, std::vector<std::string>>;

static void testCycle() {
  const DepGraph graph(Edges{ { "a", { "b" } }, { "b", { "a" } }, { "c", {} } });

  const auto cycles = graph.findCycles();
  tests::assertEq(cycles.size(), 1UL);
  tests::assertEq(fmt::format("{}", fmt::join(cycles[0], ",")), "a,b,a");
  tests::assertEq(formatCycle(cycles[0]),
                  "Cyclic dependency found: a → b → a");
  tests::assertEq(graph.checkStructure().unwrap_err()->what(),
                  "Cyclic dependency found: a → b → a");
  tests::assertTrue(graph.order().is_err());

  tests::pass();
}

static void testSelfCycle() {
  const DepGraph graph(Edges{ { "a", { "a" } } });

  const auto cycles = graph.findCycles();
  tests::assertEq(cycles.size(), 1UL);
  tests::assertEq(formatCycle(cycles[0]),
                  "Cyclic dependency found: a → a");

  tests::pass();
}

static void testOrphans() {
  const DepGraph graph(Edges{ { "web", { "base", "db" } }, { "base", {} } });

  const auto orphans = graph.findOrphans();
  tests::assertEq(orphans.size(), 1UL);
  tests::assertEq(orphans[0].from, "web");
  tests::assertEq(orphans[0].missing, "db");
  tests::assertEq(graph.checkStructure().unwrap_err()->what(),
                  "Target 'web' depends on 'db', which is not found in any of "
                  "the specified bake files.");

  tests::pass();
}

static void testOrder() {
  const DepGraph graph(Edges{
      { "web", { "base", "node" } },
      { "node", { "base" } },
      { "base", {} },
      { "api", { "base" } },
      { "tools", {} },
  });

  const auto levels = graph.levels().unwrap();
  tests::assertEq(levels.size(), 3UL);
  tests::assertEq(fmt::format("{}", fmt::join(levels[0], ",")), "base,tools");
  tests::assertEq(fmt::format("{}", fmt::join(levels[1], ",")), "api,node");
  tests::assertEq(fmt::format("{}", fmt::join(levels[2], ",")), "web");
  tests::assertEq(fmt::format("{}", fmt::join(graph.order().unwrap(), ",")),
                  "base,tools,api,node,web");

  tests::pass();
}

static void testBuild() {
  Manifest manifest;
  manifest.targets.emplace("web", TargetSpec{ .name = "web",
                                              .calculateOn = std::nullopt,
                                              .contextOf = std::nullopt,
                                              .resolves = { "config" },
                                              .skipCalculate = false });
  manifest.targets.emplace("config", TargetSpec{ .name = "config",
                                                 .calculateOn = std::nullopt,
                                                 .contextOf = std::nullopt,
                                                 .resolves = {},
                                                 .skipCalculate = false });

  BakeTarget web;
  web.name = "web";
  web.dependsOn = { "base", "base" };
  web.contexts.emplace("assets", TargetRef{ "assets" });
  web.contexts.emplace("src", LiteralContext{ "./web" });
  BakeTarget base;
  base.name = "base";
  BakeTarget assets;
  assets.name = "assets";

  const BakeCatalog catalog = BakeCatalog::fromFiles({ BakeFile{
      .path = "docker-bake.hcl",
      .targets = { web, base, assets },
      .variables = {} } });

  const DepGraph graph = DepGraph::build(manifest, catalog);
  tests::assertEq(graph.edges().size(), 4UL);
  tests::assertTrue(graph.contains("config"));
  tests::assertEq(fmt::format("{}", fmt::join(graph.dependenciesOf("web"), ",")),
                  "assets,base,config");
  tests::assertTrue(graph.dependenciesOf("missing").empty());
  tests::assertTrue(graph.checkStructure().is_ok());

  tests::pass();
}

static void testClosure() {
  const DepGraph graph(Edges{
      { "web", { "base" } },
      { "base", { "os" } },
      { "os", {} },
      { "api", { "os" } },
  });

  const auto reached = graph.closure({ "web" });
  tests::assertEq(reached.size(), 3UL);
  tests::assertTrue(reached.contains("os"));
  tests::assertFalse(reached.contains("api"));
  tests::assertTrue(graph.closure({}).empty());

  tests::pass();
}

int main() {
  testCycle();
  testSelfCycle();
  testOrphans();
  testOrder();
  testBuild();
  testClosure();
}

#endif
