#include "Tag/HashEngine.hpp"

#include "Algos.hpp"
#include "Bake/BakeTarget.hpp"
#include "Manifest.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace orcka {

template <typename V>
static std::vector<std::pair<std::string, V>>
sortedEntries(const std::unordered_map<std::string, V>& map) {
  std::vector<std::pair<std::string, V>> entries(map.begin(), map.end());
  std::ranges::sort(entries, {}, &std::pair<std::string, V>::first);
  return entries;
}

static void addDockerfile(const BakeTarget& target, const HashPaths& paths,
                          std::vector<std::string>& lines) {
  if (!target.dockerfile.has_value()) {
    return;
  }
  const fs::path dockerfilePath = paths.projectContext
                                  / target.context.value_or(".")
                                  / *target.dockerfile;
  if (const auto content = readFile(dockerfilePath)) {
    lines.push_back(fmt::format("dockerfile:{}", *content));
  } else {
    spdlog::debug("{}: cannot read dockerfile {}", target.name,
                  dockerfilePath.string());
    lines.push_back(fmt::format("dockerfile-path:{}", *target.dockerfile));
  }
}

static void addFiles(const std::string& targetName,
                     const CalculateOn& calculateOn, const HashPaths& paths,
                     std::vector<std::string>& lines) {
  for (const std::string& file : calculateOn.files) {
    const fs::path filePath = paths.targetContext / file;
    if (const auto content = readFile(filePath)) {
      lines.push_back(fmt::format("file:{}:{}", file, *content));
    } else {
      spdlog::debug("{}: cannot read {}", targetName, filePath.string());
      lines.push_back(fmt::format("file-path:{}", file));
    }
  }

  if (!calculateOn.jq.has_value() || calculateOn.jq->filename.empty()) {
    return;
  }
  const JqCriterion& jq = *calculateOn.jq;
  const fs::path jqPath = paths.targetContext / jq.filename;
  if (const auto content = readFile(jqPath)) {
    lines.push_back(
        fmt::format("jq:{}:{}:{}", jq.filename, jq.selector, *content));
  } else {
    spdlog::debug("{}: cannot read {}", targetName, jqPath.string());
    lines.push_back(fmt::format("jq-path:{}:{}", jq.filename, jq.selector));
  }
}

std::string buildHashInput(const BakeTarget& target,
                           const std::optional<CalculateOn>& calculateOn,
                           const ResolvedTags& resolvedTags,
                           const HashPaths& paths, const HashOptions& options) {
  std::vector<std::string> lines;

  addDockerfile(target, paths, lines);

  for (const auto& [key, value] : sortedEntries(target.args)) {
    lines.push_back(fmt::format("arg:{}={}", key, value));
  }

  std::vector<std::string> deps = target.dependsOn;
  deps.insert(deps.end(), options.resolves.begin(), options.resolves.end());
  std::ranges::sort(deps);
  deps.erase(std::ranges::unique(deps).begin(), deps.end());
  for (const std::string& dep : deps) {
    if (const auto itr = resolvedTags.find(dep); itr != resolvedTags.end()) {
      lines.push_back(fmt::format("dep:{}={}", dep, itr->second));
    }
  }

  for (const auto& [key, value] : sortedEntries(target.contexts)) {
    const std::string payload = std::visit(
        Overloaded{
            [](const LiteralContext& literal) { return literal.value; },
            [&](const TargetRef& ref) {
              if (const auto itr = resolvedTags.find(ref.name);
                  itr != resolvedTags.end()) {
                return itr->second;
              }
              return toString(ContextValue(ref));
            },
        },
        value);
    lines.push_back(fmt::format("context:{}={}", key, payload));
  }

  if (calculateOn.has_value()) {
    addFiles(target.name, *calculateOn, paths, lines);

    if (calculateOn->period.has_value() && options.periodBucket.has_value()) {
      lines.push_back(fmt::format("period:{}", *options.periodBucket));
    }
    if (calculateOn->always) {
      lines.push_back(fmt::format("always:{}", options.runStamp));
    }
    if (calculateOn->date.has_value()) {
      lines.push_back(fmt::format("date:{}", *calculateOn->date));
    }
  }

  spdlog::trace("{}: hash input has {} lines", target.name, lines.size());
  return fmt::format("{}", fmt::join(lines, "\n"));
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <fstream>
#  include <rs/tests.hpp>
#  include <unistd.h>

// NOLINTBEGIN
using namespace orcka;
// NOLINTEND

static fs::path makeTempDir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path()
                       / fmt::format("orcka-hash-{}-{}", name, getpid());
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static void writeFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream ofs(path);
  ofs << content;
}

static CalculateOn filesOn(std::vector<std::string> files) {
  CalculateOn calculateOn;
  calculateOn.files = std::move(files);
  return calculateOn;
}

static void testLineOrder() {
  const fs::path root = makeTempDir("order");
  writeFile(root / "web" / "Dockerfile", "FROM base");
  writeFile(root / "web" / "app.js", "console.log(1)");

  BakeTarget target;
  target.name = "web";
  target.dockerfile = "web/Dockerfile";
  target.args = { { "B", "2" }, { "A", "1" } };
  target.dependsOn = { "node", "base", "unresolved" };
  target.contexts = { { "src", LiteralContext{ "./web" } },
                      { "assets", TargetRef{ "assets" } },
                      { "pending", TargetRef{ "pending" } } };

  CalculateOn calculateOn = filesOn({ "web/app.js", "web/missing.js" });
  calculateOn.period = Period("weekly");
  calculateOn.always = true;
  calculateOn.date = "2024-01-01";

  const ResolvedTags resolved = {
    { "base", "b1" }, { "node", "n1" }, { "assets", "a1" }
  };
  const std::string input = buildHashInput(
      target, calculateOn, resolved,
      HashPaths{ .projectContext = root, .targetContext = root },
      HashOptions{ .periodBucket = "20240311", .runStamp = "run-1" });

  tests::assertEq(input, "dockerfile:FROM base\n"
                         "arg:A=1\n"
                         "arg:B=2\n"
                         "dep:base=b1\n"
                         "dep:node=n1\n"
                         "context:assets=a1\n"
                         "context:pending=target:pending\n"
                         "context:src=./web\n"
                         "file:web/app.js:console.log(1)\n"
                         "file-path:web/missing.js\n"
                         "period:20240311\n"
                         "always:run-1\n"
                         "date:2024-01-01");

  fs::remove_all(root);
  tests::pass();
}

static void testUnreadableInputs() {
  const fs::path root = makeTempDir("unreadable");

  BakeTarget target;
  target.name = "api";
  target.dockerfile = "Dockerfile";
  target.context = "api";

  CalculateOn calculateOn;
  calculateOn.jq = JqCriterion{ .filename = "package.json",
                                .selector = ".version" };

  const std::string input = buildHashInput(
      target, calculateOn, {},
      HashPaths{ .projectContext = root, .targetContext = root / "api" },
      HashOptions{});
  tests::assertEq(input,
                  "dockerfile-path:Dockerfile\njq-path:package.json:.version");

  writeFile(root / "api" / "Dockerfile", "FROM alpine");
  writeFile(root / "api" / "package.json", R"({"version":"1.0.0"})");
  tests::assertEq(
      buildHashInput(target, calculateOn, {},
                     HashPaths{ .projectContext = root,
                                .targetContext = root / "api" },
                     HashOptions{}),
      "dockerfile:FROM alpine\n"
      R"(jq:package.json:.version:{"version":"1.0.0"})");

  fs::remove_all(root);
  tests::pass();
}

static void testRelocationInvariance() {
  const fs::path first = makeTempDir("reloc-a");
  const fs::path second = makeTempDir("reloc-b") / "nested";
  for (const fs::path& root : { first, second }) {
    writeFile(root / "Dockerfile", "FROM scratch");
    writeFile(root / "src" / "main.c", "int main() {}");
  }

  BakeTarget target;
  target.name = "app";
  target.dockerfile = "Dockerfile";
  const CalculateOn calculateOn = filesOn({ "src/main.c" });

  const std::string lhs = buildHashInput(
      target, calculateOn, {},
      HashPaths{ .projectContext = first, .targetContext = first },
      HashOptions{});
  const std::string rhs = buildHashInput(
      target, calculateOn, {},
      HashPaths{ .projectContext = second, .targetContext = second },
      HashOptions{});
  tests::assertEq(lhs, rhs);
  tests::assertEq(lhs, "dockerfile:FROM scratch\nfile:src/main.c:int main() {}");

  fs::remove_all(first);
  fs::remove_all(second.parent_path());
  tests::pass();
}

static void testWithoutCalculateOn() {
  BakeTarget target;
  target.name = "plain";
  target.args = { { "VERSION", "3" } };

  tests::assertEq(buildHashInput(target, std::nullopt, {},
                                 HashPaths{ .projectContext = "/nonexistent",
                                            .targetContext = "/nonexistent" },
                                 HashOptions{ .periodBucket = "2024",
                                              .runStamp = "x" }),
                  "arg:VERSION=3");

  tests::pass();
}

static void testResolvesChainsTags() {
  BakeTarget target;
  target.name = "web";
  target.dependsOn = { "node" };

  const ResolvedTags resolved = { { "base", "b1" }, { "node", "n1" } };
  const HashPaths paths{ .projectContext = "/nonexistent",
                         .targetContext = "/nonexistent" };

  tests::assertEq(
      buildHashInput(target, std::nullopt, resolved, paths,
                     HashOptions{ .periodBucket = std::nullopt,
                                  .runStamp = "",
                                  .resolves = { "base", "node", "ghost" } }),
      "dep:base=b1\ndep:node=n1");

  BakeTarget plain;
  plain.name = "web";
  const std::string before = buildHashInput(
      plain, std::nullopt, resolved, paths,
      HashOptions{ .periodBucket = std::nullopt,
                   .runStamp = "",
                   .resolves = { "base" } });
  const std::string after = buildHashInput(
      plain, std::nullopt, { { "base", "b2" } }, paths,
      HashOptions{ .periodBucket = std::nullopt,
                   .runStamp = "",
                   .resolves = { "base" } });
  tests::assertEq(before, "dep:base=b1");
  tests::assertNe(before, after);

  tests::pass();
}

static void testInsertionOrderIndependence() {
  BakeTarget first;
  first.name = "web";
  first.args.emplace("A", "1");
  first.args.emplace("B", "2");
  first.args.emplace("C", "3");
  first.contexts.emplace("src", LiteralContext{ "./web" });
  first.contexts.emplace("assets", TargetRef{ "assets" });
  first.dependsOn = { "base", "node" };

  BakeTarget second;
  second.name = "web";
  second.args.emplace("C", "3");
  second.args.emplace("A", "1");
  second.args.emplace("B", "2");
  second.contexts.emplace("assets", TargetRef{ "assets" });
  second.contexts.emplace("src", LiteralContext{ "./web" });
  second.dependsOn = { "node", "base", "node" };

  ResolvedTags firstTags;
  firstTags.emplace("base", "b1");
  firstTags.emplace("node", "n1");
  firstTags.emplace("assets", "a1");
  ResolvedTags secondTags;
  secondTags.emplace("assets", "a1");
  secondTags.emplace("node", "n1");
  secondTags.emplace("base", "b1");

  const HashPaths paths{ .projectContext = "/nonexistent",
                         .targetContext = "/nonexistent" };
  const std::string lhs = buildHashInput(
      first, std::nullopt, firstTags, paths,
      HashOptions{ .periodBucket = std::nullopt,
                   .runStamp = "",
                   .resolves = { "extra", "base" } });
  const std::string rhs = buildHashInput(
      second, std::nullopt, secondTags, paths,
      HashOptions{ .periodBucket = std::nullopt,
                   .runStamp = "",
                   .resolves = { "base", "extra" } });
  tests::assertEq(lhs, rhs);
  tests::assertEq(lhs, "arg:A=1\n"
                       "arg:B=2\n"
                       "arg:C=3\n"
                       "dep:base=b1\n"
                       "dep:node=n1\n"
                       "context:assets=a1\n"
                       "context:src=./web");

  tests::pass();
}

int main() {
  testLineOrder();
  testUnreadableInputs();
  testRelocationInvariance();
  testWithoutCalculateOn();
  testResolvesChainsTags();
  testInsertionOrderIndependence();
}

#endif
