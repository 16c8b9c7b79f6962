#include "Tag/TagGenerator.hpp"

#include "Algos.hpp"
#include "Bake/BakeCatalog.hpp"
#include "Bake/BakeTarget.hpp"
#include "Manifest.hpp"
#include "Parallelism.hpp"
#include "Tag/ContextResolver.hpp"
#include "Tag/DepGraph.hpp"
#include "Tag/Digest.hpp"
#include "Tag/HashEngine.hpp"
#include "Tag/Period.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <tbb/blocked_range.h>
#include <tbb/concurrent_vector.h>
#include <tbb/parallel_for.h>
#include <unordered_set>
#include <utility>
#include <vector>

namespace orcka {

std::string makeVariableName(const std::string_view targetName) {
  std::string name;
  bool pendingSeparator = false;
  for (const char c : targetName) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      if (pendingSeparator && !name.empty()) {
        name += '_';
      }
      pendingSeparator = false;
      name += c;
    } else {
      pendingSeparator = true;
    }
  }
  return toUpper(name) + "_TAG_VER";
}

std::string makeVersionToken(const std::string_view hexDigest,
                             const std::string_view bucket) {
  if (bucket.empty()) {
    return std::string(hexDigest.substr(0, VERSION_TOKEN_WIDTH));
  }

  std::string token = fmt::format("{}_", bucket);
  if (token.size() >= VERSION_TOKEN_WIDTH) {
    token.resize(VERSION_TOKEN_WIDTH);
    return token;
  }
  token += hexDigest.substr(0, VERSION_TOKEN_WIDTH - token.size());
  return token;
}

TagGenerator::TagGenerator(const Manifest& manifest, const BakeCatalog& catalog,
                           const DepGraph& graph, fs::path projectContext)
    : manifest(manifest), catalog(catalog), graph(graph),
      resolver(std::move(projectContext), catalog) {}

rs::Result<GeneratedTag>
TagGenerator::hashTarget(const BakeTarget& target,
                         const ResolvedTags& resolvedTags,
                         const GenerateOptions& options,
                         const std::string& runStamp) const {
  const TargetSpec* spec = manifest.findTarget(target.name);
  const ContextOf contextOf =
      spec != nullptr ? spec->contextMode() : ContextOf::Orcka;
  const std::optional<CalculateOn>& calculateOn =
      spec != nullptr ? spec->calculateOn : std::optional<CalculateOn>();

  std::string bucket;
  if (calculateOn.has_value() && calculateOn->period.has_value()) {
    bucket = rs_try(periodBucket(*calculateOn->period, options.now));
    spdlog::trace("{}: period {} falls in bucket `{}`", target.name,
                  describePeriod(*calculateOn->period), bucket);
  }

  const HashPaths paths{
    .projectContext = resolver.projectContext(),
    .targetContext = resolver.resolveTargetContext(target.name, contextOf),
  };
  const HashOptions hashOptions{
    .periodBucket = bucket,
    .runStamp = runStamp,
    .resolves = spec != nullptr ? spec->resolves : std::vector<std::string>(),
  };
  const std::string input =
      buildHashInput(target, calculateOn, resolvedTags, paths, hashOptions);
  const std::string digest = rs_try(sha256Hex(input));

  GeneratedTag tag;
  tag.name = target.name;
  tag.varName = makeVariableName(target.name);
  tag.version = makeVersionToken(digest, bucket);
  const std::string image = target.image().value_or(target.name);
  tag.imageReference = fmt::format("{}:{}", image, tag.version);
  if (const auto itr = options.declaredTags.find(target.name);
      itr != options.declaredTags.end()) {
    tag.declaredTag = itr->second;
    tag.declaredReference = fmt::format("{}:{}", image, itr->second);
  }

  spdlog::debug("{} ({}): {} = \"{}\"", target.name,
                calculateOn.has_value() ? "configured" : "default",
                tag.varName, tag.version);
  return rs::Ok(std::move(tag));
}

rs::Result<GenerationResult>
TagGenerator::generate(const GenerateOptions& options) const {
  const std::vector<std::vector<std::string>> levels = rs_try(graph.levels());

  std::optional<std::unordered_set<std::string>> selected;
  if (!options.targets.empty()) {
    for (const std::string& name : options.targets) {
      rs_ensure(graph.contains(name),
                "Target '{}' not found in any of the specified bake files.",
                name);
    }
    selected = graph.closure(options.targets);
  }

  const std::string runStamp = options.runStamp.value_or(
      fmt::format("{}", options.now.time_since_epoch().count()));

  GenerationResult result;
  for (const std::vector<std::string>& level : levels) {
    std::vector<const BakeTarget*> work;
    for (const std::string& name : level) {
      if (selected.has_value() && !selected->contains(name)) {
        continue;
      }

      const BakeTarget* target = catalog.find(name);
      if (target == nullptr) {
        result.skipped.push_back(SkippedTarget{
            .name = name, .reason = "not declared in any bake file" });
        continue;
      }
      const TargetSpec* spec = manifest.findTarget(name);
      if (spec != nullptr && spec->skipCalculate) {
        spdlog::debug("skipping {} (skip_calculate: true)", name);
        result.skipped.push_back(
            SkippedTarget{ .name = name, .reason = "skip_calculate: true" });
        continue;
      }
      work.push_back(target);
    }

    std::vector<GeneratedTag> produced(work.size());
    if (isParallel() && work.size() > 1) {
      tbb::concurrent_vector<std::string> errors;
      tbb::parallel_for(
          tbb::blocked_range<std::size_t>(0, work.size()),
          [&](const tbb::blocked_range<std::size_t>& rng) {
            for (std::size_t i = rng.begin(); i != rng.end(); ++i) {
              auto tag =
                  hashTarget(*work[i], result.resolvedTags, options, runStamp);
              if (tag.is_err()) {
                errors.push_back(tag.unwrap_err()->what());
              } else {
                produced[i] = std::move(tag).unwrap();
              }
            }
          });
      if (!errors.empty()) {
        rs_bail("{}", fmt::join(errors, "\n"));
      }
    } else {
      for (std::size_t i = 0; i < work.size(); ++i) {
        produced[i] = rs_try(
            hashTarget(*work[i], result.resolvedTags, options, runStamp));
      }
    }

    for (GeneratedTag& tag : produced) {
      result.resolvedTags.emplace(tag.name, tag.version);
      result.tags.push_back(std::move(tag));
    }
  }
  return rs::Ok(std::move(result));
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <fstream>
#  include <rs/tests.hpp>
#  include <stdexcept>
#  include <unistd.h>

// NOLINTBEGIN
using namespace orcka;
using namespace std::chrono;
// NOLINTEND

static const system_clock::time_point NOW =
    sys_days{ year{ 2024 } / March / 13 } + hours{ 9 };

static void writeFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream ofs(path);
  ofs << content;
}

static TargetSpec makeSpec(const std::string& name,
                           std::optional<CalculateOn> calculateOn) {
  TargetSpec spec;
  spec.name = name;
  spec.calculateOn = std::move(calculateOn);
  return spec;
}

static BakeTarget makeTarget(const std::string& name) {
  BakeTarget target;
  target.name = name;
  target.sourceFile = "docker-bake.hcl";
  return target;
}

struct Fixture {
  fs::path root;
  Manifest manifest;
  BakeCatalog catalog;
  DepGraph graph;

  Fixture(const std::string& name, std::vector<BakeTarget> targets)
      : root(fs::temp_directory_path()
             / fmt::format("orcka-gen-{}-{}", name, getpid())) {
    fs::remove_all(root);
    fs::create_directories(root);
    catalog = BakeCatalog::fromFiles({ BakeFile{ .path = "docker-bake.hcl",
                                                 .targets = std::move(targets),
                                                 .variables = {} } });
  }
  Fixture(const Fixture&) = delete;
  Fixture& operator=(const Fixture&) = delete;
  ~Fixture() { fs::remove_all(root); }

  GenerationResult generate(GenerateOptions options = {}) {
    graph = DepGraph::build(manifest, catalog);
    options.now = NOW;
    if (!options.runStamp.has_value()) {
      options.runStamp = "stamp";
    }
    return TagGenerator(manifest, catalog, graph, root)
        .generate(options)
        .unwrap();
  }
};

static const GeneratedTag& findTag(const GenerationResult& result,
                                   const std::string& name) {
  const auto itr = std::ranges::find(result.tags, name, &GeneratedTag::name);
  if (itr == result.tags.end()) {
    throw std::runtime_error(fmt::format("no tag for {}", name));
  }
  return *itr;
}

static void testMakeVariableName() {
  tests::assertEq(makeVariableName("web"), "WEB_TAG_VER");
  tests::assertEq(makeVariableName("web-app"), "WEB_APP_TAG_VER");
  tests::assertEq(makeVariableName("--my..svc__2--"), "MY_SVC_2_TAG_VER");

  tests::pass();
}

static void testMakeVersionToken() {
  const std::string hex =
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
  tests::assertEq(makeVersionToken(hex, ""),
                  "ba7816bf8f01cfea414140de5dae2223b00361a3");
  tests::assertEq(makeVersionToken(hex, "20240311"),
                  "20240311_ba7816bf8f01cfea414140de5dae2223");
  tests::assertEq(makeVersionToken(hex, "20240311").size(),
                  VERSION_TOKEN_WIDTH);
  tests::assertEq(makeVersionToken(hex, "20240313_143752").size(),
                  VERSION_TOKEN_WIDTH);

  tests::pass();
}

static void testEndToEnd() {
  BakeTarget web = makeTarget("web");
  web.dockerfile = "web/Dockerfile";
  web.tags = { "registry.local/shop/web:latest" };
  Fixture fixture("e2e", { web, makeTarget("api") });
  writeFile(fixture.root / "web" / "Dockerfile", "FROM node");
  writeFile(fixture.root / "web" / "app.js", "v1");

  CalculateOn calculateOn;
  calculateOn.files = { "web/app.js" };
  fixture.manifest.targets.emplace("web", makeSpec("web", calculateOn));

  const GenerationResult first = fixture.generate();
  tests::assertEq(first.tags.size(), 2UL);
  const GeneratedTag& webTag = findTag(first, "web");
  tests::assertEq(webTag.varName, "WEB_TAG_VER");
  tests::assertEq(webTag.version.size(), VERSION_TOKEN_WIDTH);
  tests::assertEq(webTag.imageReference,
                  fmt::format("registry.local/shop/web:{}", webTag.version));
  tests::assertEq(findTag(first, "api").imageReference,
                  fmt::format("api:{}", findTag(first, "api").version));

  const GenerationResult again = fixture.generate();
  tests::assertEq(findTag(again, "web").version, webTag.version);

  writeFile(fixture.root / "web" / "app.js", "v2");
  const GenerationResult changed = fixture.generate();
  tests::assertNe(findTag(changed, "web").version, webTag.version);
  tests::assertEq(findTag(changed, "api").version,
                  findTag(first, "api").version);

  tests::pass();
}

static void testDependencyChaining() {
  BakeTarget base = makeTarget("base");
  base.args = { { "DISTRO", "alpine" } };
  BakeTarget app = makeTarget("app");
  app.dependsOn = { "base" };
  Fixture fixture("chain", { base, app, makeTarget("other") });

  const GenerationResult first = fixture.generate();
  tests::assertEq(first.tags.size(), 3UL);
  tests::assertEq(first.tags.back().name, "app");
  tests::assertEq(first.resolvedTags.at("base"), findTag(first, "base").version);

  base.args["DISTRO"] = "debian";
  fixture.catalog = BakeCatalog::fromFiles(
      { BakeFile{ .path = "docker-bake.hcl",
                  .targets = { base, app, makeTarget("other") },
                  .variables = {} } });
  const GenerationResult second = fixture.generate();
  tests::assertNe(findTag(second, "base").version,
                  findTag(first, "base").version);
  tests::assertNe(findTag(second, "app").version,
                  findTag(first, "app").version);
  tests::assertEq(findTag(second, "other").version,
                  findTag(first, "other").version);

  tests::pass();
}

static void testResolvesChaining() {
  Fixture fixture("resolves", { makeTarget("base"), makeTarget("web") });
  writeFile(fixture.root / "base" / "deps.txt", "curl");
  CalculateOn baseOn;
  baseOn.files = { "base/deps.txt" };
  fixture.manifest.targets.emplace("base", makeSpec("base", baseOn));
  TargetSpec web = makeSpec("web", std::nullopt);
  web.resolves = { "base" };
  fixture.manifest.targets.emplace("web", web);

  const GenerationResult first = fixture.generate();
  tests::assertEq(first.tags.back().name, "web");

  writeFile(fixture.root / "base" / "deps.txt", "curl jq");
  const GenerationResult second = fixture.generate();
  tests::assertNe(findTag(second, "base").version,
                  findTag(first, "base").version);
  tests::assertNe(findTag(second, "web").version,
                  findTag(first, "web").version);

  tests::pass();
}

static void testPeriodPrefix() {
  Fixture fixture("period", { makeTarget("nightly") });
  CalculateOn calculateOn;
  calculateOn.period = Period("weekly");
  fixture.manifest.targets.emplace("nightly",
                                   makeSpec("nightly", calculateOn));

  const GenerationResult result = fixture.generate();
  const GeneratedTag& tag = findTag(result, "nightly");
  tests::assertTrue(tag.version.starts_with("20240311_"));
  tests::assertEq(tag.version.size(), VERSION_TOKEN_WIDTH);

  tests::pass();
}

static void testAlwaysChangesPerRun() {
  Fixture fixture("always", { makeTarget("dev") });
  CalculateOn calculateOn;
  calculateOn.always = true;
  fixture.manifest.targets.emplace("dev", makeSpec("dev", calculateOn));

  const std::string first =
      findTag(fixture.generate(GenerateOptions{ .runStamp = "run-1" }), "dev")
          .version;
  const std::string second =
      findTag(fixture.generate(GenerateOptions{ .runStamp = "run-2" }), "dev")
          .version;
  tests::assertNe(first, second);

  tests::pass();
}

static void testSkipped() {
  Fixture fixture("skip", { makeTarget("web"), makeTarget("worker") });
  TargetSpec worker = makeSpec("worker", std::nullopt);
  worker.skipCalculate = true;
  fixture.manifest.targets.emplace("worker", worker);
  fixture.manifest.targets.emplace("ghost", makeSpec("ghost", std::nullopt));

  const GenerationResult result = fixture.generate();
  tests::assertEq(result.tags.size(), 1UL);
  tests::assertEq(result.tags[0].name, "web");
  tests::assertEq(result.skipped.size(), 2UL);
  tests::assertEq(result.skipped[0].name, "ghost");
  tests::assertEq(result.skipped[1].name, "worker");
  tests::assertEq(result.skipped[1].reason, "skip_calculate: true");

  tests::pass();
}

static void testSelection() {
  BakeTarget app = makeTarget("app");
  app.contexts.emplace("base", TargetRef{ "base" });
  Fixture fixture("select", { makeTarget("base"), app, makeTarget("docs") });

  const GenerationResult result =
      fixture.generate(GenerateOptions{ .targets = { "app" } });
  tests::assertEq(result.tags.size(), 2UL);
  tests::assertEq(result.tags[0].name, "base");
  tests::assertEq(result.tags[1].name, "app");
  tests::assertFalse(result.resolvedTags.contains("docs"));

  fixture.graph = DepGraph::build(fixture.manifest, fixture.catalog);
  const auto missing =
      TagGenerator(fixture.manifest, fixture.catalog, fixture.graph,
                   fixture.root)
          .generate(GenerateOptions{ .targets = { "nope" } });
  tests::assertEq(missing.unwrap_err()->what(),
                  "Target 'nope' not found in any of the specified bake files.");

  tests::pass();
}

static void testDeclaredTags() {
  BakeTarget web = makeTarget("web");
  web.tags = { "shop/web:dev" };
  Fixture fixture("declared", { web });

  const GenerationResult result =
      fixture.generate(GenerateOptions{ .declaredTags = { { "web", "1.2" } } });
  const GeneratedTag& tag = findTag(result, "web");
  tests::assertEq(tag.declaredTag.value(), "1.2");
  tests::assertEq(tag.declaredReference.value(), "shop/web:1.2");

  tests::pass();
}

static void testCycleAbortsGeneration() {
  BakeTarget a = makeTarget("a");
  a.dependsOn = { "b" };
  BakeTarget b = makeTarget("b");
  b.dependsOn = { "a" };
  Fixture fixture("cycle", { a, b });
  fixture.graph = DepGraph::build(fixture.manifest, fixture.catalog);

  const auto result = TagGenerator(fixture.manifest, fixture.catalog,
                                   fixture.graph, fixture.root)
                          .generate(GenerateOptions{});
  tests::assertEq(result.unwrap_err()->what(),
                  "Cyclic dependency found: a → b → a");

  tests::pass();
}

static void testParallelMatchesSequential() {
  std::vector<BakeTarget> targets;
  for (int i = 0; i < 8; ++i) {
    BakeTarget target = makeTarget(fmt::format("svc{}", i));
    target.args = { { "INDEX", std::to_string(i) } };
    if (i > 0) {
      target.dependsOn = { "svc0" };
    }
    targets.push_back(std::move(target));
  }
  Fixture fixture("parallel", targets);

  setParallelism(1);
  const GenerationResult sequential = fixture.generate();
  setParallelism(4);
  const GenerationResult parallel = fixture.generate();
  setParallelism(1);

  tests::assertEq(sequential.tags.size(), parallel.tags.size());
  for (std::size_t i = 0; i < sequential.tags.size(); ++i) {
    tests::assertEq(sequential.tags[i].name, parallel.tags[i].name);
    tests::assertEq(sequential.tags[i].version, parallel.tags[i].version);
  }

  tests::pass();
}

int main() {
  testMakeVariableName();
  testMakeVersionToken();
  testEndToEnd();
  testDependencyChaining();
  testResolvesChaining();
  testPeriodPrefix();
  testAlwaysChangesPerRun();
  testSkipped();
  testSelection();
  testDeclaredTags();
  testCycleAbortsGeneration();
  testParallelMatchesSequential();
}

#endif
