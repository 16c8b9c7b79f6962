#include "Manifest.hpp"

#include "Algos.hpp"
#include "Diag.hpp"
#include "Finding.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fmt/core.h>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <toml.hpp>
#include <utility>
#include <variant>
#include <vector>

namespace orcka {

static constexpr std::array<std::string_view, 5> CALCULATE_ON_KEYS = {
  "files", "jq", "period", "always", "date",
};

std::optional<ContextOf> parseContextOf(const std::string_view str) noexcept {
  if (str == "orcka") {
    return ContextOf::Orcka;
  } else if (str == "dockerfile") {
    return ContextOf::Dockerfile;
  } else if (str == "target") {
    return ContextOf::Target;
  } else if (str == "bake") {
    return ContextOf::Bake;
  }
  return std::nullopt;
}

std::string_view toString(const ContextOf contextOf) noexcept {
  switch (contextOf) {
  case ContextOf::Orcka:
    return "orcka";
  case ContextOf::Dockerfile:
    return "dockerfile";
  case ContextOf::Target:
    return "target";
  case ContextOf::Bake:
    return "bake";
  }
  return "orcka";
}

bool CalculateOn::hasCriteria() const noexcept {
  return always || hasContentCriteria();
}

bool CalculateOn::hasContentCriteria() const noexcept {
  return period.has_value() || !files.empty()
         || (jq.has_value() && !jq->filename.empty());
}

ContextOf TargetSpec::contextMode() const noexcept {
  if (!contextOf.has_value()) {
    return ContextOf::Orcka;
  }
  return parseContextOf(*contextOf).value_or(ContextOf::Orcka);
}

fs::path Manifest::dir() const { return path.parent_path(); }

const TargetSpec* Manifest::findTarget(const std::string_view name) const {
  const auto itr = targets.find(std::string(name));
  if (itr == targets.end()) {
    return nullptr;
  }
  return &itr->second;
}

static void addIssue(std::vector<Finding>& issues, std::string message,
                     std::string field,
                     std::optional<std::string> target = std::nullopt) {
  spdlog::debug("manifest issue: {}", message);
  issues.push_back(Finding{ .type = FindingType::Schema,
                            .message = std::move(message),
                            .target = std::move(target),
                            .field = std::move(field),
                            .path = std::nullopt });
}

static std::optional<std::string>
readString(const toml::value& table, const std::string& key,
           const std::string& field, std::vector<Finding>& issues,
           const std::optional<std::string>& target = std::nullopt) {
  if (!table.contains(key)) {
    return std::nullopt;
  }
  const toml::value& val = table.at(key);
  if (!val.is_string()) {
    addIssue(issues, fmt::format("{} must be a string", field), field, target);
    return std::nullopt;
  }
  return val.as_string();
}

static std::optional<bool>
readBool(const toml::value& table, const std::string& key,
         const std::string& field, std::vector<Finding>& issues,
         const std::optional<std::string>& target = std::nullopt) {
  if (!table.contains(key)) {
    return std::nullopt;
  }
  const toml::value& val = table.at(key);
  if (!val.is_boolean()) {
    addIssue(issues, fmt::format("{} must be a boolean", field), field,
             target);
    return std::nullopt;
  }
  return val.as_boolean();
}

static std::vector<std::string>
readStringArray(const toml::value& table, const std::string& key,
                const std::string& field, std::vector<Finding>& issues,
                const std::optional<std::string>& target = std::nullopt) {
  std::vector<std::string> strs;
  if (!table.contains(key)) {
    return strs;
  }
  const toml::value& val = table.at(key);
  if (!val.is_array()) {
    addIssue(issues, fmt::format("{} must be an array of strings", field),
             field, target);
    return strs;
  }

  const auto& arr = val.as_array();
  for (std::size_t i = 0; i < arr.size(); ++i) {
    if (!arr[i].is_string()) {
      addIssue(issues, fmt::format("{}[{}] must be a string", field, i), field,
               target);
      continue;
    }
    strs.push_back(arr[i].as_string());
  }
  return strs;
}

static std::string parseWrite(const toml::value& project,
                              std::vector<Finding>& issues) {
  if (!project.contains("write")) {
    return "";
  }
  const toml::value& val = project.at("write");
  if (val.is_string()) {
    return val.as_string();
  }
  if (val.is_table()) {
    return readString(val, "tags", "project.write.tags", issues).value_or("");
  }
  addIssue(issues,
           "project.write must be a string or a table with a `tags` key",
           "project.write");
  return "";
}

static std::optional<Project> parseProject(const toml::value& data,
                                           std::vector<Finding>& issues) {
  if (!data.contains("project")) {
    return std::nullopt;
  }
  const toml::value& val = data.at("project");
  if (!val.is_table()) {
    addIssue(issues, "'project' must be a table", "project");
    return std::nullopt;
  }

  Project project;
  project.name = readString(val, "name", "project.name", issues).value_or("");
  project.context =
      readString(val, "context", "project.context", issues).value_or(".");
  project.write = parseWrite(val, issues);
  project.bake = readStringArray(val, "bake", "project.bake", issues);
  project.parser = readString(val, "parser", "project.parser", issues);
  project.pullPolicy =
      readString(val, "pull_policy", "project.pull_policy", issues);
  return project;
}

static std::optional<Period> parsePeriod(const toml::value& val,
                                         const std::string& field,
                                         const std::string& target,
                                         std::vector<Finding>& issues) {
  if (val.is_string()) {
    return Period(val.as_string());
  }
  if (!val.is_table()) {
    addIssue(issues,
             fmt::format("{} must be a string or a table with `unit` and "
                         "`number`",
                         field),
             field, target);
    return std::nullopt;
  }

  PeriodSpec spec;
  spec.unit =
      readString(val, "unit", field + ".unit", issues, target).value_or("");
  if (val.contains("number")) {
    const toml::value& number = val.at("number");
    if (number.is_integer()) {
      spec.number = number.as_integer();
    } else {
      addIssue(issues, fmt::format("{}.number must be an integer", field),
               field + ".number", target);
    }
  }
  return Period(std::move(spec));
}

static std::optional<std::string> parseDate(const toml::value& val,
                                            const std::string& field,
                                            const std::string& target,
                                            std::vector<Finding>& issues) {
  if (val.is_string()) {
    return val.as_string();
  }
  if (val.is_local_date() || val.is_local_datetime()
      || val.is_offset_datetime()) {
    return toml::format(val);
  }
  addIssue(issues, fmt::format("{} must be a string or a date", field), field,
           target);
  return std::nullopt;
}

static CalculateOn parseCalculateOn(const toml::value& val,
                                    const std::string& target,
                                    std::vector<Finding>& issues) {
  const std::string prefix = fmt::format("targets.{}.calculate_on", target);

  CalculateOn calculateOn;
  if (!val.is_table()) {
    addIssue(issues, fmt::format("{} must be a table", prefix), prefix,
             target);
    return calculateOn;
  }

  for (const auto& [key, _] : val.as_table()) {
    if (std::ranges::find(CALCULATE_ON_KEYS, key) == CALCULATE_ON_KEYS.end()) {
      addIssue(issues,
               fmt::format("Unknown calculate_on key '{}' in target '{}'", key,
                           target),
               fmt::format("{}.{}", prefix, key), target);
    }
  }

  calculateOn.files =
      readStringArray(val, "files", prefix + ".files", issues, target);
  if (val.contains("jq")) {
    const toml::value& jq = val.at("jq");
    if (jq.is_table()) {
      calculateOn.jq = JqCriterion{
        .filename =
            readString(jq, "filename", prefix + ".jq.filename", issues, target)
                .value_or(""),
        .selector =
            readString(jq, "selector", prefix + ".jq.selector", issues, target)
                .value_or(""),
      };
    } else {
      addIssue(issues,
               fmt::format("{}.jq must be a table with `filename` and "
                           "`selector`",
                           prefix),
               prefix + ".jq", target);
    }
  }
  if (val.contains("period")) {
    calculateOn.period =
        parsePeriod(val.at("period"), prefix + ".period", target, issues);
  }
  calculateOn.always =
      readBool(val, "always", prefix + ".always", issues, target)
          .value_or(false);
  if (val.contains("date")) {
    calculateOn.date =
        parseDate(val.at("date"), prefix + ".date", target, issues);
  }
  return calculateOn;
}

static TargetSpec parseTarget(const std::string& name, const toml::value& val,
                              std::vector<Finding>& issues) {
  TargetSpec spec;
  spec.name = name;
  if (!val.is_table()) {
    addIssue(issues, fmt::format("targets.{} must be a table", name),
             fmt::format("targets.{}", name), name);
    return spec;
  }

  const std::string prefix = fmt::format("targets.{}", name);
  if (val.contains("calculate_on")) {
    spec.calculateOn = parseCalculateOn(val.at("calculate_on"), name, issues);
  }
  spec.contextOf =
      readString(val, "context_of", prefix + ".context_of", issues, name);
  spec.resolves =
      readStringArray(val, "resolves", prefix + ".resolves", issues, name);
  spec.skipCalculate =
      readBool(val, "skip_calculate", prefix + ".skip_calculate", issues, name)
          .value_or(false);
  return spec;
}

rs::Result<Manifest> Manifest::tryParse(fs::path path,
                                        const bool findParents) noexcept {
  if (findParents) {
    path = rs_try(findPath(path.parent_path()));
  }

  toml::value data;
  try {
    path = fs::absolute(path);
    if (shouldColorStderr()) {
      toml::color::enable();
    } else {
      toml::color::disable();
    }
    data = toml::parse(path);
  } catch (const std::exception& e) {
    std::string what = e.what();
    while (!what.empty() && what.back() == '\n') {
      what.pop_back(); // Diag::error adds one.
    }
    rs_bail("failed to parse `{}`: {}", path.string(), what);
  }
  return tryFromToml(data, std::move(path));
}

rs::Result<Manifest> Manifest::tryFromToml(const toml::value& data,
                                           fs::path path) noexcept {
  rs_ensure(data.is_table(), "manifest `{}` must be a table", path.string());

  try {
    Manifest manifest;
    manifest.path = std::move(path);
    manifest.project = parseProject(data, manifest.issues);

    if (data.contains("targets")) {
      const toml::value& targets = data.at("targets");
      if (targets.is_table()) {
        manifest.hasTargetsSection = true;
        for (const auto& [name, val] : targets.as_table()) {
          manifest.targets.emplace(name,
                                   parseTarget(name, val, manifest.issues));
        }
      } else {
        addIssue(manifest.issues, "'targets' must be a table", "targets");
      }
    }
    return rs::Ok(std::move(manifest));
  } catch (const std::exception& e) {
    rs_bail("failed to read manifest: {}", e.what());
  }
}

rs::Result<fs::path> Manifest::findPath(fs::path candidateDir) noexcept {
  const fs::path origCandDir = candidateDir;
  while (true) {
    const fs::path configPath = candidateDir / FILE_NAME;
    spdlog::trace("Finding manifest: {}", configPath.string());
    if (fs::exists(configPath)) {
      return rs::Ok(configPath);
    }

    const fs::path parentPath = candidateDir.parent_path();
    if (candidateDir.has_parent_path()
        && parentPath != candidateDir.root_directory()) {
      candidateDir = parentPath;
    } else {
      break;
    }
  }

  rs_bail("{} not found in `{}` and its parents", FILE_NAME,
          origCandDir.string());
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <rs/tests.hpp>
#  include <toml11/fwd/literal_fwd.hpp>

// NOLINTBEGIN
using namespace orcka;
using namespace toml::literals::toml_literals;
// NOLINTEND

static bool hasIssue(const Manifest& manifest, const std::string_view field) {
  return std::ranges::any_of(manifest.issues, [field](const Finding& issue) {
    return issue.field == field;
  });
}

static void testTryFromToml() {
  const toml::value val = R"(
    [project]
    name = "shop"
    context = "./build"
    write = "docker-tags.hcl"
    bake = ["docker-bake.hcl", "extra.json"]
    pull_policy = "always"

    [targets.web]
    context_of = "dockerfile"
    resolves = ["base"]

    [targets.web.calculate_on]
    files = ["web/app.js", "web/package.json"]
    period = { unit = "days", number = 2 }
    jq = { filename = "versions.json", selector = ".web" }

    [targets.base.calculate_on]
    period = "weekly"
    always = true
    date = "2024-01-01"
  )"_toml;

  const Manifest manifest =
      Manifest::tryFromToml(val, "/work/orcka.toml").unwrap();
  tests::assertTrue(manifest.issues.empty());
  tests::assertEq(manifest.dir(), fs::path("/work"));

  tests::assertTrue(manifest.project.has_value());
  const Project& project = *manifest.project;
  tests::assertEq(project.name, "shop");
  tests::assertEq(project.context, "./build");
  tests::assertEq(project.write, "docker-tags.hcl");
  tests::assertEq(project.bake.size(), 2UL);
  tests::assertEq(project.bake[1], "extra.json");
  tests::assertEq(project.pullPolicy.value_or(""), "always");
  tests::assertFalse(project.parser.has_value());

  tests::assertTrue(manifest.hasTargetsSection);
  tests::assertEq(manifest.targets.size(), 2UL);

  const TargetSpec* web = manifest.findTarget("web");
  tests::assertTrue(web != nullptr);
  tests::assertTrue(web->contextMode() == ContextOf::Dockerfile);
  tests::assertEq(web->resolves.size(), 1UL);
  tests::assertTrue(web->calculateOn.has_value());
  tests::assertEq(web->calculateOn->files.size(), 2UL);
  tests::assertEq(web->calculateOn->jq->selector, ".web");
  const auto& period = std::get<PeriodSpec>(*web->calculateOn->period);
  tests::assertEq(period.unit, "days");
  tests::assertEq(period.number.value_or(0), 2);

  const TargetSpec* base = manifest.findTarget("base");
  tests::assertTrue(base->contextMode() == ContextOf::Orcka);
  tests::assertEq(std::get<std::string>(*base->calculateOn->period),
                  "weekly");
  tests::assertTrue(base->calculateOn->always);
  tests::assertEq(base->calculateOn->date.value_or(""), "2024-01-01");

  tests::assertTrue(manifest.findTarget("missing") == nullptr);

  tests::pass();
}

static void testWriteTable() {
  const toml::value val = R"(
    [project]
    name = "shop"
    write = { tags = "tags.hcl" }
    bake = ["docker-bake.hcl"]
  )"_toml;

  const Manifest manifest =
      Manifest::tryFromToml(val, "/work/orcka.toml").unwrap();
  tests::assertEq(manifest.project->write, "tags.hcl");
  tests::assertEq(manifest.project->context, ".");
  tests::assertFalse(manifest.hasTargetsSection);

  tests::pass();
}

static void testShapeIssues() {
  const toml::value val = R"(
    [project]
    name = 42
    write = ["a"]
    bake = "docker-bake.hcl"

    [targets.api]
    skip_calculate = "yes"

    [targets.api.calculate_on]
    files = ["ok.txt", 3]
    period = { unit = "days", number = 1.5 }
    checksum = true
  )"_toml;

  const Manifest manifest =
      Manifest::tryFromToml(val, "/work/orcka.toml").unwrap();
  tests::assertTrue(hasIssue(manifest, "project.name"));
  tests::assertTrue(hasIssue(manifest, "project.write"));
  tests::assertTrue(hasIssue(manifest, "project.bake"));
  tests::assertTrue(hasIssue(manifest, "targets.api.skip_calculate"));
  tests::assertTrue(hasIssue(manifest, "targets.api.calculate_on.files"));
  tests::assertTrue(
      hasIssue(manifest, "targets.api.calculate_on.period.number"));
  tests::assertTrue(hasIssue(manifest, "targets.api.calculate_on.checksum"));

  const Project& project = *manifest.project;
  tests::assertEq(project.name, "");
  tests::assertEq(project.write, "");
  tests::assertTrue(project.bake.empty());

  const TargetSpec* api = manifest.findTarget("api");
  tests::assertFalse(api->skipCalculate);
  tests::assertEq(api->calculateOn->files.size(), 1UL);
  tests::assertFalse(
      std::get<PeriodSpec>(*api->calculateOn->period).number.has_value());

  tests::pass();
}

static void testMissingSections() {
  const toml::value val = R"(
    [other]
    key = "value"
  )"_toml;

  const Manifest manifest =
      Manifest::tryFromToml(val, "/work/orcka.toml").unwrap();
  tests::assertFalse(manifest.project.has_value());
  tests::assertFalse(manifest.hasTargetsSection);
  tests::assertTrue(manifest.issues.empty());

  tests::pass();
}

static void testContextOf() {
  tests::assertTrue(parseContextOf("bake") == ContextOf::Bake);
  tests::assertTrue(parseContextOf("target") == ContextOf::Target);
  tests::assertFalse(parseContextOf("compose").has_value());
  tests::assertEq(toString(ContextOf::Dockerfile), "dockerfile");

  TargetSpec spec;
  spec.contextOf = "compose";
  tests::assertTrue(spec.contextMode() == ContextOf::Orcka);

  tests::pass();
}

static void testHasCriteria() {
  CalculateOn calculateOn;
  tests::assertFalse(calculateOn.hasCriteria());

  calculateOn.date = "2024-01-01";
  tests::assertFalse(calculateOn.hasCriteria());

  calculateOn.jq = JqCriterion{ .filename = "", .selector = ".a" };
  tests::assertFalse(calculateOn.hasCriteria());

  calculateOn.always = true;
  tests::assertTrue(calculateOn.hasCriteria());
  tests::assertFalse(calculateOn.hasContentCriteria());

  calculateOn.files.emplace_back("a.txt");
  tests::assertTrue(calculateOn.hasContentCriteria());

  tests::pass();
}

int main() {
  orcka::setColorMode("never");

  testTryFromToml();
  testWriteTable();
  testShapeIssues();
  testMissingSections();
  testContextOf();
  testHasCriteria();
}

#endif
