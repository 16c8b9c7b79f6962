#include "Validation/Validator.hpp"

#include "Algos.hpp"
#include "Bake/BakeCatalog.hpp"
#include "Bake/BakeParser.hpp"
#include "Bake/BakeTarget.hpp"
#include "Finding.hpp"
#include "Manifest.hpp"
#include "Tag/ContextResolver.hpp"
#include "Tag/DepGraph.hpp"
#include "Tag/Period.hpp"
#include "Tag/TagGenerator.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <iterator>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace orcka {

static constexpr std::array<std::string_view, 4> PERIOD_PRESETS = {
  "hourly", "weekly", "monthly", "yearly",
};
static constexpr std::array<std::string_view, 7> PERIOD_UNITS = {
  "months", "weeks", "days", "hours", "minutes", "seconds", "none",
};

std::string_view toString(const FindingType type) noexcept {
  switch (type) {
  case FindingType::Schema:
    return "schema";
  case FindingType::Dependency:
    return "dependency";
  case FindingType::File:
    return "file";
  case FindingType::Runtime:
    return "runtime";
  case FindingType::Performance:
    return "performance";
  case FindingType::BestPractice:
    return "best-practice";
  }
  return "unknown";
}

static bool hasIssueAt(const Manifest& manifest, const std::string_view field) {
  return std::ranges::any_of(manifest.issues, [field](const Finding& issue) {
    return issue.field.has_value() && *issue.field == field;
  });
}

static Finding schemaError(std::string message,
                           std::optional<std::string> field,
                           std::optional<std::string> target = std::nullopt) {
  return Finding{ .type = FindingType::Schema,
                  .message = std::move(message),
                  .target = std::move(target),
                  .field = std::move(field),
                  .path = std::nullopt };
}

static void validateProject(const Manifest& manifest,
                            std::vector<Finding>& errors) {
  if (!manifest.project.has_value()) {
    if (!hasIssueAt(manifest, "project")) {
      errors.push_back(schemaError(
          fmt::format("Missing required 'project' section in {}",
                      Manifest::FILE_NAME),
          "project"));
    }
    return;
  }

  const Project& project = *manifest.project;
  if (project.name.empty() && !hasIssueAt(manifest, "project.name")) {
    errors.push_back(schemaError("project.name is required", "project.name"));
  }
  if (project.write.empty() && !hasIssueAt(manifest, "project.write")
      && !hasIssueAt(manifest, "project.write.tags")) {
    errors.push_back(
        schemaError("project.write is required", "project.write"));
  }
  if (project.bake.empty() && !hasIssueAt(manifest, "project.bake")) {
    errors.push_back(
        schemaError("project.bake is required and must be a non-empty array",
                    "project.bake"));
  }
  if (project.parser.has_value()) {
    if (const auto mode = parseBakeParserMode(*project.parser);
        mode.is_err()) {
      errors.push_back(schemaError(
          fmt::format("project.parser: {}", mode.unwrap_err()->what()),
          "project.parser"));
    }
  }
}

static void validatePeriod(const std::string& targetName, const Period& period,
                           std::vector<Finding>& errors) {
  const std::string field =
      fmt::format("targets.{}.calculate_on.period", targetName);

  if (const auto* preset = std::get_if<std::string>(&period)) {
    if (std::ranges::find(PERIOD_PRESETS, *preset) == PERIOD_PRESETS.end()) {
      errors.push_back(schemaError(
          fmt::format("Target '{}' has invalid period format. Valid string "
                      "periods are: {}",
                      targetName, fmt::join(PERIOD_PRESETS, ", ")),
          field, targetName));
    }
    return;
  }

  const PeriodSpec& spec = std::get<PeriodSpec>(period);
  if (spec.unit.empty()) {
    errors.push_back(schemaError(
        fmt::format("Target '{}' period must have a unit field", targetName),
        field + ".unit", targetName));
    return;
  }
  if (std::ranges::find(PERIOD_UNITS, spec.unit) == PERIOD_UNITS.end()) {
    errors.push_back(schemaError(
        fmt::format("Target '{}' has invalid period unit '{}'. Valid units "
                    "are: {}",
                    targetName, spec.unit, fmt::join(PERIOD_UNITS, ", ")),
        field + ".unit", targetName));
    return;
  }
  if (spec.unit != "none" && spec.number.value_or(0) <= 0) {
    errors.push_back(schemaError(
        fmt::format("Target '{}' period must have a positive number when "
                    "unit is not 'none'",
                    targetName),
        field + ".number", targetName));
  } else if (spec.number.value_or(0) > MAX_PERIOD_NUMBER) {
    errors.push_back(schemaError(
        fmt::format("Target '{}' period number must not exceed {}",
                    targetName, MAX_PERIOD_NUMBER),
        field + ".number", targetName));
  }
}

std::vector<Finding> validateSchema(const Manifest& manifest) {
  std::vector<Finding> errors = manifest.issues;

  validateProject(manifest, errors);

  if (!manifest.hasTargetsSection && !hasIssueAt(manifest, "targets")) {
    errors.push_back(schemaError(
        fmt::format("Missing required 'targets' section in {}",
                    Manifest::FILE_NAME),
        "targets"));
  }

  for (const auto& [name, spec] : manifest.targets) {
    if (spec.contextOf.has_value()
        && !parseContextOf(*spec.contextOf).has_value()) {
      errors.push_back(schemaError(
          fmt::format("Target '{}' has invalid context_of value '{}'. Valid "
                      "values are: orcka, dockerfile, target, bake",
                      name, *spec.contextOf),
          fmt::format("targets.{}.context_of", name), name));
    }

    // Targets without `calculate_on` are tagged from their bake definition
    // alone.
    if (!spec.calculateOn.has_value()) {
      continue;
    }
    const CalculateOn& calculateOn = *spec.calculateOn;
    if (!calculateOn.hasCriteria()) {
      errors.push_back(schemaError(
          fmt::format("Target '{}' must have at least one valid calculate_on "
                      "criteria (always, period, files, or jq)",
                      name),
          fmt::format("targets.{}.calculate_on", name), name));
    }
    if (calculateOn.period.has_value()) {
      validatePeriod(name, *calculateOn.period, errors);
    }
  }
  return errors;
}

std::vector<Finding> validateDependencies(const Manifest& manifest,
                                          const BakeCatalog& catalog,
                                          const DepGraph& graph) {
  std::vector<Finding> errors;

  for (const auto& [name, _] : manifest.targets) {
    if (catalog.find(name) == nullptr) {
      errors.push_back(Finding{
          .type = FindingType::Dependency,
          .message = fmt::format(
              "Target '{}' not found in any of the specified bake files.",
              name),
          .target = name,
          .field = std::nullopt,
          .path = std::nullopt,
      });
    }
  }

  for (const std::vector<std::string>& cycle : graph.findCycles()) {
    errors.push_back(Finding{
        .type = FindingType::Dependency,
        .message = formatCycle(cycle),
        .target = cycle.front(),
        .field = std::nullopt,
        .path = std::nullopt,
    });
  }

  for (const DepOrphan& orphan : graph.findOrphans()) {
    errors.push_back(Finding{
        .type = FindingType::Dependency,
        .message = orphan.message(),
        .target = orphan.from,
        .field = std::nullopt,
        .path = std::nullopt,
    });
  }
  return errors;
}

static void checkExists(const fs::path& path, const std::string& declared,
                        const std::string_view what,
                        const std::string& targetName,
                        std::vector<Finding>& errors) {
  std::error_code ec;
  if (fs::exists(path, ec)) {
    return;
  }
  spdlog::debug("{}: missing {}", targetName, path.string());
  errors.push_back(Finding{
      .type = FindingType::File,
      .message = fmt::format("{} not found: {}", what, declared),
      .target = targetName,
      .field = std::nullopt,
      .path = path.string(),
  });
}

std::vector<Finding> validateFiles(const Manifest& manifest,
                                   const BakeCatalog& catalog,
                                   const ContextResolver& resolver) {
  std::vector<Finding> errors;
  for (const auto& [name, spec] : manifest.targets) {
    if (const BakeTarget* target = catalog.find(name);
        target != nullptr && target->dockerfile.has_value()) {
      const fs::path dockerfile = (resolver.projectContext()
                                   / target->context.value_or(".")
                                   / *target->dockerfile)
                                      .lexically_normal();
      checkExists(dockerfile, *target->dockerfile, "Dockerfile", name,
                  errors);
    }

    if (!spec.calculateOn.has_value()) {
      continue;
    }
    const ContextOf contextOf = spec.contextMode();
    for (const std::string& file : spec.calculateOn->files) {
      checkExists(resolver.resolveFilePath(name, contextOf, file), file,
                  "File", name, errors);
    }
    if (spec.calculateOn->jq.has_value()
        && !spec.calculateOn->jq->filename.empty()) {
      const std::string& file = spec.calculateOn->jq->filename;
      checkExists(resolver.resolveFilePath(name, contextOf, file), file,
                  "File", name, errors);
    }
  }
  return errors;
}

std::vector<Finding> validateExternalTools(const Manifest& manifest,
                                           const ValidateOptions& options) {
  const bool usesJq =
      std::ranges::any_of(manifest.targets, [](const auto& entry) {
        const TargetSpec& spec = entry.second;
        return spec.calculateOn.has_value() && spec.calculateOn->jq.has_value();
      });
  if (!usesJq || options.commandExists("jq")) {
    return {};
  }
  return { Finding{
      .type = FindingType::Dependency,
      .message = "jq command not found. Install jq to use jq-based "
                 "calculate_on criteria.",
      .target = std::nullopt,
      .field = std::nullopt,
      .path = std::nullopt,
  } };
}

std::vector<Finding> generateWarnings(const Manifest& manifest,
                                      const BakeCatalog& catalog) {
  std::vector<Finding> warnings;
  const auto warn = [&warnings](const FindingType type, std::string message,
                                const std::string& target) {
    warnings.push_back(Finding{ .type = type,
                                .message = std::move(message),
                                .target = target,
                                .field = std::nullopt,
                                .path = std::nullopt });
  };

  for (const auto& [name, spec] : manifest.targets) {
    if (spec.calculateOn.has_value()) {
      const CalculateOn& calculateOn = *spec.calculateOn;
      if (calculateOn.always && !calculateOn.hasContentCriteria()) {
        warn(FindingType::Performance,
             fmt::format("Target '{}' uses 'always: true' without other "
                         "criteria. Consider using period, files, or jq for "
                         "better performance.",
                         name),
             name);
      }

      if (calculateOn.period.has_value()
          && isShortPeriod(*calculateOn.period)) {
        if (const auto* periodSpec =
                std::get_if<PeriodSpec>(&*calculateOn.period)) {
          warn(FindingType::Performance,
               fmt::format("Target '{}' has a very short period ({} {}). "
                           "This may cause frequent rebuilds.",
                           name, periodSpec->number.value_or(1),
                           periodSpec->unit),
               name);
        } else {
          warn(FindingType::Performance,
               fmt::format("Target '{}' uses hourly period. This may cause "
                           "frequent rebuilds.",
                           name),
               name);
        }
      }
    }

    if (spec.skipCalculate || catalog.files().empty()
        || catalog.find(name) == nullptr) {
      continue;
    }
    const std::string varName = makeVariableName(name);
    if (!catalog.declaresVariable(varName)) {
      warn(FindingType::BestPractice,
           fmt::format("Target '{}': variable '{}' is not declared in any "
                       "bake file, so the generated tag is not used.",
                       name, varName),
           name);
    }
  }
  return warnings;
}

ValidationReport validate(const Manifest& manifest, const BakeCatalog& catalog,
                          const DepGraph& graph,
                          const ContextResolver& resolver,
                          const ValidateOptions& options) {
  ValidationReport report;
  const auto append = [&report](std::vector<Finding> findings) {
    report.errors.insert(report.errors.end(),
                         std::make_move_iterator(findings.begin()),
                         std::make_move_iterator(findings.end()));
  };

  append(validateSchema(manifest));
  append(catalog.issues());
  append(validateDependencies(manifest, catalog, graph));
  append(validateFiles(manifest, catalog, resolver));
  append(validateExternalTools(manifest, options));
  report.warnings = generateWarnings(manifest, catalog);

  spdlog::debug("validation finished with {} errors and {} warnings",
                report.errors.size(), report.warnings.size());
  return report;
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <fstream>
#  include <rs/tests.hpp>
#  include <toml11/fwd/literal_fwd.hpp>
#  include <unistd.h>

// NOLINTBEGIN
using namespace orcka;
using namespace toml::literals::toml_literals;
// NOLINTEND

static Manifest parse(const toml::value& val) {
  return Manifest::tryFromToml(val, "/work/orcka.toml").unwrap();
}

static std::vector<std::string> messages(const std::vector<Finding>& findings) {
  std::vector<std::string> out;
  for (const Finding& finding : findings) {
    out.push_back(finding.message);
  }
  return out;
}

static bool containsMessage(const std::vector<Finding>& findings,
                            const std::string_view needle) {
  return std::ranges::any_of(findings, [needle](const Finding& finding) {
    return finding.message.find(needle) != std::string::npos;
  });
}

static BakeTarget makeTarget(const std::string& name) {
  BakeTarget target;
  target.name = name;
  target.sourceFile = "docker-bake.hcl";
  return target;
}

static void testToString() {
  tests::assertEq(toString(FindingType::BestPractice), "best-practice");
  tests::assertEq(fmt::format("{}", FindingType::Schema), "schema");

  tests::pass();
}

static void testSchemaValid() {
  const Manifest manifest = parse(R"(
    [project]
    name = "shop"
    write = "docker-tags.hcl"
    bake = ["docker-bake.hcl"]

    [targets.web.calculate_on]
    files = ["web/app.js"]
    period = { unit = "days", number = 1 }

    [targets.base]
    context_of = "bake"
  )"_toml);

  tests::assertTrue(validateSchema(manifest).empty());

  tests::pass();
}

static void testSchemaMissingSections() {
  const Manifest manifest = parse(R"(
    [other]
    key = 1
  )"_toml);

  const auto errors = validateSchema(manifest);
  tests::assertEq(errors.size(), 2UL);
  tests::assertEq(errors[0].message,
                  "Missing required 'project' section in orcka.toml");
  tests::assertEq(errors[1].message,
                  "Missing required 'targets' section in orcka.toml");
  tests::assertTrue(errors[0].type == FindingType::Schema);

  tests::pass();
}

static void testSchemaProjectFields() {
  const Manifest manifest = parse(R"(
    [project]
    context = "."
    bake = []
    parser = "lenient"

    [targets]
  )"_toml);

  const auto errors = validateSchema(manifest);
  tests::assertEq(errors.size(), 4UL);
  tests::assertEq(errors[0].message, "project.name is required");
  tests::assertEq(errors[1].message, "project.write is required");
  tests::assertEq(errors[2].message,
                  "project.bake is required and must be a non-empty array");
  tests::assertEq(errors[3].field.value_or(""), "project.parser");

  tests::pass();
}

static void testSchemaCriteria() {
  const Manifest manifest = parse(R"(
    [project]
    name = "shop"
    write = "tags.hcl"
    bake = ["docker-bake.hcl"]

    [targets.empty.calculate_on]
    always = false

    [targets.jqless.calculate_on]
    jq = { selector = ".version" }

    [targets.preset.calculate_on]
    period = "daily"

    [targets.unitless.calculate_on]
    period = { number = 3 }

    [targets.badunit.calculate_on]
    period = { unit = "fortnights", number = 1 }

    [targets.zero.calculate_on]
    period = { unit = "days", number = 0 }

    [targets.none.calculate_on]
    period = { unit = "none" }

    [targets.huge.calculate_on]
    period = { unit = "seconds", number = 9223372036854775807 }

    [targets.ctx]
    context_of = "compose"
  )"_toml);

  const auto errors = validateSchema(manifest);
  tests::assertEq(errors.size(), 8UL);
  tests::assertTrue(containsMessage(
      errors, "Target 'empty' must have at least one valid calculate_on "
              "criteria (always, period, files, or jq)"));
  tests::assertTrue(containsMessage(
      errors, "Target 'jqless' must have at least one valid calculate_on"));
  tests::assertTrue(containsMessage(
      errors, "Target 'preset' has invalid period format. Valid string "
              "periods are: hourly, weekly, monthly, yearly"));
  tests::assertTrue(
      containsMessage(errors, "Target 'unitless' period must have a unit"));
  tests::assertTrue(containsMessage(
      errors, "Target 'badunit' has invalid period unit 'fortnights'"));
  tests::assertTrue(containsMessage(
      errors, "Target 'zero' period must have a positive number when unit "
              "is not 'none'"));
  tests::assertTrue(containsMessage(
      errors, "Target 'huge' period number must not exceed 1000000"));
  tests::assertTrue(containsMessage(
      errors, "Target 'ctx' has invalid context_of value 'compose'"));
  tests::assertFalse(containsMessage(errors, "Target 'none'"));

  tests::pass();
}

static void testSchemaIncludesLoadIssues() {
  const Manifest manifest = parse(R"(
    [project]
    name = 42
    write = "tags.hcl"
    bake = ["docker-bake.hcl"]

    [targets.web.calculate_on]
    files = ["a"]
    colour = "blue"
  )"_toml);

  const auto errors = validateSchema(manifest);
  tests::assertEq(errors.size(), 2UL);
  tests::assertEq(errors[0].field.value_or(""), "project.name");
  tests::assertTrue(
      containsMessage(errors, "Unknown calculate_on key 'colour'"));

  tests::pass();
}

static void testDependencies() {
  Manifest manifest = parse(R"(
    [project]
    name = "shop"
    write = "tags.hcl"
    bake = ["docker-bake.hcl"]

    [targets.web]
    resolves = ["cache"]

    [targets.ghost]
  )"_toml);

  BakeTarget web = makeTarget("web");
  web.dependsOn = { "api" };
  BakeTarget api = makeTarget("api");
  api.contexts.emplace("web", TargetRef{ "web" });
  const BakeCatalog catalog = BakeCatalog::fromFiles(
      { BakeFile{ .path = "docker-bake.hcl",
                  .targets = { web, api },
                  .variables = {} } });
  const DepGraph graph = DepGraph::build(manifest, catalog);

  const auto errors = validateDependencies(manifest, catalog, graph);
  tests::assertEq(messages(errors).size(), 3UL);
  tests::assertEq(errors[0].message,
                  "Target 'ghost' not found in any of the specified bake "
                  "files.");
  tests::assertEq(errors[1].message,
                  "Cyclic dependency found: api → web → api");
  tests::assertEq(errors[2].message,
                  "Target 'web' depends on 'cache', which is not found in "
                  "any of the specified bake files.");
  tests::assertTrue(errors[2].type == FindingType::Dependency);

  tests::pass();
}

static void testFiles() {
  const fs::path root = fs::temp_directory_path()
                        / fmt::format("orcka-validate-{}", getpid());
  fs::remove_all(root);
  fs::create_directories(root / "web");
  std::ofstream(root / "web" / "Dockerfile") << "FROM node";
  std::ofstream(root / "web" / "app.js") << "v1";

  const Manifest manifest = parse(R"(
    [project]
    name = "shop"
    write = "tags.hcl"
    bake = ["docker-bake.hcl"]

    [targets.web]
    context_of = "dockerfile"

    [targets.web.calculate_on]
    files = ["app.js", "missing.js"]
    jq = { filename = "package.json", selector = ".version" }

    [targets.api.calculate_on]
    always = true
  )"_toml);

  BakeTarget web = makeTarget("web");
  web.dockerfile = "web/Dockerfile";
  BakeTarget api = makeTarget("api");
  api.dockerfile = "api/Dockerfile";
  const BakeCatalog catalog = BakeCatalog::fromFiles(
      { BakeFile{ .path = "docker-bake.hcl",
                  .targets = { web, api },
                  .variables = {} } });
  const ContextResolver resolver(root, catalog);

  const auto errors = validateFiles(manifest, catalog, resolver);
  tests::assertEq(errors.size(), 3UL);
  tests::assertEq(errors[0].message, "Dockerfile not found: api/Dockerfile");
  tests::assertEq(errors[1].message, "File not found: missing.js");
  tests::assertEq(errors[1].path.value_or(""),
                  (root / "web" / "missing.js").string());
  tests::assertEq(errors[2].message, "File not found: package.json");
  tests::assertTrue(errors[2].type == FindingType::File);

  fs::remove_all(root);
  tests::pass();
}

static void testExternalTools() {
  const Manifest manifest = parse(R"(
    [targets.web.calculate_on]
    jq = { filename = "package.json", selector = ".version" }
  )"_toml);

  const auto missing = validateExternalTools(
      manifest, ValidateOptions{ .commandExists = [](std::string_view) {
        return false;
      } });
  tests::assertEq(missing.size(), 1UL);
  tests::assertEq(missing[0].message,
                  "jq command not found. Install jq to use jq-based "
                  "calculate_on criteria.");

  tests::assertTrue(
      validateExternalTools(manifest,
                            ValidateOptions{ .commandExists =
                                                 [](std::string_view) {
                                                   return true;
                                                 } })
          .empty());

  const Manifest withoutJq = parse(R"(
    [targets.web.calculate_on]
    always = true
  )"_toml);
  tests::assertTrue(
      validateExternalTools(withoutJq,
                            ValidateOptions{ .commandExists =
                                                 [](std::string_view) {
                                                   return false;
                                                 } })
          .empty());

  tests::pass();
}

static void testWarnings() {
  const Manifest manifest = parse(R"(
    [targets.dev.calculate_on]
    always = true

    [targets.hourly.calculate_on]
    period = "hourly"

    [targets.minutes.calculate_on]
    period = { unit = "minutes", number = 30 }

    [targets.hours.calculate_on]
    period = { unit = "hours", number = 1 }

    [targets.daily.calculate_on]
    period = { unit = "days", number = 1 }
    always = true
  )"_toml);

  const BakeCatalog catalog = BakeCatalog::fromFiles(
      { BakeFile{ .path = "docker-bake.hcl",
                  .targets = { makeTarget("dev"), makeTarget("daily") },
                  .variables = { "DEV_TAG_VER" } } });

  const auto warnings = generateWarnings(manifest, catalog);
  tests::assertEq(warnings.size(), 5UL);
  tests::assertEq(warnings[0].message,
                  "Target 'daily': variable 'DAILY_TAG_VER' is not declared "
                  "in any bake file, so the generated tag is not used.");
  tests::assertTrue(warnings[0].type == FindingType::BestPractice);
  tests::assertEq(warnings[1].message,
                  "Target 'dev' uses 'always: true' without other criteria. "
                  "Consider using period, files, or jq for better "
                  "performance.");
  tests::assertEq(warnings[2].message,
                  "Target 'hourly' uses hourly period. This may cause "
                  "frequent rebuilds.");
  tests::assertEq(warnings[3].message,
                  "Target 'hours' has a very short period (1 hours). This "
                  "may cause frequent rebuilds.");
  tests::assertEq(warnings[4].message,
                  "Target 'minutes' has a very short period (30 minutes). "
                  "This may cause frequent rebuilds.");
  tests::assertTrue(warnings[4].type == FindingType::Performance);

  tests::pass();
}

static void testValidateRunsEverything() {
  const Manifest manifest = parse(R"(
    [project]
    write = "tags.hcl"
    bake = ["docker-bake.hcl"]

    [targets.web.calculate_on]
    files = ["nowhere.txt"]
    jq = { filename = "package.json", selector = ".v" }
  )"_toml);

  const BakeCatalog catalog =
      BakeCatalog::load("/nonexistent-orcka", { "docker-bake.hcl" },
                        StructuredBakeParser{});
  const DepGraph graph = DepGraph::build(manifest, catalog);
  const ContextResolver resolver("/nonexistent-orcka", catalog);

  const ValidationReport report =
      validate(manifest, catalog, graph, resolver,
               ValidateOptions{ .commandExists = [](std::string_view) {
                 return false;
               } });
  tests::assertFalse(report.ok());
  tests::assertTrue(containsMessage(report.errors, "project.name is required"));
  tests::assertTrue(
      containsMessage(report.errors, "Bake file not found: docker-bake.hcl"));
  tests::assertTrue(containsMessage(
      report.errors, "Target 'web' not found in any of the specified bake"));
  tests::assertTrue(
      containsMessage(report.errors, "File not found: nowhere.txt"));
  tests::assertTrue(containsMessage(report.errors, "jq command not found"));
  tests::assertTrue(report.warnings.empty());

  tests::pass();
}

int main() {
  testToString();
  testSchemaValid();
  testSchemaMissingSections();
  testSchemaProjectFields();
  testSchemaCriteria();
  testSchemaIncludesLoadIssues();
  testDependencies();
  testFiles();
  testExternalTools();
  testWarnings();
  testValidateRunsEverything();
}

#endif
