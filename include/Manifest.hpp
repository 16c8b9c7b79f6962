#pragma once

#include "Finding.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <toml.hpp>
#include <variant>
#include <vector>

namespace orcka {

namespace fs = std::filesystem;

enum class ContextOf : std::uint8_t {
  Orcka,
  Dockerfile,
  Target,
  Bake,
};

std::optional<ContextOf> parseContextOf(std::string_view str) noexcept;
std::string_view toString(ContextOf contextOf) noexcept;

struct PeriodSpec {
  std::string unit;
  std::optional<std::int64_t> number;

  bool operator==(const PeriodSpec&) const = default;
};

// Either a preset name (`hourly`, `weekly`, `monthly`, `yearly`) or an
// explicit `{ unit, number }` table.
using Period = std::variant<std::string, PeriodSpec>;

struct JqCriterion {
  std::string filename;
  std::string selector;
};

struct CalculateOn {
  std::vector<std::string> files;
  std::optional<JqCriterion> jq;
  std::optional<Period> period;
  bool always = false;
  std::optional<std::string> date;

  // At least one of always, period, files or jq with a filename.
  bool hasCriteria() const noexcept;
  // Whether anything besides `always` drives the hash.
  bool hasContentCriteria() const noexcept;
};

struct TargetSpec {
  std::string name;
  std::optional<CalculateOn> calculateOn;
  // Kept verbatim; unknown modes are reported by the schema checks and
  // resolve like `orcka`.
  std::optional<std::string> contextOf;
  std::vector<std::string> resolves;
  bool skipCalculate = false;

  ContextOf contextMode() const noexcept;
};

struct Project {
  std::string name;
  std::string context = ".";
  std::string write;
  std::vector<std::string> bake;
  std::optional<std::string> parser;
  std::optional<std::string> pullPolicy;
};

struct Manifest {
  static constexpr const char* FILE_NAME = "orcka.toml";

  fs::path path;
  std::optional<Project> project;
  bool hasTargetsSection = false;
  std::map<std::string, TargetSpec> targets;
  // Shape problems found while loading.  They do not fail the load and are
  // surfaced as schema errors by the validator.
  std::vector<Finding> issues;

  fs::path dir() const;
  const TargetSpec* findTarget(std::string_view name) const;

  static rs::Result<Manifest>
  tryParse(fs::path path = fs::current_path() / FILE_NAME,
           bool findParents = true) noexcept;
  static rs::Result<Manifest> tryFromToml(const toml::value& data,
                                          fs::path path) noexcept;
  static rs::Result<fs::path>
  findPath(fs::path candidateDir = fs::current_path()) noexcept;
};

} // namespace orcka
