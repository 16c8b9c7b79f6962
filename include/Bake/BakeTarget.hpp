#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace orcka {

namespace fs = std::filesystem;

struct LiteralContext {
  std::string value;

  bool operator==(const LiteralContext&) const = default;
};

// A named context fed by another bake target (`target:<name>`).
struct TargetRef {
  std::string name;

  bool operator==(const TargetRef&) const = default;
};

using ContextValue = std::variant<LiteralContext, TargetRef>;

ContextValue parseContextValue(std::string_view raw);
std::string toString(const ContextValue& value);

struct BakeTarget {
  std::string name;
  std::optional<std::string> dockerfile;
  std::optional<std::string> context;
  std::unordered_map<std::string, std::string> args;
  std::vector<std::string> dependsOn;
  std::unordered_map<std::string, ContextValue> contexts;
  std::vector<std::string> tags;
  // The bake file as declared in the manifest, relative to the project
  // context.
  std::string sourceFile;

  // Names of targets referenced through `contexts`, sorted.
  std::vector<std::string> contextRefs() const;
  // Image part of the first declared tag, if any.
  std::optional<std::string> image() const;
};

struct BakeFile {
  std::string path;
  std::vector<BakeTarget> targets;
  std::vector<std::string> variables;
};

} // namespace orcka
