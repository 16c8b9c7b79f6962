#include "Bake/BakeParser.hpp"

#include "Bake/BakeTarget.hpp"
#include "Bake/Hcl.hpp"
#include "Diag.hpp"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <regex>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace orcka {

rs::Result<BakeParserMode>
parseBakeParserMode(const std::string_view str) noexcept {
  if (str == "strict") {
    return rs::Ok(BakeParserMode::Strict);
  } else if (str == "tolerant") {
    return rs::Ok(BakeParserMode::Tolerant);
  }
  rs_bail("invalid parser mode `{}`: expected `strict` or `tolerant`", str);
}

std::string_view toString(const BakeParserMode mode) noexcept {
  switch (mode) {
  case BakeParserMode::Strict:
    return "strict";
  case BakeParserMode::Tolerant:
    return "tolerant";
  }
  return "tolerant";
}

// HCL conversion artifacts such as `target "x" (...)` produce names with
// parentheses; they never name a real block.
static bool isArtifactName(const std::string_view name) noexcept {
  return name.find_first_of("()") != std::string_view::npos;
}

static rs::Result<std::string> scalarToString(const nlohmann::json& val,
                                              const std::string& target,
                                              const std::string_view field) {
  if (val.is_string()) {
    return rs::Ok(val.get<std::string>());
  }
  if (val.is_number() || val.is_boolean()) {
    return rs::Ok(val.dump());
  }
  rs_bail("target '{}': `{}` must be a string", target, field);
}

static rs::Result<std::vector<std::string>>
stringList(const nlohmann::json& val, const std::string& target,
           const std::string_view field) {
  rs_ensure(val.is_array(), "target '{}': `{}` must be an array of strings",
            target, field);

  std::vector<std::string> strs;
  for (const nlohmann::json& item : val) {
    rs_ensure(item.is_string(),
              "target '{}': `{}` must be an array of strings", target, field);
    strs.push_back(item.get<std::string>());
  }
  return rs::Ok(std::move(strs));
}

static rs::Result<BakeTarget> targetFromJson(const std::string& name,
                                             const nlohmann::json& node,
                                             const std::string& declaredPath) {
  // Some converters wrap each block in a single-element array.
  const nlohmann::json& val =
      node.is_array() && !node.empty() ? node.front() : node;
  rs_ensure(val.is_object(), "target '{}' must be an object", name);

  BakeTarget target;
  target.name = name;
  target.sourceFile = declaredPath;

  if (val.contains("dockerfile") && !val["dockerfile"].is_null()) {
    target.dockerfile = rs_try(scalarToString(val["dockerfile"], name,
                                              "dockerfile"));
  }
  if (val.contains("context") && !val["context"].is_null()) {
    target.context = rs_try(scalarToString(val["context"], name, "context"));
  }
  if (val.contains("args")) {
    const nlohmann::json& args = val["args"];
    rs_ensure(args.is_object(), "target '{}': `args` must be an object",
              name);
    for (const auto& [key, arg] : args.items()) {
      if (arg.is_null()) {
        continue;
      }
      target.args.emplace(key, rs_try(scalarToString(arg, name, "args")));
    }
  }
  if (val.contains("depends_on")) {
    target.dependsOn = rs_try(stringList(val["depends_on"], name,
                                         "depends_on"));
  }
  if (val.contains("contexts")) {
    const nlohmann::json& contexts = val["contexts"];
    rs_ensure(contexts.is_object(),
              "target '{}': `contexts` must be an object", name);
    for (const auto& [key, ctx] : contexts.items()) {
      target.contexts.emplace(
          key,
          parseContextValue(rs_try(scalarToString(ctx, name, "contexts"))));
    }
  }
  if (val.contains("tags")) {
    target.tags = rs_try(stringList(val["tags"], name, "tags"));
  }
  return rs::Ok(std::move(target));
}

rs::Result<BakeFile>
bakeFileFromJson(const nlohmann::json& doc,
                 const std::string& declaredPath) noexcept {
  try {
    rs_ensure(doc.is_object(), "`{}` must contain an object", declaredPath);

    BakeFile file;
    file.path = declaredPath;
    if (doc.contains("target")) {
      const nlohmann::json& targets = doc["target"];
      rs_ensure(targets.is_object(), "`{}`: `target` must be an object",
                declaredPath);
      for (const auto& [name, val] : targets.items()) {
        if (isArtifactName(name)) {
          spdlog::debug("skipping bake target artifact `{}`", name);
          continue;
        }
        file.targets.push_back(rs_try(targetFromJson(name, val, declaredPath)));
      }
    }
    if (doc.contains("variable") && doc["variable"].is_object()) {
      for (const auto& [name, _] : doc["variable"].items()) {
        if (!isArtifactName(name)) {
          file.variables.push_back(name);
        }
      }
    }
    return rs::Ok(std::move(file));
  } catch (const std::exception& e) {
    rs_bail("`{}`: {}", declaredPath, e.what());
  }
}

rs::Result<BakeFile>
StructuredBakeParser::parse(const std::string& declaredPath,
                            const std::string_view content) const {
  nlohmann::json doc;
  if (std::filesystem::path(declaredPath).extension() == ".json") {
    try {
      doc = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
      rs_bail("failed to parse `{}`: {}", declaredPath, e.what());
    }
  } else {
    auto hcl = parseHcl(content);
    if (hcl.is_err()) {
      rs_bail("failed to parse `{}`: {}", declaredPath,
              hcl.unwrap_err()->what());
    }
    doc = hcl.unwrap();
  }
  return bakeFileFromJson(doc, declaredPath);
}

rs::Result<BakeFile>
TolerantBakeParser::parse(const std::string& declaredPath,
                          const std::string_view content) const {
  auto parsed = StructuredBakeParser().parse(declaredPath, content);
  if (parsed.is_ok()) {
    return parsed;
  }

  Diag::warn("{}; scanning for target blocks instead",
             parsed.unwrap_err()->what());
  return rs::Ok(scan(declaredPath, content));
}

static std::size_t findBlockEnd(const std::string_view content,
                                const std::size_t start) {
  int depth = 0;
  bool inString = false;
  for (std::size_t i = start; i < content.size(); ++i) {
    const char c = content[i];
    if (inString) {
      if (c == '\\') {
        ++i;
      } else if (c == '"') {
        inString = false;
      }
      continue;
    }
    if (c == '"') {
      inString = true;
    } else if (c == '{') {
      ++depth;
    } else if (c == '}') {
      if (depth == 0) {
        return i;
      }
      --depth;
    }
  }
  return content.size();
}

static std::optional<std::string> findString(const std::string& body,
                                             const std::regex& pattern) {
  std::smatch match;
  if (std::regex_search(body, match, pattern)) {
    return match[1].str();
  }
  return std::nullopt;
}

static std::vector<std::string> findList(const std::string& body,
                                         const std::regex& pattern) {
  static const std::regex itemPattern(R"re("([^"]*)")re");

  std::vector<std::string> items;
  std::smatch match;
  if (!std::regex_search(body, match, pattern)) {
    return items;
  }
  const std::string list = match[1].str();
  for (auto itr = std::sregex_iterator(list.begin(), list.end(), itemPattern);
       itr != std::sregex_iterator(); ++itr) {
    if (!(*itr)[1].str().empty()) {
      items.push_back((*itr)[1].str());
    }
  }
  return items;
}

static std::vector<std::pair<std::string, std::string>>
findMap(const std::string& body, const std::regex& pattern) {
  static const std::regex kvPattern(
      R"re("?([A-Za-z_][A-Za-z0-9_.-]*)"?\s*[=:]\s*"([^"]*)")re");

  std::vector<std::pair<std::string, std::string>> entries;
  std::smatch match;
  if (!std::regex_search(body, match, pattern)) {
    return entries;
  }
  const std::string map = match[1].str();
  for (auto itr = std::sregex_iterator(map.begin(), map.end(), kvPattern);
       itr != std::sregex_iterator(); ++itr) {
    entries.emplace_back((*itr)[1].str(), (*itr)[2].str());
  }
  return entries;
}

BakeFile TolerantBakeParser::scan(const std::string& declaredPath,
                                  const std::string_view content) {
  static const std::regex targetPattern(R"re(target\s+"([^"]+)"\s*\{)re");
  static const std::regex variablePattern(R"re(variable\s+"([^"]+)"\s*\{)re");
  static const std::regex dockerfilePattern(
      R"re(\bdockerfile\s*=\s*"([^"]+)")re");
  static const std::regex contextPattern(R"re(\bcontext\s*=\s*"([^"]+)")re");
  static const std::regex dependsOnPattern(
      R"re(\bdepends_on\s*=\s*\[([^\]]*)\])re");
  static const std::regex tagsPattern(R"re(\btags\s*=\s*\[([^\]]*)\])re");
  static const std::regex argsPattern(R"re(\bargs\s*=\s*\{([^}]*)\})re");
  static const std::regex contextsPattern(
      R"re(\bcontexts\s*=\s*\{([^}]*)\})re");

  const std::string text(content);

  BakeFile file;
  file.path = declaredPath;
  for (auto itr = std::sregex_iterator(text.begin(), text.end(),
                                       targetPattern);
       itr != std::sregex_iterator(); ++itr) {
    const std::smatch& match = *itr;
    const std::size_t bodyStart =
        static_cast<std::size_t>(match.position(0) + match.length(0));
    const std::size_t bodyEnd = findBlockEnd(text, bodyStart);
    const std::string body = text.substr(bodyStart, bodyEnd - bodyStart);

    BakeTarget target;
    target.name = match[1].str();
    target.sourceFile = declaredPath;
    target.dockerfile = findString(body, dockerfilePattern);
    target.context = findString(body, contextPattern);
    target.dependsOn = findList(body, dependsOnPattern);
    target.tags = findList(body, tagsPattern);
    for (auto& [key, value] : findMap(body, argsPattern)) {
      target.args.emplace(std::move(key), std::move(value));
    }
    for (auto& [key, value] : findMap(body, contextsPattern)) {
      target.contexts.emplace(std::move(key), parseContextValue(value));
    }
    spdlog::debug("scanned bake target `{}` from `{}`", target.name,
                  declaredPath);
    file.targets.push_back(std::move(target));
  }

  for (auto itr = std::sregex_iterator(text.begin(), text.end(),
                                       variablePattern);
       itr != std::sregex_iterator(); ++itr) {
    file.variables.push_back((*itr)[1].str());
  }
  return file;
}

std::unique_ptr<BakeParser> makeBakeParser(const BakeParserMode mode) {
  switch (mode) {
  case BakeParserMode::Strict:
    return std::make_unique<StructuredBakeParser>();
  case BakeParserMode::Tolerant:
    return std::make_unique<TolerantBakeParser>();
  }
  return std::make_unique<TolerantBakeParser>();
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <rs/tests.hpp>
#  include <stdexcept>

// NOLINTBEGIN
using namespace orcka;
// NOLINTEND

static const BakeTarget& findTarget(const BakeFile& file,
                                    const std::string_view name) {
  for (const BakeTarget& target : file.targets) {
    if (target.name == name) {
      return target;
    }
  }
  throw std::logic_error("no such target");
}

static void testParseBakeParserMode() {
  tests::assertTrue(parseBakeParserMode("strict").unwrap()
                    == BakeParserMode::Strict);
  tests::assertTrue(parseBakeParserMode("tolerant").unwrap()
                    == BakeParserMode::Tolerant);
  tests::assertEq(parseBakeParserMode("lenient").unwrap_err()->what(),
                  "invalid parser mode `lenient`: expected `strict` or "
                  "`tolerant`");

  tests::pass();
}

static void testJsonBakeFile() {
  const std::string_view content = R"({
    "variable": { "BASE_TAG_VER": { "default": "" } },
    "target": {
      "base": { "dockerfile": "base/Dockerfile", "context": "." },
      "web": {
        "dockerfile": "web/Dockerfile",
        "depends_on": ["base"],
        "args": { "PORT": 8080, "UNSET": null },
        "contexts": { "base": "target:base", "src": "./web" },
        "tags": ["shop/web:latest"]
      }
    }
  })";

  const BakeFile file =
      StructuredBakeParser().parse("docker-bake.json", content).unwrap();
  tests::assertEq(file.path, "docker-bake.json");
  tests::assertEq(file.targets.size(), 2UL);
  tests::assertEq(file.variables.size(), 1UL);
  tests::assertEq(file.variables[0], "BASE_TAG_VER");

  const BakeTarget& web = findTarget(file, "web");
  tests::assertEq(web.sourceFile, "docker-bake.json");
  tests::assertEq(web.dockerfile.value_or(""), "web/Dockerfile");
  tests::assertFalse(web.context.has_value());
  tests::assertEq(web.args.at("PORT"), "8080");
  tests::assertFalse(web.args.contains("UNSET"));
  tests::assertEq(web.dependsOn.size(), 1UL);
  tests::assertTrue(web.contexts.at("base") == ContextValue(TargetRef{ "base" }));
  tests::assertTrue(web.contexts.at("src")
                    == ContextValue(LiteralContext{ "./web" }));
  tests::assertEq(web.tags[0], "shop/web:latest");

  tests::pass();
}

static void testHclBakeFile() {
  const std::string_view content = R"(
    variable "WEB_TAG_VER" {}

    target "web" {
      dockerfile = "web/Dockerfile"
      context    = "."
      depends_on = ["base"]
      tags       = ["shop/web:${WEB_TAG_VER}"]
    }
  )";

  const BakeFile file =
      makeBakeParser(BakeParserMode::Strict)->parse("docker-bake.hcl", content)
          .unwrap();
  tests::assertEq(file.targets.size(), 1UL);
  tests::assertEq(file.variables[0], "WEB_TAG_VER");
  const BakeTarget& web = findTarget(file, "web");
  tests::assertEq(web.context.value_or(""), ".");
  tests::assertEq(web.dependsOn[0], "base");

  tests::pass();
}

static void testShapeErrors() {
  const std::string_view content = R"({
    "target": { "web": { "depends_on": "base" } }
  })";

  tests::assertEq(StructuredBakeParser()
                      .parse("docker-bake.json", content)
                      .unwrap_err()
                      ->what(),
                  "target 'web': `depends_on` must be an array of strings");

  tests::pass();
}

static void testTolerantFallback() {
  // Unbalanced parentheses make the structured reader give up.
  const std::string_view content = R"(
    variable "API_TAG_VER" {
      default = ""
    }

    target "api" {
      dockerfile = "api/Dockerfile"
      context = "services"
      depends_on = ["base", "tools"]
      args = {
        GO_VERSION = "1.22"
      }
      contexts = {
        base = "target:base"
      }
      platforms = split(",", PLATFORMS
    }
  )";

  tests::assertTrue(
      makeBakeParser(BakeParserMode::Strict)->parse("bake.hcl", content)
          .is_err());

  setColorMode("never");
  Diag::setLevel(DiagLevel::Error);
  const BakeFile file =
      makeBakeParser(BakeParserMode::Tolerant)->parse("bake.hcl", content)
          .unwrap();
  tests::assertEq(file.targets.size(), 1UL);
  tests::assertEq(file.variables[0], "API_TAG_VER");

  const BakeTarget& api = findTarget(file, "api");
  tests::assertEq(api.dockerfile.value_or(""), "api/Dockerfile");
  tests::assertEq(api.context.value_or(""), "services");
  tests::assertEq(api.dependsOn.size(), 2UL);
  tests::assertEq(api.dependsOn[1], "tools");
  tests::assertEq(api.args.at("GO_VERSION"), "1.22");
  tests::assertTrue(api.contexts.at("base") == ContextValue(TargetRef{ "base" }));
  tests::assertEq(api.sourceFile, "bake.hcl");

  tests::pass();
}

int main() {
  testParseBakeParserMode();
  testJsonBakeFile();
  testHclBakeFile();
  testShapeErrors();
  testTolerantFallback();
}

#endif
