#include "Render.hpp"

#include "Algos.hpp"
#include "Manifest.hpp"
#include "Tag/DepGraph.hpp"
#include "Tag/TagGenerator.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <fstream>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace orcka {

static std::string pullPolicyName(const std::string& varName) {
  constexpr std::string_view suffix = "_TAG_VER";
  if (varName.ends_with(suffix)) {
    return varName.substr(0, varName.size() - suffix.size()) + "_PULL_POLICY";
  }
  return varName + "_PULL_POLICY";
}

std::string renderHcl(const std::vector<GeneratedTag>& tags,
                      const RenderOptions& options) {
  std::vector<std::pair<std::string, std::string>> vars;
  for (const GeneratedTag& tag : tags) {
    vars.emplace_back(tag.varName, tag.version);
  }
  if (options.pullPolicy.has_value()) {
    for (const GeneratedTag& tag : tags) {
      vars.emplace_back(pullPolicyName(tag.varName), *options.pullPolicy);
    }
  }

  std::size_t width = 0;
  for (const auto& [name, _] : vars) {
    width = std::max(width, name.size());
  }

  std::string out;
  for (const auto& [name, value] : vars) {
    out += fmt::format("{:<{}} = \"{}\"\n", name, width, value);
  }
  return out;
}

static std::string describeCriteria(const CalculateOn& calculateOn) {
  std::vector<std::string> criteria;
  if (calculateOn.always) {
    criteria.emplace_back("always");
  }
  if (calculateOn.period.has_value()) {
    criteria.push_back(std::visit(
        Overloaded{
            [](const std::string& preset) { return preset; },
            [](const PeriodSpec& spec) {
              if (!spec.number.has_value()) {
                return spec.unit;
              }
              return fmt::format("{} {}", *spec.number, spec.unit);
            },
        },
        *calculateOn.period));
  }
  if (!calculateOn.files.empty()) {
    criteria.push_back(fmt::format("{} files", calculateOn.files.size()));
  }
  if (calculateOn.jq.has_value()) {
    criteria.emplace_back("jq");
  }
  return fmt::format("{}", fmt::join(criteria, ", "));
}
// Escapes `\` and `"` for a DOT quoted string.
// Escapes `\\` and `"` for a DOT quoted string.
static std::string dotEscape(const std::string_view str) {
  std::string out;
  out.reserve(str.size());
  for (const char c : str) {
    if (c == '\\' || c == '"') {
      out += '\\';
    }
    out += c;
  }
  return out;
}

std::string renderDot(const Manifest& manifest, const DepGraph& graph) {
  std::string out = "digraph ServiceDependencies {\n"
                    "  rankdir=LR;\n"
                    "  node [shape=box, style=\"rounded,filled\"];\n"
                    "\n";

  for (const auto& [name, _] : graph.edges()) {
    std::string label = dotEscape(name);
    const char* color = "lightblue";
    if (const TargetSpec* spec = manifest.findTarget(name);
        spec != nullptr && spec->calculateOn.has_value()) {
      const std::string criteria = describeCriteria(*spec->calculateOn);
      if (!criteria.empty()) {
        label += fmt::format("\\n({})", dotEscape(criteria));
      }
      if (spec->calculateOn->always) {
        color = "lightcoral";
      }
    }
    out += fmt::format("  \"{}\" [label=\"{}\", fillcolor={}];\n",
                       dotEscape(name), label, color);
  }

  out += '\n';
  for (const auto& [name, deps] : graph.edges()) {
    for (const std::string& dep : deps) {
      if (graph.contains(dep)) {
        out += fmt::format("  \"{}\" -> \"{}\";\n", dotEscape(dep),
                           dotEscape(name));
      }
    }
  }
  out += "}\n";
  return out;
}

fs::path resolveOutputPath(const fs::path& projectContext,
                           const Project& project) {
  return projectContext / OUTPUT_DIR / fs::path(project.write).filename();
}

rs::Result<void> writeOutput(const fs::path& path,
                             const std::string_view content) {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  rs_ensure(!ec, "failed to create `{}`: {}", path.parent_path().string(),
            ec.message());

  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  rs_ensure(ofs.is_open(), "failed to open `{}` for writing", path.string());
  ofs << content;
  ofs.close();
  rs_ensure(!ofs.fail(), "failed to write `{}`", path.string());

  spdlog::debug("wrote {} bytes to {}", content.size(), path.string());
  return rs::Ok();
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <rs/tests.hpp>
#  include <toml11/fwd/literal_fwd.hpp>
#  include <unistd.h>

// NOLINTBEGIN
using namespace orcka;
using namespace toml::literals::toml_literals;
// NOLINTEND

static GeneratedTag makeTag(const std::string& name,
                            const std::string& version) {
  GeneratedTag tag;
  tag.name = name;
  tag.varName = makeVariableName(name);
  tag.version = version;
  tag.imageReference = fmt::format("{}:{}", name, version);
  return tag;
}

static void testRenderHcl() {
  const std::vector<GeneratedTag> tags = { makeTag("web", "aaa"),
                                           makeTag("api-gateway", "bbb") };

  tests::assertEq(renderHcl(tags), "WEB_TAG_VER         = \"aaa\"\n"
                                   "API_GATEWAY_TAG_VER = \"bbb\"\n");
  tests::assertEq(renderHcl(tags, RenderOptions{ .pullPolicy = "never" }),
                  "WEB_TAG_VER             = \"aaa\"\n"
                  "API_GATEWAY_TAG_VER     = \"bbb\"\n"
                  "WEB_PULL_POLICY         = \"never\"\n"
                  "API_GATEWAY_PULL_POLICY = \"never\"\n");
  tests::assertEq(renderHcl({}), "");

  // Only the trailing suffix becomes the pull-policy suffix.
  const std::vector<GeneratedTag> repeated = { makeTag("web-tag-ver", "ccc") };
  tests::assertEq(renderHcl(repeated, RenderOptions{ .pullPolicy = "always" }),
                  "WEB_TAG_VER_TAG_VER     = \"ccc\"\n"
                  "WEB_TAG_VER_PULL_POLICY = \"always\"\n");

  tests::pass();
}

static void testRenderDot() {
  const Manifest manifest = Manifest::tryFromToml(R"(
    [targets.web.calculate_on]
    files = ["a", "b"]
    period = { unit = "hours", number = 2 }

    [targets.dev.calculate_on]
    always = true
  )"_toml,
                                                  "/work/orcka.toml")
                                .unwrap();
  const DepGraph graph(std::map<std::string, std::vector<std::string>>{
      { "web", { "base", "external" } },
      { "base", {} },
      { "dev", { "base" } },
  });

  tests::assertEq(renderDot(manifest, graph),
                  "digraph ServiceDependencies {\n"
                  "  rankdir=LR;\n"
                  "  node [shape=box, style=\"rounded,filled\"];\n"
                  "\n"
                  "  \"base\" [label=\"base\", fillcolor=lightblue];\n"
                  "  \"dev\" [label=\"dev\\n(always)\", fillcolor=lightcoral];\n"
                  "  \"web\" [label=\"web\\n(2 hours, 2 files)\", "
                  "fillcolor=lightblue];\n"
                  "\n"
                  "  \"base\" -> \"dev\";\n"
                  "  \"base\" -> \"web\";\n"
                  "}\n");

  const DepGraph quoted(std::map<std::string, std::vector<std::string>>{
      { "say\"hi", { "back\\slash" } },
      { "back\\slash", {} },
  });
  tests::assertEq(renderDot(Manifest{}, quoted),
                  "digraph ServiceDependencies {\n"
                  "  rankdir=LR;\n"
                  "  node [shape=box, style=\"rounded,filled\"];\n"
                  "\n"
                  "  \"back\\\\slash\" [label=\"back\\\\slash\", "
                  "fillcolor=lightblue];\n"
                  "  \"say\\\"hi\" [label=\"say\\\"hi\", fillcolor=lightblue];\n"
                  "\n"
                  "  \"back\\\\slash\" -> \"say\\\"hi\";\n"
                  "}\n");

  tests::pass();
}

static void testResolveOutputPath() {
  Project project;
  project.write = "out/docker-tags.hcl";
  tests::assertEq(resolveOutputPath("/work/build", project),
                  fs::path("/work/build/.orcka/docker-tags.hcl"));

  tests::pass();
}

static void testWriteOutput() {
  const fs::path root = fs::temp_directory_path()
                        / fmt::format("orcka-render-{}", getpid());
  fs::remove_all(root);
  const fs::path path = root / ".orcka" / "tags.hcl";

  tests::assertTrue(writeOutput(path, "A = \"1\"\n").is_ok());
  tests::assertEq(readFile(path).value_or(""), "A = \"1\"\n");
  tests::assertTrue(writeOutput(path, "B = \"2\"\n").is_ok());
  tests::assertEq(readFile(path).value_or(""), "B = \"2\"\n");

  fs::remove_all(root);
  tests::pass();
}

int main() {
  testRenderHcl();
  testRenderDot();
  testResolveOutputPath();
  testWriteOutput();
}

#endif
