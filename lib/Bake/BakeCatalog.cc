#include "Bake/BakeCatalog.hpp"

#include "Algos.hpp"
#include "Bake/BakeParser.hpp"
#include "Bake/BakeTarget.hpp"
#include "Finding.hpp"

#include <filesystem>
#include <fmt/core.h>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace orcka {

BakeCatalog BakeCatalog::load(const fs::path& projectContext,
                              const std::vector<std::string>& bakeFiles,
                              const BakeParser& parser) {
  BakeCatalog catalog;
  for (const std::string& bakeFile : bakeFiles) {
    const fs::path path = (projectContext / bakeFile).lexically_normal();
    spdlog::debug("Loading bake file: {}", path.string());

    std::error_code ec;
    if (!fs::exists(path, ec)) {
      catalog.issues_.push_back(Finding{
          .type = FindingType::File,
          .message = fmt::format("Bake file not found: {}", bakeFile),
          .target = std::nullopt,
          .field = "project.bake",
          .path = path.string(),
      });
      continue;
    }

    const std::optional<std::string> content = readFile(path);
    if (!content.has_value()) {
      catalog.issues_.push_back(Finding{
          .type = FindingType::File,
          .message = fmt::format("Failed to read bake file {}", bakeFile),
          .target = std::nullopt,
          .field = "project.bake",
          .path = path.string(),
      });
      continue;
    }

    auto parsed = parser.parse(bakeFile, *content);
    if (parsed.is_err()) {
      catalog.issues_.push_back(Finding{
          .type = FindingType::File,
          .message = fmt::format("Failed to read or parse bake file {}: {}",
                                 bakeFile, parsed.unwrap_err()->what()),
          .target = std::nullopt,
          .field = "project.bake",
          .path = path.string(),
      });
      continue;
    }
    catalog.add(parsed.unwrap());
  }
  return catalog;
}

BakeCatalog BakeCatalog::fromFiles(std::vector<BakeFile> files) {
  BakeCatalog catalog;
  for (BakeFile& file : files) {
    catalog.add(std::move(file));
  }
  return catalog;
}

void BakeCatalog::add(BakeFile file) {
  for (const BakeTarget& target : file.targets) {
    if (targets_.contains(target.name)) {
      issues_.push_back(Finding{
          .type = FindingType::Dependency,
          .message = fmt::format(
              "Duplicate bake target '{}' found in bake files.", target.name),
          .target = target.name,
          .field = std::nullopt,
          .path = file.path,
      });
      continue;
    }
    targets_.emplace(target.name, target);
  }
  for (const std::string& variable : file.variables) {
    variables_.insert(variable);
  }
  files_.push_back(std::move(file));
}

const BakeTarget* BakeCatalog::find(const std::string_view name) const {
  const auto itr = targets_.find(std::string(name));
  if (itr == targets_.end()) {
    return nullptr;
  }
  return &itr->second;
}

bool BakeCatalog::declaresVariable(const std::string_view name) const {
  return variables_.contains(std::string(name));
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <fstream>
#  include <rs/tests.hpp>
#  include <unistd.h>

// NOLINTBEGIN
using namespace orcka;
// NOLINTEND

static BakeTarget makeTarget(std::string name, std::string sourceFile) {
  BakeTarget target;
  target.name = std::move(name);
  target.sourceFile = std::move(sourceFile);
  return target;
}

static void testFromFiles() {
  BakeFile first{ .path = "a.hcl",
                  .targets = { makeTarget("web", "a.hcl"),
                               makeTarget("base", "a.hcl") },
                  .variables = { "WEB_TAG_VER" } };
  BakeFile second{ .path = "b.hcl",
                   .targets = { makeTarget("web", "b.hcl"),
                                makeTarget("api", "b.hcl") },
                   .variables = {} };

  const BakeCatalog catalog =
      BakeCatalog::fromFiles({ std::move(first), std::move(second) });
  tests::assertEq(catalog.targets().size(), 3UL);
  tests::assertEq(catalog.find("web")->sourceFile, "a.hcl");
  tests::assertEq(catalog.find("api")->sourceFile, "b.hcl");
  tests::assertTrue(catalog.find("db") == nullptr);
  tests::assertTrue(catalog.declaresVariable("WEB_TAG_VER"));
  tests::assertFalse(catalog.declaresVariable("API_TAG_VER"));

  tests::assertEq(catalog.issues().size(), 1UL);
  tests::assertTrue(catalog.issues()[0].type == FindingType::Dependency);
  tests::assertEq(catalog.issues()[0].message,
                  "Duplicate bake target 'web' found in bake files.");

  tests::pass();
}

static void testLoad() {
  const fs::path dir = fs::temp_directory_path()
                       / fmt::format("orcka-catalog-{}", getpid());
  fs::create_directories(dir / "bake");
  std::ofstream(dir / "bake" / "docker-bake.hcl") << R"(
    target "web" {
      dockerfile = "web/Dockerfile"
    }
  )";
  std::ofstream(dir / "broken.json") << "{ \"target\": ";

  const StructuredBakeParser parser{};
  const BakeCatalog catalog = BakeCatalog::load(
      dir, { "bake/docker-bake.hcl", "missing.hcl", "broken.json" }, parser);

  tests::assertEq(catalog.targets().size(), 1UL);
  tests::assertEq(catalog.find("web")->sourceFile, "bake/docker-bake.hcl");
  tests::assertEq(catalog.files().size(), 1UL);

  tests::assertEq(catalog.issues().size(), 2UL);
  tests::assertEq(catalog.issues()[0].message,
                  "Bake file not found: missing.hcl");
  tests::assertTrue(catalog.issues()[0].type == FindingType::File);
  tests::assertTrue(catalog.issues()[1].message.starts_with(
      "Failed to read or parse bake file broken.json: "));

  fs::remove_all(dir);

  tests::pass();
}

int main() {
  testFromFiles();
  testLoad();
}

#endif
