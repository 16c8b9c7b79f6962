#include "Tag/ContextResolver.hpp"

#include "Algos.hpp"
#include "Bake/BakeCatalog.hpp"
#include "Bake/BakeTarget.hpp"
#include "Manifest.hpp"

#include <filesystem>
#include <spdlog/spdlog.h>
#include <string_view>
#include <utility>

namespace orcka {

ContextResolver::ContextResolver(fs::path projectContext,
                                 const BakeCatalog& catalog)
    : projectContext_(normalizeDir(projectContext)), catalog(catalog) {}

fs::path ContextResolver::resolveProjectContext(const fs::path& manifestPath,
                                                const Project& project) {
  const fs::path manifestDir = fs::absolute(manifestPath).parent_path();
  const fs::path context = project.context.empty() ? "." : project.context;
  return normalizeDir(manifestDir / context);
}

fs::path ContextResolver::resolveTargetContext(const std::string_view targetName,
                                               const ContextOf contextOf) const {
  if (contextOf == ContextOf::Orcka) {
    return projectContext_;
  }

  const BakeTarget* target = catalog.find(targetName);
  if (target == nullptr) {
    spdlog::debug("no bake target `{}`; using the project context",
                  targetName);
    return projectContext_;
  }

  const fs::path buildContext = target->context.value_or(".");
  switch (contextOf) {
  case ContextOf::Dockerfile:
    if (!target->dockerfile.has_value()) {
      return projectContext_;
    }
    return normalizeDir(
        (projectContext_ / buildContext / *target->dockerfile).parent_path());
  case ContextOf::Target:
    if (!target->context.has_value()) {
      return projectContext_;
    }
    return normalizeDir(projectContext_ / buildContext);
  case ContextOf::Bake:
    if (target->sourceFile.empty()) {
      return projectContext_;
    }
    return normalizeDir(
        (projectContext_ / target->sourceFile).parent_path());
  case ContextOf::Orcka:
    break;
  }
  return projectContext_;
}

fs::path ContextResolver::resolveFilePath(const std::string_view targetName,
                                          const ContextOf contextOf,
                                          const fs::path& relativePath) const {
  return (resolveTargetContext(targetName, contextOf) / relativePath)
      .lexically_normal();
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <rs/tests.hpp>

// NOLINTBEGIN
using namespace orcka;
// NOLINTEND

static BakeCatalog makeCatalog() {
  BakeTarget web;
  web.name = "web";
  web.dockerfile = "web/Dockerfile";
  web.context = "services";
  web.sourceFile = "bake/docker-bake.hcl";

  BakeTarget bare;
  bare.name = "bare";
  bare.sourceFile = "docker-bake.hcl";

  return BakeCatalog::fromFiles({
      BakeFile{ .path = "bake/docker-bake.hcl",
                .targets = { web },
                .variables = {} },
      BakeFile{ .path = "docker-bake.hcl",
                .targets = { bare },
                .variables = {} },
  });
}

static void testResolveProjectContext() {
  Project project;
  project.context = "./build";
  tests::assertEq(
      ContextResolver::resolveProjectContext("/work/orcka.toml", project),
      fs::path("/work/build"));

  project.context = ".";
  tests::assertEq(
      ContextResolver::resolveProjectContext("/work/orcka.toml", project),
      fs::path("/work"));

  project.context = "";
  tests::assertEq(
      ContextResolver::resolveProjectContext("/work/orcka.toml", project),
      fs::path("/work"));

  project.context = "../shared/";
  tests::assertEq(
      ContextResolver::resolveProjectContext("/work/app/orcka.toml", project),
      fs::path("/work/shared"));

  tests::pass();
}

static void testResolveTargetContext() {
  const BakeCatalog catalog = makeCatalog();
  const ContextResolver resolver("/work/build/", catalog);
  tests::assertEq(resolver.projectContext(), fs::path("/work/build"));

  tests::assertEq(resolver.resolveTargetContext("web", ContextOf::Orcka),
                  fs::path("/work/build"));
  tests::assertEq(resolver.resolveTargetContext("web", ContextOf::Dockerfile),
                  fs::path("/work/build/services/web"));
  tests::assertEq(resolver.resolveTargetContext("web", ContextOf::Target),
                  fs::path("/work/build/services"));
  tests::assertEq(resolver.resolveTargetContext("web", ContextOf::Bake),
                  fs::path("/work/build/bake"));

  tests::pass();
}

static void testFallbacks() {
  const BakeCatalog catalog = makeCatalog();
  const ContextResolver resolver("/work/build", catalog);

  tests::assertEq(
      resolver.resolveTargetContext("missing", ContextOf::Dockerfile),
      fs::path("/work/build"));
  tests::assertEq(resolver.resolveTargetContext("missing", ContextOf::Bake),
                  fs::path("/work/build"));
  tests::assertEq(resolver.resolveTargetContext("bare", ContextOf::Dockerfile),
                  fs::path("/work/build"));
  tests::assertEq(resolver.resolveTargetContext("bare", ContextOf::Target),
                  fs::path("/work/build"));
  tests::assertEq(resolver.resolveTargetContext("bare", ContextOf::Bake),
                  fs::path("/work/build"));

  tests::pass();
}

static void testResolveFilePath() {
  const BakeCatalog catalog = makeCatalog();
  const ContextResolver resolver("/work/build", catalog);

  tests::assertEq(
      resolver.resolveFilePath("web", ContextOf::Dockerfile, "package.json"),
      fs::path("/work/build/services/web/package.json"));
  tests::assertEq(
      resolver.resolveFilePath("web", ContextOf::Orcka, "./web/../app.js"),
      fs::path("/work/build/app.js"));

  tests::pass();
}

int main() {
  testResolveProjectContext();
  testResolveTargetContext();
  testFallbacks();
  testResolveFilePath();
}

#endif
