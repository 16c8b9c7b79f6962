#pragma once

#include "helpers.hpp"

#include <string>

namespace tests {

// A two-target project: `web` hashes web/app.js, `base` hashes base/deps.txt.
// Bake files and inputs live under the `build` context directory.
inline void writeShopProject(const fs::path& root) {
  writeFile(root / "orcka.toml", R"([project]
name = "shop"
context = "./build"
write = "docker-tags.hcl"
bake = ["docker-bake.hcl"]

[targets.web.calculate_on]
files = ["web/app.js"]

[targets.base.calculate_on]
files = ["base/deps.txt"]
)");
  writeFile(root / "build" / "docker-bake.hcl", R"(variable "WEB_TAG_VER" {
  default = "latest"
}

variable "BASE_TAG_VER" {
  default = "latest"
}

target "base" {
  dockerfile = "base/Dockerfile"
}

target "web" {
  dockerfile = "web/Dockerfile"
}
)");
  writeFile(root / "build" / "web" / "Dockerfile", "FROM nginx\n");
  writeFile(root / "build" / "web" / "app.js", "console.log('v1');\n");
  writeFile(root / "build" / "base" / "Dockerfile", "FROM alpine\n");
  writeFile(root / "build" / "base" / "deps.txt", "curl\n");
}

inline fs::path shopOutput(const fs::path& root) {
  return root / "build" / ".orcka" / "docker-tags.hcl";
}

} // namespace tests
