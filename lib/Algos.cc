#include "Algos.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>

namespace orcka {

bool matchesAny(const std::string_view str,
                const std::initializer_list<std::string_view> candidates) noexcept {
  return std::ranges::any_of(candidates, [str](const std::string_view cand) {
    return str == cand;
  });
}

std::string toUpper(const std::string_view str) {
  std::string res;
  res.reserve(str.size());
  for (const unsigned char c : str) {
    res.push_back(static_cast<char>(std::toupper(c)));
  }
  return res;
}

bool commandExists(const std::string_view cmd) noexcept {
  if (cmd.empty()) {
    return false;
  }
  if (cmd.find('/') != std::string_view::npos) {
    return access(std::string(cmd).c_str(), X_OK) == 0;
  }

  const char* pathEnv = std::getenv("PATH");
  if (pathEnv == nullptr) {
    return false;
  }

  std::string_view paths = pathEnv;
  while (true) {
    const std::size_t sep = paths.find(':');
    std::string_view dir = paths.substr(0, sep);
    if (dir.empty()) {
      dir = ".";
    }

    const fs::path candidate = fs::path(dir) / cmd;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)
        && access(candidate.c_str(), X_OK) == 0) {
      return true;
    }

    if (sep == std::string_view::npos) {
      return false;
    }
    paths.remove_prefix(sep + 1);
  }
}

std::optional<std::string> readFile(const fs::path& path) noexcept {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::nullopt;
  }

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    return std::nullopt;
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  if (ifs.bad()) {
    return std::nullopt;
  }
  return oss.str();
}

fs::path normalizeDir(const fs::path& path) {
  fs::path normal = path.lexically_normal();
  if (!normal.has_filename() && normal != normal.root_path()
      && normal.has_parent_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <rs/tests.hpp>

// NOLINTBEGIN
using namespace orcka;
// NOLINTEND

static void testToUpper() {
  tests::assertEq(toUpper("web-app_1"), "WEB-APP_1");
  tests::assertEq(toUpper(""), "");

  tests::pass();
}

static void testMatchesAny() {
  tests::assertTrue(matchesAny("-q", { "-q", "--quiet" }));
  tests::assertFalse(matchesAny("-v", { "-q", "--quiet" }));

  tests::pass();
}

static void testNormalizeDir() {
  tests::assertEq(normalizeDir("/a/b/./"), fs::path("/a/b"));
  tests::assertEq(normalizeDir("/a/b/../c"), fs::path("/a/c"));
  tests::assertEq(normalizeDir("/"), fs::path("/"));
  tests::assertEq(normalizeDir("a/."), fs::path("a"));

  tests::pass();
}

static void testCommandExists() {
  tests::assertTrue(commandExists("sh"));
  tests::assertFalse(commandExists("orcka-definitely-not-a-command"));
  tests::assertFalse(commandExists(""));

  tests::pass();
}

static void testReadFile() {
  tests::assertFalse(readFile("/nonexistent/orcka/file").has_value());
  tests::assertFalse(readFile("/").has_value());

  tests::pass();
}

int main() {
  testToUpper();
  testMatchesAny();
  testNormalizeDir();
  testCommandExists();
  testReadFile();
}

#endif
