#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <random>
#include <regex>
#include <rs/result.hpp>
#include <sstream>
#include <string>
#include <string_view>
#include <sys/wait.h>
#include <system_error>
#include <utility>
#include <vector>

namespace tests {

namespace fs = std::filesystem;

inline std::string readFile(const fs::path& file);

inline fs::path orckaBinary() {
  if (const char* env = std::getenv("ORCKA")) {
    return fs::path(env);
  }
#ifdef ORCKA_BIN
  return fs::path(ORCKA_BIN);
#else
  return fs::current_path() / "orcka";
#endif
}

struct ExitStatus {
  int code = -1;

  bool success() const noexcept { return code == 0; }
  std::string toString() const { return fmt::format("exit status: {}", code); }
};

struct RunResult {
  ExitStatus status;
  std::string out;
  std::string err;
};

inline std::string replaceAll(std::string text, std::string_view from,
                              std::string_view to) {
  if (from.empty()) {
    return text;
  }
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

inline std::string scrubDurations(std::string text) {
  static const std::regex pattern(R"(in [0-9]+\.[0-9]+s)");
  return std::regex_replace(text, pattern, "in <DURATION>s");
}

inline std::string sanitizeOutput(
    std::string text,
    std::initializer_list<std::pair<std::string_view, std::string_view>>
        replacements = {}) {
  for (const auto& [from, to] : replacements) {
    text = replaceAll(std::move(text), from, to);
  }
  text = scrubDurations(std::move(text));
  text = std::regex_replace(std::move(text),
                            std::regex(R"(\b[0-9a-f]{40}\b)"), "<TOKEN>");
  return text;
}

inline std::string shellQuote(std::string_view arg) {
  std::string quoted = "'";
  quoted += replaceAll(std::string(arg), "'", R"('\'')");
  quoted += '\'';
  return quoted;
}

struct TempDir {
  fs::path path;

  TempDir()
      : path([] {
          const auto epoch =
              std::chrono::steady_clock::now().time_since_epoch();
          const auto ticks =
              std::chrono::duration_cast<std::chrono::nanoseconds>(epoch)
                  .count();
          const auto random =
              static_cast<std::uint64_t>(std::random_device{}());
          std::ostringstream oss;
          oss << "orcka-test-" << random << '-' << ticks;
          return fs::temp_directory_path() / oss.str();
        }()) {
    fs::create_directories(path);
  }

  ~TempDir() {
    if (path.empty()) {
      return;
    }
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  TempDir(TempDir&& other) noexcept : path(std::move(other.path)) {
    other.path.clear();
  }

  TempDir& operator=(TempDir&& other) noexcept {
    if (this != &other) {
      path = std::move(other.path);
      other.path.clear();
    }
    return *this;
  }

  [[nodiscard]] fs::path operator/(const fs::path& relative) const {
    return path / relative;
  }
};

// Runs the orcka binary through the shell.  Stdout is read from the pipe,
// stderr is collected in a scratch file next to the working directory.
inline rs::Result<RunResult> runOrcka(const std::vector<std::string>& args,
                                      const fs::path& workdir = {}) {
  const TempDir scratch;
  const fs::path errFile = scratch / "stderr";

  std::string command;
  if (!workdir.empty()) {
    command += fmt::format("cd {} && ", shellQuote(workdir.string()));
  }
  command += "ORCKA_TERM_COLOR=never ";
  command += shellQuote(orckaBinary().string());
  for (const auto& arg : args) {
    command += ' ';
    command += shellQuote(arg);
  }
  command += fmt::format(" 2>{}", shellQuote(errFile.string()));

  FILE* pipe = popen(command.c_str(), "r");
  rs_ensure(pipe != nullptr, "failed to spawn `{}`", command);

  std::string out;
  std::array<char, 4096> buffer{};
  std::size_t read = 0;
  while ((read = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    out.append(buffer.data(), read);
  }
  const int raw = pclose(pipe);
  rs_ensure(raw != -1, "failed to wait for `{}`", command);

  ExitStatus status;
  if (WIFEXITED(raw)) {
    status.code = WEXITSTATUS(raw);
  }
  return rs::Ok(RunResult{ status, std::move(out), readFile(errFile) });
}

inline rs::Result<RunResult> runOrcka(std::initializer_list<std::string> args,
                                      const fs::path& workdir = {}) {
  return runOrcka(std::vector<std::string>(args), workdir);
}

inline std::string readFile(const fs::path& file) {
  std::ifstream ifs(file);
  return std::string(std::istreambuf_iterator<char>(ifs), {});
}

inline void writeFile(const fs::path& file, const std::string& content) {
  if (file.has_parent_path()) {
    fs::create_directories(file.parent_path());
  }
  std::ofstream ofs(file);
  ofs << content;
}

// Value of `NAME = "value"` in a rendered variable file, empty if absent.
inline std::string variableValue(const std::string& hcl,
                                 const std::string& name) {
  const std::regex pattern("^" + name + R"( *= "([^"]*)"$)",
                           std::regex_constants::multiline);
  std::smatch match;
  if (std::regex_search(hcl, match, pattern)) {
    return match[1].str();
  }
  return {};
}

} // namespace tests
