#pragma once

#include <cstdint>
#include <fmt/color.h>
#include <fmt/core.h>
#include <string>
#include <string_view>
#include <utility>

namespace orcka {

enum class ColorMode : std::uint8_t {
  Always,
  Auto,
  Never,
};

void setColorMode(ColorMode mode) noexcept;
void setColorMode(std::string_view str) noexcept;
bool shouldColorStderr() noexcept;

enum class DiagLevel : std::uint8_t {
  Off = 0,
  Error = 1,
  Warn = 2,
  Info = 3,
  Verbose = 4,
  VeryVerbose = 5,
};

// User-facing status lines on stderr.  Developer detail goes through spdlog,
// whose level follows the diag level.
class Diag {
public:
  static DiagLevel getLevel() noexcept;
  static void setLevel(DiagLevel level) noexcept;

  static bool isQuiet() noexcept { return getLevel() < DiagLevel::Info; }
  static bool isVerbose() noexcept {
    return getLevel() >= DiagLevel::Verbose;
  }
  static bool isVeryVerbose() noexcept {
    return getLevel() >= DiagLevel::VeryVerbose;
  }

  template <typename... Args>
  static void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (getLevel() >= DiagLevel::Error) {
      print("Error", fmt::fg(fmt::terminal_color::red) | fmt::emphasis::bold,
            /*pad=*/false, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  static void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    if (getLevel() >= DiagLevel::Warn) {
      print("Warning",
            fmt::fg(fmt::terminal_color::yellow) | fmt::emphasis::bold,
            /*pad=*/false, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  static void info(const std::string_view header,
                   fmt::format_string<Args...> fmt, Args&&... args) {
    if (getLevel() >= DiagLevel::Info) {
      print(header,
            fmt::fg(fmt::terminal_color::green) | fmt::emphasis::bold,
            /*pad=*/true, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

private:
  static void print(std::string_view header, fmt::text_style style, bool pad,
                    const std::string& body);
};

} // namespace orcka
