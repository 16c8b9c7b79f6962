#include "Diag.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <fmt/color.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unistd.h>

namespace orcka {

static std::atomic<ColorMode> colorMode{ ColorMode::Auto };
static std::atomic<DiagLevel> diagLevel{ DiagLevel::Info };

void setColorMode(const ColorMode mode) noexcept { colorMode = mode; }

void setColorMode(const std::string_view str) noexcept {
  if (str == "always") {
    setColorMode(ColorMode::Always);
  } else if (str == "never") {
    setColorMode(ColorMode::Never);
  } else {
    if (str != "auto") {
      spdlog::warn("unknown color mode `{}`; falling back to auto", str);
    }
    setColorMode(ColorMode::Auto);
  }
}

bool shouldColorStderr() noexcept {
  switch (colorMode.load()) {
  case ColorMode::Always:
    return true;
  case ColorMode::Never:
    return false;
  case ColorMode::Auto:
    break;
  }
  if (const char* env = std::getenv("ORCKA_TERM_COLOR")) {
    const std::string_view value = env;
    if (value == "always") {
      return true;
    }
    if (value == "never") {
      return false;
    }
  }
  return isatty(fileno(stderr)) != 0;
}

DiagLevel Diag::getLevel() noexcept { return diagLevel.load(); }

void Diag::setLevel(const DiagLevel level) noexcept {
  diagLevel = level;
  switch (level) {
  case DiagLevel::Off:
    spdlog::set_level(spdlog::level::off);
    break;
  case DiagLevel::Error:
    spdlog::set_level(spdlog::level::err);
    break;
  case DiagLevel::Warn:
    spdlog::set_level(spdlog::level::warn);
    break;
  case DiagLevel::Info:
    spdlog::set_level(spdlog::level::info);
    break;
  case DiagLevel::Verbose:
    spdlog::set_level(spdlog::level::debug);
    break;
  case DiagLevel::VeryVerbose:
    spdlog::set_level(spdlog::level::trace);
    break;
  }
}

void Diag::print(const std::string_view header, const fmt::text_style style,
                 const bool pad, const std::string& body) {
  // Status headers are right-aligned to a fixed column; error and warning
  // headers are followed by a colon instead.
  const std::string label =
      pad ? fmt::format("{:>12}", header) : fmt::format("{}:", header);
  if (shouldColorStderr()) {
    fmt::print(stderr, "{} {}\n", fmt::styled(label, style), body);
  } else {
    fmt::print(stderr, "{} {}\n", label, body);
  }
}

} // namespace orcka
