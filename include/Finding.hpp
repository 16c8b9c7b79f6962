#pragma once

#include <cstdint>
#include <fmt/core.h>
#include <optional>
#include <string>
#include <string_view>

namespace orcka {

enum class FindingType : std::uint8_t {
  // errors
  Schema,
  Dependency,
  File,
  Runtime,
  // warnings
  Performance,
  BestPractice,
};

std::string_view toString(FindingType type) noexcept;

// One validation error or warning.  `target`, `field` and `path` are only set
// when the finding is about a specific target, manifest field or file.
struct Finding {
  FindingType type;
  std::string message;
  std::optional<std::string> target;
  std::optional<std::string> field;
  std::optional<std::string> path;

  bool operator==(const Finding&) const = default;
};

} // namespace orcka

template <>
struct fmt::formatter<orcka::FindingType> : formatter<std::string_view> {
  auto format(const orcka::FindingType type, format_context& ctx) const
      -> format_context::iterator {
    return formatter<std::string_view>::format(orcka::toString(type), ctx);
  }
};
