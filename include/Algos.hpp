#pragma once

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace orcka {

namespace fs = std::filesystem;

template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool matchesAny(std::string_view str,
                std::initializer_list<std::string_view> candidates) noexcept;
std::string toUpper(std::string_view str);

// Searches PATH for an executable named `cmd`.
bool commandExists(std::string_view cmd) noexcept;

// Reads the whole file, or nothing when it cannot be opened as a regular
// file.
std::optional<std::string> readFile(const fs::path& path) noexcept;

// Lexically normalized directory path without a trailing separator.
fs::path normalizeDir(const fs::path& path);

} // namespace orcka
