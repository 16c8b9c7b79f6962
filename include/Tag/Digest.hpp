#pragma once

#include <rs/result.hpp>
#include <string>
#include <string_view>

namespace orcka {

// Lowercase hex SHA-256 of `data`.
rs::Result<std::string> sha256Hex(std::string_view data) noexcept;

} // namespace orcka
