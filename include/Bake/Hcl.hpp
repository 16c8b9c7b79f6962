#pragma once

#include <nlohmann/json.hpp>
#include <rs/result.hpp>
#include <string_view>

namespace orcka {

// Reads the HCL subset used by bake files into a JSON document: blocks
// become objects nested by block type then labels, attributes become
// members.  Strings, numbers, booleans, null, lists, objects and heredocs
// are converted; any other expression (function calls, conditionals,
// references) is kept as its trimmed source text.
rs::Result<nlohmann::json> parseHcl(std::string_view source) noexcept;

} // namespace orcka
