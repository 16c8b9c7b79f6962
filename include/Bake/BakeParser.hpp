#pragma once

#include "Bake/BakeTarget.hpp"

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <rs/result.hpp>
#include <string>
#include <string_view>

namespace orcka {

enum class BakeParserMode : std::uint8_t {
  Strict,
  Tolerant,
};

rs::Result<BakeParserMode> parseBakeParserMode(std::string_view str) noexcept;
std::string_view toString(BakeParserMode mode) noexcept;

class BakeParser {
public:
  virtual ~BakeParser() = default;

  // `declaredPath` is the bake file as written in the manifest; it selects
  // the format and is recorded on every target.
  virtual rs::Result<BakeFile> parse(const std::string& declaredPath,
                                     std::string_view content) const = 0;
};

// JSON bake files through nlohmann::json, everything else through the HCL
// reader.  Any syntax or shape error fails the file.
class StructuredBakeParser : public BakeParser {
public:
  rs::Result<BakeFile> parse(const std::string& declaredPath,
                             std::string_view content) const override;
};

// Structured parsing first; on failure, `target "name" { ... }` blocks are
// scanned with regular expressions for the attributes tag calculation needs.
class TolerantBakeParser : public BakeParser {
public:
  rs::Result<BakeFile> parse(const std::string& declaredPath,
                             std::string_view content) const override;

  static BakeFile scan(const std::string& declaredPath,
                       std::string_view content);
};

std::unique_ptr<BakeParser> makeBakeParser(BakeParserMode mode);

// Converts a parsed bake document (`{"target": {...}, "variable": {...}}`)
// into bake targets.
rs::Result<BakeFile> bakeFileFromJson(const nlohmann::json& doc,
                                      const std::string& declaredPath) noexcept;

} // namespace orcka
