#include "Bake/Hcl.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace orcka {

static bool isIdentStart(const char c) noexcept {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool isIdentChar(const char c) noexcept {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

static std::string_view trim(std::string_view str) noexcept {
  while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
    str.remove_prefix(1);
  }
  while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
    str.remove_suffix(1);
  }
  return str;
}

namespace {

class HclReader {
public:
  explicit HclReader(const std::string_view src) : src(src) {}

  rs::Result<nlohmann::json> readBody(bool nested);

private:
  std::string_view src;
  std::size_t pos = 0;

  bool atEnd() const noexcept { return pos >= src.size(); }
  char peek(const std::size_t ahead = 0) const noexcept {
    return pos + ahead < src.size() ? src[pos + ahead] : '\0';
  }
  std::string where() const;

  void skipSpace(bool newlines);
  bool atTerminator(bool inCollection) const noexcept;
  std::string readIdent();

  rs::Result<nlohmann::json> readExpr(bool inCollection);
  rs::Result<nlohmann::json> readList();
  rs::Result<nlohmann::json> readObject();
  rs::Result<std::string> readString();
  rs::Result<std::string> readHeredoc();
  rs::Result<nlohmann::json> readRaw(bool inCollection);
  std::optional<nlohmann::json> readNumber();
};

} // namespace

std::string HclReader::where() const {
  std::size_t line = 1;
  std::size_t col = 1;
  for (std::size_t i = 0; i < pos && i < src.size(); ++i) {
    if (src[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  return fmt::format("{}:{}", line, col);
}

void HclReader::skipSpace(const bool newlines) {
  while (!atEnd()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\r') {
      ++pos;
    } else if (c == '\n' && newlines) {
      ++pos;
    } else if (c == '#' || (c == '/' && peek(1) == '/')) {
      while (!atEnd() && peek() != '\n') {
        ++pos;
      }
    } else if (c == '/' && peek(1) == '*') {
      const std::size_t end = src.find("*/", pos + 2);
      pos = end == std::string_view::npos ? src.size() : end + 2;
    } else {
      break;
    }
  }
}

bool HclReader::atTerminator(const bool inCollection) const noexcept {
  if (atEnd()) {
    return true;
  }
  const char c = peek();
  if (c == '\n' || c == '}' || c == '#'
      || (c == '/' && (peek(1) == '/' || peek(1) == '*'))) {
    return true;
  }
  return inCollection && (c == ',' || c == ']');
}

std::string HclReader::readIdent() {
  if (atEnd() || !isIdentStart(peek())) {
    return "";
  }
  const std::size_t start = pos;
  while (!atEnd() && isIdentChar(peek())) {
    ++pos;
  }
  return std::string(src.substr(start, pos - start));
}

rs::Result<nlohmann::json> HclReader::readBody(const bool nested) {
  nlohmann::json body = nlohmann::json::object();
  while (true) {
    skipSpace(/*newlines=*/true);
    if (atEnd()) {
      rs_ensure(!nested, "{}: unexpected end of input, expected `}}`",
                where());
      return rs::Ok(std::move(body));
    }
    if (peek() == '}') {
      rs_ensure(nested, "{}: unexpected `}}`", where());
      ++pos;
      return rs::Ok(std::move(body));
    }

    const std::string ident = readIdent();
    rs_ensure(!ident.empty(), "{}: expected attribute or block, found `{}`",
              where(), peek());
    skipSpace(/*newlines=*/false);

    if (peek() == '=' && peek(1) != '=') {
      ++pos;
      body[ident] = rs_try(readExpr(/*inCollection=*/false));
      skipSpace(/*newlines=*/false);
      rs_ensure(atEnd() || peek() == '\n' || peek() == '}',
                "{}: expected newline after attribute `{}`", where(), ident);
      continue;
    }

    std::vector<std::string> labels;
    while (peek() != '{') {
      if (peek() == '"') {
        ++pos;
        labels.push_back(rs_try(readString()));
      } else {
        std::string label = readIdent();
        rs_ensure(!label.empty(), "{}: expected `{{` after block `{}`",
                  where(), ident);
        labels.push_back(std::move(label));
      }
      skipSpace(/*newlines=*/false);
    }
    ++pos;

    nlohmann::json inner = rs_try(readBody(/*nested=*/true));
    nlohmann::json* slot = &body[ident];
    for (const std::string& label : labels) {
      if (!slot->is_object()) {
        *slot = nlohmann::json::object();
      }
      slot = &(*slot)[label];
    }
    if (slot->is_object()) {
      slot->update(inner);
    } else {
      *slot = std::move(inner);
    }
  }
}

rs::Result<nlohmann::json> HclReader::readExpr(const bool inCollection) {
  skipSpace(/*newlines=*/inCollection);
  rs_ensure(!atEnd(), "{}: expected expression", where());

  const std::size_t start = pos;
  std::optional<nlohmann::json> value;
  const char c = peek();
  if (c == '"') {
    ++pos;
    value = nlohmann::json(rs_try(readString()));
  } else if (c == '<' && peek(1) == '<') {
    // A heredoc ends at the start of the following line.
    return rs::Ok(nlohmann::json(rs_try(readHeredoc())));
  } else if (c == '[' || c == '{') {
    auto collection = c == '[' ? readList() : readObject();
    if (collection.is_ok()) {
      value = collection.unwrap();
    } else {
      spdlog::trace("hcl: keeping `{}` expression at {} as text: {}", c,
                    where(), collection.unwrap_err()->what());
    }
  } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
    value = readNumber();
  } else if (isIdentStart(c)) {
    const std::string ident = readIdent();
    if (ident == "true") {
      value = nlohmann::json(true);
    } else if (ident == "false") {
      value = nlohmann::json(false);
    } else if (ident == "null") {
      value = nlohmann::json(nullptr);
    }
  }

  if (value.has_value()) {
    skipSpace(/*newlines=*/false);
    if (atTerminator(inCollection)) {
      return rs::Ok(std::move(*value));
    }
  }
  pos = start;
  return readRaw(inCollection);
}

std::optional<nlohmann::json> HclReader::readNumber() {
  const std::size_t start = pos;
  if (peek() == '-') {
    ++pos;
  }
  bool isFloat = false;
  while (!atEnd()) {
    const char c = peek();
    if (std::isdigit(static_cast<unsigned char>(c))) {
      ++pos;
    } else if (c == '.' || c == 'e' || c == 'E'
               || ((c == '+' || c == '-') && (src[pos - 1] == 'e'
                                              || src[pos - 1] == 'E'))) {
      isFloat = true;
      ++pos;
    } else {
      break;
    }
  }

  const char* first = src.data() + start;
  const char* last = src.data() + pos;
  if (isFloat) {
    double num = 0;
    const auto [ptr, ec] = std::from_chars(first, last, num);
    if (ec != std::errc() || ptr != last) {
      return std::nullopt;
    }
    return nlohmann::json(num);
  }
  std::int64_t num = 0;
  const auto [ptr, ec] = std::from_chars(first, last, num);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return nlohmann::json(num);
}

rs::Result<nlohmann::json> HclReader::readList() {
  ++pos;
  nlohmann::json arr = nlohmann::json::array();
  while (true) {
    skipSpace(/*newlines=*/true);
    rs_ensure(!atEnd(), "{}: unterminated list", where());
    if (peek() == ']') {
      ++pos;
      return rs::Ok(std::move(arr));
    }
    rs_ensure(!(peek() == 'f' && src.substr(pos).starts_with("for ")),
              "{}: for expressions are not literals", where());

    arr.push_back(rs_try(readExpr(/*inCollection=*/true)));
    skipSpace(/*newlines=*/true);
    if (peek() == ',') {
      ++pos;
      continue;
    }
    rs_ensure(peek() == ']', "{}: expected `,` or `]` in list", where());
  }
}

rs::Result<nlohmann::json> HclReader::readObject() {
  ++pos;
  nlohmann::json obj = nlohmann::json::object();
  while (true) {
    skipSpace(/*newlines=*/true);
    rs_ensure(!atEnd(), "{}: unterminated object", where());
    if (peek() == '}') {
      ++pos;
      return rs::Ok(std::move(obj));
    }

    std::string key;
    if (peek() == '"') {
      ++pos;
      key = rs_try(readString());
    } else {
      key = readIdent();
    }
    rs_ensure(!key.empty(), "{}: expected object key", where());
    rs_ensure(key != "for", "{}: for expressions are not literals", where());

    skipSpace(/*newlines=*/false);
    rs_ensure(peek() == '=' || peek() == ':',
              "{}: expected `=` or `:` after key `{}`", where(), key);
    ++pos;

    obj[key] = rs_try(readExpr(/*inCollection=*/true));
    skipSpace(/*newlines=*/false);
    if (peek() == ',') {
      ++pos;
    } else {
      rs_ensure(atEnd() || peek() == '\n' || peek() == '}',
                "{}: expected `,` or newline after `{}`", where(), key);
    }
  }
}

// Reads a quoted string whose opening quote was consumed.  Template
// interpolations are kept verbatim.
rs::Result<std::string> HclReader::readString() {
  std::string out;
  while (!atEnd()) {
    const char c = src[pos++];
    if (c == '"') {
      return rs::Ok(std::move(out));
    }
    if (c == '\n') {
      break;
    }
    if (c == '\\') {
      rs_ensure(!atEnd(), "{}: unterminated escape sequence", where());
      const char esc = src[pos++];
      switch (esc) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '"':
      case '\\':
        out.push_back(esc);
        break;
      default:
        out.push_back('\\');
        out.push_back(esc);
        break;
      }
      continue;
    }
    if (c == '$' && peek() == '$' && peek(1) == '{') {
      out += "${";
      pos += 2;
      continue;
    }
    if (c == '$' && peek() == '{') {
      out += "${";
      ++pos;
      int depth = 1;
      while (!atEnd() && depth > 0) {
        const char ch = src[pos++];
        out.push_back(ch);
        if (ch == '{') {
          ++depth;
        } else if (ch == '}') {
          --depth;
        } else if (ch == '"') {
          while (!atEnd() && peek() != '"') {
            if (peek() == '\\') {
              out.push_back(src[pos++]);
            }
            if (!atEnd()) {
              out.push_back(src[pos++]);
            }
          }
          if (!atEnd()) {
            out.push_back(src[pos++]);
          }
        }
      }
      rs_ensure(depth == 0, "{}: unterminated template interpolation",
                where());
      continue;
    }
    out.push_back(c);
  }
  rs_bail("{}: unterminated string", where());
}

rs::Result<std::string> HclReader::readHeredoc() {
  pos += 2;
  const bool indented = peek() == '-';
  if (indented) {
    ++pos;
  }
  const std::string marker = readIdent();
  rs_ensure(!marker.empty(), "{}: expected heredoc marker", where());
  skipSpace(/*newlines=*/false);
  rs_ensure(peek() == '\n', "{}: expected newline after heredoc marker",
            where());
  ++pos;

  std::vector<std::string_view> lines;
  while (true) {
    rs_ensure(!atEnd(), "{}: unterminated heredoc `{}`", where(), marker);
    const std::size_t eol = src.find('\n', pos);
    const std::string_view line = src.substr(
        pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
    pos = eol == std::string_view::npos ? src.size() : eol;
    if (trim(line) == marker) {
      break;
    }
    lines.push_back(line);
    ++pos;
  }

  std::size_t indent = 0;
  if (indented) {
    indent = std::string_view::npos;
    for (const std::string_view line : lines) {
      if (trim(line).empty()) {
        continue;
      }
      const std::size_t first = line.find_first_not_of(" \t");
      indent = std::min(indent, first);
    }
    if (indent == std::string_view::npos) {
      indent = 0;
    }
  }

  std::string out;
  for (const std::string_view line : lines) {
    if (line.size() > indent) {
      out += line.substr(indent);
    }
    out.push_back('\n');
  }
  return rs::Ok(std::move(out));
}

rs::Result<nlohmann::json> HclReader::readRaw(const bool inCollection) {
  const std::size_t start = pos;
  int depth = 0;
  while (!atEnd()) {
    const char c = peek();
    if (c == '"') {
      ++pos;
      rs_try(readString());
      continue;
    }
    if (c == '(' || c == '[' || c == '{') {
      ++depth;
    } else if (c == ')' || c == ']' || c == '}') {
      if (depth == 0) {
        break;
      }
      --depth;
    } else if (depth == 0) {
      if (c == '\n' || c == '#' || (c == '/' && peek(1) == '/')) {
        break;
      }
      if (inCollection && c == ',') {
        break;
      }
    }
    ++pos;
  }
  rs_ensure(depth == 0, "{}: unbalanced brackets in expression", where());

  const std::string_view text = trim(src.substr(start, pos - start));
  rs_ensure(!text.empty(), "{}: expected expression", where());
  return rs::Ok(nlohmann::json(std::string(text)));
}

rs::Result<nlohmann::json> parseHcl(const std::string_view source) noexcept {
  try {
    HclReader reader(source);
    return reader.readBody(/*nested=*/false);
  } catch (const std::exception& e) {
    rs_bail("{}", e.what());
  }
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <rs/tests.hpp>

// NOLINTBEGIN
using namespace orcka;
// NOLINTEND

static void testTargets() {
  const nlohmann::json doc = parseHcl(R"(
    # shared base image
    variable "REGISTRY" {
      default = "registry.local"
    }

    group "default" {
      targets = ["base", "web"]
    }

    target "base" {
      dockerfile = "base/Dockerfile"
      context    = "."
      tags       = ["${REGISTRY}/base:${BASE_TAG_VER}"]
    }

    target "web" {
      dockerfile = "web/Dockerfile"
      depends_on = ["base"]
      args = {
        NODE_VERSION = "20"
        "DEBUG"      = false
      }
      contexts = {
        base = "target:base"
      }
    }
  )")
                                .unwrap();

  tests::assertTrue(doc.contains("variable"));
  tests::assertEq(doc["variable"]["REGISTRY"]["default"].get<std::string>(),
                  "registry.local");
  tests::assertEq(doc["group"]["default"]["targets"].size(), 2UL);

  const nlohmann::json& base = doc["target"]["base"];
  tests::assertEq(base["dockerfile"].get<std::string>(), "base/Dockerfile");
  tests::assertEq(base["tags"][0].get<std::string>(),
                  "${REGISTRY}/base:${BASE_TAG_VER}");

  const nlohmann::json& web = doc["target"]["web"];
  tests::assertEq(web["depends_on"][0].get<std::string>(), "base");
  tests::assertEq(web["args"]["NODE_VERSION"].get<std::string>(), "20");
  tests::assertFalse(web["args"]["DEBUG"].get<bool>());
  tests::assertEq(web["contexts"]["base"].get<std::string>(), "target:base");

  tests::pass();
}

static void testExpressionsKeptAsText() {
  const nlohmann::json doc = parseHcl(R"(
    target "app" {
      inherits = ["_common"]
      platforms = split(",", PLATFORMS)
      output = [for p in ["a", "b"] : "type=${p}"]
      pull = equal(MODE, "ci") ? true : false
      retries = 3
      ratio = 1.5
      empty = null
    }
  )")
                                .unwrap();

  const nlohmann::json& app = doc["target"]["app"];
  tests::assertEq(app["inherits"][0].get<std::string>(), "_common");
  tests::assertEq(app["platforms"].get<std::string>(),
                  R"(split(",", PLATFORMS))");
  tests::assertEq(app["output"].get<std::string>(),
                  R"([for p in ["a", "b"] : "type=${p}"])");
  tests::assertEq(app["pull"].get<std::string>(),
                  R"(equal(MODE, "ci") ? true : false)");
  tests::assertEq(app["retries"].get<std::int64_t>(), 3);
  tests::assertTrue(app["ratio"].is_number_float());
  tests::assertTrue(app["empty"].is_null());

  tests::pass();
}

static void testStringsAndComments() {
  const nlohmann::json doc = parseHcl(R"(
    // line comment
    /* block
       comment */
    target "t" { dockerfile = "Dockerfile" }
    target "u" {
      label = "say \"hi\"\tnow"
      escaped = "$${NOT_A_VAR}"
      nested = "${join("-", ["a", "b"])}"
      script = <<-EOT
        echo one
          echo two
      EOT
    }
  )")
                                .unwrap();

  tests::assertEq(doc["target"]["t"]["dockerfile"].get<std::string>(),
                  "Dockerfile");
  const nlohmann::json& u = doc["target"]["u"];
  tests::assertEq(u["label"].get<std::string>(), "say \"hi\"\tnow");
  tests::assertEq(u["escaped"].get<std::string>(), "${NOT_A_VAR}");
  tests::assertEq(u["nested"].get<std::string>(),
                  R"(${join("-", ["a", "b"])})");
  tests::assertEq(u["script"].get<std::string>(), "echo one\n  echo two\n");

  tests::pass();
}

static void testBlocksMerge() {
  const nlohmann::json doc = parseHcl(R"(
    target "web" {
      context = "."
    }
    target "web" {
      dockerfile = "web/Dockerfile"
    }
  )")
                                .unwrap();

  const nlohmann::json& web = doc["target"]["web"];
  tests::assertEq(web["context"].get<std::string>(), ".");
  tests::assertEq(web["dockerfile"].get<std::string>(), "web/Dockerfile");

  tests::pass();
}

static void testErrors() {
  tests::assertEq(parseHcl("target \"web\" {\n  context = \".\"\n")
                      .unwrap_err()
                      ->what(),
                  "3:1: unexpected end of input, expected `}`");
  tests::assertEq(parseHcl("}").unwrap_err()->what(), "1:1: unexpected `}`");
  tests::assertEq(parseHcl("target \"web\" {\n  context = \"abc\n}\n")
                      .unwrap_err()
                      ->what(),
                  "3:1: unterminated string");
  tests::assertTrue(parseHcl("= 1").is_err());

  tests::pass();
}

int main() {
  testTargets();
  testExpressionsKeptAsText();
  testStringsAndComments();
  testBlocksMerge();
  testErrors();
}

#endif
