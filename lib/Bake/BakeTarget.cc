#include "Bake/BakeTarget.hpp"

#include "Algos.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace orcka {

static constexpr std::string_view TARGET_REF_PREFIX = "target:";

ContextValue parseContextValue(const std::string_view raw) {
  if (raw.starts_with(TARGET_REF_PREFIX)
      && raw.size() > TARGET_REF_PREFIX.size()) {
    return TargetRef{ std::string(raw.substr(TARGET_REF_PREFIX.size())) };
  }
  return LiteralContext{ std::string(raw) };
}

std::string toString(const ContextValue& value) {
  return std::visit(
      Overloaded{
          [](const LiteralContext& lit) { return lit.value; },
          [](const TargetRef& ref) {
            return std::string(TARGET_REF_PREFIX) + ref.name;
          },
      },
      value);
}

std::vector<std::string> BakeTarget::contextRefs() const {
  std::vector<std::string> refs;
  for (const auto& [_, value] : contexts) {
    if (const auto* ref = std::get_if<TargetRef>(&value)) {
      refs.push_back(ref->name);
    }
  }
  std::ranges::sort(refs);
  refs.erase(std::ranges::unique(refs).begin(), refs.end());
  return refs;
}

std::optional<std::string> BakeTarget::image() const {
  if (tags.empty() || tags.front().empty()) {
    return std::nullopt;
  }

  std::string_view ref = tags.front();
  if (const std::size_t at = ref.find('@'); at != std::string_view::npos) {
    ref = ref.substr(0, at);
  }
  // A colon after the last slash separates the tag; earlier ones belong to
  // a registry port.
  const std::size_t slash = ref.rfind('/');
  const std::size_t colon = ref.rfind(':');
  if (colon != std::string_view::npos
      && (slash == std::string_view::npos || colon > slash)) {
    ref = ref.substr(0, colon);
  }
  if (ref.empty()) {
    return std::nullopt;
  }
  return std::string(ref);
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <rs/tests.hpp>

// NOLINTBEGIN
using namespace orcka;
// NOLINTEND

static void testParseContextValue() {
  tests::assertTrue(parseContextValue("target:base")
                    == ContextValue(TargetRef{ "base" }));
  tests::assertTrue(parseContextValue("docker-image://alpine:3")
                    == ContextValue(LiteralContext{ "docker-image://alpine:3" }));
  tests::assertTrue(parseContextValue("target:")
                    == ContextValue(LiteralContext{ "target:" }));
  tests::assertEq(toString(parseContextValue("target:base")), "target:base");
  tests::assertEq(toString(parseContextValue("./src")), "./src");

  tests::pass();
}

static void testContextRefs() {
  BakeTarget target;
  target.contexts.emplace("b", TargetRef{ "zeta" });
  target.contexts.emplace("a", TargetRef{ "alpha" });
  target.contexts.emplace("c", LiteralContext{ "./src" });
  target.contexts.emplace("d", TargetRef{ "alpha" });

  const std::vector<std::string> refs = target.contextRefs();
  tests::assertEq(refs.size(), 2UL);
  tests::assertEq(refs[0], "alpha");
  tests::assertEq(refs[1], "zeta");

  tests::pass();
}

static void testImage() {
  BakeTarget target;
  tests::assertFalse(target.image().has_value());

  target.tags = { "registry.local:5000/shop/web:1.2" };
  tests::assertEq(target.image().value_or(""), "registry.local:5000/shop/web");

  target.tags = { "registry.local:5000/shop/web" };
  tests::assertEq(target.image().value_or(""), "registry.local:5000/shop/web");

  target.tags = { "web@sha256:abcd", "web:latest" };
  tests::assertEq(target.image().value_or(""), "web");

  tests::pass();
}

int main() {
  testParseContextValue();
  testContextRefs();
  testImage();
}

#endif
