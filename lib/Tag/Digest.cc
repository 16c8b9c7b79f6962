#include "Tag/Digest.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <openssl/evp.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>

namespace orcka {

rs::Result<std::string> sha256Hex(const std::string_view data) noexcept {
  const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(
      EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  rs_ensure(ctx != nullptr, "failed to allocate a digest context");

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int written = 0;
  rs_ensure(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1
                && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1
                && EVP_DigestFinal_ex(ctx.get(), digest.data(), &written) == 1,
            "failed to compute SHA-256 digest");

  static constexpr std::string_view HEX = "0123456789abcdef";
  std::string hex;
  hex.reserve(static_cast<std::size_t>(written) * 2);
  for (unsigned int i = 0; i < written; ++i) {
    hex.push_back(HEX[digest[i] >> 4]);
    hex.push_back(HEX[digest[i] & 0x0f]);
  }
  return rs::Ok(hex);
}

} // namespace orcka

#ifdef ORCKA_TEST

#  include <rs/tests.hpp>

// NOLINTBEGIN
using namespace orcka;
// NOLINTEND

static void testSha256Hex() {
  tests::assertEq(
      sha256Hex("").unwrap(),
      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  tests::assertEq(
      sha256Hex("abc").unwrap(),
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  tests::assertNe(sha256Hex("file:a.txt:1").unwrap(),
                  sha256Hex("file:a.txt:2").unwrap());

  tests::pass();
}

int main() { testSha256Hex(); }

#endif
