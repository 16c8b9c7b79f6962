#include "helpers.hpp"

#include <boost/ut.hpp>
#include <fmt/format.h>
#include <regex>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "orcka version"_test = [] {
    const auto result = tests::runOrcka({ "version" }).unwrap();
    expect(result.status.success()) << result.status.toString();
    const std::string expectedOut = fmt::format("orcka {}\n", ORCKA_VERSION);
    expect(result.out == expectedOut);
    expect(result.err.empty());
  };

  "orcka --version"_test = [] {
    const auto result = tests::runOrcka({ "--version" }).unwrap();
    expect(result.status.success());
    expect(result.out == fmt::format("orcka {}\n", ORCKA_VERSION));
  };

  "orcka version verbose"_test = [] {
    const auto result = tests::runOrcka({ "version", "-v" }).unwrap();
    expect(result.status.success());
    static const std::regex compiler(R"(^compiler: .+$)",
                                     std::regex_constants::multiline);
    expect(std::regex_search(result.out, compiler));
    expect(result.out.find("OpenSSL: ") != std::string::npos);
  };

  "orcka version rejects arguments"_test = [] {
    const auto result = tests::runOrcka({ "version", "--bogus" }).unwrap();
    expect(!result.status.success());
    expect(result.out.empty());
    const std::string expectedErr =
        "Error: unexpected argument `--bogus` found\n\n"
        "For more information, try `orcka help version`\n";
    expect(result.err == expectedErr);
  };
}
