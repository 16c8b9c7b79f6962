#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "orcka help"_test = [] {
    const auto result = tests::runOrcka({ "help" }).unwrap();
    expect(result.status.success());
    expect(result.out.starts_with(
        "Content-addressed image tags for docker bake targets\n\n"
        "Usage: orcka [OPTIONS] [COMMAND]\n"));
    for (const std::string cmd : { "write", "validate", "version", "help" }) {
      expect(result.out.find("\n  " + cmd + " ") != std::string::npos)
          << cmd;
    }
    expect(result.err.empty());
  };

  "orcka --help"_test = [] {
    const auto viaFlag = tests::runOrcka({ "--help" }).unwrap();
    const auto viaCmd = tests::runOrcka({ "help" }).unwrap();
    expect(viaFlag.status.success());
    expect(viaFlag.out == viaCmd.out);
  };

  "orcka help write"_test = [] {
    const auto result = tests::runOrcka({ "help", "write" }).unwrap();
    expect(result.status.success());
    expect(result.out.find("Usage: orcka write [OPTIONS]\n")
           != std::string::npos);
    expect(result.out.find("--pull-policy") != std::string::npos);
    expect(result.out.find("-j, --jobs <NUM>") != std::string::npos);

    const auto viaFlag = tests::runOrcka({ "write", "--help" }).unwrap();
    expect(viaFlag.status.success());
    expect(viaFlag.out == result.out);
  };

  "orcka help unknown"_test = [] {
    const auto result = tests::runOrcka({ "help", "frobnicate" }).unwrap();
    expect(!result.status.success());
    expect(result.err == "Error: no such command: `frobnicate`\n");
  };

  "orcka unknown command"_test = [] {
    const auto result = tests::runOrcka({ "frobnicate" }).unwrap();
    expect(!result.status.success());
    expect(result.out.empty());
    expect(result.err
           == "Error: no such command: `frobnicate`\n\n"
              "For a list of commands, try `orcka help`\n");
  };
}
