#include "helpers.hpp"
#include "project.hpp"

#include <boost/ut.hpp>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "orcka validate"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);

    const auto result = tests::runOrcka({ "validate" }, tmp.path).unwrap();
    expect(result.status.success()) << result.err;
    expect(result.out.empty());
    const std::string sanitizedErr = tests::sanitizeOutput(
        result.err, { { tmp.path.string(), "<ROOT>" } });
    expect(sanitizedErr
           == "   Validated <ROOT>/orcka.toml (2 target(s), 0 warning(s))\n")
        << sanitizedErr;
    expect(!tests::fs::exists(tests::shopOutput(tmp.path)));
  };

  "orcka validate reports warnings"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);
    std::string manifest = tests::readFile(tmp / "orcka.toml");
    manifest += "\n[targets.api.calculate_on]\nalways = true\n";
    manifest += "\n[targets.worker.calculate_on]\nperiod = \"hourly\"\n";
    tests::writeFile(tmp / "orcka.toml", manifest);
    std::string bake = tests::readFile(tmp / "build" / "docker-bake.hcl");
    bake += "\ntarget \"api\" {}\n\ntarget \"worker\" {}\n";
    tests::writeFile(tmp / "build" / "docker-bake.hcl", bake);

    const auto result = tests::runOrcka({ "validate" }, tmp.path).unwrap();
    expect(result.status.success()) << result.err;
    const std::string& err = result.err;
    expect(err.find("Warning: performance: Target 'api' uses 'always: true' "
                    "without other criteria.")
           != std::string::npos)
        << err;
    expect(err.find("Warning: performance: Target 'worker' uses hourly "
                    "period. This may cause frequent rebuilds.\n")
           != std::string::npos)
        << err;
    expect(err.find("Warning: best-practice: Target 'api': variable "
                    "'API_TAG_VER' is not declared in any bake file, so the "
                    "generated tag is not used.\n")
           != std::string::npos)
        << err;
    expect(err.find("(4 target(s), 4 warning(s))\n") != std::string::npos)
        << err;
  };

  "orcka validate reports every error"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "orcka.toml", R"([project]
name = "shop"
write = "docker-tags.hcl"
bake = ["docker-bake.hcl", "missing.hcl"]

[targets.web]
context_of = "nowhere"
resolves = ["base"]

[targets.web.calculate_on]
files = ["web/app.js"]

[targets.base]
resolves = ["web"]

[targets.base.calculate_on]
period = { unit = "fortnights", number = 1 }

[targets.db.calculate_on]
always = true
)");
    tests::writeFile(tmp / "docker-bake.hcl", R"(target "web" {}
target "base" {}
)");

    const auto result = tests::runOrcka({ "validate" }, tmp.path).unwrap();
    expect(!result.status.success());
    const std::string& err = result.err;
    expect(err.find("Error: schema: Target 'web' has invalid context_of "
                    "value 'nowhere'. Valid values are: orcka, dockerfile, "
                    "target, bake")
           != std::string::npos)
        << err;
    expect(err.find("Error: file: Bake file not found: missing.hcl")
           != std::string::npos)
        << err;
    expect(err.find("Error: dependency: Target 'db' not found in any of the "
                    "specified bake files.")
           != std::string::npos)
        << err;
    expect(err.find("Error: dependency: Cyclic dependency found: ")
           != std::string::npos)
        << err;
    expect(err.find("Error: file: File not found: web/app.js")
           != std::string::npos)
        << err;
    expect(err.find("fortnights") != std::string::npos) << err;
    expect(err.ends_with("error(s)\n"));
    expect(err.find("Validated") == std::string::npos);
  };

  "orcka validate rejects unknown parser"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);

    const auto result =
        tests::runOrcka({ "validate", "--parser", "magic" }, tmp.path)
            .unwrap();
    expect(!result.status.success());
    expect(result.err.starts_with("Error: "));
    expect(result.err.find("magic") != std::string::npos);
  };

  "orcka validate --file missing"_test = [] {
    const tests::TempDir tmp;
    const auto result =
        tests::runOrcka({ "validate", "--file", "nope.toml" }, tmp.path)
            .unwrap();
    expect(!result.status.success());
    expect(result.err.starts_with("Error: manifest not found: `"));
  };

  "orcka validate unexpected argument"_test = [] {
    const tests::TempDir tmp;
    const auto result =
        tests::runOrcka({ "validate", "--jobs", "2" }, tmp.path).unwrap();
    expect(!result.status.success());
    expect(result.err
           == "Error: unexpected argument `--jobs` found\n\n"
              "For more information, try `orcka help validate`\n");
  };
}
