#include "helpers.hpp"
#include "project.hpp"

#include <boost/ut.hpp>
#include <iterator>
#include <regex>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "orcka write"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);

    const auto result = tests::runOrcka({ "write" }, tmp.path).unwrap();
    expect(result.status.success()) << result.status.toString() << result.err;
    expect(result.out.empty());

    const auto output = tests::shopOutput(tmp.path);
    expect(tests::fs::is_regular_file(output));
    const std::string hcl = tests::readFile(output);
    static const std::regex line(R"(^(WEB|BASE)_TAG_VER *= "[0-9a-f]{40}"$)",
                                 std::regex_constants::multiline);
    expect(std::distance(std::sregex_iterator(hcl.begin(), hcl.end(), line),
                         std::sregex_iterator())
           == 2);

    const std::string sanitizedErr = tests::sanitizeOutput(
        result.err, { { tmp.path.string(), "<ROOT>" } });
    expect(sanitizedErr.find("  Calculated WEB_TAG_VER = \"<TOKEN>\"\n")
           != std::string::npos);
    expect(sanitizedErr.find("/build/.orcka/docker-tags.hcl\n")
           != std::string::npos);
    expect(sanitizedErr.ends_with("    Finished 2 tag(s) in <DURATION>s\n"));
  };

  "orcka without a command writes"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);

    const auto result = tests::runOrcka({ "-q" }, tmp.path).unwrap();
    expect(result.status.success()) << result.err;
    expect(result.err.empty());
    expect(tests::fs::is_regular_file(tests::shopOutput(tmp.path)));
  };

  "orcka write tracks file content"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);

    expect(tests::runOrcka({ "write", "-q" }, tmp.path).unwrap()
               .status.success());
    const std::string before = tests::readFile(tests::shopOutput(tmp.path));

    expect(tests::runOrcka({ "write", "-q" }, tmp.path).unwrap()
               .status.success());
    expect(tests::readFile(tests::shopOutput(tmp.path)) == before)
        << "unchanged inputs must give unchanged tags";

    tests::writeFile(tmp / "build" / "web" / "app.js", "console.log('v2');\n");
    expect(tests::runOrcka({ "write", "-q" }, tmp.path).unwrap()
               .status.success());
    const std::string after = tests::readFile(tests::shopOutput(tmp.path));

    const std::string webBefore = tests::variableValue(before, "WEB_TAG_VER");
    const std::string webAfter = tests::variableValue(after, "WEB_TAG_VER");
    expect(!webBefore.empty());
    expect(webBefore != webAfter);
    expect(tests::variableValue(before, "BASE_TAG_VER")
           == tests::variableValue(after, "BASE_TAG_VER"));
  };

  "orcka write chains dependency tags"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);
    std::string manifest = tests::readFile(tmp / "orcka.toml");
    manifest = tests::replaceAll(
        manifest, "[targets.web.calculate_on]\n",
        "[targets.web]\nresolves = [\"base\"]\n\n"
        "[targets.web.calculate_on]\n");
    tests::writeFile(tmp / "orcka.toml", manifest);

    expect(tests::runOrcka({ "write", "-q" }, tmp.path).unwrap()
               .status.success());
    const std::string before = tests::readFile(tests::shopOutput(tmp.path));

    tests::writeFile(tmp / "build" / "base" / "deps.txt", "curl\njq\n");
    expect(tests::runOrcka({ "write", "-q" }, tmp.path).unwrap()
               .status.success());
    const std::string after = tests::readFile(tests::shopOutput(tmp.path));

    expect(tests::variableValue(before, "BASE_TAG_VER")
           != tests::variableValue(after, "BASE_TAG_VER"));
    expect(tests::variableValue(before, "WEB_TAG_VER")
           != tests::variableValue(after, "WEB_TAG_VER"));
  };

  "orcka write is relocatable"_test = [] {
    const tests::TempDir first;
    const tests::TempDir second;
    tests::writeShopProject(first.path);
    tests::writeShopProject(second.path / "nested" / "checkout");

    expect(tests::runOrcka({ "write", "-q" }, first.path).unwrap()
               .status.success());
    expect(tests::runOrcka({ "write", "-q" },
                           second.path / "nested" / "checkout")
               .unwrap()
               .status.success());
    expect(tests::readFile(tests::shopOutput(first.path))
           == tests::readFile(
               tests::shopOutput(second.path / "nested" / "checkout")));
  };

  "orcka write --file from another directory"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp / "repo");

    const auto result =
        tests::runOrcka({ "write", "-q", "--file", "repo/orcka.toml" },
                        tmp.path)
            .unwrap();
    expect(result.status.success()) << result.err;
    expect(tests::fs::is_regular_file(tests::shopOutput(tmp / "repo")));
  };

  "orcka write --target"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);

    const auto result =
        tests::runOrcka({ "write", "-q", "--target", "web" }, tmp.path)
            .unwrap();
    expect(result.status.success()) << result.err;
    const std::string hcl = tests::readFile(tests::shopOutput(tmp.path));
    expect(!tests::variableValue(hcl, "WEB_TAG_VER").empty());
    expect(tests::variableValue(hcl, "BASE_TAG_VER").empty());
  };

  "orcka write --target unknown"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);

    const auto result =
        tests::runOrcka({ "write", "--target", "db" }, tmp.path).unwrap();
    expect(!result.status.success());
    expect(result.err.ends_with(
        "Error: Target 'db' not found in any of the specified bake "
        "files.\n"));
    expect(!tests::fs::exists(tests::shopOutput(tmp.path)));
  };

  "orcka write --pull-policy"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);

    const auto result =
        tests::runOrcka({ "write", "-q", "--pull-policy" }, tmp.path)
            .unwrap();
    expect(result.status.success()) << result.err;
    const std::string hcl = tests::readFile(tests::shopOutput(tmp.path));
    expect(tests::variableValue(hcl, "WEB_PULL_POLICY") == "never");
    expect(tests::variableValue(hcl, "BASE_PULL_POLICY") == "never");
  };

  "orcka write --jobs gives the same tags"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);

    expect(tests::runOrcka({ "write", "-q", "-j", "1" }, tmp.path).unwrap()
               .status.success());
    const std::string sequential =
        tests::readFile(tests::shopOutput(tmp.path));
    expect(tests::runOrcka({ "write", "-q", "-j", "4" }, tmp.path).unwrap()
               .status.success());
    expect(tests::readFile(tests::shopOutput(tmp.path)) == sequential);
  };

  "orcka write --jobs invalid"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);

    const auto result =
        tests::runOrcka({ "write", "-j", "zero" }, tmp.path).unwrap();
    expect(!result.status.success());
    expect(result.err == "Error: invalid number of threads: zero\n");
  };

  "orcka write --dot"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);

    const auto result =
        tests::runOrcka({ "write", "-q", "--dot", "graph.dot" }, tmp.path)
            .unwrap();
    expect(result.status.success()) << result.err;
    const std::string dot = tests::readFile(tmp / "graph.dot");
    expect(dot.starts_with("digraph ServiceDependencies {\n"));
    expect(dot.find("\"web\"") != std::string::npos);
  };

  "orcka write stops on validation errors"_test = [] {
    const tests::TempDir tmp;
    tests::writeShopProject(tmp.path);
    tests::fs::remove(tmp / "build" / "web" / "app.js");

    const auto result = tests::runOrcka({ "write" }, tmp.path).unwrap();
    expect(!result.status.success());
    const std::string sanitizedErr = tests::sanitizeOutput(
        result.err, { { tmp.path.string(), "<ROOT>" } });
    expect(sanitizedErr.find("Error: file: File not found: web/app.js [web, ")
           != std::string::npos)
        << sanitizedErr;
    expect(sanitizedErr.ends_with(
        "Error: validation failed with 1 error(s)\n"));
    expect(!tests::fs::exists(tests::shopOutput(tmp.path)));
  };

  "orcka write without a manifest"_test = [] {
    const tests::TempDir tmp;
    const auto result = tests::runOrcka({ "write" }, tmp.path).unwrap();
    expect(!result.status.success());
    expect(result.err.starts_with("Error: "));
  };
}
