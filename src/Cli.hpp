#pragma once

#include <cstdint>
#include <optional>
#include <rs/result.hpp>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace orcka {

using CliArgsView = std::span<const char* const>;

class Opt {
public:
  explicit Opt(std::string name) : name(std::move(name)) {}

  Opt& setShort(std::string shortName) noexcept {
    this->shortName = std::move(shortName);
    return *this;
  }
  Opt& setDesc(std::string desc) noexcept {
    this->desc = std::move(desc);
    return *this;
  }
  Opt& setPlaceholder(std::string placeholder) noexcept {
    this->placeholder = std::move(placeholder);
    return *this;
  }

  // Width of the left column in help output.
  std::size_t leftSize() const;
  std::string format(std::size_t width) const;

private:
  std::string name;
  std::string shortName;
  std::string desc;
  std::string placeholder;
};

class Arg {
public:
  explicit Arg(std::string name) : name(std::move(name)) {}

  Arg& setDesc(std::string desc) noexcept {
    this->desc = std::move(desc);
    return *this;
  }
  Arg& setRequired(const bool required) noexcept {
    this->required = required;
    return *this;
  }

  std::string usage() const;
  const std::string& getDesc() const noexcept { return desc; }

private:
  std::string name;
  std::string desc;
  bool required = true;
};

class Subcmd {
public:
  using MainFn = rs::Result<void>(CliArgsView);

  explicit Subcmd(std::string name) : name(std::move(name)) {}

  Subcmd& setShort(std::string shortName) noexcept {
    this->shortName = std::move(shortName);
    return *this;
  }
  Subcmd& setDesc(std::string desc) noexcept {
    this->desc = std::move(desc);
    return *this;
  }
  Subcmd& addOpt(Opt opt) {
    opts.push_back(std::move(opt));
    return *this;
  }
  Subcmd& setArg(Arg arg) {
    this->arg = std::move(arg);
    return *this;
  }
  Subcmd& setMainFn(MainFn* mainFn) noexcept {
    this->mainFn = mainFn;
    return *this;
  }

  const std::string& getName() const noexcept { return name; }
  const std::string& getShort() const noexcept { return shortName; }
  const std::string& getDesc() const noexcept { return desc; }

  rs::Result<void> run(CliArgsView args) const;
  void printHelp() const;

  static rs::Result<void> missingOptArgumentFor(std::string_view arg);
  rs::Result<void> noSuchArg(std::string_view arg) const;

private:
  std::string name;
  std::string shortName;
  std::string desc;
  std::vector<Opt> opts;
  std::optional<Arg> arg;
  MainFn* mainFn = nullptr;
};

class Cli {
public:
  enum ControlFlow : std::uint8_t {
    Return,
    Continue,
    Fallthrough,
  };

  explicit Cli(std::string desc) : desc(std::move(desc)) {}

  Cli& addOpt(Opt opt) {
    opts.push_back(std::move(opt));
    return *this;
  }
  Cli& addSubcmd(const Subcmd& subcmd) {
    subcmds.push_back(subcmd);
    return *this;
  }

  bool hasSubcmd(std::string_view name) const;
  rs::Result<void> exec(std::string_view subcmd, CliArgsView args) const;
  rs::Result<void> printHelp(CliArgsView args) const;
  void printMainHelp() const;

  const std::vector<Opt>& globalOpts() const noexcept { return opts; }

  // Handles -h, -v, -vv, -q and --color wherever they appear.  On `Return`
  // the caller stops parsing, on `Continue` it moves to the next argument.
  static rs::Result<ControlFlow>
  handleGlobalOpts(CliArgsView::iterator& itr, CliArgsView::iterator end,
                   std::string_view subcmd = "");

private:
  std::string desc;
  std::vector<Opt> opts;
  std::vector<Subcmd> subcmds;

  const Subcmd* findSubcmd(std::string_view name) const;
};

const Cli& getCli();

} // namespace orcka
