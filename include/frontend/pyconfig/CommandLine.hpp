/* SPDX-License-Identifier: GPL-3.0-only */
#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "pyconfig/FrontendExitCode.hpp"
#include "pyconfig/python/PythonConfig.hpp"
#include "pyconfig/python/Version.hpp"

namespace pyconfig
{

namespace cli
{

/// The long options understood by the \p python-config scripts.
enum class Flag
{
  Prefix,
  ExecPrefix,
  Includes,
  Libs,
  CFlags,
  LdFlags,
  ExtensionSuffix,
  Help,
  AbiFlags,
  ConfigDir,
  Embed
};

/// \returns the name of \p F, without the leading \p "--".
[[nodiscard]] const char* flagName(Flag F) noexcept;

class Option
{
  Flag Kind;
  std::string Name;

public:
  explicit Option(Flag F);

  [[nodiscard]] Flag flag() const noexcept { return Kind; }
  /// The name of the option, without the prefix applied at invocation.
  [[nodiscard]] const std::string& getName() const noexcept { return Name; }
  /// \returns the option as it is spelled on the command-line.
  [[nodiscard]] std::string spelling() const { return "--" + Name; }
};

/// The outcome of parsing a command-line.
struct Invocation
{
  /// If set, only the usage is printed and the program exits with
  /// \p UsageExitCode.
  bool ShowUsage = false;
  FrontendExitCode UsageExitCode = FrontendExitCode::Success;

  /// \p --embed was given.
  bool Embed = false;

  /// The flags whose values should be printed, in command-line order.
  std::vector<Flag> Requested;
};

} // namespace cli

/// Contains the parsing logic required to meaningfully interface with a set of
/// command-line arguments (\p cli::Option) the same way one of the reference
/// \p python-config scripts does.
class CommandLineInterface
{
public:
  enum class Style
  {
    /// \p python-config.sh: exact arguments, checked left to right.
    Shell,
    /// \p python-config.py: \p getopt.getopt() with long options only.
    Getopt
  };

  /// \param UsageOnStdoutOnError Whether the usage is printed to the standard
  /// output even when it reports an error.
  CommandLineInterface(Style S, bool UsageOnStdoutOnError);

  /// Creates the interface of the script variant \p F as it was shipped with
  /// Python \p V.
  [[nodiscard]] static CommandLineInterface
  forScript(python::ScriptFlavour F, const python::PythonVersion& V);

  /// Registers the option \p O to be handled by the current instance.
  ///
  /// \throws std::out_of_range if an option with the same name is already
  /// registered.
  void addOption(cli::Option O);

  [[nodiscard]] Style style() const noexcept { return S; }
  [[nodiscard]] const std::vector<cli::Option>& options() const noexcept
  {
    return Options;
  }
  [[nodiscard]] bool accepts(cli::Flag F) const noexcept;

  /// \returns the usage line, without a trailing newline.
  [[nodiscard]] std::string usage(std::string_view Program) const;

  /// \returns whether the usage that ends the program with \p Code goes to
  /// the standard output (otherwise, to the standard error).
  [[nodiscard]] bool usageToStandardOutput(FrontendExitCode Code) const noexcept;

  /// Parses the command-line \p ArgV of \p ArgC elements, \p ArgV[0] being the
  /// program name.
  [[nodiscard]] cli::Invocation parse(int ArgC, const char* const ArgV[]) const;

private:
  Style S;
  bool UsageOnStdoutOnError;
  std::vector<cli::Option> Options;

  [[nodiscard]] const cli::Option* find(std::string_view Spelling) const;
  [[nodiscard]] cli::Invocation parseShell(int ArgC,
                                           const char* const ArgV[]) const;
  [[nodiscard]] cli::Invocation parseGetopt(int ArgC,
                                            const char* const ArgV[]) const;
};

} // namespace pyconfig
