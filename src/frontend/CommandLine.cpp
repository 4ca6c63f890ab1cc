/* SPDX-License-Identifier: GPL-3.0-only */
#include <initializer_list>
#include <stdexcept>
#include <utility>
#include <vector>

#include <getopt.h>

#include "pyconfig/adt/Ranges.hpp"
#include "pyconfig/python/Sysconfig.hpp"
#include "pyconfig/unreachable.hpp"

#include "pyconfig/CommandLine.hpp"

#include "pyconfig/Log.hpp"
#define LOG(SEVERITY) pyconfig::log::SEVERITY("CommandLine")

namespace pyconfig
{

namespace
{

/// Python 3.13 started to print the usage to the standard error for errors
/// in the shell script, too.
constexpr python::PythonVersion ShellUsageOnStderrRelease{3, 13};
/// The first release that knows about \p --embed.
constexpr python::PythonVersion EmbedRelease{3, 8};

/// \p getopt_long() reports a long option with this value added to its index.
constexpr int LongOptionValueBase = 256;

cli::Invocation usageExit(FrontendExitCode Code)
{
  cli::Invocation I;
  I.ShowUsage = true;
  I.UsageExitCode = Code;
  return I;
}

bool printsValue(cli::Flag F) noexcept
{
  return F != cli::Flag::Help && F != cli::Flag::Embed;
}

} // namespace

namespace cli
{

const char* flagName(Flag F) noexcept
{
  switch (F)
  {
    case Flag::Prefix:
      return "prefix";
    case Flag::ExecPrefix:
      return "exec-prefix";
    case Flag::Includes:
      return "includes";
    case Flag::Libs:
      return "libs";
    case Flag::CFlags:
      return "cflags";
    case Flag::LdFlags:
      return "ldflags";
    case Flag::ExtensionSuffix:
      return "extension-suffix";
    case Flag::Help:
      return "help";
    case Flag::AbiFlags:
      return "abiflags";
    case Flag::ConfigDir:
      return "configdir";
    case Flag::Embed:
      return "embed";
  }
  unreachable("Unknown Flag");
}

Option::Option(Flag F) : Kind(F), Name(flagName(F)) {}

} // namespace cli

CommandLineInterface::CommandLineInterface(Style S, bool UsageOnStdoutOnError)
  : S(S), UsageOnStdoutOnError(UsageOnStdoutOnError)
{}

CommandLineInterface
CommandLineInterface::forScript(python::ScriptFlavour F,
                                const python::PythonVersion& V)
{
  using cli::Flag;
  using cli::Option;

  const bool IsShell = F == python::ScriptFlavour::Shell;
  CommandLineInterface CLI{IsShell ? Style::Shell : Style::Getopt,
                           IsShell && V < ShellUsageOnStderrRelease};

  for (Flag Opt : {Flag::Prefix,
                   Flag::ExecPrefix,
                   Flag::Includes,
                   Flag::Libs,
                   Flag::CFlags,
                   Flag::LdFlags})
    CLI.addOption(Option{Opt});

  if (V.Major < 3)
  {
    CLI.addOption(Option{Flag::Help});
    return CLI;
  }

  for (Flag Opt : {Flag::ExtensionSuffix,
                   Flag::Help,
                   Flag::AbiFlags,
                   Flag::ConfigDir})
    CLI.addOption(Option{Opt});
  if (V >= EmbedRelease)
    CLI.addOption(Option{Flag::Embed});
  return CLI;
}

void CommandLineInterface::addOption(cli::Option O)
{
  if (accepts(O.flag()))
    throw std::out_of_range{"Trying to register an option with name '" +
                            O.getName() + "' but such is already registered."};
  Options.emplace_back(std::move(O));
}

bool CommandLineInterface::accepts(cli::Flag F) const noexcept
{
  return ranges::any_of(Options,
                        [F](const cli::Option& O) { return O.flag() == F; });
}

const cli::Option* CommandLineInterface::find(std::string_view Spelling) const
{
  auto It = ranges::find_if(Options, [Spelling](const cli::Option& O) {
    return O.spelling() == Spelling;
  });
  return It == Options.end() ? nullptr : &*It;
}

std::string CommandLineInterface::usage(std::string_view Program) const
{
  std::string Flags;
  for (const cli::Option& O : Options)
  {
    if (!Flags.empty())
      Flags.push_back('|');
    Flags.append(O.spelling());
  }

  std::string Usage = "Usage: ";
  Usage.append(Program);
  if (S == Style::Shell)
    return Usage + ' ' + Flags;
  return Usage + " [" + Flags + ']';
}

bool CommandLineInterface::usageToStandardOutput(
  FrontendExitCode Code) const noexcept
{
  if (S == Style::Getopt)
    return false;
  return Code == FrontendExitCode::Success || UsageOnStdoutOnError;
}

cli::Invocation CommandLineInterface::parse(int ArgC,
                                            const char* const ArgV[]) const
{
  switch (S)
  {
    case Style::Shell:
      return parseShell(ArgC, ArgV);
    case Style::Getopt:
      return parseGetopt(ArgC, ArgV);
  }
  unreachable("Unknown Style");
}

cli::Invocation CommandLineInterface::parseShell(int ArgC,
                                                 const char* const ArgV[]) const
{
  if (ArgC < 2 || ArgV[1][0] == '\0')
    return usageExit(FrontendExitCode::InvocationError);

  // The validation loop sees the arguments split into words, as an unquoted
  // "$*" would.
  cli::Invocation I;
  for (int A = 1; A < ArgC; ++A)
  {
    for (const std::string& Word : python::splitWords(ArgV[A]))
    {
      const cli::Option* O = find(Word);
      if (!O)
      {
        LOG(debug) << "Unknown argument '" << Word << '\'';
        return usageExit(FrontendExitCode::InvocationError);
      }
      if (O->flag() == cli::Flag::Help)
        return usageExit(FrontendExitCode::Success);
      if (O->flag() == cli::Flag::Embed)
        I.Embed = true;
    }
  }

  // The printing loop matches the original arguments exactly.
  for (int A = 1; A < ArgC; ++A)
  {
    const cli::Option* O = find(ArgV[A]);
    if (O && printsValue(O->flag()))
      I.Requested.push_back(O->flag());
  }
  return I;
}

cli::Invocation CommandLineInterface::parseGetopt(int ArgC,
                                                  const char* const ArgV[]) const
{
  std::vector<struct ::option> LongOptions;
  LongOptions.reserve(Options.size() + 1);
  for (std::size_t Idx = 0; Idx < Options.size(); ++Idx)
    LongOptions.push_back({Options[Idx].getName().c_str(),
                           no_argument,
                           nullptr,
                           LongOptionValueBase + static_cast<int>(Idx)});
  LongOptions.push_back({nullptr, 0, nullptr, 0});

  // "+" stops at the first non-option, like getopt.getopt(). Every option
  // has its own value, so a prefix of more than one is ambiguous.
  ::opterr = 0;
  ::optind = 0;

  std::vector<cli::Flag> Given;
  int Opt;
  int LongOptIndex = -1;
  while ((Opt = ::getopt_long(ArgC,
                              const_cast<char**>(ArgV), // NOLINT
                              "+",
                              LongOptions.data(),
                              &LongOptIndex)) != -1)
  {
    if (Opt < LongOptionValueBase ||
        Opt >= LongOptionValueBase + static_cast<int>(Options.size()))
    {
      LOG(debug) << "Invalid option at position " << ::optind - 1;
      return usageExit(FrontendExitCode::InvocationError);
    }
    Given.push_back(
      Options[static_cast<std::size_t>(Opt - LongOptionValueBase)].flag());
  }

  if (Given.empty())
    return usageExit(FrontendExitCode::InvocationError);
  if (ranges::contains(Given, cli::Flag::Help))
    return usageExit(FrontendExitCode::Success);

  cli::Invocation I;
  for (cli::Flag F : Given)
  {
    if (F == cli::Flag::Embed)
      I.Embed = true;
    else if (printsValue(F))
      I.Requested.push_back(F);
  }
  return I;
}

} // namespace pyconfig

#undef LOG
