/* SPDX-License-Identifier: GPL-3.0-only */
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include "pyconfig/CommandLine.hpp"
#include "pyconfig/Config.h"
#include "pyconfig/FrontendExitCode.hpp"
#include "pyconfig/python/Error.hpp"
#include "pyconfig/python/PythonConfig.hpp"
#include "pyconfig/system/Environment.hpp"

#include "pyconfig/Log.hpp"
#define LOG(SEVERITY) pyconfig::log::SEVERITY("main")

#ifndef PYCONFIG_DEFAULT_MAJOR_VERSION
#define PYCONFIG_DEFAULT_MAJOR_VERSION 3
#endif

namespace
{

using namespace pyconfig;

/// The log level of the tool when \p PYCONFIG_VERBOSITY is not set. Anything
/// more verbose would show up in the output compared to the reference script.
constexpr log::Severity DefaultSeverity = log::Warning;

log::Severity severityFromEnvironment(const system::ToolEnvironment& Env);
CommandLineInterface
resolveInterface(const python::PythonConfig& Cfg,
                 std::optional<python::ScriptFlavour> ForcedFlavour);
FrontendExitCode exitCodeFor(python::ErrorKind K) noexcept;

using Accessor = const std::string& (python::PythonConfig::*)() const;

/// The facade call printing the value for each flag, without and with
/// \p --embed.
const std::map<cli::Flag, std::pair<Accessor, Accessor>> Handlers = {
  {cli::Flag::Prefix,
   {&python::PythonConfig::prefix, &python::PythonConfig::prefix}},
  {cli::Flag::ExecPrefix,
   {&python::PythonConfig::execPrefix, &python::PythonConfig::execPrefix}},
  {cli::Flag::Includes,
   {&python::PythonConfig::includes, &python::PythonConfig::includes}},
  {cli::Flag::Libs,
   {&python::PythonConfig::libs, &python::PythonConfig::embedLibs}},
  {cli::Flag::CFlags,
   {&python::PythonConfig::cflags, &python::PythonConfig::cflags}},
  {cli::Flag::LdFlags,
   {&python::PythonConfig::ldflags, &python::PythonConfig::embedLdflags}},
  {cli::Flag::ExtensionSuffix,
   {&python::PythonConfig::extensionSuffix,
    &python::PythonConfig::extensionSuffix}},
  {cli::Flag::AbiFlags,
   {&python::PythonConfig::abiFlags, &python::PythonConfig::abiFlags}},
  {cli::Flag::ConfigDir,
   {&python::PythonConfig::configDir, &python::PythonConfig::configDir}},
};

} // namespace

int main(int ArgC, char* ArgV[])
{
  using namespace pyconfig;

  const system::ToolEnvironment Env = system::ToolEnvironment::loadFromEnv();
  log::Logger::get().setLimit(severityFromEnvironment(Env));

  const auto Major =
    static_cast<python::MajorVersion>(PYCONFIG_DEFAULT_MAJOR_VERSION);
  python::PythonConfig Cfg{
    Major, Env.Interpreter.value_or(python::defaultProgram(Major))};
  std::optional<python::ScriptFlavour> ForcedFlavour;
  if (Env.ReferenceScript)
  {
    ForcedFlavour = python::parseScriptFlavour(*Env.ReferenceScript);
    if (ForcedFlavour)
      Cfg.setScriptFlavour(*ForcedFlavour);
    else
      LOG(warn) << "Ignoring unknown PYCONFIG_REFERENCE_SCRIPT '"
                << *Env.ReferenceScript << "', expected 'shell' or 'python'";
  }

  const char* const Program = ArgC > 0 ? ArgV[0] : "python-config";
  CommandLineInterface CLI = resolveInterface(Cfg, ForcedFlavour);
  cli::Invocation Invocation = CLI.parse(ArgC, ArgV);
  if (Invocation.ShowUsage)
  {
    std::ostream& OS = CLI.usageToStandardOutput(Invocation.UsageExitCode)
                         ? std::cout
                         : std::cerr;
    OS << CLI.usage(Program) << std::endl;
    return static_cast<int>(Invocation.UsageExitCode);
  }

  auto Fail = [Program](const std::exception& E) {
    std::cout.flush();
    std::cerr << Program << ": error: " << E.what() << std::endl;
  };

  try
  {
    for (cli::Flag F : Invocation.Requested)
    {
      const std::pair<Accessor, Accessor>& Handler = Handlers.at(F);
      Accessor Get = Invocation.Embed ? Handler.second : Handler.first;
      std::cout << (Cfg.*Get)() << '\n';
    }
    std::cout.flush();
  }
  catch (const python::ConfigError& E)
  {
    LOG(debug) << "Query of '" << Cfg.interpreter().program()
               << "' failed: " << python::kindName(E.kind());
    Fail(E);
    return static_cast<int>(exitCodeFor(E.kind()));
  }
  catch (const std::system_error& E)
  {
    LOG(error) << "System error " << E.code() << ": " << E.what();
    Fail(E);
    return static_cast<int>(FrontendExitCode::SystemError);
  }

  return static_cast<int>(FrontendExitCode::Success);
}

namespace
{

log::Severity severityFromEnvironment(const system::ToolEnvironment& Env)
{
  using namespace pyconfig::log;
  if (!Env.Verbosity)
    return DefaultSeverity;

  char* End = nullptr;
  errno = 0;
  long Differential = std::strtol(Env.Verbosity->c_str(), &End, 10);
  if (errno != 0 || End == Env.Verbosity->c_str() || *End != '\0')
  {
    Logger::get().setLimit(DefaultSeverity);
    LOG(warn) << "Ignoring invalid PYCONFIG_VERBOSITY '" << *Env.Verbosity
              << '\'';
    return DefaultSeverity;
  }

  static constexpr long MaximumVerbosity = Min - DefaultSeverity;
  static constexpr long MinimumVerbosity = DefaultSeverity - Max;
  if (Differential > MaximumVerbosity || Differential < -MinimumVerbosity)
  {
    Logger::get().setLimit(DefaultSeverity);
    LOG(warn) << "Requested logging verbosity '" << Differential
              << "' larger than possible, clamping to available maximum.";
    Differential = Differential > 0 ? MaximumVerbosity : -MinimumVerbosity;
  }
  return static_cast<Severity>(DefaultSeverity + Differential);
}

CommandLineInterface
resolveInterface(const python::PythonConfig& Cfg,
                 std::optional<python::ScriptFlavour> ForcedFlavour)
{
  try
  {
    return CommandLineInterface::forScript(Cfg.scriptFlavour(),
                                           Cfg.semanticVersion());
  }
  catch (const python::ConfigError& E)
  {
    // The command-line must still be handled, so the failure is reported
    // when the first value is requested.
    LOG(debug) << "Interpreter unusable (" << E.what()
               << "), assuming the newest script";
  }
  catch (const std::system_error& E)
  {
    LOG(debug) << "Interpreter unusable (" << E.what()
               << "), assuming the newest script";
  }

  if (Cfg.majorVersion() == python::MajorVersion::Two)
    return CommandLineInterface::forScript(python::ScriptFlavour::Python,
                                           python::PythonVersion{2, 7});
  if (!ForcedFlavour)
    ForcedFlavour = config::DefaultPythonScriptFlavour
                      ? python::ScriptFlavour::Python
                      : python::ScriptFlavour::Shell;
  return CommandLineInterface::forScript(*ForcedFlavour,
                                         python::PythonVersion{3, 13});
}

FrontendExitCode exitCodeFor(python::ErrorKind K) noexcept
{
  switch (K)
  {
    case python::ErrorKind::InterpreterNotFound:
      return FrontendExitCode::SystemError;
    case python::ErrorKind::QueryFailed:
    case python::ErrorKind::MalformedOutput:
    case python::ErrorKind::MissingValue:
    case python::ErrorKind::UnsupportedField:
      return FrontendExitCode::Failure;
  }
  return FrontendExitCode::Failure;
}

} // namespace

#undef LOG
