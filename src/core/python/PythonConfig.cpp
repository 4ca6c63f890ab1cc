/* SPDX-License-Identifier: LGPL-3.0-only */
#include <fstream>
#include <initializer_list>
#include <stdexcept>
#include <utility>
#include <vector>

#include "pyconfig/Config.h"
#include "pyconfig/python/Error.hpp"
#include "pyconfig/python/Sysconfig.hpp"
#include "pyconfig/unreachable.hpp"

#include "pyconfig/python/PythonConfig.hpp"

#include "pyconfig/Log.hpp"
#define LOG(SEVERITY) pyconfig::log::SEVERITY("python/PythonConfig")

namespace pyconfig::python
{

namespace
{

/// The first release where the scripts know \p --embed and \p LIBPYTHON, and
/// the Python variant stopped appending \p LINKFORSHARED.
constexpr PythonVersion EmbedRelease{3, 8};
/// The first release where the shell variant stopped appending
/// \p LINKFORSHARED.
constexpr PythonVersion ShellNoLinkForSharedRelease{3, 7};

using Q = SysconfigQuery;

} // namespace

const char* defaultProgram(MajorVersion V) noexcept
{
  switch (V)
  {
    case MajorVersion::Two:
      return "python2";
    case MajorVersion::Three:
      return "python3";
  }
  unreachable("Unknown MajorVersion");
}

const char* flavourName(ScriptFlavour F) noexcept
{
  switch (F)
  {
    case ScriptFlavour::Shell:
      return "shell";
    case ScriptFlavour::Python:
      return "python";
  }
  unreachable("Unknown ScriptFlavour");
}

std::optional<ScriptFlavour> parseScriptFlavour(std::string_view Str) noexcept
{
  if (Str == "shell")
    return ScriptFlavour::Shell;
  if (Str == "python")
    return ScriptFlavour::Python;
  return std::nullopt;
}

PythonConfig::PythonConfig() : PythonConfig(MajorVersion::Three) {}

PythonConfig::PythonConfig(MajorVersion Version)
  : PythonConfig(Version, std::string{defaultProgram(Version)})
{}

PythonConfig::PythonConfig(MajorVersion Version, std::string Program)
  : PythonConfig(Version,
                 std::make_unique<SystemInterpreter>(std::move(Program)))
{}

PythonConfig::PythonConfig(MajorVersion Version,
                           std::unique_ptr<Interpreter> Python)
  : Major(Version), Python(std::move(Python)),
    DetectedVersion([this] { return detectVersion(); }),
    DetectedFlavour([this] { return detectFlavour(); }),
    Includes([this] { return computeIncludes(); }),
    CFlags([this] { return computeCFlags(); }),
    Libs([this] { return computeLibs(false); }),
    LdFlags([this] { return computeLdFlags(false); }),
    Prefix([this] { return computeConfigVar("prefix"); }),
    ExecPrefix([this] { return computeConfigVar("exec_prefix"); }),
    AbiFlags([this] { return computeAbiFlags(); }),
    ConfigDir([this] { return computeConfigDir(); }),
    ExtensionSuffix([this] { return computeExtensionSuffix(); }),
    EmbedLibs([this] { return computeLibs(true); }),
    EmbedLdFlags([this] { return computeLdFlags(true); })
{
  if (!this->Python)
    throw std::invalid_argument{"PythonConfig requires an interpreter"};
}

PythonConfig::~PythonConfig() = default;

ScriptFlavour PythonConfig::scriptFlavour() const
{
  if (ForcedFlavour)
    return *ForcedFlavour;
  return DetectedFlavour.get();
}

const PythonVersion& PythonConfig::semanticVersion() const
{
  return DetectedVersion.get();
}

const std::string& PythonConfig::includes() const { return Includes.get(); }
const std::string& PythonConfig::cflags() const { return CFlags.get(); }
const std::string& PythonConfig::libs() const { return Libs.get(); }
const std::string& PythonConfig::ldflags() const { return LdFlags.get(); }
const std::string& PythonConfig::prefix() const { return Prefix.get(); }
const std::string& PythonConfig::execPrefix() const { return ExecPrefix.get(); }
const std::string& PythonConfig::abiFlags() const { return AbiFlags.get(); }
const std::string& PythonConfig::configDir() const { return ConfigDir.get(); }

const std::string& PythonConfig::extensionSuffix() const
{
  return ExtensionSuffix.get();
}

const std::string& PythonConfig::embedLibs() const { return EmbedLibs.get(); }

const std::string& PythonConfig::embedLdflags() const
{
  return EmbedLdFlags.get();
}

PythonVersion PythonConfig::detectVersion() const
{
  SysconfigReply Reply = Q{}.version().run(*Python);
  const std::string& Raw = Reply.value(Q::versionKey());
  std::optional<PythonVersion> V = PythonVersion::parse(Raw);
  if (!V)
    throw ConfigError{ErrorKind::MalformedOutput,
                      "cannot parse interpreter version '" + Raw + '\''};

  LOG(debug) << Python->program() << " is Python " << V->toString();
  if (V->Major != static_cast<unsigned int>(Major))
    LOG(warn) << '\'' << Python->program() << "' is Python " << V->toString()
              << ", but Python " << static_cast<int>(Major)
              << " was requested";
  return *V;
}

ScriptFlavour PythonConfig::detectFlavour() const
{
  static constexpr ScriptFlavour PlatformDefault =
    config::DefaultPythonScriptFlavour ? ScriptFlavour::Python
                                       : ScriptFlavour::Shell;

  if (semanticVersion().Major < 3)
    return ScriptFlavour::Python;

  SysconfigReply Reply = Q{}
                           .configVar("BINDIR")
                           .configVar("LDVERSION")
                           .configVar("VERSION")
                           .run(*Python);
  std::optional<std::string> BinDir = Reply.get(Q::varKey("BINDIR"));
  if (!BinDir || BinDir->empty())
  {
    LOG(debug) << "BINDIR unknown, assuming the " << flavourName(PlatformDefault)
               << " script";
    return PlatformDefault;
  }

  std::vector<std::string> Candidates;
  std::string LdVersion = Reply.valueOr(Q::varKey("LDVERSION"),
                                        Reply.valueOr(Q::varKey("VERSION")));
  if (!LdVersion.empty())
    Candidates.emplace_back(*BinDir + "/python" + LdVersion + "-config");
  Candidates.emplace_back(*BinDir + "/python" +
                          std::to_string(semanticVersion().Major) + "-config");

  for (const std::string& Script : Candidates)
  {
    std::ifstream File{Script};
    if (!File)
      continue;

    std::string Shebang;
    std::getline(File, Shebang);
    if (Shebang.compare(0, 2, "#!") != 0)
      continue;

    ScriptFlavour F = Shebang.compare(0, 9, "#!/bin/sh") == 0
                        ? ScriptFlavour::Shell
                        : ScriptFlavour::Python;
    LOG(debug) << Script << " is the " << flavourName(F) << " script";
    return F;
  }

  LOG(debug) << "No installed python-config found, assuming the "
             << flavourName(PlatformDefault) << " script";
  return PlatformDefault;
}

void PythonConfig::requirePython3(const char* Field) const
{
  const PythonVersion& V = semanticVersion();
  if (V.Major >= 3)
    return;
  throw ConfigError{ErrorKind::UnsupportedField,
                    std::string{Field} + " is not available for Python " +
                      V.toString()};
}

void PythonConfig::requireEmbedSupport(const char* Field) const
{
  const PythonVersion& V = semanticVersion();
  if (V >= EmbedRelease)
    return;
  throw ConfigError{ErrorKind::UnsupportedField,
                    std::string{Field} + " is not available for Python " +
                      V.toString() + ", it requires Python " +
                      EmbedRelease.shortString()};
}

std::string PythonConfig::computeIncludes() const
{
  if (semanticVersion().Major < 3)
  {
    // The Python 2 script asks distutils, which distributions patch
    // separately from sysconfig.
    SysconfigReply Reply = Q{}
                             .distutilsInclude("include")
                             .distutilsInclude("platinclude")
                             .run(*Python);
    return "-I" + Reply.value(Q::includeKey("include")) + " -I" +
           Reply.value(Q::includeKey("platinclude"));
  }

  SysconfigReply Reply =
    Q{}.path("include").path("platinclude").run(*Python);
  return "-I" + Reply.value(Q::pathKey("include")) + " -I" +
         Reply.value(Q::pathKey("platinclude"));
}

std::string PythonConfig::computeCFlags() const
{
  std::vector<std::string> Flags = splitWords(includes());

  if (scriptFlavour() == ScriptFlavour::Python)
  {
    SysconfigReply Reply = Q{}.configVar("CFLAGS").run(*Python);
    for (std::string& W : Reply.words(Q::varKey("CFLAGS")))
      Flags.emplace_back(std::move(W));
    return joinWords(Flags);
  }

  SysconfigReply Reply = Q{}
                           .configVar("BASECFLAGS")
                           .configVar("CONFIGURE_CFLAGS")
                           .configVar("OPT")
                           .run(*Python);
  for (const char* Var : {"BASECFLAGS", "CONFIGURE_CFLAGS", "OPT"})
    for (std::string& W : Reply.words(Q::varKey(Var)))
      Flags.emplace_back(std::move(W));
  return joinWords(Flags);
}

std::string PythonConfig::computeLibs(bool Embed) const
{
  const PythonVersion& V = semanticVersion();
  if (Embed)
  {
    requirePython3("--embed");
    requireEmbedSupport("--embed");
  }

  Q Query;
  Query.configVar("VERSION").configVar("LIBS").configVar("SYSLIBS");
  if (V.Major >= 3)
    Query.sysAttribute("abiflags");
  if (V >= EmbedRelease)
    Query.configVar("LIBPYTHON");
  SysconfigReply Reply = Query.run(*Python);

  const std::string& PyVer = Reply.value(Q::varKey("VERSION"));
  std::vector<std::string> Libs;
  auto AppendWordsOf = [&Libs, &Reply](const char* Var) {
    for (std::string& W : Reply.words(Q::varKey(Var)))
      Libs.emplace_back(std::move(W));
  };

  if (V.Major < 3)
  {
    Libs.emplace_back("-lpython" + PyVer);
    AppendWordsOf("LIBS");
    AppendWordsOf("SYSLIBS");
    return joinWords(Libs);
  }

  std::string LinkPython =
    "-lpython" + PyVer + Reply.value(Q::sysKey("abiflags"));
  if (V < EmbedRelease || Embed)
    Libs.emplace_back(std::move(LinkPython));
  else
    AppendWordsOf("LIBPYTHON");
  AppendWordsOf("LIBS");
  AppendWordsOf("SYSLIBS");
  return joinWords(Libs);
}

std::string PythonConfig::computeLdFlags(bool Embed) const
{
  const PythonVersion& V = semanticVersion();
  std::vector<std::string> Flags = splitWords(Embed ? embedLibs() : libs());

  SysconfigReply Reply = Q{}
                           .configVar("LIBPL")
                           .configVar("LIBDIR")
                           .configVar("Py_ENABLE_SHARED")
                           .configVar("PYTHONFRAMEWORK")
                           .configVar("LINKFORSHARED")
                           .run(*Python);
  auto LinkForShared = [&Reply, &Flags] {
    for (std::string& W : Reply.words(Q::varKey("LINKFORSHARED")))
      Flags.emplace_back(std::move(W));
  };

  if (scriptFlavour() == ScriptFlavour::Python)
  {
    if (!Reply.truthy(Q::varKey("Py_ENABLE_SHARED")))
      Flags.insert(Flags.begin(), "-L" + Reply.value(Q::varKey("LIBPL")));
    if (V < EmbedRelease && !Reply.truthy(Q::varKey("PYTHONFRAMEWORK")))
      LinkForShared();
    return joinWords(Flags);
  }

  std::vector<std::string> Prefix;
  if (Reply.valueOr(Q::varKey("Py_ENABLE_SHARED")) == "0")
    Prefix.emplace_back("-L" + Reply.value(Q::varKey("LIBPL")));
  Prefix.emplace_back("-L" + Reply.value(Q::varKey("LIBDIR")));
  Flags.insert(Flags.begin(), Prefix.begin(), Prefix.end());
  if (V < ShellNoLinkForSharedRelease &&
      Reply.valueOr(Q::varKey("PYTHONFRAMEWORK")).empty())
    LinkForShared();
  return joinWords(Flags);
}

std::string PythonConfig::computeConfigVar(const char* Name) const
{
  SysconfigReply Reply = Q{}.configVar(Name).run(*Python);
  return Reply.value(Q::varKey(Name));
}

std::string PythonConfig::computeAbiFlags() const
{
  requirePython3("--abiflags");
  SysconfigReply Reply = Q{}.sysAttribute("abiflags").run(*Python);
  return Reply.value(Q::sysKey("abiflags"));
}

std::string PythonConfig::computeConfigDir() const
{
  requirePython3("--configdir");
  return computeConfigVar("LIBPL");
}

std::string PythonConfig::computeExtensionSuffix() const
{
  requirePython3("--extension-suffix");
  SysconfigReply Reply =
    Q{}.configVar("EXT_SUFFIX").configVar("SO").run(*Python);
  const std::optional<std::string>& Suffix = Reply.get(Q::varKey("EXT_SUFFIX"));
  if (Suffix)
    return *Suffix;
  return Reply.value(Q::varKey("SO"));
}

} // namespace pyconfig::python

#undef LOG
