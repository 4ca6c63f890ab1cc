/**
 * Copyright (C) 2022 Whisperity
 *
 * SPDX-License-Identifier: GPL-3.0
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "pyconfig/adt/Lazy.hpp"
#include "pyconfig/python/Interpreter.hpp"
#include "pyconfig/python/Version.hpp"

namespace pyconfig::python
{

/// The Python generation whose installation is queried.
enum class MajorVersion
{
  Two = 2,
  Three = 3
};

/// The two variants of the \p python-config script CPython installs. Their
/// outputs differ for \p --cflags and \p --ldflags, and so does their
/// command-line handling.
enum class ScriptFlavour
{
  /// \p Misc/python-config.sh, installed on most Unix-like systems.
  Shell,
  /// \p Misc/python-config.py, installed on Darwin and for Python 2.
  Python
};

/// \returns the name of the interpreter program for \p V on the \p PATH.
[[nodiscard]] const char* defaultProgram(MajorVersion V) noexcept;

[[nodiscard]] const char* flavourName(ScriptFlavour F) noexcept;

/// Parses \p "shell" or \p "python".
[[nodiscard]] std::optional<ScriptFlavour>
parseScriptFlavour(std::string_view Str) noexcept;

/// Exposes the build configuration of a Python installation, as reported by
/// its interpreter.
///
/// Every value is computed on first access and is then kept for the lifetime
/// of the object. A failure is reported by throwing \p ConfigError and is not
/// remembered: the next access tries again.
class PythonConfig
{
public:
  /// Uses the system's \p python3.
  PythonConfig();
  /// Uses the system's \p python3 or \p python2.
  explicit PythonConfig(MajorVersion Version);
  /// Uses the interpreter \p Program, which is either a path or looked up in
  /// the \p PATH.
  PythonConfig(MajorVersion Version, std::string Program);
  /// Uses an arbitrary \p Interpreter implementation.
  PythonConfig(MajorVersion Version, std::unique_ptr<Interpreter> Python);

  PythonConfig(const PythonConfig&) = delete;
  PythonConfig(PythonConfig&&) = delete;
  PythonConfig& operator=(const PythonConfig&) = delete;
  PythonConfig& operator=(PythonConfig&&) = delete;
  ~PythonConfig();

  [[nodiscard]] MajorVersion majorVersion() const noexcept { return Major; }
  [[nodiscard]] Interpreter& interpreter() const noexcept { return *Python; }

  /// Formats the values like \p F instead of detecting which script variant
  /// the installation carries.
  ///
  /// \note Must be called before the first formatted value is queried.
  void setScriptFlavour(ScriptFlavour F) noexcept { ForcedFlavour = F; }

  /// \returns the script variant the formatting follows.
  ///
  /// Python 2 only ships the Python variant. For Python 3, the first line of
  /// the installed \p pythonX.Y-config next to the interpreter decides, with
  /// a platform default if it cannot be read.
  [[nodiscard]] ScriptFlavour scriptFlavour() const;

  /// \returns the version of the interpreter.
  [[nodiscard]] const PythonVersion& semanticVersion() const;

  /// \p --includes
  [[nodiscard]] const std::string& includes() const;
  /// \p --cflags
  [[nodiscard]] const std::string& cflags() const;
  /// \p --libs
  [[nodiscard]] const std::string& libs() const;
  /// \p --ldflags
  [[nodiscard]] const std::string& ldflags() const;
  /// \p --prefix
  [[nodiscard]] const std::string& prefix() const;
  /// \p --exec-prefix
  [[nodiscard]] const std::string& execPrefix() const;
  /// \p --abiflags, Python 3 only.
  [[nodiscard]] const std::string& abiFlags() const;
  /// \p --configdir, Python 3 only.
  [[nodiscard]] const std::string& configDir() const;
  /// \p --extension-suffix, Python 3 only.
  [[nodiscard]] const std::string& extensionSuffix() const;
  /// \p --embed \p --libs, Python 3.8 and newer only.
  [[nodiscard]] const std::string& embedLibs() const;
  /// \p --embed \p --ldflags, Python 3.8 and newer only.
  [[nodiscard]] const std::string& embedLdflags() const;

private:
  using LazyString = Lazy<std::string, std::function<std::string()>>;

  MajorVersion Major;
  std::unique_ptr<Interpreter> Python;
  std::optional<ScriptFlavour> ForcedFlavour;

  mutable Lazy<PythonVersion, std::function<PythonVersion()>> DetectedVersion;
  mutable Lazy<ScriptFlavour, std::function<ScriptFlavour()>> DetectedFlavour;
  mutable LazyString Includes;
  mutable LazyString CFlags;
  mutable LazyString Libs;
  mutable LazyString LdFlags;
  mutable LazyString Prefix;
  mutable LazyString ExecPrefix;
  mutable LazyString AbiFlags;
  mutable LazyString ConfigDir;
  mutable LazyString ExtensionSuffix;
  mutable LazyString EmbedLibs;
  mutable LazyString EmbedLdFlags;

  PythonVersion detectVersion() const;
  ScriptFlavour detectFlavour() const;
  std::string computeIncludes() const;
  std::string computeCFlags() const;
  std::string computeLibs(bool Embed) const;
  std::string computeLdFlags(bool Embed) const;
  std::string computeConfigVar(const char* Name) const;
  std::string computeAbiFlags() const;
  std::string computeConfigDir() const;
  std::string computeExtensionSuffix() const;

  /// \throws ConfigError with \p UnsupportedField if \p Field is unavailable
  /// on the detected Python 2.
  void requirePython3(const char* Field) const;
  /// \throws ConfigError with \p UnsupportedField if \p Field is unavailable
  /// before Python 3.8.
  void requireEmbedSupport(const char* Field) const;
};

} // namespace pyconfig::python
