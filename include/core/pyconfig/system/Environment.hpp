/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace pyconfig::system
{

/// \returns the value of the environment variable \p Key.
///
/// \note This function is a safe alternative to \p getenv() as it immediately
/// allocates a \e new string with the result.
[[nodiscard]] std::string getEnv(const std::string& Key);

/// Splits a \p PATH -like list of directories at the \p Separator. Empty
/// elements denote the current directory and are returned as \p ".".
[[nodiscard]] std::vector<std::string> splitSearchPath(const std::string& List,
                                                       char Separator = ':');

/// Run-time configuration of the tool injected through the use of environment
/// variables, as the command-line surface is fixed by the reference script.
struct ToolEnvironment
{
  /// \p PYCONFIG_INTERPRETER: the interpreter program to query.
  std::optional<std::string> Interpreter;
  /// \p PYCONFIG_VERBOSITY: the raw verbosity differential.
  std::optional<std::string> Verbosity;
  /// \p PYCONFIG_REFERENCE_SCRIPT: the script variant to mimic.
  std::optional<std::string> ReferenceScript;

  [[nodiscard]] static ToolEnvironment loadFromEnv();
};

} // namespace pyconfig::system
