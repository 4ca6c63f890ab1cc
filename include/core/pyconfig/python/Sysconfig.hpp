/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pyconfig::python
{

class Interpreter;
class SysconfigReply;

/// Builds the list of values requested from the interpreter in a single run.
///
/// Every value is identified by a key:
///   - \p var:NAME is \p sysconfig.get_config_var(NAME),
///   - \p path:NAME is \p sysconfig.get_path(NAME),
///   - \p inc:NAME is the \p include (or \p platinclude) directory as
///     \p distutils.sysconfig.get_python_inc() reports it,
///   - \p sys:NAME is the attribute \p NAME of the \p sys module,
///   - \p version is \p sys.version_info formatted as \p X.Y.Z.
class SysconfigQuery
{
public:
  static std::string varKey(std::string_view Name);
  static std::string pathKey(std::string_view Name);
  static std::string includeKey(std::string_view Name);
  static std::string sysKey(std::string_view Name);
  static const char* versionKey() noexcept { return "version"; }

  /// The inline script passed to the interpreter's \p -c. It is valid Python
  /// 2 and 3 alike, and prints one \p key=value line for every key in its
  /// arguments, or a bare \p key line if the value is \p None.
  static const char* script() noexcept;

  SysconfigQuery& configVar(std::string_view Name);
  SysconfigQuery& path(std::string_view Name);
  /// Python 2 only, \p distutils is gone from Python 3.12.
  SysconfigQuery& distutilsInclude(std::string_view Name);
  SysconfigQuery& sysAttribute(std::string_view Name);
  SysconfigQuery& version();

  [[nodiscard]] const std::vector<std::string>& keys() const noexcept
  {
    return Keys;
  }
  [[nodiscard]] bool empty() const noexcept { return Keys.empty(); }

  /// Executes the query on \p Python.
  ///
  /// \throws ConfigError if the interpreter fails or the reply is malformed.
  [[nodiscard]] SysconfigReply run(Interpreter& Python) const;

private:
  std::vector<std::string> Keys;
};

/// The parsed answer to a \p SysconfigQuery.
class SysconfigReply
{
public:
  /// Parses the \p Output of the query script which was run for \p Keys.
  ///
  /// \throws ConfigError with \p MalformedOutput unless \p Output contains
  /// exactly one line for each of \p Keys, in order.
  [[nodiscard]] static SysconfigReply
  parse(const std::vector<std::string>& Keys, std::string_view Output);

  /// \returns the value for \p Key, or \p std::nullopt if the interpreter
  /// reported \p None.
  ///
  /// \throws std::out_of_range if \p Key was not part of the query.
  [[nodiscard]] const std::optional<std::string>&
  get(const std::string& Key) const;

  /// \returns the value for \p Key.
  ///
  /// \throws ConfigError with \p MissingValue if the value is \p None.
  [[nodiscard]] const std::string& value(const std::string& Key) const;

  /// \returns the value for \p Key, or the empty string for \p None.
  [[nodiscard]] std::string valueOr(const std::string& Key,
                                    std::string Default = {}) const;

  /// \returns the value for \p Key split into whitespace-separated words.
  /// \p None yields no words.
  [[nodiscard]] std::vector<std::string> words(const std::string& Key) const;

  /// \returns whether the value for \p Key would be true in a Python
  /// condition: it is not \p None, not empty, and not the number \p 0.
  [[nodiscard]] bool truthy(const std::string& Key) const;

private:
  std::map<std::string, std::optional<std::string>> Values;
};

/// Splits \p Str at runs of whitespace, like Python's \p str.split().
[[nodiscard]] std::vector<std::string> splitWords(std::string_view Str);

/// Joins \p Words with a single space between each.
[[nodiscard]] std::string joinWords(const std::vector<std::string>& Words);

} // namespace pyconfig::python
