/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <stdexcept>
#include <string>

namespace pyconfig::python
{

/// The reason why a configuration value could not be produced.
enum class ErrorKind
{
  /// The interpreter program does not exist or is not executable.
  InterpreterNotFound,
  /// The interpreter was started but exited with failure.
  QueryFailed,
  /// The interpreter's reply could not be understood.
  MalformedOutput,
  /// The interpreter reported no value for a variable the result needs.
  MissingValue,
  /// The requested field does not exist for the detected Python version.
  UnsupportedField
};

/// \returns a short, human-readable name of \p K.
[[nodiscard]] const char* kindName(ErrorKind K) noexcept;

/// The exception raised by the configuration query facade.
class ConfigError : public std::runtime_error
{
public:
  ConfigError(ErrorKind Kind, const std::string& Message);

  [[nodiscard]] ErrorKind kind() const noexcept { return Kind; }

private:
  ErrorKind Kind;
};

} // namespace pyconfig::python
