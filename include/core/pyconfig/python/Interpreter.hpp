/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace pyconfig::python
{

/// An abstract Python interpreter that can be started with a list of
/// command-line arguments.
class Interpreter
{
public:
  /// The observable result of running the interpreter once.
  struct Output
  {
    int ExitCode = 0;
    std::string StandardOutput;
    std::string StandardError;
  };

  virtual ~Interpreter() = default;

  /// Runs the interpreter with \p Arguments (not including the program name)
  /// and waits for it to exit.
  ///
  /// \throws ConfigError with \p InterpreterNotFound if the interpreter does
  /// not exist.
  [[nodiscard]] virtual Output run(const std::vector<std::string>& Arguments) = 0;

  /// \returns the user-facing name of the interpreter, used in diagnostics.
  [[nodiscard]] virtual const std::string& program() const noexcept = 0;

  /// Executes \p Script with \p -c and the additional \p Arguments.
  ///
  /// \returns the standard output of the script.
  /// \throws ConfigError with \p QueryFailed if the interpreter exited with
  /// a non-zero code.
  [[nodiscard]] std::string
  runScript(const std::string& Script,
            const std::vector<std::string>& Arguments = {});
};

/// Starts a real interpreter installed on the system as a child process.
class SystemInterpreter : public Interpreter
{
public:
  /// \param Program Either a path, or the name of a program that is looked up
  /// in the \p PATH.
  explicit SystemInterpreter(std::string Program);

  [[nodiscard]] Output run(const std::vector<std::string>& Arguments) override;
  [[nodiscard]] const std::string& program() const noexcept override
  {
    return Program;
  }

private:
  std::string Program;
  /// The resolved path of \p Program, cached after the first lookup.
  std::optional<std::string> Executable;
};

} // namespace pyconfig::python
