/* SPDX-License-Identifier: LGPL-3.0-only */
#include <memory>
#include <system_error>
#include <utility>
#include <vector>

#include "pyconfig/python/Error.hpp"
#include "pyconfig/system/Pipe.hpp"
#include "pyconfig/system/Platform.hpp"
#include "pyconfig/system/Process.hpp"

#include "pyconfig/python/Interpreter.hpp"

#include "pyconfig/Log.hpp"
#define LOG(SEVERITY) pyconfig::log::SEVERITY("python/Interpreter")

namespace pyconfig::python
{

namespace
{

std::string firstLine(const std::string& Str)
{
  std::string::size_type Begin = Str.find_first_not_of("\r\n");
  if (Begin == std::string::npos)
    return {};
  std::string::size_type End = Str.find_first_of("\r\n", Begin);
  return Str.substr(Begin, End == std::string::npos ? End : End - Begin);
}

/// \returns the last non-empty line, which is the exception message of a
/// Python traceback.
std::string lastLine(const std::string& Str)
{
  std::string::size_type End = Str.find_last_not_of("\r\n");
  if (End == std::string::npos)
    return {};
  std::string::size_type Begin = Str.find_last_of("\r\n", End);
  Begin = (Begin == std::string::npos) ? 0 : Begin + 1;
  return Str.substr(Begin, End - Begin + 1);
}

} // namespace

std::string Interpreter::runScript(const std::string& Script,
                                   const std::vector<std::string>& Arguments)
{
  std::vector<std::string> Args;
  Args.reserve(Arguments.size() + 2);
  Args.emplace_back("-c");
  Args.emplace_back(Script);
  Args.insert(Args.end(), Arguments.begin(), Arguments.end());

  Output Result = run(Args);
  PYCONFIG_TRACE_LOG(LOG(data) << program() << " replied:\n"
                               << Result.StandardOutput);
  if (Result.ExitCode == 0)
    return std::move(Result.StandardOutput);

  std::string Message = '\'' + program() + "' ";
  if (Result.ExitCode < 0)
    Message += "was killed by signal " + std::to_string(-Result.ExitCode);
  else
    Message += "exited with code " + std::to_string(Result.ExitCode);

  std::string Diagnostic = Result.ExitCode == system::Process::ExecFailureExitCode
                             ? firstLine(Result.StandardError)
                             : lastLine(Result.StandardError);
  if (!Diagnostic.empty())
    Message += ": " + Diagnostic;

  LOG(error) << Message;
  throw ConfigError{ErrorKind::QueryFailed, Message};
}

SystemInterpreter::SystemInterpreter(std::string Program)
  : Program(std::move(Program))
{}

Interpreter::Output
SystemInterpreter::run(const std::vector<std::string>& Arguments)
{
  using namespace pyconfig::system;

  if (!Executable)
  {
    Executable = Platform::findExecutable(Program);
    if (!Executable)
      throw ConfigError{ErrorKind::InterpreterNotFound,
                        "Python interpreter '" + Program + "' not found"};
  }

  Pipe::AnonymousPipe OutPipe = Pipe::create();
  Pipe::AnonymousPipe ErrPipe = Pipe::create();

  Process::SpawnOptions Opts;
  Opts.Program = *Executable;
  Opts.Arguments = Arguments;
  Opts.Environment["PYTHONIOENCODING"] = "utf-8";
  Opts.StandardOutput = OutPipe.getWrite()->raw();
  Opts.StandardError = ErrPipe.getWrite()->raw();

  LOG(debug) << "Running " << *Executable << " with " << Arguments.size()
             << " arguments";
  std::unique_ptr<Process> Child = Process::spawn(Opts);

  // Dropping the write ends in the parent is needed to see the end of stream
  // when the child exits.
  std::unique_ptr<Pipe> Out = OutPipe.takeRead();
  std::unique_ptr<Pipe> Err = ErrPipe.takeRead();

  Output Result;
  try
  {
    std::vector<std::string> Streams = Pipe::readAllOf({Out.get(), Err.get()});
    Result.StandardOutput = std::move(Streams.at(0));
    Result.StandardError = std::move(Streams.at(1));
  }
  catch (const std::system_error&)
  {
    // Closing the read ends lets a still writing child die of SIGPIPE.
    Out.reset();
    Err.reset();
    Child->wait();
    throw;
  }
  Child->wait();
  Result.ExitCode = Child->exitCode();

  PYCONFIG_TRACE_LOG(LOG(trace) << *Executable << " exited with "
                                << Result.ExitCode);
  return Result;
}

} // namespace pyconfig::python

#undef LOG
