/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <stdexcept>
#include <utility>

#include <sys/wait.h>
#include <unistd.h>

#include "pyconfig/CheckedErrno.hpp"
#include "pyconfig/system/fd.hpp"
#include "pyconfig/unreachable.hpp"

#include "pyconfig/system/UnixProcess.hpp"

#include "pyconfig/Log.hpp"
#define LOG(SEVERITY) pyconfig::log::SEVERITY("system/Process")

namespace pyconfig::system
{

static void allocCopyString(const std::string& Source,
                            char* DestinationStringArray[],
                            std::size_t Index)
{
  DestinationStringArray[Index] =
    reinterpret_cast<char*>(std::calloc(Source.size() + 1, 1));
  std::strncpy(
    DestinationStringArray[Index], Source.c_str(), Source.size() + 1);
}

int Process::exitCode() const
{
  if (!Dead)
    throw std::logic_error{"Process " + std::to_string(Handle) +
                           " has not terminated yet"};
  return ExitCode;
}

[[noreturn]] void Process::exec(const SpawnOptions& Opts)
{
  using namespace pyconfig::system::unix;

  PYCONFIG_TRACE_LOG(LOG(debug) << "----- Process::exec() "
                                << "was called -----");

  // The argument vector is never freed, it is either consumed by a
  // successful exec() or the process exits.
  const std::size_t ArgC = Opts.Arguments.size();
  char** NewArgv = new char*[ArgC + 2];
  allocCopyString(Opts.Program, NewArgv, 0);
  PYCONFIG_TRACE_LOG(LOG(debug) << "        Program: " << Opts.Program);
  NewArgv[ArgC + 1] = nullptr;
  for (std::size_t I = 0; I < ArgC; ++I)
  {
    allocCopyString(Opts.Arguments[I], NewArgv, I + 1);
    PYCONFIG_TRACE_LOG(
      LOG(debug) << "        Arg "
                 << std::setw(static_cast<int>(
                                 log::Logger::digits(Opts.Arguments.size()))) << I
                 << ": " << Opts.Arguments[I]);
  }

  for (const auto& E : Opts.Environment)
  {
    if (!E.second.has_value())
    {
      PYCONFIG_TRACE_LOG(LOG(debug) << "        Env unset: " << E.first);
      auto Unset =
        CheckedErrno([&K = E.first] { return ::unsetenv(K.c_str()); }, -1);
      if (!Unset)
        LOG(warn) << "unsetenv(" << E.first
                  << ") failed: " << Unset.getError().message();
    }
    else
    {
      PYCONFIG_TRACE_LOG(LOG(debug) << "        Env   set: " << E.first
                                    << " = " << *E.second);
      auto Set = CheckedErrno(
        [&K = E.first, &V = E.second] {
          return ::setenv(K.c_str(), V->c_str(), 1);
        },
        -1);
      if (!Set)
        LOG(warn) << "setenv(" << E.first
                  << ") failed: " << Set.getError().message();
    }
  }

  if (Opts.StandardInput)
    fd::replace(fd::fileno(stdin), *Opts.StandardInput);
  if (Opts.StandardError)
    fd::replace(fd::fileno(stderr), *Opts.StandardError);
  if (Opts.StandardOutput)
    fd::replace(fd::fileno(stdout), *Opts.StandardOutput);

  auto ExecSuccessful =
    CheckedErrno([NewArgv] { return ::execvp(NewArgv[0], NewArgv); }, -1);
  if (!ExecSuccessful)
  {
    // The standard error stream of the child is usually captured by the
    // parent, so the report reaches it as the diagnostic output.
    (void)std::fprintf(stderr, // NOLINT(cppcoreguidelines-pro-type-vararg)
                       "%s: %s\n",
                       Opts.Program.c_str(),
                       ExecSuccessful.getError().message().c_str());
    std::_Exit(ExecFailureExitCode);
  }
  unreachable("::exec() should've started a new process");
}

std::unique_ptr<Process> Process::spawn(const SpawnOptions& Opts)
{
  // Flush the buffers so the child does not inherit and re-emit them.
  (void)std::fflush(stdout);
  (void)std::fflush(stderr);

  Raw ForkResult =
    CheckedErrnoThrow([] { return ::fork(); }, "fork() failed in spawn()", -1);
  if (ForkResult != 0)
  {
    // We are in the parent.
    std::unique_ptr<Process> P = std::make_unique<unix::Process>();
    P->Handle = ForkResult;
    PYCONFIG_TRACE_LOG(LOG(debug) << "PID " << P->Handle << " spawned.");
    return P;
  }

  // We are in the child.
  try
  {
    Process::exec(Opts);
  }
  catch (const std::system_error& Err)
  {
    (void)std::fprintf(stderr, // NOLINT(cppcoreguidelines-pro-type-vararg)
                       "%s: %s\n",
                       Opts.Program.c_str(),
                       Err.what());
    std::_Exit(ExecFailureExitCode);
  }
  unreachable("Process::exec() should've replaced the process.");
}

static int reapAndGetExitCode(Process::Raw PID)
{
  int WaitStatus = 0;
  while (true)
  {
    auto ChangedPID = CheckedErrno(
      [&WaitStatus, PID] { return ::waitpid(PID, &WaitStatus, 0); }, -1);
    if (ChangedPID)
      break;

    std::error_code EC = ChangedPID.getError();
    if (EC == std::errc::interrupted /* EINTR */)
      continue;
    throw std::system_error{EC, "waitpid(" + std::to_string(PID) + ")"};
  }

  PYCONFIG_TRACE_LOG(LOG(trace) << "Successfully reaped child PID " << PID);
  if (WIFEXITED(WaitStatus))
    return WEXITSTATUS(WaitStatus);
  if (WIFSIGNALED(WaitStatus))
    return -(WTERMSIG(WaitStatus));
  return -1;
}

namespace unix
{

void Process::wait()
{
  if (Dead || Handle == PlatformSpecificProcessTraits::Invalid)
    return;

  PYCONFIG_TRACE_LOG(LOG(debug)
                     << "Waiting on child PID " << Handle << " to exit...");
  ExitCode = reapAndGetExitCode(Handle);
  Dead = true;
  LOG(debug) << "Child PID " << Handle << " exited with " << ExitCode;
}

} // namespace unix

} // namespace pyconfig::system

#undef LOG
