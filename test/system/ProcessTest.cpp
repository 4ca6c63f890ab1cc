/* SPDX-License-Identifier: GPL-3.0-only */
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include "pyconfig/python/Error.hpp"
#include "pyconfig/python/Interpreter.hpp"
#include "pyconfig/system/Pipe.hpp"
#include "pyconfig/system/Process.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace pyconfig;
using namespace pyconfig::system;

TEST(Process, SpawnCapturesOutputAndExitCode)
{
  Pipe::AnonymousPipe Out = Pipe::create();

  Process::SpawnOptions Opts;
  Opts.Program = "/bin/sh";
  Opts.Arguments = {"-c", "printf '%s' \"$PYCONFIG_TEST_VALUE\"; exit 3"};
  Opts.Environment["PYCONFIG_TEST_VALUE"] = "hello";
  Opts.StandardOutput = Out.getWrite()->raw();

  std::unique_ptr<Process> Child = Process::spawn(Opts);
  ASSERT_TRUE(Child);
  EXPECT_GT(Child->raw(), 0);
  EXPECT_FALSE(Child->dead());
  EXPECT_THROW((void)Child->exitCode(), std::logic_error);

  std::unique_ptr<Pipe> Read = Out.takeRead();
  EXPECT_EQ(Read->readAll(), "hello");

  Child->wait();
  EXPECT_TRUE(Child->dead());
  EXPECT_EQ(Child->exitCode(), 3);
}

TEST(Process, FailedExecExitsWithConventionalCode)
{
  Process::SpawnOptions Opts;
  Opts.Program = "/nonexistent/pyconfig-test-program";
  Opts.StandardError = Handle::Raw{-1};

  std::unique_ptr<Process> Child = Process::spawn(Opts);
  Child->wait();
  EXPECT_EQ(Child->exitCode(), Process::ExecFailureExitCode);
}

TEST(Pipe, ReadEndOnly)
{
  Pipe::AnonymousPipe P = Pipe::create();
  EXPECT_EQ(P.getWrite()->mode(), Pipe::Write);
  EXPECT_THROW((void)P.getWrite()->readAll(), std::system_error);

  std::unique_ptr<Pipe> Read = P.takeRead();
  EXPECT_EQ(P.getWrite(), nullptr);
  // The write end is closed, so the read end sees the end of stream.
  EXPECT_EQ(Read->readAll(), "");
  EXPECT_THROW((void)P.takeRead(), std::system_error);
}

TEST(SystemInterpreter, RunsProgramWithArguments)
{
  python::SystemInterpreter Sh{"sh"};
  python::Interpreter::Output O =
    Sh.run({"-c", "echo out; echo err >&2; exit 5"});

  EXPECT_EQ(O.ExitCode, 5);
  EXPECT_EQ(O.StandardOutput, "out\n");
  EXPECT_EQ(O.StandardError, "err\n");
}

TEST(Pipe, ReadAllOfRequiresReadEnds)
{
  Pipe::AnonymousPipe P = Pipe::create();
  Pipe::AnonymousPipe Other = Pipe::create();
  std::unique_ptr<Pipe> Read = P.takeRead();
  EXPECT_THROW((void)Pipe::readAllOf({Read.get(), Other.getWrite()}),
               std::system_error);
}

TEST(SystemInterpreter, LargeStandardErrorBeforeOutput)
{
  // Far more than a pipe buffer goes to the standard error before anything
  // is written to the standard output.
  python::SystemInterpreter Sh{"sh"};
  python::Interpreter::Output O =
    Sh.run({"-c", "head -c 262144 /dev/zero >&2; echo out"});

  EXPECT_EQ(O.ExitCode, 0);
  EXPECT_EQ(O.StandardOutput, "out\n");
  EXPECT_EQ(O.StandardError.size(), 262144U);
}

TEST(SystemInterpreter, ScriptFailureCarriesDiagnostic)
{
  python::SystemInterpreter Sh{"/bin/sh"};
  EXPECT_EQ(Sh.runScript("echo ok"), "ok\n");

  try
  {
    (void)Sh.runScript("echo first >&2; echo 'ValueError: bad' >&2; exit 1");
    FAIL() << "Expected a QueryFailed error";
  }
  catch (const python::ConfigError& E)
  {
    EXPECT_EQ(E.kind(), python::ErrorKind::QueryFailed);
    EXPECT_NE(std::string{E.what()}.find("ValueError: bad"),
              std::string::npos);
  }
}

TEST(SystemInterpreter, MissingProgram)
{
  python::SystemInterpreter Missing{"pyconfig-test-no-such-python"};
  try
  {
    (void)Missing.run({"--version"});
    FAIL() << "Expected an InterpreterNotFound error";
  }
  catch (const python::ConfigError& E)
  {
    EXPECT_EQ(E.kind(), python::ErrorKind::InterpreterNotFound);
    EXPECT_NE(std::string{E.what()}.find("pyconfig-test-no-such-python"),
              std::string::npos);
  }
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
