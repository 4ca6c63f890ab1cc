/* SPDX-License-Identifier: GPL-3.0-only */
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "pyconfig/system/Pipe.hpp"
#include "pyconfig/system/Platform.hpp"
#include "pyconfig/system/Process.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace pyconfig::system;

namespace
{

struct Result
{
  int ExitCode;
  std::string Out;
  std::string Err;
};

Result run(const std::string& Program,
           const std::vector<std::string>& Args,
           const std::optional<std::string>& Interpreter)
{
  Pipe::AnonymousPipe OutPipe = Pipe::create();
  Pipe::AnonymousPipe ErrPipe = Pipe::create();

  Process::SpawnOptions Opts;
  Opts.Program = Program;
  Opts.Arguments = Args;
  Opts.StandardOutput = OutPipe.getWrite()->raw();
  Opts.StandardError = ErrPipe.getWrite()->raw();
  Opts.Environment["PYCONFIG_VERBOSITY"] = std::nullopt;
  Opts.Environment["PYCONFIG_REFERENCE_SCRIPT"] = std::nullopt;
  Opts.Environment["PYCONFIG_INTERPRETER"] = Interpreter;

  std::unique_ptr<Process> Child = Process::spawn(Opts);
  std::unique_ptr<Pipe> Out = OutPipe.takeRead();
  std::unique_ptr<Pipe> Err = ErrPipe.takeRead();

  Result R;
  std::vector<std::string> Streams = Pipe::readAllOf({Out.get(), Err.get()});
  R.Out = std::move(Streams.at(0));
  R.Err = std::move(Streams.at(1));
  Child->wait();
  R.ExitCode = Child->exitCode();
  return R;
}

/// Removes the spaces, as runs of them depend on which variables are empty.
std::string withoutSpaces(const std::string& Str)
{
  std::string R;
  for (char C : Str)
    if (C != ' ')
      R.push_back(C);
  return R;
}

/// Removes "Usage:" and the program name from the front of a usage line.
std::string withoutProgramName(const std::string& Usage)
{
  static const std::string Head = "Usage: ";
  if (Usage.compare(0, Head.size(), Head) != 0)
    return Usage;
  std::string::size_type FlagsAt = Usage.find(' ', Head.size());
  if (FlagsAt == std::string::npos)
    return Usage;
  return Usage.substr(FlagsAt + 1);
}

/// Runs a built python-config and the one installed on the system with the
/// same arguments.
class EquivalenceBase : public ::testing::Test
{
protected:
  std::string Ours;
  std::string Reference;
  std::optional<std::string> Interpreter;

  /// Finds the first of \p ReferenceNames on the \p PATH and the first of
  /// \p InterpreterNames beside it.
  ///
  /// \returns why the comparison cannot run, if it cannot.
  std::optional<std::string>
  locate(const char* Built,
         std::initializer_list<const char*> ReferenceNames,
         std::initializer_list<const char*> InterpreterNames)
  {
    if (!Built)
      return std::string{"The path of the built script is not known"};
    Ours = Built;

    for (const char* Name : ReferenceNames)
      if (std::optional<std::string> Ref = Platform::findExecutable(Name))
      {
        Reference = *Ref;
        break;
      }
    if (Reference.empty())
      return "No " + std::string{*ReferenceNames.begin()} +
             " installed on the system";

    // Query the interpreter installed beside the reference script.
    std::string Dir = Reference.substr(0, Reference.find_last_of('/') + 1);
    for (const char* Name : InterpreterNames)
      if (Platform::isExecutableFile(Dir + Name))
      {
        Interpreter = Dir + Name;
        break;
      }
    return std::nullopt;
  }

  void expectSameValues(const std::vector<std::string>& Args)
  {
    Result Expected = run(Reference, Args, Interpreter);
    Result Actual = run(Ours, Args, Interpreter);

    std::string Invocation;
    for (const std::string& A : Args)
      Invocation += ' ' + A;

    EXPECT_EQ(Actual.ExitCode, Expected.ExitCode) << Invocation;
    EXPECT_EQ(withoutSpaces(Actual.Out), withoutSpaces(Expected.Out))
      << Invocation;
    EXPECT_EQ(Actual.Err, Expected.Err) << Invocation;
  }

  void expectSameUsage(const std::vector<std::string>& Args)
  {
    Result Expected = run(Reference, Args, Interpreter);
    Result Actual = run(Ours, Args, Interpreter);

    std::string Invocation;
    for (const std::string& A : Args)
      Invocation += ' ' + A;

    EXPECT_EQ(Actual.ExitCode, Expected.ExitCode) << Invocation;
    EXPECT_EQ(withoutProgramName(Actual.Out),
              withoutProgramName(Expected.Out))
      << Invocation;
    EXPECT_EQ(withoutProgramName(Actual.Err),
              withoutProgramName(Expected.Err))
      << Invocation;
  }
};

class Equivalence : public EquivalenceBase
{
protected:
  void SetUp() override
  {
#ifdef PYCONFIG_TEST_PYTHON3_CONFIG
    const char* Built = PYCONFIG_TEST_PYTHON3_CONFIG;
#else
    const char* Built = nullptr;
#endif
    if (std::optional<std::string> Skip =
          locate(Built, {"python3-config"}, {"python3"}))
      GTEST_SKIP() << *Skip;
  }
};

class Equivalence2 : public EquivalenceBase
{
protected:
  void SetUp() override
  {
#ifdef PYCONFIG_TEST_PYTHON2_CONFIG
    const char* Built = PYCONFIG_TEST_PYTHON2_CONFIG;
#else
    const char* Built = nullptr;
#endif
    if (std::optional<std::string> Skip =
          locate(Built,
                 {"python2-config", "python2.7-config"},
                 {"python2", "python2.7"}))
      GTEST_SKIP() << *Skip;
    // Without an interpreter beside the script, ours would run python3.
    if (!Interpreter)
      Interpreter = Platform::findExecutable("python2");
    if (!Interpreter)
      GTEST_SKIP() << "No python2 interpreter installed on the system";
  }
};

} // namespace

TEST_F(Equivalence, SingleFlags)
{
  for (const char* Flag : {"--prefix",
                           "--exec-prefix",
                           "--includes",
                           "--libs",
                           "--cflags",
                           "--ldflags",
                           "--extension-suffix",
                           "--abiflags",
                           "--configdir"})
    expectSameValues({Flag});
}

TEST_F(Equivalence, MultipleFlags)
{
  expectSameValues({"--cflags", "--libs", "--prefix"});
  expectSameValues({"--ldflags", "--ldflags"});
}

TEST_F(Equivalence, Embed)
{
  Result Help = run(Reference, {"--help"}, Interpreter);
  if ((Help.Out + Help.Err).find("--embed") == std::string::npos)
    GTEST_SKIP() << "The installed Python predates --embed";

  expectSameValues({"--libs", "--embed"});
  expectSameValues({"--embed", "--ldflags"});
  expectSameValues({"--embed"});
}

TEST_F(Equivalence, Usage)
{
  expectSameUsage({});
  expectSameUsage({"--help"});
  expectSameUsage({"--bogus"});
  expectSameUsage({"--prefix", "--bogus"});
}

TEST_F(Equivalence2, SingleFlags)
{
  for (const char* Flag : {"--prefix",
                           "--exec-prefix",
                           "--includes",
                           "--libs",
                           "--cflags",
                           "--ldflags"})
    expectSameValues({Flag});
}

TEST_F(Equivalence2, MultipleFlags)
{
  expectSameValues({"--libs", "--ldflags", "--includes"});
}

TEST_F(Equivalence2, Usage)
{
  expectSameUsage({});
  expectSameUsage({"--help"});
  expectSameUsage({"--abiflags"});
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
