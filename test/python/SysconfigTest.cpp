/* SPDX-License-Identifier: GPL-3.0-only */
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "pyconfig/python/Error.hpp"
#include "pyconfig/python/Interpreter.hpp"
#include "pyconfig/python/Sysconfig.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace pyconfig::python;

namespace
{

/// Counts the runs without answering anything.
class SilentInterpreter : public Interpreter
{
public:
  Output run(const std::vector<std::string>& /* Arguments */) override
  {
    ++Runs;
    return Output{};
  }
  const std::string& program() const noexcept override { return Name; }

  std::size_t Runs = 0;

private:
  std::string Name = "silent-python";
};

ErrorKind parseErrorKind(const std::vector<std::string>& Keys,
                         const std::string& Output)
{
  try
  {
    (void)SysconfigReply::parse(Keys, Output);
  }
  catch (const ConfigError& E)
  {
    return E.kind();
  }
  ADD_FAILURE() << "Parsing '" << Output << "' did not fail";
  return ErrorKind::QueryFailed;
}

} // namespace

TEST(SysconfigQuery, KeysInOrder)
{
  SysconfigQuery Q;
  Q.configVar("LIBS")
    .path("include")
    .distutilsInclude("platinclude")
    .sysAttribute("abiflags")
    .version();

  std::vector<std::string> Expected = {
    "var:LIBS", "path:include", "inc:platinclude", "sys:abiflags", "version"};
  EXPECT_EQ(Q.keys(), Expected);
  EXPECT_FALSE(Q.empty());
}

TEST(SysconfigQuery, EmptyQueryDoesNotRun)
{
  SilentInterpreter Python;
  SysconfigQuery Q;
  ASSERT_TRUE(Q.empty());
  SysconfigReply R = Q.run(Python);
  EXPECT_EQ(Python.Runs, 0U);
  EXPECT_THROW((void)R.get(SysconfigQuery::varKey("prefix")),
               std::out_of_range);

  Q.configVar("prefix");
  // The silent reply lacks the requested line.
  EXPECT_THROW((void)Q.run(Python), ConfigError);
  EXPECT_EQ(Python.Runs, 1U);
}

TEST(SysconfigReply, ValuesAndNone)
{
  std::vector<std::string> Keys = {"var:prefix", "var:LIBPYTHON", "var:SO"};
  SysconfigReply R =
    SysconfigReply::parse(Keys, "var:prefix=/usr\nvar:LIBPYTHON=\nvar:SO\n");

  EXPECT_EQ(R.value("var:prefix"), "/usr");
  EXPECT_EQ(R.value("var:LIBPYTHON"), "");
  EXPECT_FALSE(R.get("var:SO").has_value());
  EXPECT_EQ(R.valueOr("var:SO", "fallback"), "fallback");
  EXPECT_TRUE(R.words("var:SO").empty());
}

TEST(SysconfigReply, ValueMayContainSeparator)
{
  SysconfigReply R =
    SysconfigReply::parse({"var:CONFIG_ARGS"}, "var:CONFIG_ARGS=a=b c=d\n");
  EXPECT_EQ(R.value("var:CONFIG_ARGS"), "a=b c=d");
}

TEST(SysconfigReply, MissingValueIsReported)
{
  SysconfigReply R = SysconfigReply::parse({"var:LIBPL"}, "var:LIBPL\n");
  try
  {
    (void)R.value("var:LIBPL");
    FAIL() << "Expected a MissingValue error";
  }
  catch (const ConfigError& E)
  {
    EXPECT_EQ(E.kind(), ErrorKind::MissingValue);
    EXPECT_NE(std::string{E.what()}.find("var:LIBPL"), std::string::npos);
  }
}

TEST(SysconfigReply, UnqueriedKeyIsALogicError)
{
  SysconfigReply R = SysconfigReply::parse({"var:prefix"}, "var:prefix=/\n");
  EXPECT_THROW((void)R.get("var:exec_prefix"), std::out_of_range);
}

TEST(SysconfigReply, Words)
{
  SysconfigReply R = SysconfigReply::parse(
    {"var:LIBS"}, "var:LIBS=  -lpthread -ldl\t -lutil  \n");
  std::vector<std::string> Expected = {"-lpthread", "-ldl", "-lutil"};
  EXPECT_EQ(R.words("var:LIBS"), Expected);
}

TEST(SysconfigReply, Truthiness)
{
  std::vector<std::string> Keys = {"var:A", "var:B", "var:C", "var:D"};
  SysconfigReply R =
    SysconfigReply::parse(Keys, "var:A=1\nvar:B=0\nvar:C=\nvar:D\n");
  EXPECT_TRUE(R.truthy("var:A"));
  EXPECT_FALSE(R.truthy("var:B"));
  EXPECT_FALSE(R.truthy("var:C"));
  EXPECT_FALSE(R.truthy("var:D"));
}

TEST(SysconfigReply, CarriageReturnsAreStripped)
{
  SysconfigReply R = SysconfigReply::parse({"version"}, "version=3.11.4\r\n");
  EXPECT_EQ(R.value("version"), "3.11.4");
}

TEST(SysconfigReply, Malformed)
{
  std::vector<std::string> Two = {"var:prefix", "var:exec_prefix"};

  EXPECT_EQ(parseErrorKind(Two, ""), ErrorKind::MalformedOutput);
  EXPECT_EQ(parseErrorKind(Two, "var:prefix=/usr\n"),
            ErrorKind::MalformedOutput);
  EXPECT_EQ(parseErrorKind(Two, "var:exec_prefix=/usr\nvar:prefix=/usr\n"),
            ErrorKind::MalformedOutput);
  EXPECT_EQ(parseErrorKind(Two, "var:prefix=/usr\nvar:exec_prefix=/usr"),
            ErrorKind::MalformedOutput);
  EXPECT_EQ(
    parseErrorKind(Two, "var:prefix=/usr\nvar:exec_prefix=/usr\nextra\n"),
    ErrorKind::MalformedOutput);
  EXPECT_EQ(parseErrorKind({"var:LIBS"}, "var:LIBSX=-lm\n"),
            ErrorKind::MalformedOutput);
  EXPECT_EQ(parseErrorKind({"version"}, "Python 3.11.4\n"),
            ErrorKind::MalformedOutput);
}

TEST(Words, SplitAndJoin)
{
  EXPECT_TRUE(splitWords("").empty());
  EXPECT_TRUE(splitWords(" \t\n").empty());
  EXPECT_EQ(joinWords(splitWords("  -I/a   -I/b ")), "-I/a -I/b");
  EXPECT_EQ(joinWords({}), "");
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
