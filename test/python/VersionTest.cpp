/* SPDX-License-Identifier: GPL-3.0-only */
#include <gtest/gtest.h>

#include "pyconfig/python/Version.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace pyconfig::python;

TEST(PythonVersion, ParseFullVersion)
{
  auto V = PythonVersion::parse("3.11.4");
  ASSERT_TRUE(V);
  EXPECT_EQ(V->Major, 3U);
  EXPECT_EQ(V->Minor, 11U);
  EXPECT_EQ(V->Patch, 4U);
  EXPECT_EQ(V->toString(), "3.11.4");
  EXPECT_EQ(V->shortString(), "3.11");
}

TEST(PythonVersion, ParseBannerAndShortForms)
{
  EXPECT_EQ(PythonVersion::parse("Python 3.7.2"), PythonVersion(3, 7, 2));
  EXPECT_EQ(PythonVersion::parse("Python 2.7.18\n"), PythonVersion(2, 7, 18));
  EXPECT_EQ(PythonVersion::parse("3.8"), PythonVersion(3, 8, 0));
}

TEST(PythonVersion, SuffixesAreIgnored)
{
  EXPECT_EQ(PythonVersion::parse("3.13.0rc1"), PythonVersion(3, 13, 0));
  EXPECT_EQ(PythonVersion::parse("2.7.18+"), PythonVersion(2, 7, 18));
  EXPECT_EQ(PythonVersion::parse("3.12.0a7"), PythonVersion(3, 12, 0));
}

TEST(PythonVersion, Malformed)
{
  EXPECT_FALSE(PythonVersion::parse(""));
  EXPECT_FALSE(PythonVersion::parse("Python"));
  EXPECT_FALSE(PythonVersion::parse("3"));
  EXPECT_FALSE(PythonVersion::parse("3."));
  EXPECT_FALSE(PythonVersion::parse("3.x"));
  EXPECT_FALSE(PythonVersion::parse("3.11."));
  EXPECT_FALSE(PythonVersion::parse("v3.11.4"));
  EXPECT_FALSE(PythonVersion::parse("3.11.4 and more"));
  EXPECT_FALSE(PythonVersion::parse("99999999999.1"));
}

TEST(PythonVersion, SemanticOrdering)
{
  EXPECT_LT(PythonVersion(2, 7, 18), PythonVersion(3, 0, 0));
  EXPECT_LT(PythonVersion(3, 7, 17), PythonVersion(3, 8, 0));
  // Minor versions compare numerically, not lexically.
  EXPECT_LT(PythonVersion(3, 9, 0), PythonVersion(3, 10, 0));
  EXPECT_LT(PythonVersion(3, 11, 3), PythonVersion(3, 11, 4));
  EXPECT_GE(PythonVersion(3, 8, 0), PythonVersion(3, 8));
  EXPECT_NE(PythonVersion(3, 8, 1), PythonVersion(3, 8));
}

TEST(PythonVersion, ConstantExpression)
{
  static constexpr PythonVersion Threshold{3, 8};
  static_assert(Threshold.Minor == 8, "constant-initialised");
  static_assert(PythonVersion(3, 7) < Threshold, "ordered at compile time");
  static_assert(PythonVersion(3, 8, 0) >= Threshold, "ordered at compile time");
  EXPECT_EQ(Threshold.toString(), "3.8.0");
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
