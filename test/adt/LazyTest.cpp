/* SPDX-License-Identifier: GPL-3.0-only */
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "pyconfig/adt/Lazy.hpp"

/* NOLINTBEGIN(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */

using namespace pyconfig;

TEST(Lazy, ConstructsOnFirstAccessOnly)
{
  int Calls = 0;
  Lazy<std::string> L{[&Calls] {
    ++Calls;
    return std::string{"value"};
  }};
  ASSERT_EQ(Calls, 0);

  EXPECT_EQ(L.get(), "value");
  EXPECT_EQ(Calls, 1);
  EXPECT_EQ(L.get(), "value");
  EXPECT_EQ(Calls, 1);
}

TEST(Lazy, ReturnsTheSameInstance)
{
  Lazy<std::string> L{[] { return std::string{"x"}; }};
  std::string& First = L.get();
  First.append("y");
  EXPECT_EQ(&First, &L.get());
  EXPECT_EQ(L.get(), "xy");
}

TEST(Lazy, FailureIsNotRemembered)
{
  int Calls = 0;
  Lazy<int> L{[&Calls] {
    ++Calls;
    if (Calls == 1)
      throw std::runtime_error{"first call fails"};
    return Calls;
  }};

  EXPECT_THROW((void)L.get(), std::runtime_error);
  EXPECT_EQ(Calls, 1);

  EXPECT_EQ(L.get(), 2);
  EXPECT_EQ(L.get(), 2);
  EXPECT_EQ(Calls, 2);
}

/* NOLINTEND(cert-err58-cpp,cppcoreguidelines-avoid-goto,cppcoreguidelines-owning-memory)
 */
