/* SPDX-License-Identifier: GPL-3.0-only */
#include <gtest/gtest.h>

#include "pyconfig/Log.hpp"

int main(int argc, char* argv[])
{
  ::testing::InitGoogleTest(&argc, argv);

  // Many tests provoke failures on purpose, do not flood the output.
  pyconfig::log::Logger::get().setLimit(pyconfig::log::Fatal);

  return RUN_ALL_TESTS();
}
