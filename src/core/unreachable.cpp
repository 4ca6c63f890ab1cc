/* SPDX-License-Identifier: LGPL-3.0-only */
#include <csignal>
#include <cstdio>
#include <cstdlib>

#include "pyconfig/unreachable.hpp"

namespace pyconfig::detail
{

[[noreturn]] void
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
unreachable_impl(const char* Msg, const char* File, std::size_t LineNo)
{
  /* NOLINTBEGIN(cppcoreguidelines-pro-type-vararg) */
  (void)std::fprintf(stderr, "FATAL! UNREACHABLE executed");
  if (File)
    (void)std::fprintf(stderr, " at %s:%zu", File, LineNo);

  if (Msg)
    (void)std::fprintf(stderr, ": %s!\n", Msg);
  else
    (void)std::fprintf(stderr, "!\n");
  /* NOLINTEND(cppcoreguidelines-pro-type-vararg) */

  // This is also reached in a forked child that failed to exec(), so do not
  // run the parent's atexit() handlers or flush its stdio buffers twice.
  std::_Exit(-SIGILL);
}

} // namespace pyconfig::detail
