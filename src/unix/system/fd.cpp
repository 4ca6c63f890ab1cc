/* SPDX-License-Identifier: LGPL-3.0-only */
#include <unistd.h>

#include "pyconfig/CheckedErrno.hpp"

#include "pyconfig/system/fd.hpp"

#include "pyconfig/Log.hpp"
#define LOG(SEVERITY) pyconfig::log::SEVERITY("system/fd")

namespace pyconfig::system
{

void HandleTraits<PlatformTag::Unix>::close(raw_fd FD) noexcept
{
  PYCONFIG_TRACE_LOG(LOG(data) << "Closing FD #" << FD << "...");
  auto Closed = CheckedErrno([FD] { return ::close(FD); }, -1);
  if (!Closed)
    LOG(warn) << "close(" << FD << ") failed: " << Closed.getError().message();
}

std::string HandleTraits<PlatformTag::Unix>::to_string(raw_fd FD)
{
  return std::to_string(FD);
}

namespace unix
{

fd::fd(raw_fd Value) noexcept : Handle(Value) {}

fd::raw_fd fd::fileno(std::FILE* File)
{
  return CheckedErrnoThrow([File] { return ::fileno(File); }, "fileno()", -1);
}

void fd::replace(raw_fd Original, raw_fd With)
{
  if (With == Traits::Invalid)
  {
    Traits::close(Original);
    return;
  }
  if (With == Original)
    return;

  CheckedErrnoThrow([=] { return ::dup2(With, Original); }, "dup2()", -1);
  Traits::close(With);
}

} // namespace unix
} // namespace pyconfig::system

#undef LOG
