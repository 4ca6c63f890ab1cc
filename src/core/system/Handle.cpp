/* SPDX-License-Identifier: LGPL-3.0-only */
#include "pyconfig/system/Handle.hpp"

#include "pyconfig/Log.hpp"
#define LOG(SEVERITY) pyconfig::log::SEVERITY("system/Handle")

namespace pyconfig::system
{

Handle::Handle(Raw Value) noexcept : Value(Value)
{
  PYCONFIG_TRACE_LOG(LOG(data) << "Owning handle #" << Value);
}

void Handle::reset() noexcept
{
  if (!has())
    return;

  PYCONFIG_TRACE_LOG(LOG(data) << "Closing handle #" << Value);
  PlatformSpecificHandleTraits::close(release());
}

} // namespace pyconfig::system

#undef LOG
