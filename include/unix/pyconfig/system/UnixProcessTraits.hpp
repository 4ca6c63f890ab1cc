/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <unistd.h>

#include "pyconfig/system/Platform.hpp"

namespace pyconfig::system
{

template <> struct ProcessTraits<PlatformTag::Unix>
{
  /// Type alias for the raw process handle type on the platform.
  using raw_handle = ::pid_t;
  using RawTy = raw_handle;

  /// A magic constant representing the invalid process.
  static constexpr RawTy Invalid = -1;
};

} // namespace pyconfig::system
