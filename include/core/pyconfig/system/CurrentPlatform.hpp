/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "pyconfig/Config.h"
#include "pyconfig/system/Platform.hpp"

namespace pyconfig::system
{

static constexpr PlatformTag CurrentPlatform =

#if PYCONFIG_PLATFORM_ID == PYCONFIG_PLATFORM_ID_Unsupported
  PlatformTag::Unsupported
#elif PYCONFIG_PLATFORM_ID == PYCONFIG_PLATFORM_ID_Unix
  PlatformTag::Unix
#endif /* PYCONFIG_PLATFORM_ID */

  ;

} // namespace pyconfig::system
