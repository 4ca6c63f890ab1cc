/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "pyconfig/Config.h"

#ifdef PYCONFIG_PLATFORM_UNIX
#include "pyconfig/system/UnixProcessTraits.hpp"
#endif /* PYCONFIG_PLATFORM_UNIX */
