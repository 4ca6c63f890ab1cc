/* SPDX-License-Identifier: LGPL-3.0-only */

/* This file contains the CMake-level configuration variables that are exposed
 * to the compilers executed.
 */
#ifndef PYCONFIG_CONFIG_H
#define PYCONFIG_CONFIG_H

#if __cplusplus >= 201103L
/* Expose something in the \p pyconfig::config namespace if in C++ mode. */
#define EXPOSE_CONFIG(NAME, VALUE)                                             \
  namespace pyconfig                                                           \
  {                                                                            \
  namespace config                                                             \
  {                                                                            \
  constexpr bool NAME = VALUE;                                                 \
  }                                                                            \
  }
#else /* __cplusplus < 201103L */
#define EXPOSE_CONFIG(NAME, VALUE)
#endif /* __cplusplus */

/* If true, the built binary will contain some additional log outputs that are
 * needed for verbose debugging of the project, such as every spawned process
 * and every raw reply of the interpreter.
 *
 * Turn off to cut down further on the binary size for production.
 */
#cmakedefine01 PYCONFIG_NON_ESSENTIAL_LOGS
EXPOSE_CONFIG(NonEssentialLogs, PYCONFIG_NON_ESSENTIAL_LOGS)

/* If true, the reference 'python-config' of the build host is the Python
 * script variant (as on Darwin), otherwise the shell script variant that
 * CPython installs on other Unix-like systems.
 *
 * This is only the fallback when the installed script cannot be inspected.
 */
#cmakedefine01 PYCONFIG_DEFAULT_PYTHON_SCRIPT_FLAVOUR
EXPOSE_CONFIG(DefaultPythonScriptFlavour,
              PYCONFIG_DEFAULT_PYTHON_SCRIPT_FLAVOUR)

/* The system platform (string) that the current build is being done on. */
#define PYCONFIG_PLATFORM "${PYCONFIG_PLATFORM}"

/* Define some constants for the platforms that are supported.
 * These values will be used (exactly one of them) in PYCONFIG_PLATFORM_ID
 * to support a numerical comparison (e.g.,
 *     #if PYCONFIG_PLATFORM_ID == PYCONFIG_PLATFORM_ID_Unix
 * ) for more complex code where a simple #if(n)def does not suffice.
 */
/* NOLINTBEGIN(modernize-macro-to-enum) */
#define PYCONFIG_PLATFORM_ID_Unsupported 0
#define PYCONFIG_PLATFORM_ID_Unix 1
/* NOLINTEND(modernize-macro-to-enum) */

/* The current platform's ID. Always selected from the PYCONFIG_PLATFORM_ID_*
 * macros at build time.
 */
/* clang-format off */
#define PYCONFIG_PLATFORM_ID PYCONFIG_PLATFORM_ID_${PYCONFIG_PLATFORM}
/* clang-format on */

/* If set, the PLATFORM is "Unix". Shorthand for the == check on the ID. */
#cmakedefine PYCONFIG_PLATFORM_UNIX

/* The build type for the current build. */
#define PYCONFIG_BUILD_TYPE "${CMAKE_BUILD_TYPE}"

#undef EXPOSE_CONFIG

#endif /* PYCONFIG_CONFIG_H */
