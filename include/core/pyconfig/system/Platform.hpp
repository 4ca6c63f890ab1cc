/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <optional>
#include <string>

#include "pyconfig/Config.h"

/// A generic macro that prints to some \p ostream the prefix for a "platform
/// not supported" message.
#define PYCONFIG_FEED_PLATFORM_NOT_SUPPORTED_MESSAGE                           \
  "ERROR: The current platform " << '(' << PYCONFIG_PLATFORM << ')'            \
                                 << " does not support "

namespace pyconfig::system
{

enum class PlatformTag
{
  Unsupported = PYCONFIG_PLATFORM_ID_Unsupported,

  /// Standard UNIX and POSIX systems, most importantly Linux.
  Unix = PYCONFIG_PLATFORM_ID_Unix
};

/// Dummy class that is implemented by platform-specific details to provide
/// business logic to \p Handle and keep it as a value-semantics-capable class.
template <PlatformTag> struct HandleTraits
{};

/// Dummy class that is implemented by platform-specific details to provide
/// business logic to \p Process.
template <PlatformTag> struct ProcessTraits
{};

/// Base class for querying and building platform-specific bits of information.
class Platform
{
public:
  /// Resolves \p Program to the file that would be executed for it.
  ///
  /// If \p Program contains a directory separator, it is checked as-is.
  /// Otherwise the directories listed in the \p PATH environment variable are
  /// searched, in order, for an executable regular file named \p Program.
  ///
  /// \returns the path to the executable, or \p std::nullopt if none found.
  [[nodiscard]] static std::optional<std::string>
  findExecutable(const std::string& Program);

  /// \returns whether \p Path names an existing, executable regular file.
  [[nodiscard]] static bool isExecutableFile(const std::string& Path);
};

} // namespace pyconfig::system
