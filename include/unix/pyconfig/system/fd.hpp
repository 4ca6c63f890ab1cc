/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstdio>

#include <fcntl.h>

#include "pyconfig/system/Handle.hpp"

namespace pyconfig::system::unix
{

/// This is a smart file descriptor wrapper which will call \p close() on the
/// underyling resource at the end of its life.
///
/// \note \p fd is not a polymorphic class. Due to using the \p HandleTraits
/// detail implementation, it is always safe to assign an \p fd instance to a
/// \p Handle instance.
class fd : public Handle // NOLINT(readability-identifier-naming)
{
public:
  using Traits = HandleTraits<PlatformTag::Unix>;

  /// The file descriptor type on a POSIX system.
  using raw_fd = Traits::raw_fd;

  /// Creates an empty file descriptor that does not wrap anything.
  fd() noexcept = default;

  /// Wrap the raw platform resource handle into the RAII object.
  fd(raw_fd Value) noexcept;

  /// Returns the \b raw file descriptor for the standard C I/O object.
  [[nodiscard]] static raw_fd fileno(std::FILE* File);

  /// Replaces the descriptor \p Original with a duplicate of \p With, then
  /// closes \p With. If \p With is invalid, \p Original is closed instead.
  ///
  /// \see dup2(2)
  static void replace(raw_fd Original, raw_fd With);
};

static_assert(sizeof(Handle) == sizeof(fd),
              "Handle implementation MUST be non-polymorphic!");

} // namespace pyconfig::system::unix
