/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>

#include "pyconfig/system/Pipe.hpp"
#include "pyconfig/system/fd.hpp"

namespace pyconfig::system::unix
{

/// This class wraps one end of a nameless Unix pipe, and allows reading from
/// it.
class Pipe : public system::Pipe
{
public:
  /// Creates a new unnamed pipe which will be owned by the current instance,
  /// and cleaned up on exit.
  ///
  /// Both ends are created \e close-on-exec, unless \p InheritInChild is
  /// true. Redirecting an end onto a standard stream of a child with \p dup2()
  /// makes the new descriptor inheritable regardless.
  ///
  /// \see pipe2(2)
  [[nodiscard]] static AnonymousPipe create(bool InheritInChild = false);

  ~Pipe() noexcept override = default;
  Pipe(Pipe&&) noexcept = default;
  Pipe& operator=(Pipe&&) noexcept = default;

protected:
  Pipe(fd::raw_fd FD, std::string Identifier, Mode OpenMode);

  [[nodiscard]] std::string readImpl(std::size_t Bytes,
                                     bool& Continue) override;
};

} // namespace pyconfig::system::unix
