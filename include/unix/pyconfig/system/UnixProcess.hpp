/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include "pyconfig/system/Process.hpp"

namespace pyconfig::system::unix
{

/// Responsible for creating, executing, and handling processes on the
/// system.
class Process : public system::Process
{
public:
  /// Blocks until the child has terminated, and reaps it.
  ///
  /// \see waitpid(2)
  void wait() override;
};

} // namespace pyconfig::system::unix
