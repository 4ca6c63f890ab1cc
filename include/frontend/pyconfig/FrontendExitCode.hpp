/* SPDX-License-Identifier: GPL-3.0-only */
#pragma once

namespace pyconfig
{

/// Contains the exit codes the \p python-config \p main() functions return
/// with.
enum class FrontendExitCode : int
{
  /// Successful execution, every requested value was printed.
  Success = 0,

  /// Values specified on the command-line are erroneous. This is the code the
  /// reference scripts exit with after printing their usage.
  InvocationError = 1,

  /// The interpreter could not be found or started.
  SystemError = 2,

  /// Nonspecific other failure, e.g. a value could not be determined.
  Failure = 3,
};

} // namespace pyconfig
