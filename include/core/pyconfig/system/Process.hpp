/**
 * Copyright (C) 2022 Whisperity
 *
 * SPDX-License-Identifier: GPL-3.0
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pyconfig/system/CurrentPlatform.hpp"
#include "pyconfig/system/Handle.hpp"
#include "pyconfig/system/ProcessTraits.hpp"

namespace pyconfig::system
{

using PlatformSpecificProcessTraits = ProcessTraits<CurrentPlatform>;

/// Responsible for creating, executing, and handling processes on the
/// system.
class Process
{
public:
  /// Type alias for the raw process handle type on the platform.
  using Raw = PlatformSpecificProcessTraits::RawTy;

  /// The exit code of a spawned child whose \p exec() failed, following the
  /// convention of POSIX shells for "command not executable".
  static constexpr int ExecFailureExitCode = 127;

  struct SpawnOptions
  {
    std::string Program;
    std::vector<std::string> Arguments;
    std::map<std::string, std::optional<std::string>> Environment;

    /// Override the standard streams of the spawned process to the
    /// handles specified. If an invalid handle is given, the potentially
    /// inherited standard stream will be closed.
    std::optional<Handle::Raw> StandardInput, StandardOutput, StandardError;
  };

  virtual ~Process() = default;

  Raw raw() const noexcept { return Handle; }

  /// Blocks until the current process instance has terminated.
  virtual void wait() = 0;

  /// \returns whether the child process has been \b OBSERVED to be dead.
  bool dead() const noexcept { return Dead; }

  /// \returns the exit code of the process, if it has already terminated.
  /// A process killed by a signal reports the negated signal number.
  ///
  /// \throws std::logic_error if the process was not yet observed dead.
  int exitCode() const;

protected:
  Raw Handle = PlatformSpecificProcessTraits::Invalid;
  bool Dead = false;
  int ExitCode = 0;

public:
  /// Replaces the current process (as if by calling the \p exec() family) in
  /// the system with the started one. This is a low-level operation that
  /// performs no additional meaningful setup of process state.
  ///
  /// \warning This command does \b NOT \p fork()!
  [[noreturn]] static void exec(const SpawnOptions& Opts);

  /// Spawns a new process based on the specified \p Opts. This process calls
  /// \p fork() internally, and then does an \p exec().
  ///
  /// The spawned process will be the child of the current process. The call
  /// returns the handle of the child, and execution resumes normally in the
  /// parent. If the \p exec() fails in the child, the child exits with
  /// \p ExecFailureExitCode.
  ///
  /// \note This call does \b NOT return in the child!
  static std::unique_ptr<Process> spawn(const SpawnOptions& Opts);
};

} // namespace pyconfig::system
