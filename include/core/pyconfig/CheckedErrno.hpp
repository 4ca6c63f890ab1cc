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
#include <cerrno>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace pyconfig
{

namespace detail
{

/// The outcome of a system call executed through \p CheckedErrno().
template <typename R> struct Result
{
private:
  R Value;
  bool Errored;
  std::error_code ErrorCode;

public:
  Result(R&& Value, bool Errored, std::error_code Error)
    : Value(std::move(Value)), Errored(Errored), ErrorCode(Error)
  {}

  explicit operator bool() const noexcept { return !Errored; }
  std::error_code getError() const noexcept { return ErrorCode; }
  R& get() noexcept { return Value; }
  const R& get() const noexcept { return Value; }
};

} // namespace detail

/// Allows executing a system call with automatically handled \p errno checking.
///
/// Clients MUST pass a lambda that returns the value of the system call, and
/// list ALL the values which might indicate a FAILED system call.
///
/// The result of the call itself is obtainable from the return value of this
/// function. \p errno is captured only if the call failed, so a stale value
/// left behind by an earlier call is never reported.
///
/// Example:
///
///   \code{.cpp}
///   auto Read = CheckedErrno([&] {
///     return ::read(FD, Buffer, sizeof(Buffer));
///   }, /* ErrorIndicatingReturnValue =*/-1);
///
///   if (!Read && Read.getError() == std::errc::interrupted) {
///     // Try again.
///   }
///   Read.get(); // The number of bytes read.
///   \endcode
template <typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedErrno(Fn&& F, ErrTys&&... ErrorValues) noexcept
{
  using namespace pyconfig::detail;
  static_assert(!std::is_same_v<decltype(F()), void>,
                "Lambda must return something!");

  errno = 0;
  auto ReturnValue = F();
  bool Errored = (false || ... || (ReturnValue == ErrorValues));
  std::error_code EC;
  if (Errored)
    EC = std::make_error_code(static_cast<std::errc>(errno));
  return Result<decltype(ReturnValue)>{std::move(ReturnValue), Errored, EC};
}

/// Allows executing a system call with translating an error to an exception.
///
/// Clients MUST pass a lambda that returns the value of the system call, and
/// list ALL the values which might indicate a FAILED system call.
///
/// The result of the call itself is returned by this function.
/// If the call fails, this function throws an \p std::system_error with
/// \p ErrMsg as its description.
///
/// Example:
///
///   \code{.cpp}
///   pid_t Child = CheckedErrnoThrow([] { return ::fork(); }, "fork()", -1);
///   \endcode
template <typename Fn, typename... ErrTys>
decltype(auto)
// NOLINTNEXTLINE(readability-identifier-naming)
CheckedErrnoThrow(Fn&& F, const std::string& ErrMsg, ErrTys&&... ErrorValues)
{
  auto Result =
    CheckedErrno(std::forward<Fn>(F), std::forward<ErrTys>(ErrorValues)...);
  if (!Result)
    throw std::system_error{Result.getError(), ErrMsg};

  // Make sure to not return an `int &` or something similar dangling!
  std::remove_reference_t<decltype(Result.get())> Copy = Result.get();
  return Copy;
}

} // namespace pyconfig
