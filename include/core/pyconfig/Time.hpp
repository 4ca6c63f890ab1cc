/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace pyconfig
{

/// Formats the given \p Chrono \p Time object to an ISO 8601-like timestamp
/// with the local time zone, as used in the log prefixes.
template <typename T> [[nodiscard]] std::string formatTime(const T& Time)
{
  std::time_t RawTime = T::clock::to_time_t(Time);
  std::tm SplitTime{};
  ::localtime_r(&RawTime, &SplitTime);

  std::ostringstream Buf;
  Buf << std::put_time(&SplitTime, "%Y-%m-%d %H:%M:%S");
  return Buf.str();
}

} // namespace pyconfig
