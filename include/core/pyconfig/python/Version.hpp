/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace pyconfig::python
{

/// The version of a Python installation, ordered like a semantic version.
struct PythonVersion
{
  unsigned int Major = 0;
  unsigned int Minor = 0;
  unsigned int Patch = 0;

  constexpr PythonVersion() = default;
  constexpr PythonVersion(unsigned int Major,
                          unsigned int Minor,
                          unsigned int Patch = 0)
    : Major(Major), Minor(Minor), Patch(Patch)
  {}

  /// Parses \p X.Y.Z, \p X.Y or the \p "Python X.Y.Z" banner of
  /// \p "python --version". A pre-release or local suffix directly after the
  /// last number (\p 3.13.0rc1, \p 2.7.18+) is ignored.
  ///
  /// \returns \p std::nullopt if \p Str is not a version.
  [[nodiscard]] static std::optional<PythonVersion> parse(std::string_view Str);

  /// Formats the version as \p X.Y.Z.
  [[nodiscard]] std::string toString() const;
  /// Formats the version as \p X.Y, the way \p VERSION is set in sysconfig.
  [[nodiscard]] std::string shortString() const;

  constexpr bool operator==(const PythonVersion& RHS) const noexcept
  {
    return tie() == RHS.tie();
  }
  constexpr bool operator!=(const PythonVersion& RHS) const noexcept
  {
    return tie() != RHS.tie();
  }
  constexpr bool operator<(const PythonVersion& RHS) const noexcept
  {
    return tie() < RHS.tie();
  }
  constexpr bool operator<=(const PythonVersion& RHS) const noexcept
  {
    return tie() <= RHS.tie();
  }
  constexpr bool operator>(const PythonVersion& RHS) const noexcept
  {
    return tie() > RHS.tie();
  }
  constexpr bool operator>=(const PythonVersion& RHS) const noexcept
  {
    return tie() >= RHS.tie();
  }

private:
  [[nodiscard]] constexpr std::tuple<unsigned int, unsigned int, unsigned int>
  tie() const noexcept
  {
    return std::make_tuple(Major, Minor, Patch);
  }
};

} // namespace pyconfig::python
