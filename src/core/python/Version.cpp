/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cctype>
#include <limits>

#include "pyconfig/python/Version.hpp"

namespace pyconfig::python
{

namespace
{

/// Consumes a non-empty run of decimal digits from the front of \p Str.
std::optional<unsigned int> eatNumber(std::string_view& Str)
{
  std::size_t Pos = 0;
  unsigned long Value = 0;
  while (Pos < Str.size() &&
         std::isdigit(static_cast<unsigned char>(Str[Pos])))
  {
    Value = Value * 10 + static_cast<unsigned long>(Str[Pos] - '0');
    if (Value > std::numeric_limits<unsigned int>::max())
      return std::nullopt;
    ++Pos;
  }
  if (Pos == 0)
    return std::nullopt;
  Str.remove_prefix(Pos);
  return static_cast<unsigned int>(Value);
}

std::string_view trim(std::string_view Str)
{
  while (!Str.empty() && std::isspace(static_cast<unsigned char>(Str.front())))
    Str.remove_prefix(1);
  while (!Str.empty() && std::isspace(static_cast<unsigned char>(Str.back())))
    Str.remove_suffix(1);
  return Str;
}

/// A version suffix is a pre-release marker, a local marker, or a build tag.
bool isValidSuffix(std::string_view Str)
{
  if (Str.empty())
    return true;
  if (Str.front() == '+')
    return true;
  return std::isalpha(static_cast<unsigned char>(Str.front())) != 0;
}

} // namespace

std::optional<PythonVersion> PythonVersion::parse(std::string_view Str)
{
  Str = trim(Str);
  static constexpr std::string_view Banner = "Python ";
  if (Str.substr(0, Banner.size()) == Banner)
    Str = trim(Str.substr(Banner.size()));

  PythonVersion V;
  std::optional<unsigned int> Major = eatNumber(Str);
  if (!Major || Str.empty() || Str.front() != '.')
    return std::nullopt;
  Str.remove_prefix(1);
  V.Major = *Major;

  std::optional<unsigned int> Minor = eatNumber(Str);
  if (!Minor)
    return std::nullopt;
  V.Minor = *Minor;

  if (!Str.empty() && Str.front() == '.')
  {
    Str.remove_prefix(1);
    std::optional<unsigned int> Patch = eatNumber(Str);
    if (!Patch)
      return std::nullopt;
    V.Patch = *Patch;
  }

  if (!isValidSuffix(Str))
    return std::nullopt;
  return V;
}

std::string PythonVersion::toString() const
{
  return std::to_string(Major) + '.' + std::to_string(Minor) + '.' +
         std::to_string(Patch);
}

std::string PythonVersion::shortString() const
{
  return std::to_string(Major) + '.' + std::to_string(Minor);
}

} // namespace pyconfig::python
