/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <string>

#include "pyconfig/system/CurrentPlatform.hpp"
#include "pyconfig/system/HandleTraits.hpp"

namespace pyconfig::system
{

using PlatformSpecificHandleTraits = HandleTraits<CurrentPlatform>;

/// Represents the abstract notion of a resource handle. The release of the
/// underlying OS-level resource should be taken care of at the end of the
/// life of \p Handle.
class Handle
{
public:
  using Raw = PlatformSpecificHandleTraits::RawTy;

protected:
  Raw Value;

  Handle(Raw Value) noexcept;

public:
  /// Creates an empty handle that does not wrap anything.
  Handle() noexcept : Value(PlatformSpecificHandleTraits::Invalid) {}

  Handle(const Handle&) = delete;
  Handle& operator=(const Handle&) = delete;
  Handle(Handle&& RHS) noexcept : Value(RHS.release()) {}
  Handle& operator=(Handle&& RHS) noexcept
  {
    if (this == &RHS)
      return *this;
    reset();
    Value = RHS.release();
    return *this;
  }

  /// When the wrapper dies, if the object owned a resource, close it.
  ~Handle() noexcept { reset(); }

  /// Closes the owned resource, if any, and empties the handle.
  void reset() noexcept;

  /// \returns true if the handle is owning a resource.
  [[nodiscard]] bool has() const noexcept { return isValid(get()); }

  /// \returns true if the raw handle refers to a resource.
  [[nodiscard]] static bool isValid(Raw Value) noexcept
  {
    return Value != PlatformSpecificHandleTraits::Invalid;
  }

  /// Convert to the system primitive type.
  [[nodiscard]] Raw get() const noexcept { return Value; }

  /// Takes the resource from the current object and changes it to not
  /// manage anything.
  [[nodiscard]] Raw release() noexcept
  {
    Raw H = Value;
    Value = PlatformSpecificHandleTraits::Invalid;
    return H;
  }

  [[nodiscard]] std::string
  to_string() const // NOLINT(readability-identifier-naming)
  {
    return PlatformSpecificHandleTraits::to_string(Value);
  }
};

} // namespace pyconfig::system
