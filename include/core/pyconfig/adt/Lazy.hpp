/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace pyconfig
{

/// Implements a simple, lazy-initialised wrapper of \p T which will construct
/// the object on the first access by running \p EnterFunction.
///
/// If \p EnterFunction throws, nothing is stored, the exception propagates to
/// the caller of \p get(), and the next \p get() runs \p EnterFunction again.
template <class T, typename EnterFunction = std::function<T()>> class Lazy
{
  static constexpr bool IsNoexceptConstruction =
    std::is_nothrow_invocable_v<EnterFunction&> &&
    std::is_nothrow_constructible_v<T, std::invoke_result_t<EnterFunction&>>;

public:
  /// Constructs a \p Lazy object that will initialise the underlying instance
  /// by executing the \p Enter function.
  explicit Lazy(EnterFunction&& Enter) noexcept(
    std::is_nothrow_move_constructible_v<EnterFunction>)
    : EnterFn(std::move(Enter))
  {}

  Lazy(const Lazy&) = delete;
  Lazy(Lazy&&) = delete;
  Lazy& operator=(const Lazy&) = delete;
  Lazy& operator=(Lazy&&) = delete;
  ~Lazy() = default;

  /// \returns the underlying instance.
  ///
  /// If it is not constructed yet, it is first constructed by calling the
  /// \p EnterFunction.
  T& get() noexcept(IsNoexceptConstruction)
  {
    if (!Value)
      Value.emplace(EnterFn());
    return *Value;
  }

private:
  std::optional<T> Value;
  EnterFunction EnterFn;
};

} // namespace pyconfig
