/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <algorithm>
#include <iterator>
#include <utility>

/* NOLINTBEGIN(readability-identifier-naming) */

namespace pyconfig::ranges
{

#define PYCONFIG_RANGE_OVERLOAD_1(FUNCTION, TEMPLATE_PARAM, PARAM_NAME)        \
  template <typename Range, typename TEMPLATE_PARAM>                           \
  [[nodiscard]] auto FUNCTION(Range&& R, TEMPLATE_PARAM&& PARAM_NAME)          \
  {                                                                            \
    using std::begin, std::end;                                                \
    return std::FUNCTION(                                                      \
      begin(R), end(R), std::forward<TEMPLATE_PARAM>(PARAM_NAME));             \
  }

PYCONFIG_RANGE_OVERLOAD_1(any_of, Predicate, P);
PYCONFIG_RANGE_OVERLOAD_1(find_if, Predicate, P);

#undef PYCONFIG_RANGE_OVERLOAD_1

template <typename Range, typename T>
[[nodiscard]] bool contains(Range&& R, const T& V)
{
  using std::begin, std::end;
  return std::find(begin(R), end(R), V) != end(R);
}

} // namespace pyconfig::ranges

/* NOLINTEND(readability-identifier-naming) */
