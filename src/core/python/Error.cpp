/* SPDX-License-Identifier: LGPL-3.0-only */
#include "pyconfig/unreachable.hpp"

#include "pyconfig/python/Error.hpp"

namespace pyconfig::python
{

const char* kindName(ErrorKind K) noexcept
{
  switch (K)
  {
    case ErrorKind::InterpreterNotFound:
      return "interpreter not found";
    case ErrorKind::QueryFailed:
      return "query failed";
    case ErrorKind::MalformedOutput:
      return "malformed output";
    case ErrorKind::MissingValue:
      return "missing value";
    case ErrorKind::UnsupportedField:
      return "unsupported field";
  }
  unreachable("Unknown ErrorKind");
}

ConfigError::ConfigError(ErrorKind Kind, const std::string& Message)
  : std::runtime_error(Message), Kind(Kind)
{}

} // namespace pyconfig::python
