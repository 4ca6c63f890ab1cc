/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cstdlib>
#include <utility>

#include "pyconfig/system/Environment.hpp"

#include "pyconfig/Log.hpp"
#define LOG(SEVERITY) pyconfig::log::SEVERITY("system/Environment")

namespace pyconfig::system
{

std::string getEnv(const std::string& Key)
{
  const char* const Value = std::getenv(Key.c_str());
  if (!Value)
  {
    PYCONFIG_TRACE_LOG(LOG(data) << "getEnv(" << Key << ") -> unset");
    return {};
  }
  PYCONFIG_TRACE_LOG(LOG(data) << "getEnv(" << Key << ") = " << Value);
  return {Value};
}

std::vector<std::string> splitSearchPath(const std::string& List,
                                         char Separator)
{
  std::vector<std::string> R;
  std::string::size_type Begin = 0;
  while (true)
  {
    std::string::size_type End = List.find(Separator, Begin);
    std::string Element = List.substr(
      Begin, End == std::string::npos ? std::string::npos : End - Begin);
    R.emplace_back(Element.empty() ? "." : std::move(Element));
    if (End == std::string::npos)
      break;
    Begin = End + 1;
  }
  return R;
}

ToolEnvironment ToolEnvironment::loadFromEnv()
{
  auto Load = [](const char* Key) -> std::optional<std::string> {
    std::string Value = getEnv(Key);
    if (Value.empty())
      return std::nullopt;
    return Value;
  };

  ToolEnvironment E;
  E.Interpreter = Load("PYCONFIG_INTERPRETER");
  E.Verbosity = Load("PYCONFIG_VERBOSITY");
  E.ReferenceScript = Load("PYCONFIG_REFERENCE_SCRIPT");

  if (E.Interpreter)
    LOG(debug) << "Interpreter from environment: " << *E.Interpreter;
  if (E.ReferenceScript)
    LOG(debug) << "Reference script from environment: " << *E.ReferenceScript;
  return E;
}

} // namespace pyconfig::system

#undef LOG
