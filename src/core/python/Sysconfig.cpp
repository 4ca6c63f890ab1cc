/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cctype>
#include <stdexcept>

#include "pyconfig/python/Error.hpp"
#include "pyconfig/python/Interpreter.hpp"

#include "pyconfig/python/Sysconfig.hpp"

#include "pyconfig/Log.hpp"
#define LOG(SEVERITY) pyconfig::log::SEVERITY("python/Sysconfig")

namespace pyconfig::python
{

std::string SysconfigQuery::varKey(std::string_view Name)
{
  return "var:" + std::string{Name};
}

std::string SysconfigQuery::pathKey(std::string_view Name)
{
  return "path:" + std::string{Name};
}

std::string SysconfigQuery::includeKey(std::string_view Name)
{
  return "inc:" + std::string{Name};
}

std::string SysconfigQuery::sysKey(std::string_view Name)
{
  return "sys:" + std::string{Name};
}

const char* SysconfigQuery::script() noexcept
{
  return R"PY(import sys, sysconfig
for key in sys.argv[1:]:
    kind, _, name = key.partition(':')
    if kind == 'var':
        value = sysconfig.get_config_var(name)
    elif kind == 'path':
        value = sysconfig.get_path(name)
    elif kind == 'inc':
        from distutils import sysconfig as distutils_sysconfig
        value = distutils_sysconfig.get_python_inc(
            plat_specific=(name == 'platinclude'))
    elif kind == 'sys':
        value = getattr(sys, name, None)
    elif kind == 'version':
        value = '%d.%d.%d' % tuple(sys.version_info[:3])
    else:
        value = None
    if value is None:
        sys.stdout.write(key + '\n')
    else:
        sys.stdout.write(key + '=' + ' '.join(str(value).splitlines()) + '\n')
)PY";
}

SysconfigQuery& SysconfigQuery::configVar(std::string_view Name)
{
  Keys.emplace_back(varKey(Name));
  return *this;
}

SysconfigQuery& SysconfigQuery::path(std::string_view Name)
{
  Keys.emplace_back(pathKey(Name));
  return *this;
}

SysconfigQuery& SysconfigQuery::distutilsInclude(std::string_view Name)
{
  Keys.emplace_back(includeKey(Name));
  return *this;
}

SysconfigQuery& SysconfigQuery::sysAttribute(std::string_view Name)
{
  Keys.emplace_back(sysKey(Name));
  return *this;
}

SysconfigQuery& SysconfigQuery::version()
{
  Keys.emplace_back(versionKey());
  return *this;
}

SysconfigReply SysconfigQuery::run(Interpreter& Python) const
{
  if (empty())
    return SysconfigReply{};

  PYCONFIG_TRACE_LOG(LOG(trace) << "Querying " << Keys.size() << " keys from "
                                << Python.program());
  std::string Output = Python.runScript(script(), Keys);
  return SysconfigReply::parse(Keys, Output);
}

SysconfigReply SysconfigReply::parse(const std::vector<std::string>& Keys,
                                     std::string_view Output)
{
  auto Malformed = [](const std::string& Why) {
    LOG(error) << "Malformed interpreter reply: " << Why;
    return ConfigError{ErrorKind::MalformedOutput,
                       "malformed interpreter output: " + Why};
  };

  SysconfigReply Reply;
  std::size_t Index = 0;
  while (!Output.empty())
  {
    std::string_view::size_type EOL = Output.find('\n');
    if (EOL == std::string_view::npos)
      throw Malformed("unterminated line");
    std::string_view Line = Output.substr(0, EOL);
    Output.remove_prefix(EOL + 1);
    if (!Line.empty() && Line.back() == '\r')
      Line.remove_suffix(1);

    if (Index >= Keys.size())
      throw Malformed("unexpected line '" + std::string{Line} + '\'');
    const std::string& Key = Keys[Index];
    ++Index;

    if (Line.substr(0, Key.size()) != Key)
      throw Malformed("expected '" + Key + "', got '" + std::string{Line} +
                      '\'');
    Line.remove_prefix(Key.size());
    if (Line.empty())
      Reply.Values[Key] = std::nullopt;
    else if (Line.front() == '=')
      Reply.Values[Key] = std::string{Line.substr(1)};
    else
      throw Malformed("expected '" + Key + "=', got '" + Key +
                      std::string{Line} + '\'');
  }

  if (Index != Keys.size())
    throw Malformed("expected " + std::to_string(Keys.size()) +
                    " values, got " + std::to_string(Index));
  return Reply;
}

const std::optional<std::string>&
SysconfigReply::get(const std::string& Key) const
{
  auto It = Values.find(Key);
  if (It == Values.end())
    throw std::out_of_range{"Key '" + Key + "' was not queried"};
  return It->second;
}

const std::string& SysconfigReply::value(const std::string& Key) const
{
  const std::optional<std::string>& V = get(Key);
  if (!V)
    throw ConfigError{ErrorKind::MissingValue,
                      "the interpreter does not define '" + Key + '\''};
  return *V;
}

std::string SysconfigReply::valueOr(const std::string& Key,
                                    std::string Default) const
{
  const std::optional<std::string>& V = get(Key);
  if (!V)
    return Default;
  return *V;
}

std::vector<std::string> SysconfigReply::words(const std::string& Key) const
{
  const std::optional<std::string>& V = get(Key);
  if (!V)
    return {};
  return splitWords(*V);
}

bool SysconfigReply::truthy(const std::string& Key) const
{
  const std::optional<std::string>& V = get(Key);
  return V && !V->empty() && *V != "0";
}

std::vector<std::string> splitWords(std::string_view Str)
{
  std::vector<std::string> R;
  std::size_t Pos = 0;
  while (Pos < Str.size())
  {
    while (Pos < Str.size() && std::isspace(static_cast<unsigned char>(Str[Pos])))
      ++Pos;
    std::size_t Begin = Pos;
    while (Pos < Str.size() &&
           !std::isspace(static_cast<unsigned char>(Str[Pos])))
      ++Pos;
    if (Pos > Begin)
      R.emplace_back(Str.substr(Begin, Pos - Begin));
  }
  return R;
}

std::string joinWords(const std::vector<std::string>& Words)
{
  std::string R;
  for (const std::string& W : Words)
  {
    if (!R.empty())
      R.push_back(' ');
    R.append(W);
  }
  return R;
}

} // namespace pyconfig::python

#undef LOG
