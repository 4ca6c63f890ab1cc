/* SPDX-License-Identifier: LGPL-3.0-only */
#include <optional>

#include <sys/stat.h>
#include <unistd.h>

#include "pyconfig/CheckedErrno.hpp"
#include "pyconfig/system/Environment.hpp"

#include "pyconfig/system/Platform.hpp"

#include "pyconfig/Log.hpp"
#define LOG(SEVERITY) pyconfig::log::SEVERITY("system/UnixPlatform")

namespace pyconfig::system
{

bool Platform::isExecutableFile(const std::string& Path)
{
  if (Path.empty())
    return false;

  struct ::stat StatResult = {};
  auto Stat = CheckedErrno(
    [Prog = Path.c_str(), &StatResult] { return ::stat(Prog, &StatResult); },
    -1);
  if (!Stat || !S_ISREG(StatResult.st_mode))
    return false;

  auto Access = CheckedErrno(
    [Prog = Path.c_str()] { return ::access(Prog, X_OK); }, -1);
  return static_cast<bool>(Access);
}

std::optional<std::string> Platform::findExecutable(const std::string& Program)
{
  if (Program.empty())
    return std::nullopt;

  if (Program.find('/') != std::string::npos)
  {
    LOG(debug) << "Checking program path " << Program;
    if (isExecutableFile(Program))
      return Program;
    return std::nullopt;
  }

  std::string Path = getEnv("PATH");
  if (Path.empty())
    Path = "/usr/local/bin:/usr/bin:/bin";

  for (const std::string& Directory : splitSearchPath(Path))
  {
    std::string Candidate = Directory;
    if (Candidate.back() != '/')
      Candidate.push_back('/');
    Candidate.append(Program);

    PYCONFIG_TRACE_LOG(LOG(trace) << "Trying " << Candidate);
    if (isExecutableFile(Candidate))
    {
      LOG(debug) << "Found '" << Program << "' at " << Candidate;
      return Candidate;
    }
  }

  LOG(debug) << "'" << Program << "' not found in PATH";
  return std::nullopt;
}

} // namespace pyconfig::system

#undef LOG
