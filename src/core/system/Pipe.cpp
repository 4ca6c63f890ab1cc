/* SPDX-License-Identifier: LGPL-3.0-only */
#include <system_error>
#include <utility>

#include "pyconfig/system/Pipe.hpp"

#include "pyconfig/Log.hpp"
#define LOG(SEVERITY) pyconfig::log::SEVERITY("system/Pipe")

namespace pyconfig::system
{

static constexpr std::size_t DefaultPipeBuffer = 512;

Pipe::Pipe(Handle FD, std::string Identifier, Mode OpenMode)
  : FD(std::move(FD)), Identifier(std::move(Identifier)), OpenedAs(OpenMode)
{}

std::size_t Pipe::optimalReadSize() const noexcept { return DefaultPipeBuffer; }

std::string Pipe::readAll()
{
  if (OpenedAs != Read || !FD.has())
    throw std::system_error{std::make_error_code(std::errc::bad_file_descriptor),
                            "Pipe '" + Identifier + "' is not open for reading"};

  std::string Data;
  bool Continue = true;
  while (Continue)
    Data.append(readImpl(optimalReadSize(), Continue));

  PYCONFIG_TRACE_LOG(LOG(data) << "Read " << Data.size() << " bytes from '"
                               << Identifier << '\'');
  return Data;
}

std::unique_ptr<Pipe> Pipe::AnonymousPipe::takeRead()
{
  if (!Read)
    throw std::system_error{std::make_error_code(std::errc::io_error),
                            "Read end of pipe already taken."};
  if (Write)
    Write.reset();
  return std::move(Read);
}

} // namespace pyconfig::system

#undef LOG
