/* SPDX-License-Identifier: LGPL-3.0-only */
#include <cstdio>
#include <sstream>
#include <system_error>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include "pyconfig/CheckedErrno.hpp"

#include "pyconfig/system/UnixPipe.hpp"

#include "pyconfig/Log.hpp"
#define LOG(SEVERITY) pyconfig::log::SEVERITY("system/Pipe")

namespace pyconfig::system
{

Pipe::AnonymousPipe Pipe::create(bool InheritInChild)
{
  return unix::Pipe::create(InheritInChild);
}

std::vector<std::string> Pipe::readAllOf(const std::vector<Pipe*>& Pipes)
{
  std::vector<struct ::pollfd> Polled;
  Polled.reserve(Pipes.size());
  for (Pipe* P : Pipes)
  {
    if (P->mode() != Read || !Handle::isValid(P->raw()))
      throw std::system_error{
        std::make_error_code(std::errc::bad_file_descriptor),
        "Pipe '" + P->identifier() + "' is not open for reading"};
    Polled.push_back({P->raw(), POLLIN, 0});
  }

  std::vector<std::string> Data(Pipes.size());
  std::size_t Open = Polled.size();
  while (Open > 0)
  {
    auto Ready = CheckedErrno(
      [&Polled] {
        return ::poll(Polled.data(), static_cast<::nfds_t>(Polled.size()), -1);
      },
      -1);
    if (!Ready)
    {
      if (Ready.getError() == std::errc::interrupted /* EINTR */)
        continue;
      throw std::system_error{Ready.getError(), "poll()"};
    }

    for (std::size_t I = 0; I < Polled.size(); ++I)
    {
      // A negative descriptor is skipped by poll().
      if (Polled[I].fd < 0 || Polled[I].revents == 0)
        continue;

      bool Continue = true;
      Data[I].append(
        Pipes[I]->readImpl(Pipes[I]->optimalReadSize(), Continue));
      if (!Continue)
      {
        PYCONFIG_TRACE_LOG(LOG(data) << "Read " << Data[I].size()
                                     << " bytes from '"
                                     << Pipes[I]->identifier() << '\'');
        Polled[I].fd = -1;
        --Open;
      }
    }
  }
  return Data;
}

namespace unix
{

Pipe::Pipe(fd::raw_fd FD, std::string Identifier, Mode OpenMode)
  : system::Pipe(fd{FD}, std::move(Identifier), OpenMode)
{}

Pipe::AnonymousPipe Pipe::create(bool InheritInChild)
{
  fd::raw_fd PipeFDs[2] = {fd::Traits::Invalid, fd::Traits::Invalid};
  int ExtraFlags = InheritInChild ? 0 : O_CLOEXEC;

  CheckedErrnoThrow(
    [&PipeFDs, ExtraFlags] { return ::pipe2(PipeFDs, ExtraFlags); },
    "pipe2()",
    -1);

  std::ostringstream RName;
  RName << "<anonpipe:" << PipeFDs[0] << "+" << PipeFDs[1] << "/";
  std::ostringstream WName;
  WName << RName.str();
  RName << "read" << ':' << PipeFDs[0] << '>';
  WName << "write" << ':' << PipeFDs[1] << '>';

  PYCONFIG_TRACE_LOG(LOG(trace) << "Created anonymous pipe " << PipeFDs[0]
                                << '+' << PipeFDs[1]);

  return AnonymousPipe{
    std::unique_ptr<system::Pipe>(new Pipe(PipeFDs[0], RName.str(), Read)),
    std::unique_ptr<system::Pipe>(new Pipe(PipeFDs[1], WName.str(), Write))};
}

std::string Pipe::readImpl(std::size_t Bytes, bool& Continue)
{
  static constexpr std::size_t BufferSize = BUFSIZ;
  char RawBuffer[BufferSize];
  if (Bytes > BufferSize)
    Bytes = BufferSize;

  auto ReadBytes = CheckedErrno(
    [FD = raw(), Bytes, &RawBuffer] { return ::read(FD, RawBuffer, Bytes); },
    -1);
  if (!ReadBytes)
  {
    if (ReadBytes.getError() == std::errc::interrupted /* EINTR */)
    {
      // Not an error, continue.
      Continue = true;
      return {};
    }

    LOG(error) << identifier() << ": Read error";
    Continue = false;
    throw std::system_error{ReadBytes.getError(), "read(" + identifier() + ')'};
  }

  if (ReadBytes.get() == 0)
  {
    // All writers closed their end.
    Continue = false;
    return {};
  }

  Continue = true;
  return std::string(RawBuffer, static_cast<std::size_t>(ReadBytes.get()));
}

} // namespace unix
} // namespace pyconfig::system

#undef LOG
