/* SPDX-License-Identifier: LGPL-3.0-only */
#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "pyconfig/system/Handle.hpp"

namespace pyconfig::system
{

/// A pipe is a one-way communication channel between a reading and a writing
/// end.
///
/// Data written to the pipe's write end is buffered by the kernel and
/// can be read on the read end.
class Pipe
{
public:
  /// The mode with which the \p Pipe is opened.
  enum Mode
  {
    /// Sentinel.
    None = 0,

    /// Open the read end of the pipe.
    Read = 1,

    /// Open the write end of the pipe.
    Write = 2
  };

  /// Wrapper for the return type of \p create() which creates an anonymous
  /// pipe that only exists as file descriptors, but not named entities.
  struct AnonymousPipe
  {
    AnonymousPipe(std::unique_ptr<Pipe>&& Read, std::unique_ptr<Pipe>&& Write)
      : Read(std::move(Read)), Write(std::move(Write))
    {}

    /// \returns the pipe for the write end.
    [[nodiscard]] Pipe* getWrite() const noexcept { return Write.get(); }

    /// Take ownership for the read end of the pipe, and close the write end.
    [[nodiscard]] std::unique_ptr<Pipe> takeRead();

  private:
    std::unique_ptr<Pipe> Read;
    std::unique_ptr<Pipe> Write;
  };

  /// Creates a new anonymous pipe with the current platform's implementation.
  /// Both ends are closed in executed child processes unless
  /// \p InheritInChild is set.
  [[nodiscard]] static AnonymousPipe create(bool InheritInChild = false);

  virtual ~Pipe() noexcept = default;
  Pipe(Pipe&&) noexcept = default;
  Pipe& operator=(Pipe&&) noexcept = default;

  [[nodiscard]] Handle::Raw raw() const noexcept { return FD.get(); }
  [[nodiscard]] Mode mode() const noexcept { return OpenedAs; }
  [[nodiscard]] const std::string& identifier() const noexcept
  {
    return Identifier;
  }

  /// Reads from the pipe until the writing end is closed by every process
  /// holding it.
  ///
  /// \throws std::system_error if the pipe is not open for reading, or the
  /// read fails.
  [[nodiscard]] std::string readAll();

  /// Reads all \p Pipes until every writing end is closed, taking the data
  /// from whichever pipe has some first. A writer blocked on a full pipe thus
  /// never waits for the end of another.
  ///
  /// \returns the data read, in the order of \p Pipes.
  ///
  /// \throws std::system_error if a pipe is not open for reading, or the
  /// wait or a read fails.
  [[nodiscard]] static std::vector<std::string>
  readAllOf(const std::vector<Pipe*>& Pipes);

  [[nodiscard]] virtual std::size_t optimalReadSize() const noexcept;

protected:
  Pipe(Handle FD, std::string Identifier, Mode OpenMode);

  /// Reads at most \p Bytes from the pipe. \p Continue is set to \p false if
  /// the end of the stream was reached.
  [[nodiscard]] virtual std::string readImpl(std::size_t Bytes,
                                             bool& Continue) = 0;

  Handle FD;
  std::string Identifier;
  Mode OpenedAs;
};

} // namespace pyconfig::system
