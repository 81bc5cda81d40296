// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <span>
#include <string_view>

namespace tfview
{

/// @brief Outcome of a bounded read.
enum class ReadStatus
{
    Data,
    Timeout,
    EndOfStream,
};

struct ReadResult
{
    ReadStatus status = ReadStatus::Timeout;
    std::size_t size = 0;
};

/// @brief Byte source the reader thread consumes: standard input or a child's pseudo-terminal.
///
/// read() is only called by the reader thread and write() only by the UI thread.
class InputSource
{
  public:
    virtual ~InputSource() = default;

    /// @brief Reads available bytes, waiting at most @p timeout.
    [[nodiscard]] virtual auto read(std::span<char> buffer, std::chrono::milliseconds timeout)
        -> Result<ReadResult> = 0;

    /// @brief Writes @p data to the source's input side, if it has one.
    [[nodiscard]] virtual auto write(std::string_view data) -> VoidResult = 0;

    /// @brief Releases the underlying descriptor.
    virtual void close() = 0;

    /// @brief True if the source is a live, interactive session.
    [[nodiscard]] virtual auto isInteractive() const noexcept -> bool = 0;
};

/// @brief Polls @p fd for up to @p timeout and reads what is available.
///
/// EIO is reported as end of stream when @p eioIsEof is set, which is how Linux signals
/// that the slave side of a pseudo-terminal has been closed.
[[nodiscard]] auto readFromFd(int fd, std::span<char> buffer, std::chrono::milliseconds timeout, bool eioIsEof)
    -> Result<ReadResult>;

/// @brief Writes all of @p data to @p fd, retrying on partial writes and EINTR.
///
/// Each write waits for POLLOUT first, and the whole call gives up with an IoError once
/// @p timeout has passed, so a child that stopped reading cannot stall the caller.
[[nodiscard]] auto writeToFd(int fd, std::string_view data, std::chrono::milliseconds timeout) -> VoidResult;

} // namespace tfview
