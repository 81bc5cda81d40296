// SPDX-License-Identifier: Apache-2.0
#include <stream/FdInputSource.hpp>

#include <cerrno>
#include <cstring>
#include <format>

#include <poll.h>
#include <unistd.h>

namespace tfview
{

// ===== fd helpers =====

auto readFromFd(int fd, std::span<char> buffer, std::chrono::milliseconds timeout, bool eioIsEof)
    -> Result<ReadResult>
{
    if (fd < 0)
        return makeError(ErrorCode::IoError, "Read from closed descriptor");

    auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
    auto const ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0)
    {
        if (errno == EINTR)
            return ReadResult { .status = ReadStatus::Timeout };
        return makeError(ErrorCode::IoError, std::format("poll() failed: {}", std::strerror(errno)));
    }
    if (ready == 0)
        return ReadResult { .status = ReadStatus::Timeout };

    auto const n = ::read(fd, buffer.data(), buffer.size());
    if (n > 0)
        return ReadResult { .status = ReadStatus::Data, .size = static_cast<std::size_t>(n) };
    if (n == 0)
        return ReadResult { .status = ReadStatus::EndOfStream };

    if (errno == EINTR || errno == EAGAIN)
        return ReadResult { .status = ReadStatus::Timeout };
    if (errno == EIO && eioIsEof)
        return ReadResult { .status = ReadStatus::EndOfStream };
    return makeError(ErrorCode::IoError, std::format("read() failed: {}", std::strerror(errno)));
}

auto writeToFd(int fd, std::string_view data, std::chrono::milliseconds timeout) -> VoidResult
{
    if (fd < 0)
        return makeError(ErrorCode::IoError, "Write to closed descriptor");

    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!data.empty())
    {
        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::IoError, "write() timed out");

        auto pfd = pollfd { .fd = fd, .events = POLLOUT, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::IoError, std::format("poll() failed: {}", std::strerror(errno)));
        }
        if (ready == 0)
            return makeError(ErrorCode::IoError, "write() timed out");
        if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0 && (pfd.revents & POLLOUT) == 0)
            return makeError(ErrorCode::IoError, "Peer closed the descriptor");

        auto const n = ::write(fd, data.data(), data.size());
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            return makeError(ErrorCode::IoError, std::format("write() failed: {}", std::strerror(errno)));
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
    return {};
}

// ===== FdInputSource =====

FdInputSource::FdInputSource(int fd, bool ownsFd): _fd(fd), _ownsFd(ownsFd)
{
}

FdInputSource::~FdInputSource()
{
    close();
}

auto FdInputSource::read(std::span<char> buffer, std::chrono::milliseconds timeout) -> Result<ReadResult>
{
    return readFromFd(_fd, buffer, timeout, false);
}

auto FdInputSource::write(std::string_view /*data*/) -> VoidResult
{
    return makeError(ErrorCode::InvalidArgument, "Piped input does not accept keystrokes");
}

void FdInputSource::close()
{
    if (_ownsFd && _fd >= 0)
        ::close(_fd);
    _fd = -1;
}

} // namespace tfview
