// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <stream/PtyProcess.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <thread>

#include <sys/ioctl.h>
#include <sys/wait.h>

#include <fcntl.h>
#include <pty.h>
#include <signal.h>
#include <termios.h>
#include <unistd.h>

namespace tfview
{

namespace
{
    /// Keystrokes are forwarded from the UI thread; a child that stops reading must not freeze it.
    constexpr auto KeystrokeWriteTimeout = std::chrono::milliseconds(50);

    auto decodeWaitStatus(int status) -> int
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }

    auto makeWinsize(int columns, int rows) -> winsize
    {
        auto ws = winsize {};
        ws.ws_col = static_cast<unsigned short>(columns > 0 ? columns : 80);
        ws.ws_row = static_cast<unsigned short>(rows > 0 ? rows : 24);
        return ws;
    }
} // namespace

struct PtyProcess::Impl
{
    pid_t childPid = -1;
    int master = -1;
    std::optional<int> exitCode;

    void closeMaster()
    {
        if (master >= 0)
        {
            ::close(master);
            master = -1;
        }
    }

    /// Non-blocking reap; records the exit code once.
    auto reap() -> std::optional<int>
    {
        if (exitCode || childPid <= 0)
            return exitCode;

        auto status = 0;
        auto const result = ::waitpid(childPid, &status, WNOHANG);
        if (result == childPid)
        {
            exitCode = decodeWaitStatus(status);
            childPid = -1;
            log::debug("Child exited with code {}", *exitCode);
        }
        else if (result < 0 && errno == ECHILD)
        {
            childPid = -1;
        }
        return exitCode;
    }
};

PtyProcess::PtyProcess(): _impl(std::make_unique<Impl>())
{
}

PtyProcess::~PtyProcess()
{
    if (_impl->childPid > 0)
        terminate(std::chrono::milliseconds(0));
    _impl->closeMaster();
}

auto PtyProcess::start(PtyProcessConfig const& config) -> VoidResult
{
    if (_impl->childPid > 0)
        return makeError(ErrorCode::ProcessError, "Process already started");
    if (config.argv.empty() || config.argv.front().empty())
        return makeError(ErrorCode::InvalidArgument, "No command given");

    // Reports an exec failure from the child; closed automatically on successful exec.
    auto execPipe = std::array<int, 2> { -1, -1 };
    if (::pipe2(execPipe.data(), O_CLOEXEC) != 0)
        return makeError(ErrorCode::ProcessError, std::format("pipe2() failed: {}", std::strerror(errno)));

    auto argvCopies = std::vector<std::string>(config.argv);
    auto argv = std::vector<char*> {};
    for (auto& arg: argvCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto ws = makeWinsize(config.columns, config.rows);
    auto master = -1;
    auto const pid = ::forkpty(&master, nullptr, nullptr, &ws);
    if (pid < 0)
    {
        auto const error = errno;
        ::close(execPipe[0]);
        ::close(execPipe[1]);
        return makeError(ErrorCode::ProcessError, std::format("forkpty() failed: {}", std::strerror(error)));
    }

    if (pid == 0)
    {
        ::close(execPipe[0]);
        ::execvp(argv[0], argv.data());
        auto const error = errno;
        static_cast<void>(::write(execPipe[1], &error, sizeof(error)));
        ::_exit(127);
    }

    ::close(execPipe[1]);
    auto childErrno = 0;
    auto n = ssize_t { 0 };
    do
        n = ::read(execPipe[0], &childErrno, sizeof(childErrno));
    while (n < 0 && errno == EINTR);
    ::close(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno)))
    {
        auto status = 0;
        static_cast<void>(::waitpid(pid, &status, 0));
        ::close(master);
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to execute '{}': {}", config.argv.front(), std::strerror(childErrno)));
    }

    _impl->childPid = pid;
    _impl->master = master;
    _impl->exitCode.reset();
    log::info("Started '{}' (pid {}) on a {}x{} pseudo-terminal", config.argv.front(), pid, ws.ws_col, ws.ws_row);
    return {};
}

auto PtyProcess::read(std::span<char> buffer, std::chrono::milliseconds timeout) -> Result<ReadResult>
{
    return readFromFd(_impl->master, buffer, timeout, true);
}

auto PtyProcess::write(std::string_view data) -> VoidResult
{
    return writeToFd(_impl->master, data, KeystrokeWriteTimeout);
}

void PtyProcess::close()
{
    _impl->closeMaster();
}

auto PtyProcess::resize(int columns, int rows) -> VoidResult
{
    if (_impl->master < 0)
        return makeError(ErrorCode::ProcessError, "Pseudo-terminal is closed");

    auto ws = makeWinsize(columns, rows);
    if (::ioctl(_impl->master, TIOCSWINSZ, &ws) != 0)
        return makeError(ErrorCode::ProcessError, std::format("TIOCSWINSZ failed: {}", std::strerror(errno)));
    return {};
}

auto PtyProcess::pollExit() -> std::optional<int>
{
    return _impl->reap();
}

auto PtyProcess::terminate(std::chrono::milliseconds timeout) -> std::optional<int>
{
    if (_impl->reap() || _impl->childPid <= 0)
    {
        _impl->closeMaster();
        return _impl->exitCode;
    }

    if (::kill(_impl->childPid, SIGTERM) != 0)
        log::debug("SIGTERM to pid {} failed: {}", _impl->childPid, std::strerror(errno));

    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!_impl->reap() && _impl->childPid > 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

    if (!_impl->exitCode && _impl->childPid > 0)
    {
        log::warning("Child pid {} did not exit within {} ms, killing it", _impl->childPid, timeout.count());
        if (::kill(_impl->childPid, SIGKILL) != 0)
            log::debug("SIGKILL to pid {} failed: {}", _impl->childPid, std::strerror(errno));

        auto status = 0;
        if (::waitpid(_impl->childPid, &status, 0) == _impl->childPid)
            _impl->exitCode = decodeWaitStatus(status);
        _impl->childPid = -1;
    }

    _impl->closeMaster();
    return _impl->exitCode;
}

auto PtyProcess::isRunning() const noexcept -> bool
{
    return _impl->childPid > 0;
}

} // namespace tfview
