// SPDX-License-Identifier: Apache-2.0
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <unistd.h>

#include <tui/Terminal.hpp>

namespace tfview::tui
{

namespace
{
    // Only one Terminal is active at a time.
    TerminalInput* gActiveInput = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigwinch {};     // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void sigwinchHandler(int /*sig*/)
    {
        if (gActiveInput != nullptr)
            gActiveInput->notifyResize();
    }
} // namespace

Terminal::Terminal() = default;

Terminal::~Terminal()
{
    shutdown();
}

auto Terminal::initialize() -> VoidResult
{
    if (_initialized)
        return {};

    _fd = ::open("/dev/tty", O_RDWR | O_CLOEXEC | O_NOCTTY);
    if (_fd < 0)
        return makeError(ErrorCode::TerminalError, std::format("Cannot open /dev/tty: {}", std::strerror(errno)));

    if (auto result = _output.initialize(_fd); !result)
        return result;
    if (auto result = _input.initialize(_fd); !result)
        return result;

    gActiveInput = &_input;
    struct sigaction sa {};
    sa.sa_handler = sigwinchHandler;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGWINCH, &sa, &gPrevSigwinch);

    _output.enterAltScreen();
    _output.hideCursor();
    _output.clearScreen();
    _output.flush();

    _initialized = true;
    return {};
}

void Terminal::shutdown()
{
    if (_initialized)
    {
        sigaction(SIGWINCH, &gPrevSigwinch, nullptr);
        gActiveInput = nullptr;

        _output.showCursor();
        _output.leaveAltScreen();
        _output.flush();
        _initialized = false;
    }

    _input.shutdown();
    if (_fd >= 0)
    {
        ::close(_fd);
        _fd = -1;
    }
}

auto Terminal::poll(int timeoutMs) -> std::vector<InputEvent>
{
    return _input.poll(timeoutMs);
}

} // namespace tfview::tui
