// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <tui/TerminalInput.hpp>

namespace tfview::tui
{

namespace
{
    constexpr auto EnableMouse = "\033[?1000h\033[?1006h";
    constexpr auto DisableMouse = "\033[?1006l\033[?1000l";
    constexpr auto EnableBracketedPaste = "\033[?2004h";
    constexpr auto DisableBracketedPaste = "\033[?2004l";
} // namespace

TerminalInput::TerminalInput() = default;

TerminalInput::~TerminalInput()
{
    shutdown();
}

auto TerminalInput::initialize(int fd) -> VoidResult
{
    if (::tcgetattr(fd, &_origTermios) != 0)
        return makeError(ErrorCode::TerminalError, std::format("tcgetattr() failed: {}", std::strerror(errno)));

    if (::pipe2(_resizePipe.data(), O_CLOEXEC | O_NONBLOCK) != 0)
        return makeError(ErrorCode::TerminalError, "Failed to create resize notification pipe");

    _fd = fd;

    // ISIG is cleared so Ctrl+C reaches the viewer as a key and can be forwarded.
    auto raw = _origTermios;
    raw.c_iflag &= ~static_cast<tcflag_t>(ICRNL | IXON);
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG | IEXTEN);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(_fd, TCSAFLUSH, &raw) != 0)
        return makeError(ErrorCode::TerminalError, std::format("tcsetattr() failed: {}", std::strerror(errno)));
    _rawMode = true;

    writeControl(EnableMouse);
    writeControl(EnableBracketedPaste);
    return {};
}

void TerminalInput::shutdown()
{
    if (_rawMode)
    {
        writeControl(DisableBracketedPaste);
        writeControl(DisableMouse);
        ::tcsetattr(_fd, TCSAFLUSH, &_origTermios);
        _rawMode = false;
    }

    for (auto& fd: _resizePipe)
    {
        if (fd != -1)
            ::close(fd);
        fd = -1;
    }
}

auto TerminalInput::poll(int timeoutMs) -> std::vector<InputEvent>
{
    auto fds = std::array<pollfd, 2> {
        pollfd { .fd = _fd, .events = POLLIN, .revents = 0 },
        pollfd { .fd = _resizePipe[0], .events = POLLIN, .revents = 0 },
    };

    auto const ready = ::poll(fds.data(), fds.size(), timeoutMs);
    if (ready == 0)
        return _parser.timeout();
    if (ready < 0)
        return {};

    auto events = std::vector<InputEvent> {};

    if ((fds[1].revents & POLLIN) != 0)
    {
        auto drain = std::array<char, 64> {};
        while (::read(_resizePipe[0], drain.data(), drain.size()) > 0)
            ;

        auto ws = winsize {};
        if (::ioctl(_fd, TIOCGWINSZ, &ws) == 0)
            events.emplace_back(ResizeEvent { .columns = ws.ws_col, .rows = ws.ws_row });
    }

    if ((fds[0].revents & POLLIN) != 0)
    {
        auto buffer = std::array<char, 512> {};
        auto const n = ::read(_fd, buffer.data(), buffer.size());
        if (n > 0)
        {
            auto parsed = _parser.feed(std::string_view(buffer.data(), static_cast<std::size_t>(n)));
            events.insert(events.end(), std::make_move_iterator(parsed.begin()), std::make_move_iterator(parsed.end()));
        }
    }

    return events;
}

void TerminalInput::notifyResize() noexcept
{
    if (_resizePipe[1] != -1)
    {
        auto const byte = char { 1 };
        static_cast<void>(::write(_resizePipe[1], &byte, 1));
    }
}

void TerminalInput::writeControl(char const* sequence)
{
    static_cast<void>(::write(_fd, sequence, std::strlen(sequence)));
}

} // namespace tfview::tui
