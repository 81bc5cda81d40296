// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <cerrno>
#include <cstring>
#include <format>

#include <unistd.h>

#include <tui/TerminalOutput.hpp>

namespace tfview::tui
{

namespace
{
    void appendColor(std::string& params, Color const& color, int base)
    {
        if (auto const* index = std::get_if<std::uint8_t>(&color))
            params += std::format(";{};5;{}", base, *index);
        else if (auto const* rgb = std::get_if<RgbColor>(&color))
            params += std::format(";{};2;{};{};{}", base, rgb->r, rgb->g, rgb->b);
    }
} // namespace

// ===== SyncGuard =====

SyncGuard::SyncGuard(int fd): _fd(fd)
{
    static constexpr auto Begin = "\033[?2026h";
    if (_fd >= 0)
        static_cast<void>(::write(_fd, Begin, std::strlen(Begin)));
}

SyncGuard::~SyncGuard()
{
    static constexpr auto End = "\033[?2026l";
    if (_fd >= 0)
        static_cast<void>(::write(_fd, End, std::strlen(End)));
}

// ===== TerminalOutput =====

auto TerminalOutput::initialize(int fd) -> VoidResult
{
    if (fd < 0)
        return makeError(ErrorCode::TerminalError, "No terminal to write to");
    _fd = fd;
    updateDimensions();
    return {};
}

void TerminalOutput::write(std::string_view text, Style const& style)
{
    appendSgr(style);
    _buffer.append(text);
    _buffer += "\033[m";
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

void TerminalOutput::moveTo(int row, int col)
{
    _buffer += std::format("\033[{};{}H", row, col);
}

void TerminalOutput::clearScreen()
{
    _buffer += "\033[2J\033[H";
}

void TerminalOutput::enterAltScreen()
{
    _buffer += "\033[?1049h";
}

void TerminalOutput::leaveAltScreen()
{
    _buffer += "\033[?1049l";
}

void TerminalOutput::showCursor()
{
    _buffer += "\033[?25h";
}

void TerminalOutput::hideCursor()
{
    _buffer += "\033[?25l";
}

auto TerminalOutput::syncGuard() -> SyncGuard
{
    flush();
    return SyncGuard(_fd);
}

void TerminalOutput::flush()
{
    if (_fd < 0 || _buffer.empty())
        return;

    auto data = std::string_view(_buffer);
    while (!data.empty())
    {
        auto const n = ::write(_fd, data.data(), data.size());
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;
        data.remove_prefix(static_cast<std::size_t>(n));
    }
    _buffer.clear();
}

void TerminalOutput::updateDimensions()
{
    auto ws = winsize {};
    if (_fd >= 0 && ::ioctl(_fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0)
    {
        _cols = ws.ws_col;
        _rows = ws.ws_row;
    }
}

void TerminalOutput::setDimensions(int columns, int rows) noexcept
{
    _cols = columns;
    _rows = rows;
}

void TerminalOutput::appendSgr(Style const& style)
{
    auto params = std::string {};
    if (style.bold)
        params += ";1";
    if (style.dim)
        params += ";2";
    if (style.underline)
        params += ";4";
    if (style.inverse)
        params += ";7";
    appendColor(params, style.fg, 38);
    appendColor(params, style.bg, 48);

    if (params.empty())
        return;

    _buffer += "\033[";
    _buffer.append(params, 1);
    _buffer += 'm';
}

} // namespace tfview::tui
