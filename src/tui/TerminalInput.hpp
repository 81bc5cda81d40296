// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <array>
#include <vector>

#include <termios.h>

#include <tui/InputEvent.hpp>
#include <tui/VtParser.hpp>

namespace tfview::tui
{

/// @brief Raw-mode keyboard and mouse input from the controlling terminal.
///
/// Reads from the terminal descriptor rather than stdin, which may be the plan pipe.
/// Window size changes arrive through a self-pipe written from the SIGWINCH handler
/// and are reported as ResizeEvent.
class TerminalInput
{
  public:
    TerminalInput();
    ~TerminalInput();

    TerminalInput(TerminalInput const&) = delete;
    auto operator=(TerminalInput const&) -> TerminalInput& = delete;
    TerminalInput(TerminalInput&&) = delete;
    auto operator=(TerminalInput&&) -> TerminalInput& = delete;

    /// @brief Switches @p fd to raw mode and enables mouse reporting and bracketed paste.
    [[nodiscard]] auto initialize(int fd) -> VoidResult;

    /// @brief Restores the original terminal mode.
    void shutdown();

    /// @brief Waits up to @p timeoutMs (-1 = forever) for input.
    [[nodiscard]] auto poll(int timeoutMs) -> std::vector<InputEvent>;

    /// @brief Wakes poll() with a resize notification. Async-signal-safe.
    void notifyResize() noexcept;

  private:
    void writeControl(char const* sequence);

    VtParser _parser;
    int _fd = -1;
    termios _origTermios {};
    bool _rawMode = false;
    std::array<int, 2> _resizePipe { -1, -1 };
};

} // namespace tfview::tui
