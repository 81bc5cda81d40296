// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <vector>

#include <tui/InputEvent.hpp>
#include <tui/TerminalInput.hpp>
#include <tui/TerminalOutput.hpp>

namespace tfview::tui
{

/// @brief Owns the controlling terminal for the lifetime of the full-screen UI.
///
/// Opens /dev/tty for both input and output, so the viewer works while stdin is a pipe.
/// Installs a SIGWINCH handler and enters the alternate screen; shutdown() undoes both.
class Terminal
{
  public:
    Terminal();
    ~Terminal();

    Terminal(Terminal const&) = delete;
    auto operator=(Terminal const&) -> Terminal& = delete;
    Terminal(Terminal&&) = delete;
    auto operator=(Terminal&&) -> Terminal& = delete;

    [[nodiscard]] auto initialize() -> VoidResult;
    void shutdown();

    [[nodiscard]] auto input() noexcept -> TerminalInput& { return _input; }
    [[nodiscard]] auto output() noexcept -> TerminalOutput& { return _output; }

    /// @brief Polls for input events; -1 blocks, 0 returns immediately.
    [[nodiscard]] auto poll(int timeoutMs) -> std::vector<InputEvent>;

    [[nodiscard]] auto columns() const noexcept -> int { return _output.columns(); }
    [[nodiscard]] auto rows() const noexcept -> int { return _output.rows(); }

  private:
    int _fd = -1;
    TerminalInput _input;
    TerminalOutput _output;
    bool _initialized = false;
};

} // namespace tfview::tui
