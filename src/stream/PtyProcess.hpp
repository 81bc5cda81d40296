// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/InputSource.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tfview
{

/// @brief Configuration for spawning a child under a pseudo-terminal.
struct PtyProcessConfig
{
    std::vector<std::string> argv; ///< Program followed by its arguments; looked up in PATH.
    int columns = 80;
    int rows = 24;
};

/// @brief A child process whose stdin, stdout and stderr are one pseudo-terminal.
///
/// The master side is the input source: the reader thread reads the child's output
/// from it, and the UI thread writes forwarded keystrokes to it.
class PtyProcess: public InputSource
{
  public:
    PtyProcess();
    ~PtyProcess() override;

    PtyProcess(PtyProcess const&) = delete;
    auto operator=(PtyProcess const&) -> PtyProcess& = delete;

    /// @brief Forks the child and executes the configured program.
    /// @return ProcessError if the terminal cannot be created or the program cannot be executed.
    [[nodiscard]] auto start(PtyProcessConfig const& config) -> VoidResult;

    [[nodiscard]] auto read(std::span<char> buffer, std::chrono::milliseconds timeout)
        -> Result<ReadResult> override;
    [[nodiscard]] auto write(std::string_view data) -> VoidResult override;

    /// @brief Releases the master descriptor. The child is not signalled.
    void close() override;

    [[nodiscard]] auto isInteractive() const noexcept -> bool override { return true; }

    /// @brief Propagates a new window size to the child.
    [[nodiscard]] auto resize(int columns, int rows) -> VoidResult;

    /// @brief Reaps the child if it has exited, without blocking.
    /// @return The exit code (128 + signal for signalled children), once known.
    [[nodiscard]] auto pollExit() -> std::optional<int>;

    /// @brief Stops the child: SIGTERM, wait up to @p timeout, then SIGKILL.
    ///
    /// Also releases the master descriptor. Safe to call when the child already exited.
    /// @return The child's exit code, if it could be collected.
    auto terminate(std::chrono::milliseconds timeout) -> std::optional<int>;

    /// @brief Whether the child is started and not yet reaped.
    [[nodiscard]] auto isRunning() const noexcept -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tfview
