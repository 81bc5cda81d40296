// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tfview::tui
{

struct RgbColor
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

/// @brief Terminal default, 256-color index, or true color.
using Color = std::variant<std::monostate, std::uint8_t, RgbColor>;

struct Style
{
    Color fg;
    Color bg;
    bool bold = false;
    bool dim = false;
    bool underline = false;
    bool inverse = false;
};

/// @brief RAII guard for synchronized output (CSI ?2026h ... ?2026l).
class SyncGuard
{
  public:
    explicit SyncGuard(int fd);
    ~SyncGuard();

    SyncGuard(SyncGuard const&) = delete;
    auto operator=(SyncGuard const&) -> SyncGuard& = delete;
    SyncGuard(SyncGuard&&) = delete;
    auto operator=(SyncGuard&&) -> SyncGuard& = delete;

  private:
    int _fd;
};

/// @brief Buffered styled output to the terminal.
///
/// All calls append to an internal buffer; nothing reaches the terminal before flush().
/// Without a descriptor (fd < 0) flush() discards nothing and the buffer can be inspected
/// through pending().
class TerminalOutput
{
  public:
    /// @brief Binds the output to @p fd and queries its size.
    [[nodiscard]] auto initialize(int fd) -> VoidResult;

    /// @brief Writes @p text with @p style applied, followed by an SGR reset.
    void write(std::string_view text, Style const& style = {});

    void writeRaw(std::string_view text);

    /// @brief Moves the cursor to an absolute 1-based position.
    void moveTo(int row, int col);

    void clearScreen();
    void enterAltScreen();
    void leaveAltScreen();
    void showCursor();
    void hideCursor();

    [[nodiscard]] auto syncGuard() -> SyncGuard;

    void flush();

    /// @brief Buffered, not yet flushed output.
    [[nodiscard]] auto pending() const noexcept -> std::string_view { return _buffer; }

    [[nodiscard]] auto columns() const noexcept -> int { return _cols; }
    [[nodiscard]] auto rows() const noexcept -> int { return _rows; }

    /// @brief Re-reads the terminal size; keeps the previous size on failure.
    void updateDimensions();

    /// @brief Overrides the cached size (used where no terminal is attached).
    void setDimensions(int columns, int rows) noexcept;

  private:
    void appendSgr(Style const& style);

    int _fd = -1;
    std::string _buffer;
    int _cols = 80;
    int _rows = 24;
};

} // namespace tfview::tui
