// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tui/InputEvent.hpp>

namespace tfview::tui
{

/// @brief Incremental decoder for bytes read from the controlling terminal.
///
/// Understands control characters, UTF-8 text, CSI and SS3 cursor/editing keys,
/// SGR mouse reports (CSI < b;x;y M/m) and bracketed paste. Input may be split at any
/// byte; incomplete sequences are kept until the next feed().
class VtParser
{
  public:
    [[nodiscard]] auto feed(std::string_view data) -> std::vector<InputEvent>;

    /// @brief Resolves a lone ESC once no further bytes arrived within the poll timeout.
    [[nodiscard]] auto timeout() -> std::vector<InputEvent>;

  private:
    enum class State : std::uint8_t
    {
        Ground,
        Escape,
        Csi,
        Ss3,
        Paste,
    };

    void processGround(char ch, std::vector<InputEvent>& events);
    void processEscape(char ch, std::vector<InputEvent>& events);
    void processCsi(char ch, std::vector<InputEvent>& events);
    void processSs3(char ch, std::vector<InputEvent>& events);
    void processPaste(char ch, std::vector<InputEvent>& events);
    void dispatchCsi(char finalByte, std::vector<InputEvent>& events);
    void dispatchMouse(char finalByte, std::vector<InputEvent>& events);

    State _state = State::Ground;
    std::string _params;
    std::string _paste;
    std::string _utf8;             ///< Bytes of a partially received character.
    std::size_t _utf8Expected = 0; ///< Total length of that character.
};

} // namespace tfview::tui
