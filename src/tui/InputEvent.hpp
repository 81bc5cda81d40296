// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace tfview::tui
{

/// @brief Keys the viewer distinguishes. Everything printable is Key::Character.
enum class Key : std::uint8_t
{
    Character,
    Enter,
    Tab,
    Backspace,
    Delete,
    Escape,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
};

/// @brief Bitmask of modifier keys.
enum class Modifier : std::uint8_t
{
    None = 0,
    Shift = 1 << 0,
    Alt = 1 << 1,
    Ctrl = 1 << 2,
};

[[nodiscard]] constexpr auto operator|(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

[[nodiscard]] constexpr auto hasModifier(Modifier mods, Modifier flag) noexcept -> bool
{
    return (static_cast<std::uint8_t>(mods) & static_cast<std::uint8_t>(flag)) != 0;
}

/// @brief A key press.
struct KeyEvent
{
    Key key = Key::Character;
    Modifier modifiers = Modifier::None;
    std::string text; ///< One UTF-8 encoded character for Key::Character, empty otherwise.

    /// @brief True for Ctrl plus the given lower-case letter.
    [[nodiscard]] auto isCtrl(char letter) const noexcept -> bool
    {
        return key == Key::Character && hasModifier(modifiers, Modifier::Ctrl) && text.size() == 1
               && text.front() == letter;
    }

    /// @brief True for the given unmodified ASCII character.
    [[nodiscard]] auto is(char ch) const noexcept -> bool
    {
        return key == Key::Character && modifiers == Modifier::None && text.size() == 1 && text.front() == ch;
    }
};

/// @brief An SGR mouse report.
struct MouseEvent
{
    enum class Type : std::uint8_t
    {
        Press,
        Release,
        WheelUp,
        WheelDown,
    };

    Type type = Type::Press;
    int button = 0; ///< 0 = left, 1 = middle, 2 = right.
    int column = 0; ///< 1-based.
    int row = 0;    ///< 1-based.
};

struct ResizeEvent
{
    int columns = 0;
    int rows = 0;
};

/// @brief Text received between bracketed-paste markers.
struct PasteEvent
{
    std::string text;
};

using InputEvent = std::variant<KeyEvent, MouseEvent, ResizeEvent, PasteEvent>;

} // namespace tfview::tui
