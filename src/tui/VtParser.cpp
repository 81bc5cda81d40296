// SPDX-License-Identifier: Apache-2.0
#include <charconv>
#include <optional>

#include <tui/VtParser.hpp>

namespace tfview::tui
{

namespace
{
    constexpr char Esc = '\033';
    constexpr auto PasteEnd = std::string_view { "\033[201~" };

    /// Splits "a;b;c" into integers; empty or malformed fields become 0.
    auto parseParams(std::string_view text) -> std::vector<int>
    {
        auto result = std::vector<int> {};
        while (true)
        {
            auto const sep = text.find(';');
            auto const field = text.substr(0, sep);
            auto value = 0;
            if (std::from_chars(field.data(), field.data() + field.size(), value).ec != std::errc {})
                value = 0;
            result.push_back(value);
            if (sep == std::string_view::npos)
                return result;
            text.remove_prefix(sep + 1);
        }
    }

    /// xterm modifier parameter: 1 + shift + 2*alt + 4*ctrl.
    constexpr auto modifiersFromParam(int param) noexcept -> Modifier
    {
        auto mods = Modifier::None;
        if (param <= 1)
            return mods;
        auto const bits = param - 1;
        if (bits & 1)
            mods = mods | Modifier::Shift;
        if (bits & 2)
            mods = mods | Modifier::Alt;
        if (bits & 4)
            mods = mods | Modifier::Ctrl;
        return mods;
    }

    constexpr auto keyFromFinal(char finalByte) noexcept -> std::optional<Key>
    {
        switch (finalByte)
        {
            case 'A': return Key::Up;
            case 'B': return Key::Down;
            case 'C': return Key::Right;
            case 'D': return Key::Left;
            case 'H': return Key::Home;
            case 'F': return Key::End;
            default: return std::nullopt;
        }
    }

    constexpr auto keyFromTilde(int code) noexcept -> std::optional<Key>
    {
        switch (code)
        {
            case 1:
            case 7: return Key::Home;
            case 3: return Key::Delete;
            case 4:
            case 8: return Key::End;
            case 5: return Key::PageUp;
            case 6: return Key::PageDown;
            default: return std::nullopt;
        }
    }

    constexpr auto utf8Length(unsigned char lead) noexcept -> std::size_t
    {
        if ((lead & 0xE0) == 0xC0)
            return 2;
        if ((lead & 0xF0) == 0xE0)
            return 3;
        if ((lead & 0xF8) == 0xF0)
            return 4;
        return 0;
    }
} // namespace

auto VtParser::feed(std::string_view data) -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    for (auto const ch: data)
    {
        switch (_state)
        {
            case State::Ground: processGround(ch, events); break;
            case State::Escape: processEscape(ch, events); break;
            case State::Csi: processCsi(ch, events); break;
            case State::Ss3: processSs3(ch, events); break;
            case State::Paste: processPaste(ch, events); break;
        }
    }
    return events;
}

auto VtParser::timeout() -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    if (_state == State::Escape)
    {
        events.emplace_back(KeyEvent { .key = Key::Escape });
        _state = State::Ground;
    }
    return events;
}

void VtParser::processGround(char ch, std::vector<InputEvent>& events)
{
    auto const byte = static_cast<unsigned char>(ch);

    if (!_utf8.empty())
    {
        if ((byte & 0xC0) == 0x80)
        {
            _utf8 += ch;
            if (_utf8.size() == _utf8Expected)
            {
                events.emplace_back(KeyEvent { .text = std::move(_utf8) });
                _utf8.clear();
            }
            return;
        }
        // Truncated character: drop it and handle this byte normally.
        _utf8.clear();
    }

    if (ch == Esc)
    {
        _state = State::Escape;
        return;
    }

    switch (byte)
    {
        case '\r':
        case '\n': events.emplace_back(KeyEvent { .key = Key::Enter }); return;
        case '\t': events.emplace_back(KeyEvent { .key = Key::Tab }); return;
        case 0x08:
        case 0x7F: events.emplace_back(KeyEvent { .key = Key::Backspace }); return;
        default: break;
    }

    if (byte >= 0x01 && byte <= 0x1A)
    {
        events.emplace_back(KeyEvent {
            .modifiers = Modifier::Ctrl,
            .text = std::string(1, static_cast<char>('a' + byte - 1)),
        });
        return;
    }
    if (byte < 0x20)
        return;

    if (byte < 0x80)
    {
        events.emplace_back(KeyEvent { .text = std::string(1, ch) });
        return;
    }

    if (auto const length = utf8Length(byte); length > 0)
    {
        _utf8.assign(1, ch);
        _utf8Expected = length;
    }
}

void VtParser::processEscape(char ch, std::vector<InputEvent>& events)
{
    if (ch == '[')
    {
        _params.clear();
        _state = State::Csi;
        return;
    }
    if (ch == 'O')
    {
        _state = State::Ss3;
        return;
    }

    _state = State::Ground;
    if (ch >= 0x20 && ch < 0x7F)
    {
        events.emplace_back(KeyEvent { .modifiers = Modifier::Alt, .text = std::string(1, ch) });
        return;
    }

    events.emplace_back(KeyEvent { .key = Key::Escape });
    processGround(ch, events);
}

void VtParser::processCsi(char ch, std::vector<InputEvent>& events)
{
    if (ch >= 0x40 && ch <= 0x7E)
    {
        _state = State::Ground;
        dispatchCsi(ch, events);
        return;
    }
    if (ch >= 0x20 && ch <= 0x3F)
    {
        _params += ch;
        return;
    }

    // Not a CSI byte: abandon the sequence.
    _state = State::Ground;
    processGround(ch, events);
}

void VtParser::processSs3(char ch, std::vector<InputEvent>& events)
{
    _state = State::Ground;
    if (auto const key = keyFromFinal(ch))
        events.emplace_back(KeyEvent { .key = *key });
}

void VtParser::processPaste(char ch, std::vector<InputEvent>& events)
{
    _paste += ch;
    if (_paste.ends_with(PasteEnd))
    {
        _paste.resize(_paste.size() - PasteEnd.size());
        events.emplace_back(PasteEvent { .text = std::move(_paste) });
        _paste.clear();
        _state = State::Ground;
    }
}

void VtParser::dispatchCsi(char finalByte, std::vector<InputEvent>& events)
{
    if (_params.starts_with('<') && (finalByte == 'M' || finalByte == 'm'))
    {
        dispatchMouse(finalByte, events);
        return;
    }

    if (finalByte == '~' && _params == "200")
    {
        _paste.clear();
        _state = State::Paste;
        return;
    }

    if (_params.starts_with('?') || _params.starts_with('>') || _params.starts_with('<'))
        return;

    auto const params = parseParams(_params);
    auto const modifiers = params.size() >= 2 ? modifiersFromParam(params[1]) : Modifier::None;

    if (finalByte == 'Z')
    {
        events.emplace_back(KeyEvent { .key = Key::Tab, .modifiers = Modifier::Shift });
        return;
    }

    auto const key = finalByte == '~' ? keyFromTilde(params.front()) : keyFromFinal(finalByte);
    if (key)
        events.emplace_back(KeyEvent { .key = *key, .modifiers = modifiers });
}

void VtParser::dispatchMouse(char finalByte, std::vector<InputEvent>& events)
{
    auto const params = parseParams(std::string_view(_params).substr(1));
    if (params.size() < 3)
        return;

    auto const code = params[0];
    auto event = MouseEvent { .button = code & 3, .column = params[1], .row = params[2] };

    if ((code & 64) != 0)
    {
        if ((code & 3) > 1)
            return;
        event.type = (code & 1) == 0 ? MouseEvent::Type::WheelUp : MouseEvent::Type::WheelDown;
        event.button = 0;
    }
    else if ((code & 32) != 0)
    {
        return; // Motion reports are not used.
    }
    else
    {
        event.type = finalByte == 'M' ? MouseEvent::Type::Press : MouseEvent::Type::Release;
    }
    events.emplace_back(event);
}

} // namespace tfview::tui
