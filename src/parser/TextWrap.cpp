// SPDX-License-Identifier: Apache-2.0
#include <parser/Ansi.hpp>
#include <parser/TextWrap.hpp>

#include <libunicode/width.h>

namespace tfview
{

namespace
{
    /// One unit of input: a whole UTF-8 sequence, a CSI sequence, or a single invalid byte.
    struct Glyph
    {
        std::size_t length = 1;
        int width = 0;
    };

    auto sequenceLength(unsigned char lead) noexcept -> std::size_t
    {
        if (lead < 0x80)
            return 1;
        if ((lead & 0xE0) == 0xC0)
            return 2;
        if ((lead & 0xF0) == 0xE0)
            return 3;
        if ((lead & 0xF8) == 0xF0)
            return 4;
        return 0;
    }

    auto nextGlyph(std::string_view text, std::size_t pos) -> Glyph
    {
        if (auto const csi = ansi::csiLength(text, pos); csi > 0)
            return Glyph { .length = csi, .width = 0 };

        auto const lead = static_cast<unsigned char>(text[pos]);
        auto const length = sequenceLength(lead);
        if (length == 0 || pos + length > text.size())
            return Glyph { .length = 1, .width = 1 };

        auto codepoint = static_cast<char32_t>(length == 1 ? lead : lead & (0x7F >> length));
        for (auto i = std::size_t { 1 }; i < length; ++i)
        {
            auto const next = static_cast<unsigned char>(text[pos + i]);
            if ((next & 0xC0) != 0x80)
                return Glyph { .length = 1, .width = 1 };
            codepoint = (codepoint << 6) | (next & 0x3F);
        }

        if (codepoint < 0x20 || codepoint == 0x7F)
            return Glyph { .length = length, .width = 0 };

        auto const width = static_cast<int>(unicode::width(codepoint));
        return Glyph { .length = length, .width = width < 0 ? 0 : width };
    }
} // namespace

auto wrapText(std::string_view text, int maxWidth, int hangingIndent) -> std::vector<std::string>
{
    if (maxWidth <= 0)
        return { std::string(text) };
    if (text.empty())
        return { std::string {} };

    if (hangingIndent < 0 || hangingIndent >= maxWidth)
        hangingIndent = 0;

    auto rows = std::vector<std::string> {};
    auto current = std::string {};
    auto currentWidth = 0;
    auto rowStartWidth = 0;

    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        auto const glyph = nextGlyph(text, pos);
        if (glyph.width > 0 && currentWidth + glyph.width > maxWidth && currentWidth > rowStartWidth)
        {
            rows.push_back(std::move(current));
            current = std::string(static_cast<std::size_t>(hangingIndent), ' ');
            currentWidth = hangingIndent;
            rowStartWidth = hangingIndent;
        }
        current.append(text.substr(pos, glyph.length));
        currentWidth += glyph.width;
        pos += glyph.length;
    }

    if (!current.empty())
        rows.push_back(std::move(current));

    return rows;
}

auto hangingIndentFor(std::string_view line) noexcept -> int
{
    auto const firstNonSpace = line.find_first_not_of(' ');
    if (firstNonSpace == std::string_view::npos)
        return static_cast<int>(line.size());

    auto indent = static_cast<int>(firstNonSpace);
    auto const contentStart = line.find_first_not_of(" \t", firstNonSpace);
    if (contentStart != std::string_view::npos)
    {
        auto const marker = line[contentStart];
        if (marker == '+' || marker == '-' || marker == '~')
            indent += 2;
    }
    return indent;
}

auto displayWidth(std::string_view text) -> int
{
    auto width = 0;
    for (auto pos = std::size_t { 0 }; pos < text.size();)
    {
        auto const glyph = nextGlyph(text, pos);
        width += glyph.width;
        pos += glyph.length;
    }
    return width;
}

} // namespace tfview
