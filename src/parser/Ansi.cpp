// SPDX-License-Identifier: Apache-2.0
#include <parser/Ansi.hpp>

#include <charconv>
#include <vector>

namespace tfview::ansi
{

namespace
{
    constexpr char Esc = '\033';

    constexpr auto isParameterByte(char c) noexcept -> bool
    {
        return c >= 0x30 && c <= 0x3F;
    }

    constexpr auto isIntermediateByte(char c) noexcept -> bool
    {
        return c >= 0x20 && c <= 0x2F;
    }

    constexpr auto isFinalByte(char c) noexcept -> bool
    {
        return c >= 0x40 && c <= 0x7E;
    }

    /// Splits an SGR parameter string on ';' into integers; -1 marks an empty or malformed field.
    auto parseSgrParams(std::string_view params) -> std::vector<int>
    {
        auto result = std::vector<int> {};
        while (true)
        {
            auto const sep = params.find(';');
            auto const field = params.substr(0, sep);
            auto value = -1;
            if (!field.empty())
            {
                auto const [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
                if (ec != std::errc {} || ptr != field.data() + field.size())
                    value = -1;
            }
            result.push_back(value);
            if (sep == std::string_view::npos)
                break;
            params.remove_prefix(sep + 1);
        }
        return result;
    }

    /// Rewrites an SGR parameter list keeping only bold and underline.
    auto filterSgr(std::string_view params) -> std::string
    {
        auto const values = parseSgrParams(params);
        auto kept = std::string {};
        for (auto i = std::size_t { 0 }; i < values.size(); ++i)
        {
            auto const value = values[i];
            if (value == 38 || value == 48 || value == 58)
            {
                // Extended color: 5;n or 2;r;g;b follow.
                if (i + 1 < values.size() && values[i + 1] == 5)
                    i += 2;
                else if (i + 1 < values.size() && values[i + 1] == 2)
                    i += 4;
                continue;
            }
            if (value == 1 || value == 4)
            {
                if (!kept.empty())
                    kept += ';';
                kept += static_cast<char>('0' + value);
            }
        }
        return kept;
    }
} // namespace

auto csiLength(std::string_view text, std::size_t pos) noexcept -> std::size_t
{
    if (pos + 1 >= text.size() || text[pos] != Esc || text[pos + 1] != '[')
        return 0;

    auto i = pos + 2;
    while (i < text.size() && isParameterByte(text[i]))
        ++i;
    while (i < text.size() && isIntermediateByte(text[i]))
        ++i;
    if (i < text.size() && isFinalByte(text[i]))
        return i + 1 - pos;

    // Unterminated or malformed: consume up to the offending byte.
    return i - pos;
}

auto strip(std::string_view text) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());

    auto i = std::size_t { 0 };
    while (i < text.size())
    {
        if (auto const n = csiLength(text, i); n > 0)
        {
            i += n;
            continue;
        }
        result += text[i++];
    }
    return result;
}

auto sanitize(std::string_view text) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());

    auto i = std::size_t { 0 };
    while (i < text.size())
    {
        auto const n = csiLength(text, i);
        if (n == 0)
        {
            result += text[i++];
            continue;
        }

        auto const sequence = text.substr(i, n);
        i += n;

        if (sequence.size() < 3 || sequence.back() != 'm')
            continue;

        auto const params = sequence.substr(2, sequence.size() - 3);
        if (params.find_first_not_of("0123456789;") != std::string_view::npos)
            continue;

        if (auto const kept = filterSgr(params); !kept.empty())
        {
            result += "\033[";
            result += kept;
            result += 'm';
        }
    }
    return result;
}

} // namespace tfview::ansi
