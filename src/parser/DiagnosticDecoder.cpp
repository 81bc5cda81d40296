// SPDX-License-Identifier: Apache-2.0
#include <parser/Ansi.hpp>
#include <parser/DiagnosticDecoder.hpp>

#include <algorithm>
#include <cctype>
#include <vector>

namespace tfview
{

namespace
{
    constexpr auto Whitespace = std::string_view { " \t\r\n\v\f" };

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(Whitespace);
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(Whitespace);
        return text.substr(first, last - first + 1);
    }

    auto trimRight(std::string_view text) -> std::string_view
    {
        auto const last = text.find_last_not_of(Whitespace);
        if (last == std::string_view::npos)
            return {};
        return text.substr(0, last + 1);
    }

    auto isBlank(std::string_view text) -> bool
    {
        return trim(ansi::strip(text)).empty();
    }

    struct Heading
    {
        Severity severity;
        std::string summary;
    };

    /// Matches "Error: <text>" / "Warning: <text>" at the start of the plain text.
    auto matchHeading(std::string_view line) -> std::optional<Heading>
    {
        auto const plain = ansi::strip(line);
        auto const text = trim(plain);

        auto const tryPrefix = [&](std::string_view prefix, Severity severity) -> std::optional<Heading> {
            if (!text.starts_with(prefix))
                return std::nullopt;
            auto const rest = trim(text.substr(prefix.size()));
            if (rest.empty())
                return std::nullopt;
            return Heading { .severity = severity, .summary = std::string(rest) };
        };

        if (auto heading = tryPrefix("Error:", Severity::Error))
            return heading;
        return tryPrefix("Warning:", Severity::Warning);
    }

    auto makeDetail(std::string_view line) -> DiagnosticLine
    {
        return DiagnosticLine { .content = std::string(trimRight(line)), .isMarker = isSourceLocation(line) };
    }
} // namespace

auto isSourceLocation(std::string_view line) -> bool
{
    auto const plain = ansi::strip(line);
    auto const text = trim(plain);
    if (!text.starts_with("on "))
        return false;

    // "on <file> line <digits>" with a non-empty file part.
    auto const rest = text.substr(3);
    for (auto pos = rest.find(" line "); pos != std::string_view::npos; pos = rest.find(" line ", pos + 1))
    {
        if (trim(rest.substr(0, pos)).empty())
            continue;
        auto const after = rest.substr(pos + 6);
        if (!after.empty() && std::isdigit(static_cast<unsigned char>(after.front())))
            return true;
    }
    return false;
}

auto isUnderlineRow(std::string_view line) -> bool
{
    auto const plain = ansi::strip(line);
    auto const text = trim(plain);
    return !text.empty() && text.find_first_not_of("^~") == std::string_view::npos;
}

auto decodeDiagnostic(std::span<std::string const> lines) -> std::optional<Diagnostic>
{
    auto const first = std::ranges::find_if(lines, [](auto const& line) { return !isBlank(line); });
    if (first == lines.end())
        return std::nullopt;

    auto const body = std::span<std::string const>(first, lines.end());

    auto diagnostic = Diagnostic {};
    auto headingIndex = std::optional<std::size_t> {};
    for (auto i = std::size_t { 0 }; i < body.size(); ++i)
    {
        if (auto heading = matchHeading(body[i]))
        {
            diagnostic.severity = heading->severity;
            diagnostic.summary = std::move(heading->summary);
            headingIndex = i;
            break;
        }
    }

    if (!headingIndex)
    {
        // Unknown shape: surface it as an error rather than dropping it.
        diagnostic.severity = Severity::Error;
        diagnostic.summary = std::string(trim(ansi::strip(body.front())));
        headingIndex = 0;
    }

    for (auto i = std::size_t { 0 }; i < body.size(); ++i)
    {
        if (i == *headingIndex || isBlank(body[i]))
            continue;
        diagnostic.details.push_back(makeDetail(body[i]));
    }

    return diagnostic;
}

} // namespace tfview
