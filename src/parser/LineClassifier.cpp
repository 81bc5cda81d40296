// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <parser/Ansi.hpp>
#include <parser/DiagnosticDecoder.hpp>
#include <parser/LineClassifier.hpp>

#include <algorithm>
#include <array>

namespace tfview
{

namespace
{
    constexpr auto BlockOpen = std::string_view { "╷" };
    constexpr auto BlockClose = std::string_view { "╵" };
    constexpr auto BlockLine = std::string_view { "│" };
    constexpr auto ResourceBodyToken = std::string_view { " resource \"" };
    constexpr auto Whitespace = std::string_view { " \t\r\n\v\f" };

    constexpr auto ActionPhrases = std::array<std::string_view, 5> {
        "will be created", "will be destroyed", "will be updated in-place", "must be replaced", "will be imported",
    };

    auto trimLeft(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(Whitespace);
        return first == std::string_view::npos ? std::string_view {} : text.substr(first);
    }

    auto trim(std::string_view text) -> std::string_view
    {
        text = trimLeft(text);
        auto const last = text.find_last_not_of(Whitespace);
        return last == std::string_view::npos ? std::string_view {} : text.substr(0, last + 1);
    }

    auto isBlank(std::string_view text) -> bool
    {
        return text.find_first_not_of(Whitespace) == std::string_view::npos;
    }

    auto netBraces(std::string_view line) -> int
    {
        return static_cast<int>(std::ranges::count(line, '{')) - static_cast<int>(std::ranges::count(line, '}'));
    }

    /// Whether the line carries anything besides braces and whitespace.
    auto hasTextBesidesBraces(std::string_view line) -> bool
    {
        return line.find_first_not_of(" \t\r\n\v\f{}") != std::string_view::npos;
    }

    /// Text following the last closing brace of a single-line body.
    auto textAfterBody(std::string_view line) -> std::string_view
    {
        return trim(line.substr(line.rfind('}') + 1));
    }
} // namespace

// ===== free helpers =====

auto parseResourceHeader(std::string_view line) -> std::optional<ResourceHeader>
{
    auto const text = trimLeft(line);
    if (!text.starts_with("# "))
        return std::nullopt;

    auto const rest = text.substr(2);

    // Earliest " <phrase>" wins; the address is everything before it.
    auto bestPos = std::string_view::npos;
    auto bestPhrase = std::string_view {};
    for (auto const phrase: ActionPhrases)
    {
        for (auto pos = rest.find(phrase); pos != std::string_view::npos; pos = rest.find(phrase, pos + 1))
        {
            if (pos == 0 || rest[pos - 1] != ' ')
                continue;
            if (pos < bestPos)
            {
                bestPos = pos;
                bestPhrase = phrase;
            }
            break;
        }
    }

    if (bestPos == std::string_view::npos)
        return std::nullopt;

    auto const address = rest.substr(0, bestPos - 1);
    if (address.empty() || isBlank(address))
        return std::nullopt;

    return ResourceHeader { .address = std::string(address), .phrase = std::string(bestPhrase) };
}

auto stripBlockPrefix(std::string_view line) -> std::string
{
    auto pos = std::size_t { 0 };
    while (auto const n = ansi::csiLength(line, pos))
        pos += n;

    if (line.substr(pos).starts_with(BlockLine))
    {
        auto result = std::string(line.substr(0, pos));
        auto rest = line.substr(pos + BlockLine.size());
        if (rest.starts_with(' '))
            rest.remove_prefix(1);
        result.append(rest);
        return result;
    }
    return std::string(line);
}

// ===== LineClassifier =====

LineClassifier::LineClassifier(ClassifierOptions options): _options(std::move(options))
{
}

auto LineClassifier::feed(std::string_view bytes) -> std::vector<StreamMessage>
{
    auto out = std::vector<StreamMessage> {};
    if (bytes.empty())
        return out;

    _pending.append(bytes);

    auto start = std::size_t { 0 };
    for (auto newline = _pending.find('\n'); newline != std::string::npos; newline = _pending.find('\n', start))
    {
        processLine(std::string_view(_pending).substr(start, newline - start), out);
        start = newline + 1;
        _lastPrompt.clear();
    }
    _pending.erase(0, start);

    checkPrompt(out);
    return out;
}

auto LineClassifier::finish() -> std::vector<StreamMessage>
{
    auto out = std::vector<StreamMessage> {};

    if (!_pending.empty())
    {
        auto const tail = std::move(_pending);
        _pending.clear();
        processLine(tail, out);
    }

    flushDiagnostic(out);
    flushResource(out);
    _state = State::Normal;
    _braceDepth = 0;
    _lastPrompt.clear();

    out.emplace_back(StreamFinished { .receivedContent = _receivedContent });
    return out;
}

void LineClassifier::processLine(std::string_view rawLine, std::vector<StreamMessage>& out)
{
    if (rawLine.ends_with('\r'))
        rawLine.remove_suffix(1);

    auto const stripped = ansi::strip(rawLine);
    auto const line = std::string_view(stripped);
    if (!isBlank(line))
        _receivedContent = true;

    switch (_state)
    {
        case State::InsideDiagnosticBlock:
            if (line.starts_with(BlockClose))
            {
                flushDiagnostic(out);
                _state = State::Normal;
                if (auto const rest = line.substr(BlockClose.size()); !isBlank(rest))
                    out.emplace_back(LogLine { .text = std::string(trim(rest)) });
                return;
            }
            if (line.starts_with(BlockOpen))
            {
                log::debug("Diagnostic block reopened before it was closed");
                openDiagnosticBlock(rawLine, out);
                return;
            }
            _diagnosticLines.push_back(stripBlockPrefix(ansi::sanitize(rawLine)));
            return;

        case State::InsideResourceBlock:
            if (line.starts_with(BlockOpen) || parseResourceHeader(line))
            {
                log::debug("Resource block of {} ended without closing brace", _resource ? _resource->address : "?");
                flushResource(out);
                _state = State::Normal;
                processNormalLine(rawLine, line, out);
                return;
            }

            _braceDepth += netBraces(line);
            if (_braceDepth <= 0 && line.find('}') != std::string_view::npos)
            {
                if (hasTextBesidesBraces(line) && _resource)
                    _resource->attributes.emplace_back(line);
                flushResource(out);
                _state = State::Normal;
                return;
            }
            if (!isBlank(line) && _resource)
                _resource->attributes.emplace_back(line);
            return;

        case State::Normal: processNormalLine(rawLine, line, out); return;
    }
}

void LineClassifier::processNormalLine(std::string_view rawLine,
                                       std::string_view line,
                                       std::vector<StreamMessage>& out)
{
    if (line.starts_with(BlockOpen))
    {
        openDiagnosticBlock(rawLine, out);
        return;
    }

    if (line.starts_with(BlockClose))
    {
        // Close marker without an open block: keep whatever text follows it.
        if (auto const rest = line.substr(BlockClose.size()); !isBlank(rest))
            out.emplace_back(LogLine { .text = std::string(trim(rest)) });
        return;
    }

    if (auto header = parseResourceHeader(line))
    {
        flushResource(out);
        auto const action = actionFromPhrase(header->phrase);
        _resource = ResourceChange {
            .address = std::move(header->address),
            .action = action,
            .actionPhrase = std::move(header->phrase),
        };
        return;
    }

    if (_resource && line.find(ResourceBodyToken) != std::string_view::npos)
    {
        _braceDepth = netBraces(line);
        if (_braceDepth <= 0 && line.find('}') != std::string_view::npos)
        {
            if (auto const trailing = textAfterBody(line); !trailing.empty())
                _resource->attributes.emplace_back(trailing);
            flushResource(out);
            return;
        }
        _state = State::InsideResourceBlock;
        return;
    }

    if (!isBlank(line))
        out.emplace_back(LogLine { .text = std::string(line) });
}

void LineClassifier::openDiagnosticBlock(std::string_view rawLine, std::vector<StreamMessage>& out)
{
    flushDiagnostic(out);
    _state = State::InsideDiagnosticBlock;

    // Text sharing the line with the open marker belongs to the block.
    auto const sanitized = ansi::sanitize(rawLine);
    auto const markerPos = sanitized.find(BlockOpen);
    if (markerPos == std::string::npos)
        return;
    auto const rest = std::string_view(sanitized).substr(markerPos + BlockOpen.size());
    if (!isBlank(ansi::strip(rest)))
        _diagnosticLines.emplace_back(trimLeft(rest));
}

void LineClassifier::checkPrompt(std::vector<StreamMessage>& out)
{
    if (_pending.empty())
        return;

    auto const stripped = ansi::strip(_pending);
    auto const text = trim(stripped);
    if (text.empty() || text == _lastPrompt)
        return;

    auto const matches = std::ranges::any_of(_options.promptSentinels, [&](std::string const& sentinel) {
        return !sentinel.empty() && text.ends_with(sentinel);
    });
    if (!matches)
        return;

    _lastPrompt = std::string(text);
    out.emplace_back(Prompt { .text = _lastPrompt });
}

void LineClassifier::flushDiagnostic(std::vector<StreamMessage>& out)
{
    if (_state != State::InsideDiagnosticBlock && _diagnosticLines.empty())
        return;

    if (auto diagnostic = decodeDiagnostic(_diagnosticLines))
        out.emplace_back(std::move(*diagnostic));
    _diagnosticLines.clear();
}

void LineClassifier::flushResource(std::vector<StreamMessage>& out)
{
    if (!_resource)
        return;

    out.emplace_back(std::move(*_resource));
    _resource.reset();
    _braceDepth = 0;
}

} // namespace tfview
