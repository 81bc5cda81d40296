// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <view/ViewModel.hpp>

#include <algorithm>

#include <libunicode/utf8_grapheme_segmenter.h>

namespace tfview
{

namespace
{
    auto makeEmptyPipeWarning() -> Diagnostic
    {
        return Diagnostic {
            .severity = Severity::Warning,
            .summary = "No input received",
            .details = {
                { .content = "Terraform writes errors to stderr, which a pipe does not capture." },
                { .content = "Redirect it as well, e.g.: terraform plan 2>&1 | tfview" },
            },
            .expanded = true,
        };
    }
} // namespace

ViewModel::ViewModel(ViewModelOptions options):
    _options(options), _mode(options.startInLogView ? ViewMode::Log : ViewMode::Plan)
{
}

// ===== stream =====

void ViewModel::apply(StreamMessage message)
{
    if (auto* resource = std::get_if<ResourceChange>(&message))
    {
        _resources.push_back(std::move(*resource));
        if (_resources.size() == 1 && !_hasError && _exitCode.value_or(0) == 0)
            setViewMode(ViewMode::Plan);
    }
    else if (auto* diagnostic = std::get_if<Diagnostic>(&message))
    {
        auto const isError = diagnostic->severity == Severity::Error;
        _diagnostics.push_back(std::move(*diagnostic));
        if (isError)
        {
            _hasError = true;
            setViewMode(ViewMode::Log);
        }
    }
    else if (auto* logLine = std::get_if<LogLine>(&message))
    {
        _logs.push_back(std::move(*logLine));
    }
    else if (auto* prompt = std::get_if<Prompt>(&message))
    {
        _prompt = std::move(prompt->text);
    }
    else if (auto const* finished = std::get_if<StreamFinished>(&message))
    {
        if (_done)
            return;
        _done = true;
        _prompt.clear();
        if (!finished->receivedContent && !_options.interactive)
        {
            log::warning("No input received on stdin");
            _diagnostics.push_back(makeEmptyPipeWarning());
        }
    }
    _dirty = true;
}

void ViewModel::streamClosed()
{
    if (!_done)
        apply(StreamFinished { .receivedContent = hasContent() });
}

void ViewModel::setExitCode(int exitCode)
{
    _exitCode = exitCode;
    if (exitCode != 0)
    {
        log::info("Command exited with code {}", exitCode);
        setViewMode(ViewMode::Log);
    }
    _dirty = true;
}

void ViewModel::tick()
{
    if (!_dirty)
        return;

    rebuild();
    if (_following)
        _cursor = static_cast<int>(_lines.size()) - 1;
    clampCursor();
    ensureCursorVisible();
}

// ===== navigation =====

void ViewModel::moveCursor(int delta)
{
    _following = false;
    _cursor += delta;
    clampCursor();
    ensureCursorVisible();
}

void ViewModel::pageUp()
{
    moveCursor(-std::max(1, visibleHeight() / 2));
}

void ViewModel::pageDown()
{
    moveCursor(std::max(1, visibleHeight() / 2));
}

void ViewModel::home()
{
    _following = false;
    _cursor = 0;
    _offset = 0;
    clampCursor();
}

void ViewModel::end()
{
    _following = false;
    _cursor = static_cast<int>(_lines.size()) - 1;
    clampCursor();
    ensureCursorVisible();
}

void ViewModel::scroll(int direction)
{
    moveCursor(direction < 0 ? -_options.mouseScrollLines : _options.mouseScrollLines);
}

void ViewModel::click(int screenRow)
{
    _following = false;
    auto const row = screenRow - ContentTopRow;
    if (row < 0 || row >= visibleHeight())
        return;

    auto const index = _offset + row;
    if (index < 0 || index >= static_cast<int>(_lines.size()))
        return;

    if (index == _cursor)
        toggleExpand(static_cast<std::size_t>(index));
    else
        _cursor = index;
}

void ViewModel::toggleExpand(std::size_t lineIndex)
{
    if (lineIndex >= _lines.size())
        return;

    auto const& line = _lines[lineIndex];
    if (line.type == LineType::ResourceHeader && line.resource && *line.resource < _resources.size())
    {
        auto& resource = _resources[*line.resource];
        resource.expanded = !resource.expanded;
    }
    else if (line.type == LineType::DiagnosticHeader && line.diagnostic && *line.diagnostic < _diagnostics.size())
    {
        auto& diagnostic = _diagnostics[*line.diagnostic];
        diagnostic.expanded = !diagnostic.expanded;
    }
    else
    {
        return;
    }

    rebuild();
    clampCursor();
    clampOffset();
}

void ViewModel::toggleExpandAtCursor()
{
    _following = false;
    if (_cursor >= 0)
        toggleExpand(static_cast<std::size_t>(_cursor));
}

void ViewModel::setAllExpanded(bool expanded)
{
    _following = false;
    for (auto& resource: _resources)
        resource.expanded = expanded;
    for (auto& diagnostic: _diagnostics)
        diagnostic.expanded = expanded;

    rebuild();
    clampCursor();
    clampOffset();
}

void ViewModel::toggleViewMode()
{
    setViewMode(_mode == ViewMode::Log ? ViewMode::Plan : ViewMode::Log);
    rebuild();
    _cursor = 0;
    _offset = 0;
    _following = false;
    clampCursor();
}

void ViewModel::resize(int width, int height)
{
    _width = std::max(1, width);
    _height = std::max(1, height);
    rebuild();
    clampCursor();
    ensureCursorVisible();
}

// ===== interactive input =====

auto ViewModel::beginInput() -> bool
{
    if (!_options.interactive)
        return false;
    if (!_typing)
        _dirty = true;
    _typing = true;
    ensureCursorVisible();
    return true;
}

void ViewModel::appendInput(std::string_view text)
{
    if (_typing)
        _input.append(text);
}

void ViewModel::eraseLastInputCharacter()
{
    if (!_typing || _input.empty())
        return;

    // Erase the whole last grapheme cluster, so that a base character and its
    // combining marks go away together.
    auto const text = std::string_view(_input);
    auto segmenter = unicode::utf8_grapheme_segmenter(text);

    auto lastBoundary = std::size_t { 0 };
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        lastBoundary = static_cast<std::size_t>(it._clusterStart - text.data());

    _input.erase(lastBoundary);
}

void ViewModel::cancelInput()
{
    if (_typing)
        _dirty = true;
    _typing = false;
    ensureCursorVisible();
}

auto ViewModel::submitInput() -> std::string
{
    auto payload = std::move(_input);
    payload += '\n';
    _input.clear();
    _prompt.clear();
    _typing = false;
    _following = true;
    setViewMode(ViewMode::Log);
    rebuild();
    _cursor = static_cast<int>(_lines.size()) - 1;
    clampCursor();
    ensureCursorVisible();
    return payload;
}

// ===== queries =====

auto ViewModel::visibleHeight() const noexcept -> int
{
    auto height = _height - ChromeRows;
    if (!_prompt.empty() || _typing)
        height -= PromptRows;
    return std::max(1, height);
}

auto ViewModel::status() const noexcept -> StreamStatus
{
    if (_exitCode.value_or(0) != 0)
        return StreamStatus::Failed;
    if (!_prompt.empty())
        return StreamStatus::WaitingForInput;
    return _done ? StreamStatus::Done : StreamStatus::Live;
}

auto ViewModel::summary() const -> PlanSummary
{
    return summarize(_resources, _diagnostics);
}

// ===== internals =====

void ViewModel::rebuild()
{
    _lines = projectLines(ProjectionInput {
        .resources = _resources,
        .diagnostics = _diagnostics,
        .logs = _logs,
        .mode = _mode,
        .width = _width,
    });
    _dirty = false;
}

void ViewModel::setViewMode(ViewMode mode)
{
    if (_mode == mode)
        return;
    log::debug("Switching to {} view", mode == ViewMode::Log ? "log" : "plan");
    _mode = mode;
    _dirty = true;
}

void ViewModel::clampCursor()
{
    auto const maxCursor = std::max(0, static_cast<int>(_lines.size()) - 1);
    _cursor = std::clamp(_cursor, 0, maxCursor);
}

void ViewModel::clampOffset()
{
    auto const maxOffset = std::max(0, static_cast<int>(_lines.size()) - visibleHeight());
    _offset = std::clamp(_offset, 0, maxOffset);
}

void ViewModel::ensureCursorVisible()
{
    auto const height = visibleHeight();
    if (_cursor < _offset)
        _offset = _cursor;
    else if (_cursor >= _offset + height)
        _offset = _cursor - height + 1;
    clampOffset();
}

auto ViewModel::hasContent() const noexcept -> bool
{
    return !_resources.empty() || !_diagnostics.empty() || !_logs.empty();
}

} // namespace tfview
