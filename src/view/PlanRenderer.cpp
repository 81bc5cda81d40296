// SPDX-License-Identifier: Apache-2.0
#include <parser/Ansi.hpp>
#include <parser/DiagnosticDecoder.hpp>
#include <parser/TextWrap.hpp>

#include <view/PlanRenderer.hpp>

#include <algorithm>
#include <format>
#include <initializer_list>
#include <string>

namespace tfview
{

namespace
{
    constexpr auto ForcesReplacement = std::string_view { "# forces replacement" };

    auto trimmedFront(std::string_view text) -> char
    {
        auto const first = text.find_first_not_of(' ');
        return first == std::string_view::npos ? '\0' : text[first];
    }

    /// Writes segments of one row and keeps track of the columns used.
    struct RowWriter
    {
        tui::TerminalOutput& output;
        tui::Color background;
        int used = 0;

        void emit(std::string_view text, tui::Style style)
        {
            style.bg = background;
            output.write(text, style);
            used += displayWidth(text);
        }

        void padTo(int width)
        {
            if (used < width)
                emit(std::string(static_cast<std::size_t>(width - used), ' '), {});
        }
    };
} // namespace

void PlanRenderer::render(ViewModel const& model, tui::TerminalOutput& output) const
{
    auto const& lines = model.lines();
    auto const height = model.visibleHeight();
    auto const total = static_cast<int>(lines.size());
    auto const first = std::min(model.offset(), total);
    auto const last = std::min(first + height, total);
    auto const muted = tui::Style { .fg = _palette.muted };

    output.clearScreen();
    auto row = 1;
    auto const nextRow = [&]() -> bool {
        if (row > output.rows())
            return false;
        output.moveTo(row++, 1);
        return true;
    };

    if (nextRow())
        renderHeader(model, output);
    static_cast<void>(nextRow());

    if (nextRow() && first > 0)
        output.write(std::format("  ↑ {} more lines above", first), muted);

    for (auto i = 0; i < height; ++i)
    {
        if (!nextRow())
            return;
        if (first + i < last)
            renderLine(model, static_cast<std::size_t>(first + i), output);
    }

    if (nextRow() && total > last)
        output.write(std::format("  ↓ {} more lines below", total - last), muted);

    if (!model.prompt().empty() || model.typing())
    {
        static_cast<void>(nextRow());
        if (nextRow())
            renderPrompt(model, output);
    }

    static_cast<void>(nextRow());
    if (nextRow())
        renderFooter(model, output);
}

void PlanRenderer::renderHeader(ViewModel const& model, tui::TerminalOutput& output) const
{
    auto badgeStyle = tui::Style { .fg = _palette.base, .bold = true };
    auto badge = std::string_view {};
    auto title = std::string_view {};
    if (model.typing())
    {
        badgeStyle.bg = _palette.create;
        badge = " INPUT ";
        title = " Interactive Mode";
    }
    else if (model.viewMode() == ViewMode::Log)
    {
        badgeStyle.bg = _palette.replace;
        badge = " LOGS ";
        title = " Terraform Output";
    }
    else
    {
        badgeStyle.bg = _palette.planBadge;
        badge = " PLAN ";
        title = " Terraform Viewer";
    }

    auto const muted = tui::Style { .fg = _palette.muted };
    output.write(badge, badgeStyle);
    output.write(title, muted);

    switch (model.status())
    {
        case StreamStatus::Failed:
            output.write(std::format(" ● Exited with code {}", model.exitCode().value_or(-1)),
                         tui::Style { .fg = _palette.destroy, .bold = true });
            break;
        case StreamStatus::WaitingForInput:
            output.write(" ● WAITING FOR INPUT", tui::Style { .fg = _palette.warning, .bold = true });
            break;
        case StreamStatus::Live: output.write(" ● Live", muted); break;
        case StreamStatus::Done: output.write(" ● Done", muted); break;
    }

    auto controls = std::string { "  ↑↓:navigate  Enter:expand  e/c:all  L:mode  q:quit" };
    if (model.interactive())
        controls += model.typing() ? "  Esc:exit input" : "  i:input";
    output.write(controls, muted);
}

void PlanRenderer::renderLine(ViewModel const& model, std::size_t index, tui::TerminalOutput& output) const
{
    auto const& line = model.lines()[index];
    auto const selected = static_cast<int>(index) == model.cursor();

    auto writer = RowWriter { .output = output, .background = tui::Color {} };
    if (selected)
        writer.background = _palette.selection;
    writer.emit(selected ? "► " : "  ", tui::Style { .fg = _palette.text, .bold = selected });

    switch (line.type)
    {
        case LineType::Log: writer.emit(line.content, logStyle(line.content)); break;

        case LineType::DiagnosticHeader: {
            auto const& diagnostic = model.diagnostics()[*line.diagnostic];
            auto const style = tui::Style { .fg = severityColor(diagnostic.severity), .bold = true };
            if (line.continuation)
                writer.emit("    ", style);
            else
                writer.emit(std::format("{} {} ",
                                        diagnostic.expanded ? "▾" : "▸",
                                        diagnostic.severity == Severity::Error ? "✗" : "⚠"),
                            style);
            writer.emit(line.content, style);
            break;
        }

        case LineType::DiagnosticDetail: {
            auto const& diagnostic = model.diagnostics()[*line.diagnostic];
            auto style = tui::Style { .fg = _palette.text, .bold = line.marker };
            if (line.marker || isUnderlineRow(line.content))
                style.fg = severityColor(diagnostic.severity);
            writer.emit("  ", {});
            // Details may carry the tool's own bold/underline; end them without resetting colors.
            writer.emit(line.content + std::string(ansi::FormattingReset), style);
            break;
        }

        case LineType::ResourceHeader: {
            auto const& resource = model.resources()[*line.resource];
            auto const style = tui::Style { .fg = actionColor(resource.action), .bold = true };
            auto const muted = tui::Style { .fg = _palette.muted };
            if (line.continuation)
            {
                writer.emit("    ", style);
                writer.emit(line.content, muted);
                break;
            }
            writer.emit(std::format("{} {} ", resource.expanded ? "▾" : "▸", actionSymbol(resource.action)), style);
            auto const content = std::string_view(line.content);
            if (content.starts_with(resource.address))
            {
                writer.emit(content.substr(0, resource.address.size()), style);
                writer.emit(content.substr(resource.address.size()), muted);
            }
            else
            {
                writer.emit(content, style);
            }
            break;
        }

        case LineType::ResourceAttribute: {
            auto const& resource = model.resources()[*line.resource];
            auto const style = attributeStyle(resource.attributes[*line.entry]);
            auto const content = std::string_view(line.content);
            writer.emit("  ", {});
            if (auto const pos = content.find(ForcesReplacement); pos != std::string_view::npos)
            {
                writer.emit(content.substr(0, pos), style);
                writer.emit(ForcesReplacement, tui::Style { .fg = _palette.destroy, .bold = true });
                writer.emit(content.substr(pos + ForcesReplacement.size()), tui::Style { .fg = _palette.text });
            }
            else
            {
                writer.emit(content, style);
            }
            break;
        }
    }

    if (selected)
        writer.padTo(model.width());
}

void PlanRenderer::renderPrompt(ViewModel const& model, tui::TerminalOutput& output) const
{
    output.write(">> " + model.prompt(), tui::Style { .fg = _palette.prompt, .bold = true });
    if (model.typing())
    {
        output.write(" " + model.inputText(), tui::Style { .fg = _palette.create });
        output.write("█", tui::Style { .fg = _palette.muted });
    }
}

void PlanRenderer::renderFooter(ViewModel const& model, tui::TerminalOutput& output) const
{
    auto const muted = tui::Style { .fg = _palette.muted };
    if (model.viewMode() == ViewMode::Log)
    {
        output.write(std::format("{} lines", model.lines().size()), muted);
        return;
    }

    auto const summary = model.summary();
    if (summary.empty())
    {
        output.write("No changes", muted);
        return;
    }

    auto separator = std::string_view {};
    auto const part = [&](int count, std::string_view symbol, std::string_view label, tui::RgbColor color) {
        if (count == 0)
            return;
        output.writeRaw(separator);
        output.write(std::format("{}{} {}", symbol, count, label), tui::Style { .fg = color, .bold = true });
        separator = "  ";
    };

    part(summary.errors, "✗", "error", _palette.destroy);
    part(summary.warnings, "⚠", "warning", _palette.warning);
    for (auto const action: { Action::Create, Action::Update, Action::Destroy, Action::Replace, Action::Import })
        part(summary.count(action), actionSymbol(action), actionName(action), actionColor(action));
}

auto PlanRenderer::actionColor(Action action) const noexcept -> tui::RgbColor
{
    switch (action)
    {
        case Action::Create: return _palette.create;
        case Action::Update: return _palette.update;
        case Action::Destroy: return _palette.destroy;
        case Action::Replace: return _palette.replace;
        case Action::Import: return _palette.import;
        case Action::Unknown: break;
    }
    return _palette.text;
}

auto PlanRenderer::severityColor(Severity severity) const noexcept -> tui::RgbColor
{
    return severity == Severity::Error ? _palette.destroy : _palette.warning;
}

auto PlanRenderer::logStyle(std::string_view content) const -> tui::Style
{
    auto const contains = [&](std::string_view needle) { return content.find(needle) != std::string_view::npos; };

    if (contains("Error:"))
        return { .fg = _palette.destroy, .bold = true };
    if (contains("Warning:"))
        return { .fg = _palette.warning, .bold = true };
    if (content.starts_with("Initializing"))
        return { .fg = _palette.import, .bold = true };
    if (contains("Success!") || contains("Creation complete") || contains("Complete!"))
        return { .fg = _palette.create, .bold = true };
    if (contains("Enter a value:"))
        return { .fg = _palette.destroy, .bold = true };
    if (contains("Creating...") || contains("Destroying...") || contains("Modifying..."))
        return { .fg = _palette.update, .bold = true };
    return { .fg = _palette.text };
}

auto PlanRenderer::attributeStyle(std::string_view content) const -> tui::Style
{
    switch (trimmedFront(content))
    {
        case '+': return { .fg = _palette.create };
        case '-': return { .fg = _palette.destroy };
        case '~': return { .fg = _palette.update };
        default: return { .fg = _palette.muted };
    }
}

} // namespace tfview
