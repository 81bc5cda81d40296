// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>
#include <view/ViewModel.hpp>

#include <string_view>

namespace tfview
{

/// @brief Colors used by the plan viewer (Catppuccin Mocha).
struct PlanPalette
{
    tui::RgbColor text { 0xcd, 0xd6, 0xf4 };
    tui::RgbColor muted { 0x7f, 0x84, 0x9c };
    tui::RgbColor base { 0x1e, 0x1e, 0x2e };
    tui::RgbColor selection { 0x45, 0x47, 0x5a };
    tui::RgbColor create { 0xa6, 0xe3, 0xa1 };
    tui::RgbColor update { 0xf9, 0xe2, 0xaf };
    tui::RgbColor destroy { 0xff, 0x55, 0x55 };
    tui::RgbColor replace { 0xcb, 0xa6, 0xf7 };
    tui::RgbColor import { 0x89, 0xdc, 0xeb };
    tui::RgbColor warning { 0xfa, 0xb3, 0x87 };
    tui::RgbColor prompt { 0xf5, 0xc2, 0xe7 };
    tui::RgbColor planBadge { 0x89, 0xb4, 0xfa };
};

/// @brief Paints one frame of the viewer.
///
/// Layout, top to bottom: header, blank row, "more above" indicator, the visible lines,
/// "more below" indicator, the pinned prompt (if any), blank row and footer. The row
/// offsets match ViewModel::ContentTopRow and ViewModel::ChromeRows.
class PlanRenderer
{
  public:
    PlanRenderer() = default;
    explicit PlanRenderer(PlanPalette palette): _palette(palette) {}

    void render(ViewModel const& model, tui::TerminalOutput& output) const;

  private:
    void renderHeader(ViewModel const& model, tui::TerminalOutput& output) const;
    void renderLine(ViewModel const& model, std::size_t index, tui::TerminalOutput& output) const;
    void renderPrompt(ViewModel const& model, tui::TerminalOutput& output) const;
    void renderFooter(ViewModel const& model, tui::TerminalOutput& output) const;

    [[nodiscard]] auto actionColor(Action action) const noexcept -> tui::RgbColor;
    [[nodiscard]] auto severityColor(Severity severity) const noexcept -> tui::RgbColor;
    [[nodiscard]] auto logStyle(std::string_view content) const -> tui::Style;
    [[nodiscard]] auto attributeStyle(std::string_view content) const -> tui::Style;

    PlanPalette _palette;
};

} // namespace tfview
