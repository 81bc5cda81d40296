// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tfview
{

/// @brief Splits @p text into rows of at most @p maxWidth display columns.
///
/// Width is measured in terminal cells (wide characters count as two). Rows after the
/// first are prefixed with @p hangingIndent spaces. Wrapping happens at any character,
/// not at word boundaries. CSI escape sequences take no space and are never split.
///
/// A character that does not fit even on a fresh row is placed there anyway, so the
/// function always makes progress.
///
/// @return The input unsplit if @p maxWidth <= 0, and a single empty row for empty input.
[[nodiscard]] auto wrapText(std::string_view text, int maxWidth, int hangingIndent = 0)
    -> std::vector<std::string>;

/// @brief Computes the hanging indent for a plan diff line.
///
/// Counts leading spaces, plus two if the remaining content starts with a change
/// marker (+, -, ~), so continuation rows line up with the attribute name.
[[nodiscard]] auto hangingIndentFor(std::string_view line) noexcept -> int;

/// @brief Display width of @p text in terminal cells, ignoring CSI sequences.
[[nodiscard]] auto displayWidth(std::string_view text) -> int;

} // namespace tfview
