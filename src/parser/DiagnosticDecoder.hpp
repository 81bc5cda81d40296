// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <parser/PlanTypes.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace tfview
{

/// @brief Turns the body of a diagnostic block into a Diagnostic.
///
/// @p lines are the block's lines with the "│" prefix already removed; they may still
/// carry bold/underline escape codes. The first "Error: ..." or "Warning: ..." line
/// determines severity and summary. Lines before it are kept as details ahead of the
/// rest. If no such line exists, the first non-blank line becomes the summary and the
/// severity is Error.
///
/// @return std::nullopt only if every line is blank.
[[nodiscard]] auto decodeDiagnostic(std::span<std::string const> lines) -> std::optional<Diagnostic>;

/// @brief Tests whether @p line names a source location ("on main.tf line 12").
[[nodiscard]] auto isSourceLocation(std::string_view line) -> bool;

/// @brief Tests whether @p line only underlines a column range ("    ^~~~").
[[nodiscard]] auto isUnderlineRow(std::string_view line) -> bool;

} // namespace tfview
