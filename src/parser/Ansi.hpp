// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace tfview::ansi
{

/// @brief Resets bold and underline without touching colors (SGR 22;24).
///
/// Emitted by renderers after content produced by sanitize(), instead of a full reset.
inline constexpr std::string_view FormattingReset = "\033[22;24m";

/// @brief Removes every CSI escape sequence (ESC '[' params intermediates final).
///
/// An unterminated sequence at the end of the input is removed as well.
/// Other bytes, including lone ESC characters, are kept.
[[nodiscard]] auto strip(std::string_view text) -> std::string;

/// @brief Removes color and reset sequences but keeps bold and underline.
///
/// Non-SGR CSI sequences are removed. Each SGR sequence is rewritten to contain only
/// its bold (1) and underline (4) parameters, or dropped entirely if none remain.
/// The result therefore never contains a reset-all code.
[[nodiscard]] auto sanitize(std::string_view text) -> std::string;

/// @brief Returns the length of the CSI sequence starting at @p pos, or 0 if there is none.
[[nodiscard]] auto csiLength(std::string_view text, std::size_t pos) noexcept -> std::size_t;

} // namespace tfview::ansi
