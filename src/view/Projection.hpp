// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <parser/PlanTypes.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tfview
{

/// @brief Which collection the viewport shows.
enum class ViewMode
{
    Log,  ///< Log lines, followed by diagnostics.
    Plan, ///< Diagnostics, followed by resource changes.
};

/// @brief Kind of a projected display row.
enum class LineType
{
    ResourceHeader,
    ResourceAttribute,
    DiagnosticHeader,
    DiagnosticDetail,
    Log,
};

/// @brief One row of the scrollable viewport.
///
/// Rows are rebuilt wholesale by projectLines(); they are never edited in place.
struct Line
{
    LineType type = LineType::Log;
    std::optional<std::size_t> resource;   ///< Owning ResourceChange.
    std::optional<std::size_t> diagnostic; ///< Owning Diagnostic.
    std::optional<std::size_t> entry;      ///< Attribute, detail or log index.
    std::string content;                   ///< Already wrapped to the viewport width.
    bool continuation = false;             ///< Second or later row of a wrapped entry.
    bool marker = false;                   ///< Diagnostic source-location row.
};

/// @brief Columns taken by the selection gutter ("► ").
inline constexpr int GutterWidth = 2;

/// @brief Columns taken by a header's expand icon and symbol ("▸ + ").
inline constexpr int HeaderPrefixWidth = 4;

/// @brief Extra indentation of attribute and detail rows below their header.
inline constexpr int DetailIndent = 2;

/// @brief Everything the projection depends on.
struct ProjectionInput
{
    std::span<ResourceChange const> resources;
    std::span<Diagnostic const> diagnostics;
    std::span<LogLine const> logs;
    ViewMode mode = ViewMode::Log;
    int width = 80; ///< Full viewport width in columns.
};

/// @brief Flattens the model into display rows.
///
/// Collapsed items contribute only their header. Every entry is wrapped to the space
/// left after the gutter (and header prefix or detail indent); attribute and detail rows
/// use the hanging indent of their diff marker.
[[nodiscard]] auto projectLines(ProjectionInput const& input) -> std::vector<Line>;

/// @brief Header text of a resource change before wrapping ("<address> <action phrase>").
[[nodiscard]] auto resourceHeaderText(ResourceChange const& resource) -> std::string;

} // namespace tfview
