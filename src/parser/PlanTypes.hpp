// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tfview
{

/// @brief Kind of change planned for a single resource.
enum class Action
{
    Unknown,
    Create,
    Update,
    Destroy,
    Replace,
    Import,
};

/// @brief Severity of a diagnostic block.
enum class Severity
{
    Error,
    Warning,
};

/// @brief Maps a plan action phrase (e.g. "will be created") to its Action.
///
/// The mapping is exact. Unrecognized phrases yield Action::Unknown.
[[nodiscard]] constexpr auto actionFromPhrase(std::string_view phrase) noexcept -> Action
{
    if (phrase == "will be created")
        return Action::Create;
    if (phrase == "will be updated in-place")
        return Action::Update;
    if (phrase == "will be destroyed")
        return Action::Destroy;
    if (phrase == "must be replaced")
        return Action::Replace;
    if (phrase == "will be imported")
        return Action::Import;
    return Action::Unknown;
}

[[nodiscard]] constexpr auto actionName(Action action) noexcept -> std::string_view
{
    switch (action)
    {
        case Action::Unknown: return "";
        case Action::Create: return "create";
        case Action::Update: return "update";
        case Action::Destroy: return "destroy";
        case Action::Replace: return "replace";
        case Action::Import: return "import";
    }
    return "";
}

/// @brief Single-character change marker shown in resource headers.
[[nodiscard]] constexpr auto actionSymbol(Action action) noexcept -> std::string_view
{
    switch (action)
    {
        case Action::Create: return "+";
        case Action::Update: return "~";
        case Action::Destroy: return "-";
        case Action::Replace: return "±";
        case Action::Import: return "←";
        case Action::Unknown: break;
    }
    return "?";
}

[[nodiscard]] constexpr auto severityName(Severity severity) noexcept -> std::string_view
{
    return severity == Severity::Error ? "Error" : "Warning";
}

/// @brief One resource's planned change.
///
/// Attribute lines are kept verbatim (ANSI-stripped) including their indentation.
struct ResourceChange
{
    std::string address;
    Action action = Action::Unknown;
    std::string actionPhrase;
    std::vector<std::string> attributes;
    bool expanded = false;
};

/// @brief One line below a diagnostic's summary.
struct DiagnosticLine
{
    std::string content;
    bool isMarker = false; ///< Source location line, e.g. "on main.tf line 3".
};

/// @brief One error or warning block.
struct Diagnostic
{
    Severity severity = Severity::Error;
    std::string summary;
    std::vector<DiagnosticLine> details;
    bool expanded = false;
};

/// @brief A line of output that is neither part of a diagnostic nor of a resource block.
struct LogLine
{
    std::string text;
};

/// @brief An interactive prompt detected at the unterminated end of the stream.
struct Prompt
{
    std::string text;
};

/// @brief Terminal message of a stream.
struct StreamFinished
{
    bool receivedContent = false;
};

/// @brief Unit of communication between the reader thread and the view model.
///
/// Every payload is an independent value; the sender keeps no reference to it.
using StreamMessage = std::variant<ResourceChange, Diagnostic, LogLine, Prompt, StreamFinished>;

} // namespace tfview
