// SPDX-License-Identifier: Apache-2.0
#include <view/Summary.hpp>

#include <initializer_list>
#include <format>

namespace tfview
{

auto PlanSummary::count(Action action) const noexcept -> int
{
    switch (action)
    {
        case Action::Create: return create;
        case Action::Update: return update;
        case Action::Destroy: return destroy;
        case Action::Replace: return replace;
        case Action::Import: return import;
        case Action::Unknown: break;
    }
    return 0;
}

auto PlanSummary::empty() const noexcept -> bool
{
    return create == 0 && update == 0 && destroy == 0 && replace == 0 && import == 0 && errors == 0
           && warnings == 0;
}

auto summarize(std::span<ResourceChange const> resources, std::span<Diagnostic const> diagnostics)
    -> PlanSummary
{
    auto summary = PlanSummary {};
    for (auto const& resource: resources)
    {
        switch (resource.action)
        {
            case Action::Create: ++summary.create; break;
            case Action::Update: ++summary.update; break;
            case Action::Destroy: ++summary.destroy; break;
            case Action::Replace: ++summary.replace; break;
            case Action::Import: ++summary.import; break;
            case Action::Unknown: break;
        }
    }
    for (auto const& diagnostic: diagnostics)
    {
        if (diagnostic.severity == Severity::Error)
            ++summary.errors;
        else
            ++summary.warnings;
    }
    return summary;
}

auto formatSummary(PlanSummary const& summary) -> std::string
{
    if (summary.empty())
        return "No changes";

    auto text = std::string {};
    auto const append = [&](int count, std::string_view symbol, std::string_view label) {
        if (count == 0)
            return;
        if (!text.empty())
            text += "  ";
        text += std::format("{}{} {}", symbol, count, label);
    };

    append(summary.errors, "✗", "error");
    append(summary.warnings, "⚠", "warning");
    for (auto const action: { Action::Create, Action::Update, Action::Destroy, Action::Replace, Action::Import })
        append(summary.count(action), actionSymbol(action), actionName(action));
    return text;
}

} // namespace tfview
