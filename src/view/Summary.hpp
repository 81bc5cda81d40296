// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <parser/PlanTypes.hpp>

#include <span>
#include <string>

namespace tfview
{

/// @brief Counts shown in the footer.
struct PlanSummary
{
    int create = 0;
    int update = 0;
    int destroy = 0;
    int replace = 0;
    int import = 0;
    int errors = 0;
    int warnings = 0;

    [[nodiscard]] auto count(Action action) const noexcept -> int;
    [[nodiscard]] auto empty() const noexcept -> bool;
};

[[nodiscard]] auto summarize(std::span<ResourceChange const> resources, std::span<Diagnostic const> diagnostics)
    -> PlanSummary;

/// @brief Plain-text footer, e.g. "✗1 error  +2 create  -1 destroy", or "No changes".
[[nodiscard]] auto formatSummary(PlanSummary const& summary) -> std::string;

} // namespace tfview
