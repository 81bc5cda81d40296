// SPDX-License-Identifier: Apache-2.0
#include <parser/TextWrap.hpp>

#include <view/Projection.hpp>

namespace tfview
{

namespace
{
    struct Builder
    {
        std::vector<Line>& lines;
        int contentWidth;

        void add(Line prototype, std::string_view text, int width, int hangingIndent)
        {
            auto rows = wrapText(text, width, hangingIndent);
            for (auto i = std::size_t { 0 }; i < rows.size(); ++i)
            {
                auto line = prototype;
                line.content = std::move(rows[i]);
                line.continuation = i > 0;
                lines.push_back(std::move(line));
            }
        }

        void addDiagnostic(Diagnostic const& diagnostic, std::size_t index)
        {
            add(Line { .type = LineType::DiagnosticHeader, .diagnostic = index },
                diagnostic.summary,
                contentWidth - HeaderPrefixWidth,
                0);

            if (!diagnostic.expanded)
                return;

            for (auto j = std::size_t { 0 }; j < diagnostic.details.size(); ++j)
            {
                auto const& detail = diagnostic.details[j];
                add(Line { .type = LineType::DiagnosticDetail, .diagnostic = index, .entry = j, .marker = detail.isMarker },
                    detail.content,
                    contentWidth - DetailIndent,
                    hangingIndentFor(detail.content));
            }
        }

        void addResource(ResourceChange const& resource, std::size_t index)
        {
            add(Line { .type = LineType::ResourceHeader, .resource = index },
                resourceHeaderText(resource),
                contentWidth - HeaderPrefixWidth,
                0);

            if (!resource.expanded)
                return;

            for (auto j = std::size_t { 0 }; j < resource.attributes.size(); ++j)
            {
                auto const& attribute = resource.attributes[j];
                add(Line { .type = LineType::ResourceAttribute, .resource = index, .entry = j },
                    attribute,
                    contentWidth - DetailIndent,
                    hangingIndentFor(attribute));
            }
        }
    };
} // namespace

auto resourceHeaderText(ResourceChange const& resource) -> std::string
{
    if (resource.actionPhrase.empty())
        return resource.address;
    return resource.address + " " + resource.actionPhrase;
}

auto projectLines(ProjectionInput const& input) -> std::vector<Line>
{
    auto lines = std::vector<Line> {};
    auto builder = Builder { .lines = lines, .contentWidth = input.width - GutterWidth };

    if (input.mode == ViewMode::Log)
    {
        for (auto i = std::size_t { 0 }; i < input.logs.size(); ++i)
            builder.add(Line { .type = LineType::Log, .entry = i }, input.logs[i].text, builder.contentWidth, 0);
        for (auto i = std::size_t { 0 }; i < input.diagnostics.size(); ++i)
            builder.addDiagnostic(input.diagnostics[i], i);
        return lines;
    }

    for (auto i = std::size_t { 0 }; i < input.diagnostics.size(); ++i)
        builder.addDiagnostic(input.diagnostics[i], i);
    for (auto i = std::size_t { 0 }; i < input.resources.size(); ++i)
        builder.addResource(input.resources[i], i);
    return lines;
}

} // namespace tfview
