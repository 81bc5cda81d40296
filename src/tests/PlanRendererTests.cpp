// SPDX-License-Identifier: Apache-2.0
#include <view/PlanRenderer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>
#include <string>

using namespace tfview;

namespace
{

auto renderFrame(ViewModel const& model, int columns = 80, int rows = 24) -> std::string
{
    auto output = tui::TerminalOutput {};
    output.setDimensions(columns, rows);
    PlanRenderer {}.render(model, output);
    return std::string(output.pending());
}

auto contains(std::string_view haystack, std::string_view needle) -> bool
{
    return haystack.find(needle) != std::string_view::npos;
}

auto makeModel(ViewModelOptions options = {}) -> ViewModel
{
    auto model = ViewModel(options);
    model.resize(80, 24);
    return model;
}

} // namespace

TEST_CASE("PlanRenderer: header badge follows the view mode", "[view][renderer]")
{
    auto model = makeModel();
    auto frame = renderFrame(model);
    CHECK(contains(frame, " LOGS "));
    CHECK(contains(frame, "0 lines"));
    CHECK(contains(frame, "● Live"));
    CHECK_FALSE(contains(frame, "i:input"));

    model.toggleViewMode();
    frame = renderFrame(model);
    CHECK(contains(frame, " PLAN "));
    CHECK(contains(frame, "No changes"));
}

TEST_CASE("PlanRenderer: plan rows and summary", "[view][renderer]")
{
    auto model = makeModel();
    model.apply(ResourceChange {
        .address = "aws_instance.web",
        .action = Action::Create,
        .actionPhrase = "will be created",
        .attributes = { "      + ami = \"ami-123\"" },
    });
    model.apply(StreamFinished { .receivedContent = true });
    model.tick();

    auto const frame = renderFrame(model);
    CHECK(contains(frame, " PLAN "));
    CHECK(contains(frame, "● Done"));
    CHECK(contains(frame, "► "));
    CHECK(contains(frame, "▸ + "));
    CHECK(contains(frame, "aws_instance.web"));
    CHECK(contains(frame, " will be created"));
    CHECK(contains(frame, "+1 create"));
    CHECK_FALSE(contains(frame, "ami-123"));

    model.toggleExpandAtCursor();
    CHECK(contains(renderFrame(model), "ami-123"));
}

TEST_CASE("PlanRenderer: scroll indicators", "[view][renderer]")
{
    auto model = makeModel();
    for (auto i = 0; i < 30; ++i)
        model.apply(LogLine { .text = std::format("line {}", i) });
    model.tick();

    auto const hidden = 30 - model.visibleHeight();
    auto frame = renderFrame(model);
    CHECK(contains(frame, std::format("↑ {} more lines above", hidden)));
    CHECK_FALSE(contains(frame, "more lines below"));

    model.home();
    frame = renderFrame(model);
    CHECK(contains(frame, std::format("↓ {} more lines below", hidden)));
    CHECK_FALSE(contains(frame, "more lines above"));
}

TEST_CASE("PlanRenderer: prompt and input", "[view][renderer]")
{
    auto model = makeModel(ViewModelOptions { .interactive = true });
    model.apply(Prompt { .text = "Enter a value:" });
    model.tick();

    auto frame = renderFrame(model);
    CHECK(contains(frame, "WAITING FOR INPUT"));
    CHECK(contains(frame, ">> Enter a value:"));
    CHECK(contains(frame, "i:input"));

    REQUIRE(model.beginInput());
    model.appendInput("yes");
    frame = renderFrame(model);
    CHECK(contains(frame, " INPUT "));
    CHECK(contains(frame, " yes"));
    CHECK(contains(frame, "Esc:exit input"));
}

TEST_CASE("PlanRenderer: failed command", "[view][renderer]")
{
    auto model = makeModel(ViewModelOptions { .interactive = true });
    model.apply(Diagnostic { .severity = Severity::Error, .summary = "Invalid reference" });
    model.setExitCode(1);
    model.tick();

    auto const frame = renderFrame(model);
    CHECK(contains(frame, "Exited with code 1"));
    CHECK(contains(frame, "✗ "));
    CHECK(contains(frame, "Invalid reference"));
}

TEST_CASE("PlanRenderer: short terminals drop rows instead of overflowing", "[view][renderer]")
{
    auto model = ViewModel {};
    model.resize(80, 3);
    model.apply(LogLine { .text = "only line" });
    model.tick();

    auto const frame = renderFrame(model, 80, 3);
    CHECK(contains(frame, " LOGS "));
    CHECK_FALSE(contains(frame, "\033[4;1H"));
    CHECK_FALSE(contains(frame, "1 lines"));
}
