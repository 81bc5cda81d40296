// SPDX-License-Identifier: Apache-2.0
#include <parser/LineClassifier.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <format>
#include <iterator>
#include <random>
#include <string>
#include <string_view>
#include <vector>

using namespace tfview;

namespace
{

auto classify(std::string_view input, ClassifierOptions options = {}) -> std::vector<StreamMessage>
{
    auto classifier = LineClassifier(std::move(options));
    auto messages = classifier.feed(input);
    auto tail = classifier.finish();
    messages.insert(messages.end(), std::make_move_iterator(tail.begin()), std::make_move_iterator(tail.end()));
    return messages;
}

template <typename T>
auto collect(std::vector<StreamMessage> const& messages) -> std::vector<T>
{
    auto result = std::vector<T> {};
    for (auto const& message: messages)
        if (auto const* value = std::get_if<T>(&message))
            result.push_back(*value);
    return result;
}

/// One line per message, for comparing whole streams.
auto describe(std::vector<StreamMessage> const& messages) -> std::string
{
    auto text = std::string {};
    for (auto const& message: messages)
    {
        if (auto const* resource = std::get_if<ResourceChange>(&message))
        {
            text += std::format("resource {} {}\n", resource->address, actionName(resource->action));
            for (auto const& attribute: resource->attributes)
                text += std::format("  attr {}\n", attribute);
        }
        else if (auto const* diagnostic = std::get_if<Diagnostic>(&message))
        {
            text += std::format("diagnostic {} {}\n", severityName(diagnostic->severity), diagnostic->summary);
            for (auto const& detail: diagnostic->details)
                text += std::format("  detail {}\n", detail.content);
        }
        else if (auto const* log = std::get_if<LogLine>(&message))
            text += std::format("log {}\n", log->text);
        else if (auto const* prompt = std::get_if<Prompt>(&message))
            text += std::format("prompt {}\n", prompt->text);
        else if (auto const* finished = std::get_if<StreamFinished>(&message))
            text += std::format("finished {}\n", finished->receivedContent);
    }
    return text;
}

/// Every piece of text the classifier surfaced, concatenated.
auto surfacedText(std::vector<StreamMessage> const& messages) -> std::string
{
    auto text = std::string {};
    for (auto const& message: messages)
    {
        if (auto const* resource = std::get_if<ResourceChange>(&message))
        {
            text += resource->address + " " + resource->actionPhrase + "\n";
            for (auto const& attribute: resource->attributes)
                text += attribute + "\n";
        }
        else if (auto const* diagnostic = std::get_if<Diagnostic>(&message))
        {
            text += diagnostic->summary + "\n";
            for (auto const& detail: diagnostic->details)
                text += detail.content + "\n";
        }
        else if (auto const* log = std::get_if<LogLine>(&message))
            text += log->text + "\n";
    }
    return text;
}

constexpr auto CreatePlan = std::string_view {
    "# aws_instance.web will be created\n"
    "  + resource \"aws_instance\" \"web\" {\n"
    "      + ami = \"x\"\n"
    "    }\n"
};

} // namespace

TEST_CASE("LineClassifier: resource change block", "[parser][classifier]")
{
    auto const messages = classify(CreatePlan);
    auto const resources = collect<ResourceChange>(messages);

    REQUIRE(resources.size() == 1);
    CHECK(resources[0].address == "aws_instance.web");
    CHECK(resources[0].action == Action::Create);
    CHECK(resources[0].actionPhrase == "will be created");
    REQUIRE(resources[0].attributes.size() == 1);
    CHECK(resources[0].attributes[0] == "      + ami = \"x\"");
    CHECK_FALSE(resources[0].expanded);

    CHECK(collect<LogLine>(messages).empty());
    REQUIRE(std::holds_alternative<StreamFinished>(messages.back()));
    CHECK(std::get<StreamFinished>(messages.back()).receivedContent);
}

TEST_CASE("LineClassifier: diagnostic block", "[parser][classifier]")
{
    auto const messages = classify("╷\n│ Error: boom\n│ \n│   with aws_instance.web,\n╵\n");
    auto const diagnostics = collect<Diagnostic>(messages);

    REQUIRE(diagnostics.size() == 1);
    CHECK(diagnostics[0].severity == Severity::Error);
    CHECK(diagnostics[0].summary == "boom");
    REQUIRE(diagnostics[0].details.size() == 1);
    CHECK(diagnostics[0].details[0].content.find("aws_instance.web") != std::string::npos);
    CHECK(diagnostics[0].details[0].content == "  with aws_instance.web,");
}

TEST_CASE("LineClassifier: action phrases map to actions", "[parser][classifier]")
{
    auto const messages = classify("# a.one will be created\n"
                                   "# a.two will be updated in-place\n"
                                   "# a.three will be destroyed\n"
                                   "# a.four must be replaced\n"
                                   "# a.five will be imported\n");
    auto const resources = collect<ResourceChange>(messages);

    REQUIRE(resources.size() == 5);
    CHECK(resources[0].action == Action::Create);
    CHECK(resources[1].action == Action::Update);
    CHECK(resources[2].action == Action::Destroy);
    CHECK(resources[3].action == Action::Replace);
    CHECK(resources[4].action == Action::Import);
    CHECK(resources[3].address == "a.four");
}

TEST_CASE("LineClassifier: comment lines without an action phrase are logs", "[parser][classifier]")
{
    auto const messages = classify("# a.b will be renamed\n");
    CHECK(collect<ResourceChange>(messages).empty());
    auto const logs = collect<LogLine>(messages);
    REQUIRE(logs.size() == 1);
    CHECK(logs[0].text == "# a.b will be renamed");
}

TEST_CASE("LineClassifier: headers under color codes", "[parser][classifier]")
{
    auto const messages =
        classify("\033[1m  # aws_s3_bucket.logs\033[0m will be \033[1m\033[31mdestroyed\033[0m\n"
                 "\033[31m-\033[0m resource \"aws_s3_bucket\" \"logs\" {\n"
                 "      \033[31m-\033[0m bucket = \"logs\" \033[90m-> null\033[0m\n"
                 "    }\n");
    auto const resources = collect<ResourceChange>(messages);

    REQUIRE(resources.size() == 1);
    CHECK(resources[0].address == "aws_s3_bucket.logs");
    CHECK(resources[0].action == Action::Destroy);
    REQUIRE(resources[0].attributes.size() == 1);
    CHECK(resources[0].attributes[0] == "      - bucket = \"logs\" -> null");
}

TEST_CASE("LineClassifier: nested braces stay inside the resource", "[parser][classifier]")
{
    auto const messages = classify("# aws_instance.web will be updated in-place\n"
                                   "  ~ resource \"aws_instance\" \"web\" {\n"
                                   "      ~ tags = {\n"
                                   "          + \"Env\" = \"prod\"\n"
                                   "        }\n"
                                   "        id = \"i-123\"\n"
                                   "    }\n"
                                   "Plan: 0 to add, 1 to change, 0 to destroy.\n");
    auto const resources = collect<ResourceChange>(messages);

    REQUIRE(resources.size() == 1);
    CHECK(resources[0].attributes == std::vector<std::string> {
                                         "      ~ tags = {",
                                         "          + \"Env\" = \"prod\"",
                                         "        }",
                                         "        id = \"i-123\"",
                                     });

    auto const logs = collect<LogLine>(messages);
    REQUIRE(logs.size() == 1);
    CHECK(logs[0].text == "Plan: 0 to add, 1 to change, 0 to destroy.");
}

TEST_CASE("LineClassifier: single-line resource body", "[parser][classifier]")
{
    auto const messages = classify("# null_resource.x will be created\n"
                                   "  + resource \"null_resource\" \"x\" {}\n"
                                   "after\n");
    auto const resources = collect<ResourceChange>(messages);
    REQUIRE(resources.size() == 1);
    CHECK(resources[0].attributes.empty());
    CHECK(collect<LogLine>(messages).size() == 1);
}

TEST_CASE("LineClassifier: text on a closing brace line is kept", "[parser][classifier]")
{
    SECTION("multi-line body")
    {
        auto const resources = collect<ResourceChange>(classify("# a.b will be destroyed\n"
                                                                "  - resource \"a\" \"b\" {\n"
                                                                "      - x = 1\n"
                                                                "    } # trailing\n"));
        REQUIRE(resources.size() == 1);
        CHECK(resources[0].attributes == std::vector<std::string> { "      - x = 1", "    } # trailing" });
    }

    SECTION("single-line body")
    {
        auto const resources = collect<ResourceChange>(classify("# a.b will be created\n"
                                                                "  + resource \"a\" \"b\" {} # note\n"));
        REQUIRE(resources.size() == 1);
        CHECK(resources[0].attributes == std::vector<std::string> { "# note" });
    }
}

TEST_CASE("LineClassifier: plain lines become logs", "[parser][classifier]")
{
    auto const messages = classify("Refreshing state...\r\n\n   \nInitializing provider plugins...\n");
    auto const logs = collect<LogLine>(messages);
    REQUIRE(logs.size() == 2);
    CHECK(logs[0].text == "Refreshing state...");
    CHECK(logs[1].text == "Initializing provider plugins...");
}

TEST_CASE("LineClassifier: text after a close marker is kept", "[parser][classifier]")
{
    auto const messages = classify("╷\n│ Warning: careful\n╵ trailing note\n╵ stray\n");
    REQUIRE(collect<Diagnostic>(messages).size() == 1);
    auto const logs = collect<LogLine>(messages);
    REQUIRE(logs.size() == 2);
    CHECK(logs[0].text == "trailing note");
    CHECK(logs[1].text == "stray");
}

TEST_CASE("LineClassifier: detail lines keep bold and underline", "[parser][classifier]")
{
    auto const messages =
        classify("\033[31m╷\033[0m\n"
                 "\033[31m│\033[0m \033[1m\033[31mError: \033[0m\033[0m\033[1mUnsupported argument\033[0m\n"
                 "\033[31m│\033[0m   on main.tf line 4:\n"
                 "\033[31m│\033[0m    4:   \033[4mfoo\033[0m = 1\n"
                 "\033[31m╵\033[0m\n");
    auto const diagnostics = collect<Diagnostic>(messages);

    REQUIRE(diagnostics.size() == 1);
    CHECK(diagnostics[0].summary == "Unsupported argument");
    REQUIRE(diagnostics[0].details.size() == 2);
    CHECK(diagnostics[0].details[0].content == "  on main.tf line 4:");
    CHECK(diagnostics[0].details[0].isMarker);
    CHECK(diagnostics[0].details[1].content == "   4:   \033[4mfoo = 1");
}

TEST_CASE("LineClassifier: overlapping diagnostic blocks", "[parser][classifier]")
{
    auto const messages = classify("╷\n│ Error: first\n│ detail one\n╷\n│ Error: second\n╵\n");
    auto const diagnostics = collect<Diagnostic>(messages);

    REQUIRE(diagnostics.size() == 2);
    CHECK(diagnostics[0].summary == "first");
    REQUIRE(diagnostics[0].details.size() == 1);
    CHECK(diagnostics[0].details[0].content == "detail one");
    CHECK(diagnostics[1].summary == "second");
}

TEST_CASE("LineClassifier: truncated streams surface buffered content", "[parser][classifier]")
{
    SECTION("mid diagnostic block")
    {
        auto const diagnostics = collect<Diagnostic>(classify("╷\n│ Error: cut\n│ half a detail"));
        REQUIRE(diagnostics.size() == 1);
        CHECK(diagnostics[0].summary == "cut");
        REQUIRE(diagnostics[0].details.size() == 1);
        CHECK(diagnostics[0].details[0].content == "half a detail");
    }

    SECTION("mid resource block")
    {
        auto const resources = collect<ResourceChange>(classify("# a.b will be destroyed\n"
                                                                "  - resource \"a\" \"b\" {\n"
                                                                "      - id = \"1\"\n"));
        REQUIRE(resources.size() == 1);
        CHECK(resources[0].attributes == std::vector<std::string> { "      - id = \"1\"" });
    }

    SECTION("header without a body")
    {
        auto const resources = collect<ResourceChange>(classify("# a.b will be destroyed\n# c.d will be created"));
        REQUIRE(resources.size() == 2);
        CHECK(resources[0].address == "a.b");
        CHECK(resources[1].address == "c.d");
    }

    SECTION("mid line")
    {
        auto const logs = collect<LogLine>(classify("Apply complete!"));
        REQUIRE(logs.size() == 1);
        CHECK(logs[0].text == "Apply complete!");
    }
}

TEST_CASE("LineClassifier: resource interrupted by a diagnostic", "[parser][classifier]")
{
    auto const messages = classify("# a.b will be created\n"
                                   "  + resource \"a\" \"b\" {\n"
                                   "      + name = \"n\"\n"
                                   "╷\n"
                                   "│ Error: provider crashed\n"
                                   "╵\n");

    auto const resources = collect<ResourceChange>(messages);
    REQUIRE(resources.size() == 1);
    CHECK(resources[0].attributes.size() == 1);
    auto const diagnostics = collect<Diagnostic>(messages);
    REQUIRE(diagnostics.size() == 1);
    CHECK(diagnostics[0].summary == "provider crashed");
}

TEST_CASE("LineClassifier: prompt on the unterminated tail", "[parser][classifier]")
{
    auto classifier = LineClassifier();

    auto messages = classifier.feed("Do you want to perform these actions?\n  Enter a value: ");
    auto prompts = collect<Prompt>(messages);
    REQUIRE(prompts.size() == 1);
    CHECK(prompts[0].text == "Enter a value:");
    CHECK(collect<LogLine>(messages).size() == 1);

    SECTION("repeated partial data does not repeat the prompt")
    {
        CHECK(collect<Prompt>(classifier.feed("")).empty());
        CHECK(classifier.feed("\033[0m").empty());
    }

    SECTION("the answer completes the line")
    {
        messages = classifier.feed("yes\n");
        auto const logs = collect<LogLine>(messages);
        REQUIRE(logs.size() == 1);
        CHECK(logs[0].text == "  Enter a value: yes");
    }
}

TEST_CASE("LineClassifier: prompt sentinels are configurable", "[parser][classifier]")
{
    auto classifier = LineClassifier(ClassifierOptions { .promptSentinels = { "Password:", "[y/N]" } });

    CHECK(collect<Prompt>(classifier.feed("Enter a value: ")).empty());
    CHECK(collect<Prompt>(classifier.feed("\nContinue? [y/N]")).size() == 1);
    CHECK(collect<Prompt>(classifier.feed("\nPassword:")).size() == 1);
}

TEST_CASE("LineClassifier: chunking does not change the result", "[parser][classifier]")
{
    auto const input = std::string(CreatePlan) + "╷\n│ Warning: note\n│   on x.tf line 1:\n╵\nPlan: 1 to add.\n";
    auto const expected = describe(classify(input));

    for (auto const chunkSize: { 1, 2, 3, 7, 64 })
    {
        auto classifier = LineClassifier();
        auto messages = std::vector<StreamMessage> {};
        for (auto pos = std::size_t { 0 }; pos < input.size(); pos += static_cast<std::size_t>(chunkSize))
        {
            auto part = classifier.feed(std::string_view(input).substr(pos, static_cast<std::size_t>(chunkSize)));
            messages.insert(messages.end(), part.begin(), part.end());
        }
        auto tail = classifier.finish();
        messages.insert(messages.end(), tail.begin(), tail.end());

        INFO("chunk size " << chunkSize);
        CHECK(describe(messages) == expected);
    }
}

TEST_CASE("LineClassifier: received content flag", "[parser][classifier]")
{
    CHECK_FALSE(std::get<StreamFinished>(classify("").back()).receivedContent);
    CHECK_FALSE(std::get<StreamFinished>(classify("\n\n   \r\n").back()).receivedContent);
    CHECK(std::get<StreamFinished>(classify("x").back()).receivedContent);
}

TEST_CASE("LineClassifier: no meaningful line is lost", "[parser][classifier]")
{
    auto const input = std::string { "Terraform will perform the following actions:\n"
                                     "# module.db.aws_db_instance.main must be replaced\n"
                                     "-/+ resource \"aws_db_instance\" \"main\" {\n"
                                     "      ~ engine_version = \"13\" -> \"14\" # forces replacement\n"
                                     "    } # end of main\n"
                                     "╷\n"
                                     "│ preamble from the plugin\n"
                                     "│ Error: Provider produced inconsistent result\n"
                                     "│ \n"
                                     "│   on db.tf line 9, in resource \"aws_db_instance\" \"main\":\n"
                                     "╵\n"
                                     "╷\n"
                                     "│ something nobody anticipated\n"
                                     "│ and its follow-up\n"
                                     "╵\n"
                                     "╷\n"
                                     "│ Warning: unclosed\n"
                                     "╷\n"
                                     "│ Error: reopened\n"
                                     "# orphan.header will be imported\n"
                                     "Plan: 1 to import, 0 to add, 0 to change, 0 to destroy.\n"
                                     "no trailing newline" };

    auto const messages = classify(input);
    auto const text = surfacedText(messages);

    for (auto const fragment: {
             "Terraform will perform the following actions:",
             "module.db.aws_db_instance.main must be replaced",
             "~ engine_version = \"13\" -> \"14\" # forces replacement",
             "# end of main",
             "preamble from the plugin",
             "Provider produced inconsistent result",
             "on db.tf line 9, in resource \"aws_db_instance\" \"main\":",
             "something nobody anticipated",
             "and its follow-up",
             "unclosed",
             "reopened",
             "orphan.header will be imported",
             "Plan: 1 to import, 0 to add, 0 to change, 0 to destroy.",
             "no trailing newline",
         })
    {
        INFO(fragment);
        CHECK(text.find(fragment) != std::string::npos);
    }
}

TEST_CASE("LineClassifier: survives random and malformed input", "[parser][classifier][fuzz]")
{
    auto constexpr Pieces = std::array<std::string_view, 16> {
        "╷", "╵", "│", "{", "}", "\n", " ", "\033[", "\033[1m", "Error:", "Warning:",
        "# a.b will be created", " resource \"", "Enter a value:", "\r", "\xff\xfe",
    };

    auto rng = std::mt19937 { 20240521 };
    for (auto round = 0; round < 200; ++round)
    {
        auto input = std::string {};
        auto const length = std::uniform_int_distribution<int> { 0, 120 }(rng);
        for (auto i = 0; i < length; ++i)
        {
            if (std::uniform_int_distribution<int> { 0, 1 }(rng) == 0)
                input += Pieces[std::uniform_int_distribution<std::size_t> { 0, Pieces.size() - 1 }(rng)];
            else
                input += static_cast<char>(std::uniform_int_distribution<int> { 0, 255 }(rng));
        }

        auto classifier = LineClassifier();
        auto messages = std::vector<StreamMessage> {};
        auto pos = std::size_t { 0 };
        while (pos < input.size())
        {
            auto const chunk = std::uniform_int_distribution<std::size_t> { 1, 16 }(rng);
            REQUIRE_NOTHROW(static_cast<void>(classifier.feed(std::string_view(input).substr(pos, chunk))));
            pos += chunk;
        }
        auto tail = classifier.finish();

        REQUIRE(!tail.empty());
        CHECK(std::holds_alternative<StreamFinished>(tail.back()));
    }
}

TEST_CASE("LineClassifier: free helpers", "[parser][classifier]")
{
    SECTION("parseResourceHeader")
    {
        auto const header = parseResourceHeader("  # module.x.aws_iam_role.r[\"a b\"] will be destroyed");
        REQUIRE(header.has_value());
        CHECK(header->address == "module.x.aws_iam_role.r[\"a b\"]");
        CHECK(header->phrase == "will be destroyed");

        CHECK_FALSE(parseResourceHeader("# will be created").has_value());
        CHECK_FALSE(parseResourceHeader("a.b will be created").has_value());
        CHECK_FALSE(parseResourceHeader("#a.b will be created").has_value());
    }

    SECTION("stripBlockPrefix")
    {
        CHECK(stripBlockPrefix("│   on main.tf") == "  on main.tf");
        CHECK(stripBlockPrefix("│") == "");
        CHECK(stripBlockPrefix("\033[1m│ x") == "\033[1mx");
        CHECK(stripBlockPrefix("no prefix") == "no prefix");
    }
}
