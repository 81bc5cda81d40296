// SPDX-License-Identifier: Apache-2.0
#include <tfview/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace tfview;

namespace
{

auto writeTempFile(std::string_view name, std::string_view content) -> std::filesystem::path
{
    auto const path = std::filesystem::temp_directory_path() / name;
    auto file = std::ofstream(path);
    file << content;
    return path;
}

} // namespace

TEST_CASE("defaultConfigPath returns a path ending with tfview/config.json", "[config]")
{
    REQUIRE(!defaultConfigDir().empty());
    REQUIRE(defaultConfigPath().ends_with("tfview/config.json"));
}

TEST_CASE("ViewerConfig has expected defaults", "[config]")
{
    auto const config = ViewerConfig {};
    CHECK(config.tickIntervalMs == 50);
    CHECK(config.queueCapacity == 100);
    CHECK(config.readTimeoutMs == 100);
    CHECK(config.shutdownTimeoutMs == 5000);
    REQUIRE(config.promptSentinels.size() == 1);
    CHECK(config.promptSentinels[0] == "Enter a value:");
    CHECK(config.mouseScrollLines == 3);
    CHECK(config.startInLogView);
    CHECK(config.logFile.empty());
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = writeTempFile("tfview_test_config.json", R"({
        "tickIntervalMs": 20,
        "queueCapacity": 500,
        "readTimeoutMs": 250,
        "shutdownTimeoutMs": 1000,
        "promptSentinels": ["Enter a value:", "Do you want to continue?"],
        "mouseScrollLines": 5,
        "startInLogView": false,
        "logFile": "/tmp/tfview.log"
    })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;
    CHECK(config.tickIntervalMs == 20);
    CHECK(config.queueCapacity == 500);
    CHECK(config.readTimeoutMs == 250);
    CHECK(config.shutdownTimeoutMs == 1000);
    REQUIRE(config.promptSentinels.size() == 2);
    CHECK(config.promptSentinels[1] == "Do you want to continue?");
    CHECK(config.mouseScrollLines == 5);
    CHECK_FALSE(config.startInLogView);
    CHECK(config.logFile == "/tmp/tfview.log");

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile keeps defaults for absent keys", "[config]")
{
    auto const tempPath = writeTempFile("tfview_test_empty.json", "{}");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(result->tickIntervalMs == 50);
    CHECK(result->promptSentinels == ViewerConfig {}.promptSentinels);
    CHECK(result->startInLogView);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile replaces invalid values", "[config]")
{
    auto const tempPath = writeTempFile("tfview_test_invalid_values.json", R"({
        "tickIntervalMs": 0,
        "queueCapacity": -3,
        "readTimeoutMs": "fast",
        "shutdownTimeoutMs": -1,
        "promptSentinels": ["", "Enter a value:", ""],
        "mouseScrollLines": 0
    })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(result->tickIntervalMs == 50);
    CHECK(result->queueCapacity == 100);
    CHECK(result->readTimeoutMs == 100);
    CHECK(result->shutdownTimeoutMs == 0);
    CHECK(result->promptSentinels == std::vector<std::string> { "Enter a value:" });
    CHECK(result->mouseScrollLines == 3);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile returns error for non-existent file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const tempPath = writeTempFile("tfview_test_invalid.json", "{ invalid json }}}");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects a non-object root", "[config]")
{
    auto const tempPath = writeTempFile("tfview_test_array.json", "[1, 2, 3]");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("saveConfigToFile writes a valid config that can be loaded back", "[config]")
{
    auto const tempDir = std::filesystem::temp_directory_path() / "tfview_test_save";
    auto const tempPath = tempDir / "nested" / "config.json";
    std::filesystem::remove_all(tempDir);

    auto config = ViewerConfig {};
    config.tickIntervalMs = 30;
    config.shutdownTimeoutMs = 2000;
    config.promptSentinels = { "Enter a value:", "Only 'yes' will be accepted" };
    config.startInLogView = false;
    config.logFile = "/tmp/tfview-save.log";

    auto saveResult = saveConfigToFile(tempPath.string(), config);
    REQUIRE(saveResult.has_value());

    auto loadResult = loadConfigFromFile(tempPath.string());
    REQUIRE(loadResult.has_value());

    auto const& loaded = *loadResult;
    CHECK(loaded.tickIntervalMs == 30);
    CHECK(loaded.queueCapacity == 100);
    CHECK(loaded.shutdownTimeoutMs == 2000);
    CHECK(loaded.promptSentinels == config.promptSentinels);
    CHECK_FALSE(loaded.startInLogView);
    CHECK(loaded.logFile == "/tmp/tfview-save.log");

    std::filesystem::remove_all(tempDir);
}
