// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace tfview
{

namespace
{
    /// Values below 1 would stall the reader or the UI loop.
    auto positiveOr(int value, int fallback) -> int
    {
        return value > 0 ? value : fallback;
    }
} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/tfview";
    auto const* const home = std::getenv("HOME");
    if (home && *home)
        return std::string(home) + "/.config/tfview";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<ViewerConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} is not a JSON object", path));

    auto const defaults = ViewerConfig {};
    auto config = ViewerConfig {};
    config.tickIntervalMs =
        positiveOr(json::getIntOr(root, "tickIntervalMs", defaults.tickIntervalMs), defaults.tickIntervalMs);
    config.queueCapacity =
        positiveOr(json::getIntOr(root, "queueCapacity", defaults.queueCapacity), defaults.queueCapacity);
    config.readTimeoutMs =
        positiveOr(json::getIntOr(root, "readTimeoutMs", defaults.readTimeoutMs), defaults.readTimeoutMs);
    config.shutdownTimeoutMs = std::max(0, json::getIntOr(root, "shutdownTimeoutMs", defaults.shutdownTimeoutMs));
    config.promptSentinels = json::getStringListOr(root, "promptSentinels", defaults.promptSentinels);
    config.mouseScrollLines = positiveOr(json::getIntOr(root, "mouseScrollLines", defaults.mouseScrollLines),
                                         defaults.mouseScrollLines);
    config.startInLogView = json::getBoolOr(root, "startInLogView", defaults.startInLogView);
    config.logFile = json::getStringOr(root, "logFile", "");

    // An empty sentinel would match every tail.
    std::erase_if(config.promptSentinels, [](std::string const& s) { return s.empty(); });

    return config;
}

auto saveConfigToFile(std::string_view path, ViewerConfig const& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    root["tickIntervalMs"] = config.tickIntervalMs;
    root["queueCapacity"] = config.queueCapacity;
    root["readTimeoutMs"] = config.readTimeoutMs;
    root["shutdownTimeoutMs"] = config.shutdownTimeoutMs;
    root["promptSentinels"] = config.promptSentinels;
    root["mouseScrollLines"] = config.mouseScrollLines;
    root["startInLogView"] = config.startInLogView;
    if (!config.logFile.empty())
        root["logFile"] = config.logFile;

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write config file: {}", path));
    return {};
}

auto loadConfig() -> Result<ViewerConfig>
{
    auto const path = defaultConfigPath();
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
    {
        log::debug("No config file found at {}, using defaults", path);
        return ViewerConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace tfview
