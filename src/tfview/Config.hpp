// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace tfview
{

/// @brief Viewer configuration. Every key is optional in the JSON file.
struct ViewerConfig
{
    /// @brief Interval between batched re-projections of the plan.
    int tickIntervalMs = 50;

    /// @brief Capacity of the queue between the reader thread and the UI.
    int queueCapacity = 100;

    /// @brief Longest blocking read before the reader re-checks for cancellation.
    int readTimeoutMs = 100;

    /// @brief Grace period between SIGTERM and SIGKILL when the child is stopped.
    int shutdownTimeoutMs = 5000;

    /// @brief Suffixes that mark an unterminated output line as an interactive prompt.
    std::vector<std::string> promptSentinels = { "Enter a value:" };

    int mouseScrollLines = 3;
    bool startInLogView = true;

    /// @brief Optional file receiving the viewer's own log messages.
    std::string logFile;
};

/// @brief Loads the configuration from the default config path.
///
/// A missing file is not an error and yields the defaults.
[[nodiscard]] auto loadConfig() -> Result<ViewerConfig>;

/// @brief Loads the configuration from a specific file path.
/// @return ConfigError if the file cannot be read or is not valid JSON.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<ViewerConfig>;

/// @brief Writes the configuration, creating the parent directory if needed.
[[nodiscard]] auto saveConfigToFile(std::string_view path, ViewerConfig const& config) -> VoidResult;

/// @brief $XDG_CONFIG_HOME/tfview, or ~/.config/tfview.
[[nodiscard]] auto defaultConfigDir() -> std::string;

[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace tfview
