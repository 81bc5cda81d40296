// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <tfview/App.hpp>
#include <tfview/Config.hpp>

#include <CLI/CLI.hpp>

#include <string>
#include <vector>

int main(int argc, char** argv)
{
    auto app = CLI::App { "tfview - interactive viewer for terraform/tofu plan output" };
    app.usage("Usage: terraform plan 2>&1 | tfview [OPTIONS]\n"
              "       tfview [OPTIONS] -- terraform apply [ARGS...]");

    auto configPath = std::string {};
    auto logFile = std::string {};
    auto verbose = false;
    auto startInPlanView = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--log-file", logFile, "Append the viewer's own log messages to this file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--plan", startInPlanView, "Start in the plan view instead of the log view");
    // Everything from the first positional argument on is the command to run.
    app.prefix_command();
    app.footer("Without a command the plan is read from stdin.");

    CLI11_PARSE(app, argc, argv);

    auto command = app.remaining();
    if (!command.empty() && command.front() == "--")
        command.erase(command.begin());

    if (verbose)
        tfview::log::setLevel(tfview::log::Level::Debug);

    auto configResult = configPath.empty() ? tfview::loadConfig() : tfview::loadConfigFromFile(configPath);
    if (!configResult)
    {
        tfview::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Command line overrides the config file.
    if (!logFile.empty())
        config.logFile = logFile;
    if (startInPlanView)
        config.startInLogView = false;

    auto application = tfview::App(std::move(config), std::move(command));
    return application.run();
}
