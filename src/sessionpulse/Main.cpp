// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <sessionpulse/App.hpp>
#include <sessionpulse/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "sessionpulse - live status line for agent sessions" };

    auto configPath = std::string {};
    auto position = std::string {};
    auto noTokens = false;
    auto noElapsed = false;
    auto interval = 0.0;
    auto stuckThreshold = 0.0;
    auto noUnstickHint = false;
    auto spinner = std::string {};
    auto logFile = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--position", position, "Status line position (bottom|inline)");
    app.add_flag("--no-tokens", noTokens, "Hide token counts");
    app.add_flag("--no-elapsed", noElapsed, "Hide elapsed time");
    app.add_option("--interval", interval, "Seconds between status line updates");
    app.add_option("--stuck-threshold", stuckThreshold, "Seconds of inactivity before warning");
    app.add_flag("--no-unstick-hint", noUnstickHint, "Do not suggest Ctrl+C when idle");
    app.add_option("--spinner", spinner, "Spinner style (dots|line|box|arrow|bounce|circle|grow|ellipsis)");
    app.add_option("--log-file", logFile, "Write log messages to a file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        sessionpulse::log::setLevel(sessionpulse::log::Level::Debug);

    // Load config
    auto configResult =
        configPath.empty() ? sessionpulse::loadConfig() : sessionpulse::loadConfigFromFile(configPath);

    if (!configResult)
    {
        sessionpulse::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!position.empty())
    {
        auto const parsed = sessionpulse::statusLinePositionFromString(position);
        if (!parsed)
        {
            sessionpulse::log::error("Invalid position '{}' (expected bottom or inline)", position);
            return 1;
        }
        config.position = *parsed;
    }
    if (!spinner.empty())
    {
        auto const parsed = sessionpulse::tui::spinnerTypeFromString(spinner);
        if (!parsed)
        {
            sessionpulse::log::error("Unknown spinner style '{}'", spinner);
            return 1;
        }
        config.spinnerStyle = *parsed;
    }
    if (noTokens)
        config.showTokens = false;
    if (noElapsed)
        config.showElapsed = false;
    if (noUnstickHint)
        config.enableUnstickHint = false;
    if (app.count("--interval") > 0)
        config.updateInterval = interval;
    if (app.count("--stuck-threshold") > 0)
        config.stuckThreshold = stuckThreshold;

    if (auto result = sessionpulse::validateConfig(config); !result)
    {
        sessionpulse::log::error("Invalid configuration: {}", result.error().message);
        return 1;
    }

    sessionpulse::applyEnvironment(config, sessionpulse::processEnvironment());
    if (!sessionpulse::supportsStatusLine(STDERR_FILENO))
        config.renderingEnabled = false;

    auto options = sessionpulse::AppOptions {};
    options.logFile = logFile;

    auto application = sessionpulse::App(std::move(config), std::move(options));
    auto initResult = application.initialize();
    if (!initResult)
    {
        sessionpulse::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
