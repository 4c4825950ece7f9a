// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace sessionpulse
{

namespace
{
    constexpr auto KnownKeys = std::array<std::string_view, 8> {
        "position",        "show_tokens",         "show_elapsed",  "update_interval",
        "stuck_threshold", "enable_unstick_hint", "spinner_style", "queue_capacity",
    };

    auto typeError(std::string_view key, std::string_view expected) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ConfigError, std::format("Config key '{}' must be {}", key, expected));
    }

    auto readBool(nlohmann::json const& root, std::string_view key, bool& target) -> VoidResult
    {
        auto const it = root.find(std::string(key));
        if (it == root.end())
            return {};
        if (!it->is_boolean())
            return typeError(key, "a boolean");
        target = it->get<bool>();
        return {};
    }

    auto readSeconds(nlohmann::json const& root, std::string_view key, double& target) -> VoidResult
    {
        auto const it = root.find(std::string(key));
        if (it == root.end())
            return {};
        if (!it->is_number())
            return typeError(key, "a number of seconds");
        target = it->get<double>();
        return {};
    }

    auto readString(nlohmann::json const& root, std::string_view key) -> Result<std::optional<std::string>>
    {
        auto const it = root.find(std::string(key));
        if (it == root.end())
            return std::optional<std::string> {};
        if (!it->is_string())
            return typeError(key, "a string");
        return std::optional { it->get<std::string>() };
    }
} // namespace

auto parseIndicatorConfig(nlohmann::json const& root) -> Result<IndicatorConfig>
{
    auto config = IndicatorConfig {};
    if (root.is_null())
        return config;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Indicator config must be a JSON object");

    for (auto const& [key, value]: root.items())
    {
        if (std::ranges::find(KnownKeys, key) == KnownKeys.end())
            log::warning("Ignoring unknown config key '{}'", key);
    }

    auto position = readString(root, "position");
    if (!position)
        return std::unexpected(position.error());
    if (*position)
    {
        auto const parsed = statusLinePositionFromString(**position);
        if (!parsed)
            return makeError(ErrorCode::ConfigError,
                             std::format("Invalid position '{}' (expected bottom or inline)", **position));
        config.position = *parsed;
    }

    auto spinner = readString(root, "spinner_style");
    if (!spinner)
        return std::unexpected(spinner.error());
    if (*spinner)
    {
        auto const parsed = tui::spinnerTypeFromString(**spinner);
        if (!parsed)
            return makeError(ErrorCode::ConfigError, std::format("Unknown spinner style '{}'", **spinner));
        config.spinnerStyle = *parsed;
    }

    for (auto const& result: {
             readBool(root, "show_tokens", config.showTokens),
             readBool(root, "show_elapsed", config.showElapsed),
             readBool(root, "enable_unstick_hint", config.enableUnstickHint),
             readSeconds(root, "update_interval", config.updateInterval),
             readSeconds(root, "stuck_threshold", config.stuckThreshold),
         })
    {
        if (!result)
            return std::unexpected(result.error());
    }

    if (auto const it = root.find("queue_capacity"); it != root.end())
    {
        if (!it->is_number_integer() || it->get<std::int64_t>() <= 0)
            return typeError("queue_capacity", "a positive integer");
        config.queueCapacity = it->get<std::size_t>();
    }

    if (auto result = validateConfig(config); !result)
        return std::unexpected(result.error());

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<IndicatorConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid config file {}: {}", path, parseResult.error().message));

    return parseIndicatorConfig(*parseResult);
}

auto defaultConfigPath() -> std::string
{
    if (auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME"))
        return std::string(xdgConfig) + "/sessionpulse/config.json";
    if (auto const* const home = std::getenv("HOME"))
        return std::string(home) + "/.config/sessionpulse/config.json";
    return "sessionpulse.json";
}

auto loadConfig() -> Result<IndicatorConfig>
{
    auto const path = defaultConfigPath();
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
    {
        log::debug("No config file found at {}, using defaults", path);
        return IndicatorConfig {};
    }

    return loadConfigFromFile(path);
}

auto validateConfig(IndicatorConfig const& config) -> VoidResult
{
    if (!std::isfinite(config.updateInterval) || config.updateInterval <= 0.0)
        return makeError(ErrorCode::ConfigError,
                         std::format("update_interval must be greater than 0 (got {})", config.updateInterval));

    auto const maxInterval = std::chrono::duration<double>(RenderLoopConfig::MaxInterval).count();
    if (config.updateInterval > maxInterval)
        return makeError(ErrorCode::ConfigError,
                         std::format("update_interval must not exceed {} seconds (got {})",
                                     maxInterval,
                                     config.updateInterval));

    if (!std::isfinite(config.stuckThreshold) || config.stuckThreshold <= 0.0)
        return makeError(ErrorCode::ConfigError,
                         std::format("stuck_threshold must be greater than 0 (got {})", config.stuckThreshold));

    if (config.queueCapacity == 0)
        return makeError(ErrorCode::ConfigError, "queue_capacity must be greater than 0");

    return {};
}

auto processEnvironment() -> EnvironmentLookup
{
    return [](std::string_view name) -> std::optional<std::string> {
        if (auto const* const value = std::getenv(std::string(name).c_str()))
            return std::string(value);
        return std::nullopt;
    };
}

void applyEnvironment(IndicatorConfig& config, EnvironmentLookup const& environment)
{
    // Presence alone counts, whatever the value (https://no-color.org)
    if (environment("NO_COLOR"))
        config.colorsEnabled = false;

    if (environment("AMPLIFIER_NO_STATUS"))
    {
        log::debug("AMPLIFIER_NO_STATUS is set, status line disabled");
        config.renderingEnabled = false;
    }

    if (environment("TERM") == std::optional<std::string> { "dumb" })
    {
        log::debug("TERM=dumb, status line disabled");
        config.renderingEnabled = false;
    }
}

auto supportsStatusLine(int fd) -> bool
{
    return isatty(fd) == 1;
}

auto toIndicatorOptions(IndicatorConfig const& config) -> IndicatorOptions
{
    auto options = IndicatorOptions {};
    options.render.interval = secondsToDuration(config.updateInterval);
    options.render.stuckThreshold = secondsToDuration(config.stuckThreshold);
    options.render.spinner = config.spinnerStyle;
    options.render.display.showTokens = config.showTokens;
    options.render.display.showElapsed = config.showElapsed;
    options.render.display.colorsEnabled = config.colorsEnabled;
    options.render.display.unstickHint = config.enableUnstickHint;
    options.ingest.queueCapacity = config.queueCapacity;
    options.renderingEnabled = config.renderingEnabled;
    return options;
}

} // namespace sessionpulse
