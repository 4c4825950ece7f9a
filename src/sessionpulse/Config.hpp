// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <indicator/SessionIndicator.hpp>
#include <indicator/StatusLine.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <tui/Spinner.hpp>

namespace sessionpulse
{

/// @brief Indicator configuration, resolved once at startup.
struct IndicatorConfig
{
    StatusLinePosition position = StatusLinePosition::Bottom;
    bool showTokens = true;
    bool showElapsed = true;
    double updateInterval = 0.1;  ///< Seconds between renders.
    double stuckThreshold = 60.0; ///< Seconds without activity before the session counts as stuck.
    bool enableUnstickHint = true;
    tui::SpinnerType spinnerStyle = tui::SpinnerType::Dots;
    std::size_t queueCapacity = 1024;

    // Resolved from the environment, not from the config object.
    bool colorsEnabled = true;
    bool renderingEnabled = true;
};

/// @brief Looks up an environment variable; std::nullopt if it is not set.
using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// @brief Builds a configuration from a host-supplied JSON object.
///
/// Missing keys keep their defaults; a null value yields the defaults. Values of the wrong
/// type or out of range produce a ConfigError. Unknown keys are logged and ignored.
/// @param config The configuration object.
/// @return The configuration or an error.
[[nodiscard]] auto parseIndicatorConfig(nlohmann::json const& config) -> Result<IndicatorConfig>;

/// @brief Loads the configuration from a JSON file.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<IndicatorConfig>;

/// @brief Loads the configuration from the default config path, or the defaults if there is none.
[[nodiscard]] auto loadConfig() -> Result<IndicatorConfig>;

/// @brief Returns the default config file path ($XDG_CONFIG_HOME/sessionpulse/config.json).
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Checks the value ranges of a configuration.
/// @return Success or a ConfigError naming the offending key.
[[nodiscard]] auto validateConfig(IndicatorConfig const& config) -> VoidResult;

/// @brief Returns an EnvironmentLookup backed by the process environment.
[[nodiscard]] auto processEnvironment() -> EnvironmentLookup;

/// @brief Applies NO_COLOR, AMPLIFIER_NO_STATUS and TERM=dumb to the configuration.
void applyEnvironment(IndicatorConfig& config, EnvironmentLookup const& environment);

/// @brief Returns whether a status line can be drawn on @p fd (it is a terminal).
[[nodiscard]] auto supportsStatusLine(int fd) -> bool;

/// @brief Converts the configuration into runtime options for SessionIndicator.
[[nodiscard]] auto toIndicatorOptions(IndicatorConfig const& config) -> IndicatorOptions;

} // namespace sessionpulse
