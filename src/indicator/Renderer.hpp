// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <session/EscalationStateMachine.hpp>
#include <session/SessionState.hpp>
#include <session/StuckDetector.hpp>

#include <cstdint>
#include <string>

#include <tui/Text.hpp>

namespace sessionpulse
{

/// @brief Display options for the status line.
struct DisplayConfig
{
    bool showTokens = true;
    bool showElapsed = true;
    bool colorsEnabled = true;
    bool unstickHint = true; ///< Append "(Ctrl+C to interrupt)" to the idle warning.
    int maxColumns = 0;      ///< Truncate wider lines; 0 disables truncation.
};

/// @brief Everything the renderer needs for one frame, detached from the live state.
struct RenderSnapshot
{
    SessionState session;
    StuckStatus stuck;
    Clock::Duration elapsed {};
    EscalationLevel escalation = EscalationLevel::Normal;
    std::string spinnerFrame;
};

/// @brief Separator placed between status line fields.
constexpr auto FieldSeparator = std::string_view { " \u2502 " }; // │

/// @brief Formats a token count: verbatim below 1000, then "1.0K" and "1.5M" style.
[[nodiscard]] auto formatTokenCount(std::uint64_t count) -> std::string;

/// @brief Formats the token field, e.g. "12.5K↑ 45.0K↓".
[[nodiscard]] auto formatTokens(std::uint64_t tokensIn, std::uint64_t tokensOut) -> std::string;

/// @brief Formats a duration as "mm:ss", or "hh:mm:ss" from one hour on.
[[nodiscard]] auto formatElapsed(Clock::Duration elapsed) -> std::string;

/// @brief Returns the human-readable phrase for what the session is doing.
[[nodiscard]] auto activityPhrase(SessionState const& state) -> std::string;

/// @brief Builds the styled status line for a snapshot.
[[nodiscard]] auto buildStatusLine(RenderSnapshot const& snapshot, DisplayConfig const& config) -> tui::TextLine;

/// @brief Renders the status line to text.
///
/// Pure: the result depends only on the arguments. With colors disabled the result
/// contains no escape sequences.
[[nodiscard]] auto renderStatusLine(RenderSnapshot const& snapshot, DisplayConfig const& config) -> std::string;

} // namespace sessionpulse
