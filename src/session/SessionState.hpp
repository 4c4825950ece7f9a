// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sessionpulse
{

/// @brief What the monitored session is currently doing.
enum class Activity : std::uint8_t
{
    Idle,
    Thinking,
    Executing,
    Streaming,
    Done,
    Errored,
};

/// @brief Converts an Activity enum to its string representation.
/// @param activity The activity to convert.
/// @return The lower-case name.
[[nodiscard]] constexpr auto activityToString(Activity activity) -> std::string_view
{
    switch (activity)
    {
        case Activity::Idle: return "idle";
        case Activity::Thinking: return "thinking";
        case Activity::Executing: return "executing";
        case Activity::Streaming: return "streaming";
        case Activity::Done: return "done";
        case Activity::Errored: return "errored";
    }
    return "unknown";
}

/// @brief A sub-agent that currently holds control.
struct Delegate
{
    std::string id;   ///< Sub-session identifier from the spawn payload.
    std::string name; ///< Agent name shown in the status line.
};

/// @brief The facts known about the monitored session.
///
/// A plain value type: copies are fully independent, which is what makes
/// StateTracker::snapshot() safe to hand to another thread.
struct SessionState
{
    Activity activity = Activity::Idle;
    std::optional<std::string> toolName;
    std::optional<std::string> delegateName;
    std::uint64_t tokensIn = 0;
    std::uint64_t tokensOut = 0;
    std::uint32_t turnCount = 0;
    Clock::TimePoint sessionStart {};
    Clock::TimePoint lastActivityAt {};
    bool started = false;
    bool terminal = false;

    std::optional<std::string> sessionId;
    std::optional<std::string> errorMessage;
    std::vector<Delegate> delegates; ///< Active sub-agents, oldest first.
};

} // namespace sessionpulse
