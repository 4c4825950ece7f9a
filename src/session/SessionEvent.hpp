// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace sessionpulse
{

/// @brief Lifecycle event kinds understood by the StateTracker.
enum class EventKind : std::uint8_t
{
    Unknown,
    SessionStart,
    SessionEnd,
    SessionError,
    LlmRequest,
    LlmResponse,
    LlmStream,
    ToolPre,
    ToolPost,
    TurnStart,
    TurnEnd,
    AgentSpawned,
    AgentComplete,
};

/// @brief Maps a host event name to its kind.
///
/// Any "llm:stream_*" name maps to LlmStream. The provider:request, provider:response,
/// thinking:delta and content_block:delta names are accepted as aliases.
/// @param name The event name as delivered by the host.
/// @return The event kind, or EventKind::Unknown.
[[nodiscard]] auto eventKindFromName(std::string_view name) -> EventKind;

/// @brief Returns the canonical event name for a kind.
[[nodiscard]] auto eventKindToString(EventKind kind) -> std::string_view;

/// @brief Returns the canonical event names this indicator subscribes to.
[[nodiscard]] auto subscribedEvents() -> std::span<std::string_view const>;

/// @brief A decoded host lifecycle event.
struct SessionEvent
{
    EventKind kind = EventKind::Unknown;
    std::string name;        ///< Original event name, kept for logging.
    Clock::TimePoint at {};  ///< When the host handed the event over.

    std::optional<std::string> sessionId;
    std::optional<std::string> toolName;
    std::optional<std::string> agentId;
    std::optional<std::string> agentName;
    std::optional<std::string> errorMessage;
    std::uint64_t tokensInDelta = 0;
    std::uint64_t tokensOutDelta = 0;
};

/// @brief Maximum length in grapheme clusters of an error message kept from a session:error payload.
constexpr auto MaxErrorMessageLength = 50;

/// @brief Decodes a host event into a SessionEvent.
///
/// Unknown event names decode successfully to EventKind::Unknown so that new host
/// events pass through harmlessly.
/// @param name The event name.
/// @param payload The event payload; must be an object or null.
/// @param at The ingestion timestamp.
/// @return The decoded event, or a MalformedEvent error.
[[nodiscard]] auto decodeEvent(std::string_view name, nlohmann::json const& payload, Clock::TimePoint at)
    -> Result<SessionEvent>;

} // namespace sessionpulse
