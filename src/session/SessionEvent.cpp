// SPDX-License-Identifier: Apache-2.0
#include "SessionEvent.hpp"

#include <core/JsonUtils.hpp>

#include <array>
#include <format>

#include <tui/Text.hpp>

namespace sessionpulse
{

namespace
{

    struct EventName
    {
        std::string_view name;
        EventKind kind;
    };

    constexpr auto StreamPrefix = std::string_view { "llm:stream_" };

    constexpr auto CanonicalNames = std::array {
        EventName { "session:start", EventKind::SessionStart },
        EventName { "session:end", EventKind::SessionEnd },
        EventName { "session:error", EventKind::SessionError },
        EventName { "llm:request", EventKind::LlmRequest },
        EventName { "llm:response", EventKind::LlmResponse },
        EventName { "llm:stream_start", EventKind::LlmStream },
        EventName { "llm:stream_chunk", EventKind::LlmStream },
        EventName { "llm:stream_end", EventKind::LlmStream },
        EventName { "tool:pre", EventKind::ToolPre },
        EventName { "tool:post", EventKind::ToolPost },
        EventName { "turn:start", EventKind::TurnStart },
        EventName { "turn:end", EventKind::TurnEnd },
        EventName { "task:agent_spawned", EventKind::AgentSpawned },
        EventName { "task:agent_complete", EventKind::AgentComplete },
    };

    constexpr auto AliasNames = std::array {
        EventName { "provider:request", EventKind::LlmRequest },
        EventName { "thinking:delta", EventKind::LlmRequest },
        EventName { "provider:response", EventKind::LlmResponse },
        EventName { "content_block:delta", EventKind::LlmStream },
    };

    constexpr auto SubscribedNames = [] {
        auto names = std::array<std::string_view, CanonicalNames.size() + AliasNames.size()> {};
        auto i = std::size_t { 0 };
        for (auto const& entry: CanonicalNames)
            names[i++] = entry.name;
        for (auto const& entry: AliasNames)
            names[i++] = entry.name;
        return names;
    }();

    /// @brief The "task" tool spawns a sub-agent; its input names the agent.
    constexpr auto DelegationToolName = std::string_view { "task" };

    auto decodeErrorMessage(nlohmann::json const& payload) -> std::optional<std::string>
    {
        auto message = json::findString(payload, "error");
        if (!message && payload.contains("error"))
            message = json::findString(payload["error"], "message");
        if (!message)
            message = json::findString(payload, "message");
        if (!message)
            return std::nullopt;
        return tui::truncate(*message, MaxErrorMessageLength, "");
    }

    void decodeTokenUsage(nlohmann::json const& payload, SessionEvent& event)
    {
        if (payload.contains("usage") && payload["usage"].is_object())
        {
            auto const& usage = payload["usage"];
            event.tokensInDelta = json::findCount(usage, "input_tokens").value_or(0);
            event.tokensOutDelta = json::findCount(usage, "output_tokens").value_or(0);
            return;
        }

        event.tokensInDelta = json::findCount(payload, "input_tokens").value_or(0);
        if (auto const output = json::findCount(payload, "output_tokens"))
            event.tokensOutDelta = *output;
        else
            event.tokensOutDelta = json::findCount(payload, "token_count").value_or(0);
    }

    void decodeToolCall(nlohmann::json const& payload, SessionEvent& event)
    {
        event.toolName = json::findString(payload, "tool_name");
        if (!event.toolName)
            event.toolName = json::findString(payload, "name");
        if (!event.toolName)
            event.toolName = "tool";

        if (*event.toolName != DelegationToolName)
            return;

        event.agentId = json::getStringOr(payload, "tool_call_id", DelegationToolName);
        if (payload.contains("input"))
            event.agentName = json::findString(payload["input"], "agent");
    }

} // namespace

auto eventKindFromName(std::string_view name) -> EventKind
{
    for (auto const& entry: CanonicalNames)
        if (entry.name == name)
            return entry.kind;

    if (name.starts_with(StreamPrefix))
        return EventKind::LlmStream;

    for (auto const& entry: AliasNames)
        if (entry.name == name)
            return entry.kind;

    return EventKind::Unknown;
}

auto eventKindToString(EventKind kind) -> std::string_view
{
    if (kind == EventKind::LlmStream)
        return "llm:stream";

    for (auto const& entry: CanonicalNames)
        if (entry.kind == kind)
            return entry.name;

    return "unknown";
}

auto subscribedEvents() -> std::span<std::string_view const>
{
    return SubscribedNames;
}

auto decodeEvent(std::string_view name, nlohmann::json const& payload, Clock::TimePoint at)
    -> Result<SessionEvent>
{
    if (name.empty())
        return makeError(ErrorCode::MalformedEvent, "Event without a name");

    if (!payload.is_null() && !payload.is_object())
        return makeError(ErrorCode::MalformedEvent,
                         std::format("Payload of '{}' is a {}, expected an object", name, payload.type_name()));

    auto event = SessionEvent {};
    event.kind = eventKindFromName(name);
    event.name = std::string(name);
    event.at = at;

    if (payload.is_null())
        return event;

    switch (event.kind)
    {
        case EventKind::SessionStart:
            event.sessionId = json::findString(payload, "session_id");
            break;
        case EventKind::SessionError:
            event.errorMessage = decodeErrorMessage(payload);
            break;
        case EventKind::LlmResponse:
            decodeTokenUsage(payload, event);
            break;
        case EventKind::ToolPre:
        case EventKind::ToolPost:
            decodeToolCall(payload, event);
            break;
        case EventKind::AgentSpawned:
            event.agentId = json::getStringOr(payload, "session_id", "unknown");
            event.agentName = json::findString(payload, "agent");
            if (!event.agentName)
                event.agentName = json::getStringOr(payload, "agent_name", "agent");
            break;
        case EventKind::AgentComplete:
            event.agentId = json::findString(payload, "session_id");
            break;
        case EventKind::SessionEnd:
        case EventKind::LlmRequest:
        case EventKind::LlmStream:
        case EventKind::TurnStart:
        case EventKind::TurnEnd:
        case EventKind::Unknown:
            break;
    }

    return event;
}

} // namespace sessionpulse
