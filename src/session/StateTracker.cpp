// SPDX-License-Identifier: Apache-2.0
#include "StateTracker.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <limits>

namespace sessionpulse
{

namespace
{

    auto saturatingAdd(std::uint64_t a, std::uint64_t b) -> std::uint64_t
    {
        return (std::numeric_limits<std::uint64_t>::max() - a < b) ? std::numeric_limits<std::uint64_t>::max()
                                                                   : a + b;
    }

    /// @brief Records activity at @p at, keeping lastActivityAt monotonic and >= sessionStart.
    ///
    /// The first event of a session that was never explicitly started starts it implicitly.
    void touch(SessionState& state, Clock::TimePoint at)
    {
        if (!state.started)
        {
            state.started = true;
            state.sessionStart = at;
            state.lastActivityAt = at;
            return;
        }

        state.lastActivityAt = std::max({ state.lastActivityAt, state.sessionStart, at });
    }

    void refreshDelegateName(SessionState& state)
    {
        if (state.delegates.empty())
            state.delegateName.reset();
        else
            state.delegateName = state.delegates.back().name;
    }

    void pushDelegate(SessionState& state, std::string id, std::string name)
    {
        auto const it = std::ranges::find(state.delegates, id, &Delegate::id);
        if (it != state.delegates.end())
            state.delegates.erase(it);
        state.delegates.push_back(Delegate { .id = std::move(id), .name = std::move(name) });
        refreshDelegateName(state);
    }

    void removeDelegate(SessionState& state, std::optional<std::string> const& id)
    {
        if (id)
        {
            auto const it = std::ranges::find(state.delegates, *id, &Delegate::id);
            if (it != state.delegates.end())
                state.delegates.erase(it);
        }
        else if (!state.delegates.empty())
        {
            state.delegates.pop_back();
        }
        refreshDelegateName(state);
    }

    auto reduce(SessionState& state, SessionEvent const& event) -> ApplyResult
    {
        if (event.kind == EventKind::Unknown)
            return ApplyResult::Ignored;

        if (state.terminal && event.kind != EventKind::SessionStart)
            return ApplyResult::RejectedTerminal;

        switch (event.kind)
        {
            case EventKind::SessionStart:
                state = SessionState {};
                state.started = true;
                state.sessionStart = event.at;
                state.lastActivityAt = event.at;
                state.sessionId = event.sessionId;
                return ApplyResult::Applied;

            case EventKind::SessionEnd:
                touch(state, event.at);
                state.activity = Activity::Done;
                state.terminal = true;
                break;

            case EventKind::SessionError:
                touch(state, event.at);
                state.activity = Activity::Errored;
                state.errorMessage = event.errorMessage;
                state.terminal = true;
                break;

            case EventKind::LlmRequest:
                touch(state, event.at);
                state.activity = Activity::Thinking;
                break;

            case EventKind::LlmResponse:
                touch(state, event.at);
                state.tokensIn = saturatingAdd(state.tokensIn, event.tokensInDelta);
                state.tokensOut = saturatingAdd(state.tokensOut, event.tokensOutDelta);
                break;

            case EventKind::LlmStream:
                touch(state, event.at);
                state.activity = Activity::Streaming;
                break;

            case EventKind::ToolPre:
                touch(state, event.at);
                state.activity = Activity::Executing;
                state.toolName = event.toolName;
                if (event.agentId && event.agentName)
                    pushDelegate(state, *event.agentId, *event.agentName);
                break;

            case EventKind::ToolPost:
                touch(state, event.at);
                state.toolName.reset();
                if (state.activity == Activity::Executing)
                    state.activity = Activity::Thinking;
                if (event.agentId)
                    removeDelegate(state, event.agentId);
                break;

            case EventKind::TurnStart:
                touch(state, event.at);
                break;

            case EventKind::TurnEnd:
                touch(state, event.at);
                ++state.turnCount;
                state.activity = Activity::Idle;
                state.toolName.reset();
                break;

            case EventKind::AgentSpawned:
                touch(state, event.at);
                pushDelegate(state, event.agentId.value_or("unknown"), event.agentName.value_or("agent"));
                break;

            case EventKind::AgentComplete:
                touch(state, event.at);
                removeDelegate(state, event.agentId);
                break;

            case EventKind::Unknown:
                return ApplyResult::Ignored;
        }

        return ApplyResult::Applied;
    }

} // namespace

auto StateTracker::apply(SessionEvent const& event) -> ApplyResult
{
    auto result = ApplyResult::Applied;
    {
        auto const lock = std::lock_guard(_mutex);
        result = reduce(_state, event);
    }

    switch (result)
    {
        case ApplyResult::Applied:
            log::trace("Applied event {}", event.name);
            break;
        case ApplyResult::Ignored:
            log::debug("Ignoring unrecognized event '{}'", event.name);
            break;
        case ApplyResult::RejectedTerminal:
            log::debug("Ignoring event '{}' after session end", event.name);
            break;
    }

    return result;
}

auto StateTracker::snapshot() const -> SessionState
{
    auto const lock = std::lock_guard(_mutex);
    return _state;
}

} // namespace sessionpulse
