// SPDX-License-Identifier: Apache-2.0
#include <session/SessionEvent.hpp>
#include <tui/Text.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>

using namespace sessionpulse;

namespace
{
auto const T0 = Clock::TimePoint {} + std::chrono::hours(1);

auto decodeOrFail(std::string_view name, nlohmann::json const& payload) -> SessionEvent
{
    auto result = decodeEvent(name, payload, T0);
    REQUIRE(result.has_value());
    return *result;
}
} // namespace

TEST_CASE("eventKindFromName: canonical names", "[session][event]")
{
    CHECK(eventKindFromName("session:start") == EventKind::SessionStart);
    CHECK(eventKindFromName("session:end") == EventKind::SessionEnd);
    CHECK(eventKindFromName("session:error") == EventKind::SessionError);
    CHECK(eventKindFromName("llm:request") == EventKind::LlmRequest);
    CHECK(eventKindFromName("llm:response") == EventKind::LlmResponse);
    CHECK(eventKindFromName("tool:pre") == EventKind::ToolPre);
    CHECK(eventKindFromName("tool:post") == EventKind::ToolPost);
    CHECK(eventKindFromName("turn:start") == EventKind::TurnStart);
    CHECK(eventKindFromName("turn:end") == EventKind::TurnEnd);
    CHECK(eventKindFromName("task:agent_spawned") == EventKind::AgentSpawned);
    CHECK(eventKindFromName("task:agent_complete") == EventKind::AgentComplete);
}

TEST_CASE("eventKindFromName: stream prefix and aliases", "[session][event]")
{
    CHECK(eventKindFromName("llm:stream_chunk") == EventKind::LlmStream);
    CHECK(eventKindFromName("llm:stream_something_new") == EventKind::LlmStream);
    CHECK(eventKindFromName("provider:request") == EventKind::LlmRequest);
    CHECK(eventKindFromName("thinking:delta") == EventKind::LlmRequest);
    CHECK(eventKindFromName("provider:response") == EventKind::LlmResponse);
    CHECK(eventKindFromName("content_block:delta") == EventKind::LlmStream);
    CHECK(eventKindFromName("prompt:submit") == EventKind::Unknown);
    CHECK(eventKindFromName("") == EventKind::Unknown);
}

TEST_CASE("subscribedEvents: lists every canonical name once", "[session][event]")
{
    auto const names = subscribedEvents();
    CHECK(std::ranges::find(names, "session:start") != names.end());
    CHECK(std::ranges::find(names, "task:agent_complete") != names.end());
    CHECK(std::ranges::find(names, "content_block:delta") != names.end());

    for (auto const name: names)
        CHECK(std::ranges::count(names, name) == 1);
}

TEST_CASE("decodeEvent: rejects malformed input", "[session][event]")
{
    SECTION("empty name")
    {
        auto const result = decodeEvent("", nlohmann::json::object(), T0);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::MalformedEvent);
    }

    SECTION("payload that is not an object")
    {
        auto const result = decodeEvent("tool:pre", nlohmann::json::array({ 1, 2 }), T0);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::MalformedEvent);
    }
}

TEST_CASE("decodeEvent: null payload and unknown names decode", "[session][event]")
{
    auto const start = decodeOrFail("session:start", nullptr);
    CHECK(start.kind == EventKind::SessionStart);
    CHECK(start.at == T0);
    CHECK_FALSE(start.sessionId.has_value());

    auto const unknown = decodeOrFail("custom:thing", { { "x", 1 } });
    CHECK(unknown.kind == EventKind::Unknown);
    CHECK(unknown.name == "custom:thing");
}

TEST_CASE("decodeEvent: tool name fallbacks", "[session][event]")
{
    CHECK(*decodeOrFail("tool:pre", { { "tool_name", "bash" } }).toolName == "bash");
    CHECK(*decodeOrFail("tool:pre", { { "name", "read_file" } }).toolName == "read_file");
    CHECK(*decodeOrFail("tool:pre", nlohmann::json::object()).toolName == "tool");
}

TEST_CASE("decodeEvent: task tool carries the delegated agent", "[session][event]")
{
    auto const event =
        decodeOrFail("tool:pre", { { "tool_name", "task" }, { "input", { { "agent", "zen-architect" } } } });
    REQUIRE(event.agentId.has_value());
    CHECK(*event.agentId == "task");
    REQUIRE(event.agentName.has_value());
    CHECK(*event.agentName == "zen-architect");
}

TEST_CASE("decodeEvent: agent spawn fallbacks", "[session][event]")
{
    auto const named = decodeOrFail("task:agent_spawned", { { "session_id", "s1" }, { "agent_name", "helper" } });
    CHECK(*named.agentId == "s1");
    CHECK(*named.agentName == "helper");

    auto const anonymous = decodeOrFail("task:agent_spawned", nlohmann::json::object());
    CHECK(*anonymous.agentId == "unknown");
    CHECK(*anonymous.agentName == "agent");
}

TEST_CASE("decodeEvent: error messages", "[session][event]")
{
    CHECK(*decodeOrFail("session:error", { { "error", "boom" } }).errorMessage == "boom");
    CHECK(*decodeOrFail("session:error", { { "error", { { "message", "nested" } } } }).errorMessage == "nested");
    CHECK(*decodeOrFail("session:error", { { "message", "top level" } }).errorMessage == "top level");
    CHECK_FALSE(decodeOrFail("session:error", nlohmann::json::object()).errorMessage.has_value());

    auto const longMessage = std::string(80, 'x');
    auto const truncated = decodeOrFail("session:error", { { "error", longMessage } }).errorMessage;
    REQUIRE(truncated.has_value());
    CHECK(truncated->size() == static_cast<std::size_t>(MaxErrorMessageLength));

    // Counted in grapheme clusters: a base letter with a combining accent is one
    auto accented = std::string {};
    for (auto i = 0; i < 60; ++i)
        accented += "e\u0301"; // é
    auto const clusters = decodeOrFail("session:error", { { "error", accented } }).errorMessage;
    REQUIRE(clusters.has_value());
    CHECK(tui::displayWidth(*clusters) == MaxErrorMessageLength);
    CHECK(clusters->size() == static_cast<std::size_t>(MaxErrorMessageLength) * 3);
}

TEST_CASE("decodeEvent: token usage", "[session][event]")
{
    SECTION("usage object")
    {
        auto const event =
            decodeOrFail("llm:response", { { "usage", { { "input_tokens", 10 }, { "output_tokens", 20 } } } });
        CHECK(event.tokensInDelta == 10);
        CHECK(event.tokensOutDelta == 20);
    }

    SECTION("top level fields")
    {
        auto const event = decodeOrFail("llm:response", { { "input_tokens", 3 }, { "token_count", 7 } });
        CHECK(event.tokensInDelta == 3);
        CHECK(event.tokensOutDelta == 7);
    }

    SECTION("missing usage")
    {
        auto const event = decodeOrFail("llm:response", nlohmann::json::object());
        CHECK(event.tokensInDelta == 0);
        CHECK(event.tokensOutDelta == 0);
    }
}
