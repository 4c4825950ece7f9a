// SPDX-License-Identifier: Apache-2.0
#include <session/StateTracker.hpp>
#include <session/StuckDetector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <chrono>
#include <random>

using namespace sessionpulse;
using namespace std::chrono_literals;

namespace
{
auto const T0 = Clock::TimePoint {} + 1h;
constexpr auto Threshold = Clock::Duration { 60s };

auto startedAt(Clock::TimePoint start, Clock::TimePoint lastActivity) -> SessionState
{
    auto state = SessionState {};
    state.started = true;
    state.sessionStart = start;
    state.lastActivityAt = lastActivity;
    return state;
}
} // namespace

TEST_CASE("detectStuck: threshold boundary is inclusive", "[session][stuck]")
{
    auto const state = startedAt(T0, T0);

    CHECK_FALSE(detectStuck(state, T0 + 59s, Threshold).stuck);
    CHECK(detectStuck(state, T0 + 60s, Threshold).stuck);
    CHECK(detectStuck(state, T0 + 61s, Threshold).stuck);
    CHECK_FALSE(detectStuck(state, T0 + 60s - 1ns, Threshold).stuck);
}

TEST_CASE("detectStuck: a threshold beyond the clock range never fires", "[session][stuck]")
{
    auto const threshold = secondsToDuration(1e10);
    REQUIRE(threshold == Clock::Duration::max());

    auto const state = startedAt(T0, T0);
    CHECK_FALSE(detectStuck(state, T0 + 1s, threshold).stuck);
    CHECK_FALSE(detectStuck(state, T0 + 24h * 365, threshold).stuck);
}

TEST_CASE("secondsToDuration: converts and saturates", "[session][stuck]")
{
    CHECK(secondsToDuration(0.25) == 250ms);
    CHECK(secondsToDuration(60.0) == 60s);
    CHECK(secondsToDuration(1e300) == Clock::Duration::max());
    CHECK(secondsToDuration(-1.0) == Clock::Duration::zero());
    CHECK(secondsToDuration(0.0) == Clock::Duration::zero());
}

TEST_CASE("detectStuck: reports the idle duration", "[session][stuck]")
{
    auto const state = startedAt(T0, T0 + 10s);
    auto const status = detectStuck(state, T0 + 25s, Threshold);
    CHECK(status.idle == 15s);
    CHECK_FALSE(status.stuck);
}

TEST_CASE("detectStuck: never stuck after the session ended", "[session][stuck]")
{
    auto state = startedAt(T0, T0);
    state.terminal = true;
    state.activity = Activity::Done;

    CHECK_FALSE(detectStuck(state, T0 + 10min, Threshold).stuck);
}

TEST_CASE("detectStuck: never stuck before the session started", "[session][stuck]")
{
    auto const status = detectStuck(SessionState {}, T0 + 10min, Threshold);
    CHECK_FALSE(status.stuck);
    CHECK(status.idle == Clock::Duration::zero());
}

TEST_CASE("detectStuck: a clock reading before the last activity counts as no idle time", "[session][stuck]")
{
    auto const state = startedAt(T0, T0 + 30s);
    auto const status = detectStuck(state, T0 + 10s, Threshold);
    CHECK(status.idle == Clock::Duration::zero());
    CHECK_FALSE(status.stuck);
}

TEST_CASE("detectStuck: matches the idle rule across random event interleavings", "[session][stuck]")
{
    constexpr auto EventNames = std::array<std::string_view, 7> {
        "llm:request", "llm:response", "llm:stream_chunk", "tool:pre", "tool:post", "turn:start", "turn:end",
    };

    auto rng = std::mt19937 { 4242 };
    auto eventPick = std::uniform_int_distribution<std::size_t> { 0, EventNames.size() - 1 };
    auto stepMs = std::uniform_int_distribution<int> { 0, 90'000 };
    auto action = std::uniform_int_distribution<int> { 0, 9 };

    for (auto run = 0; run < 50; ++run)
    {
        auto tracker = StateTracker {};
        auto now = T0;
        auto ended = false;
        auto lastEventAt = now;

        auto start = decodeEvent("session:start", {}, now);
        REQUIRE(start.has_value());
        tracker.apply(*start);

        for (auto step = 0; step < 100; ++step)
        {
            now += std::chrono::milliseconds(stepMs(rng));

            auto const choice = action(rng);
            if (choice < 6 && !ended)
            {
                auto event = decodeEvent(EventNames[eventPick(rng)], {}, now);
                REQUIRE(event.has_value());
                tracker.apply(*event);
                lastEventAt = now;
            }
            else if (choice == 6 && !ended)
            {
                auto event = decodeEvent("session:end", {}, now);
                REQUIRE(event.has_value());
                tracker.apply(*event);
                lastEventAt = now;
                ended = true;
            }

            auto const state = tracker.snapshot();
            auto const status = detectStuck(state, now, Threshold);
            CHECK(status.idle == now - lastEventAt);
            CHECK(status.stuck == (now - lastEventAt >= Threshold && !ended));
        }
    }
}
