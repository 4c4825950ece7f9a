// SPDX-License-Identifier: Apache-2.0
#include <session/EventIngestor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace sessionpulse;
using namespace std::chrono_literals;

namespace
{
/// @brief Records the names of applied events and can hold the worker on the first one.
class AppliedLog
{
  public:
    void holdFirst() { _holding = true; }

    auto callback() -> EventAppliedCallback
    {
        return [this](SessionEvent const& event, ApplyResult /*result*/) {
            {
                auto const lock = std::lock_guard(_mutex);
                _names.push_back(event.name);
            }

            if (_holding && !_held)
            {
                _held = true;
                _entered.set_value();
                _release.get_future().wait();
            }
        };
    }

    void waitUntilHeld() { _entered.get_future().wait(); }

    void release() { _release.set_value(); }

    auto names() const -> std::vector<std::string>
    {
        auto const lock = std::lock_guard(_mutex);
        return _names;
    }

  private:
    mutable std::mutex _mutex;
    std::vector<std::string> _names;
    bool _holding = false;
    bool _held = false;
    std::promise<void> _entered;
    std::promise<void> _release;
};
} // namespace

TEST_CASE("EventIngestor: applies submitted events in order", "[session][ingestor]")
{
    auto const clock = ManualClock {};
    auto tracker = StateTracker {};
    auto applied = AppliedLog {};
    auto ingestor = EventIngestor { tracker, clock, {}, applied.callback() };

    CHECK(ingestor.submit("session:start", { { "session_id", "s1" } }));
    CHECK(ingestor.submit("llm:request", nlohmann::json::object()));
    CHECK(ingestor.submit("tool:pre", { { "tool_name", "bash" } }));
    ingestor.flush();

    auto const state = tracker.snapshot();
    CHECK(state.started);
    CHECK(state.activity == Activity::Executing);
    CHECK(*state.toolName == "bash");
    CHECK(applied.names() == std::vector<std::string> { "session:start", "llm:request", "tool:pre" });
    CHECK(ingestor.droppedCount() == 0);
}

TEST_CASE("EventIngestor: timestamps events on submission", "[session][ingestor]")
{
    auto clock = ManualClock {};
    auto tracker = StateTracker {};
    auto ingestor = EventIngestor { tracker, clock };

    auto const start = clock.now();
    ingestor.submit("session:start", nullptr);
    clock.advance(5s);
    ingestor.submit("llm:request", nullptr);
    ingestor.flush();

    auto const state = tracker.snapshot();
    CHECK(state.sessionStart == start);
    CHECK(state.lastActivityAt == start + 5s);
}

TEST_CASE("EventIngestor: malformed events are rejected without side effects", "[session][ingestor]")
{
    auto const clock = ManualClock {};
    auto tracker = StateTracker {};
    auto ingestor = EventIngestor { tracker, clock };

    CHECK_FALSE(ingestor.submit("", nlohmann::json::object()));
    CHECK_FALSE(ingestor.submit("tool:pre", nlohmann::json::array()));
    CHECK_FALSE(ingestor.submit("tool:pre", "not an object"));
    ingestor.flush();

    CHECK_FALSE(tracker.snapshot().started);
    CHECK(ingestor.droppedCount() == 0);
}

TEST_CASE("EventIngestor: unknown events are accepted and ignored", "[session][ingestor]")
{
    auto const clock = ManualClock {};
    auto tracker = StateTracker {};
    auto ingestor = EventIngestor { tracker, clock };

    CHECK(ingestor.submit("prompt:submit", { { "prompt", "hi" } }));
    ingestor.flush();
    CHECK_FALSE(tracker.snapshot().started);
}

TEST_CASE("EventIngestor: overflow drops new events but keeps session boundaries", "[session][ingestor]")
{
    auto const clock = ManualClock {};
    auto tracker = StateTracker {};
    auto applied = AppliedLog {};
    applied.holdFirst();
    auto ingestor = EventIngestor { tracker, clock, EventIngestorConfig { .queueCapacity = 2 }, applied.callback() };

    // The worker takes the first event and blocks inside the callback
    CHECK(ingestor.submit("session:start", nullptr));
    applied.waitUntilHeld();

    CHECK(ingestor.submit("llm:request", nullptr));
    CHECK(ingestor.submit("tool:pre", { { "tool_name", "bash" } }));

    SECTION("ordinary events are dropped when full")
    {
        CHECK_FALSE(ingestor.submit("tool:post", nullptr));
        CHECK(ingestor.droppedCount() == 1);

        applied.release();
        ingestor.flush();
        CHECK(applied.names() == std::vector<std::string> { "session:start", "llm:request", "tool:pre" });
    }

    SECTION("session events evict the oldest queued event")
    {
        CHECK(ingestor.submit("session:end", nullptr));
        CHECK(ingestor.droppedCount() == 1);

        applied.release();
        ingestor.flush();
        CHECK(applied.names() == std::vector<std::string> { "session:start", "tool:pre", "session:end" });
        CHECK(tracker.snapshot().terminal);
    }
}

TEST_CASE("EventIngestor: shutdown rejects further events", "[session][ingestor]")
{
    auto const clock = ManualClock {};
    auto tracker = StateTracker {};
    auto ingestor = EventIngestor { tracker, clock };

    ingestor.submit("session:start", nullptr);
    ingestor.flush();
    ingestor.shutdown();
    ingestor.shutdown();

    CHECK_FALSE(ingestor.submit("session:end", nullptr));
    ingestor.flush();
    CHECK_FALSE(tracker.snapshot().terminal);
}

TEST_CASE("EventIngestor: submitting from many threads loses nothing below capacity", "[session][ingestor]")
{
    auto const clock = ManualClock {};
    auto tracker = StateTracker {};
    auto ingestor = EventIngestor { tracker, clock, EventIngestorConfig { .queueCapacity = 10'000 } };

    ingestor.submit("session:start", nullptr);

    constexpr auto ThreadCount = 4;
    constexpr auto EventsPerThread = 200;
    {
        auto threads = std::vector<std::jthread> {};
        for (auto t = 0; t < ThreadCount; ++t)
        {
            threads.emplace_back([&ingestor] {
                for (auto i = 0; i < EventsPerThread; ++i)
                    ingestor.submit("llm:response", { { "input_tokens", 1 }, { "output_tokens", 2 } });
            });
        }
    }
    ingestor.flush();

    auto const state = tracker.snapshot();
    CHECK(state.tokensIn == ThreadCount * EventsPerThread);
    CHECK(state.tokensOut == 2 * ThreadCount * EventsPerThread);
    CHECK(ingestor.droppedCount() == 0);
}
