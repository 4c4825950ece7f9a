// SPDX-License-Identifier: Apache-2.0
#include <indicator/RenderLoop.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace sessionpulse;
using namespace std::chrono_literals;

namespace
{
/// @brief LineSink that records every line it receives.
class RecordingSink final: public LineSink
{
  public:
    auto writeLine(std::string_view line) -> VoidResult override
    {
        auto const lock = std::lock_guard(_mutex);
        if (_failing)
            return makeError(ErrorCode::TerminalError, "sink is broken");
        _lines.emplace_back(line);
        return {};
    }

    auto columns() const -> int override { return _columns; }

    void begin() override
    {
        auto const lock = std::lock_guard(_mutex);
        ++_begins;
        _beginThread = std::this_thread::get_id();
    }

    void finish() override
    {
        auto const lock = std::lock_guard(_mutex);
        ++_finishes;
    }

    void setFailing(bool failing)
    {
        auto const lock = std::lock_guard(_mutex);
        _failing = failing;
    }

    void setColumns(int columns) { _columns = columns; }

    auto lines() const -> std::vector<std::string>
    {
        auto const lock = std::lock_guard(_mutex);
        return _lines;
    }

    auto begins() const -> int
    {
        auto const lock = std::lock_guard(_mutex);
        return _begins;
    }

    auto beginThread() const -> std::thread::id
    {
        auto const lock = std::lock_guard(_mutex);
        return _beginThread;
    }

    auto finishes() const -> int
    {
        auto const lock = std::lock_guard(_mutex);
        return _finishes;
    }

  private:
    mutable std::mutex _mutex;
    std::vector<std::string> _lines;
    int _columns = 0;
    int _begins = 0;
    int _finishes = 0;
    bool _failing = false;
    std::thread::id _beginThread;
};

auto plainLoopConfig() -> RenderLoopConfig
{
    auto config = RenderLoopConfig {};
    config.interval = 5ms;
    config.display.colorsEnabled = false;
    config.spinner = tui::SpinnerType::Line;
    return config;
}

void applyNamed(StateTracker& tracker, std::string_view name, Clock::TimePoint at, nlohmann::json const& payload = {})
{
    auto event = decodeEvent(name, payload, at);
    REQUIRE(event.has_value());
    tracker.apply(*event);
}

/// @brief Polls @p condition until it holds or the timeout expires.
template <typename Predicate>
auto waitUntil(Predicate condition, std::chrono::milliseconds timeout = 2s) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (condition())
            return true;
        std::this_thread::sleep_for(1ms);
    }
    return condition();
}

/// @brief Tracker, escalation machine, clock and sink wired to one loop.
struct LoopFixture
{
    ManualClock clock;
    StateTracker tracker;
    EscalationStateMachine escalation;
    RecordingSink sink;
    RenderLoop loop { tracker, escalation, clock, sink, plainLoopConfig() };
};
} // namespace

TEST_CASE("makeRenderSnapshot: elapsed time", "[indicator][renderloop]")
{
    auto clock = ManualClock {};
    auto tracker = StateTracker {};
    auto const escalation = EscalationStateMachine {};
    auto const start = clock.now();

    SECTION("zero before the session started")
    {
        auto const snapshot = makeRenderSnapshot(tracker, escalation, start + 10s, 60s, "*");
        CHECK(snapshot.elapsed == Clock::Duration::zero());
        CHECK_FALSE(snapshot.stuck.stuck);
    }

    SECTION("runs with the clock while active")
    {
        applyNamed(tracker, "session:start", start);
        auto const snapshot = makeRenderSnapshot(tracker, escalation, start + 42s, 60s, "*");
        CHECK(snapshot.elapsed == 42s);
        CHECK(snapshot.spinnerFrame == "*");
    }

    SECTION("freezes at the last event once the session ended")
    {
        applyNamed(tracker, "session:start", start);
        applyNamed(tracker, "session:end", start + 30s);
        auto const snapshot = makeRenderSnapshot(tracker, escalation, start + 5min, 60s, "*");
        CHECK(snapshot.elapsed == 30s);
        CHECK_FALSE(snapshot.stuck.stuck);
    }
}

TEST_CASE("makeRenderSnapshot: escalation level is read at render time", "[indicator][renderloop]")
{
    auto const clock = ManualClock {};
    auto const tracker = StateTracker {};
    auto escalation = EscalationStateMachine {};
    escalation.pulse(clock.now());

    CHECK(makeRenderSnapshot(tracker, escalation, clock.now() + 1s, 60s, "").escalation == EscalationLevel::Cancel);
    CHECK(makeRenderSnapshot(tracker, escalation, clock.now() + 3s, 60s, "").escalation == EscalationLevel::Normal);
}

TEST_CASE("RenderLoop: renders exactly once after the session ended", "[indicator][renderloop]")
{
    auto fixture = LoopFixture {};
    applyNamed(fixture.tracker, "session:start", fixture.clock.now());
    CHECK(fixture.loop.tick());

    fixture.clock.advance(3s);
    applyNamed(fixture.tracker, "session:end", fixture.clock.now());

    CHECK_FALSE(fixture.loop.tick());
    CHECK(fixture.loop.finished());
    CHECK(fixture.sink.finishes() == 1);

    auto const lines = fixture.sink.lines();
    REQUIRE(lines.size() == 2);
    CHECK(lines.back().starts_with("✓ Session complete"));

    // Further ticks neither render nor write
    auto const renders = fixture.loop.renderCount();
    CHECK_FALSE(fixture.loop.tick());
    CHECK(fixture.loop.renderCount() == renders);
    CHECK(fixture.sink.lines().size() == 2);
    CHECK(fixture.sink.finishes() == 1);
}

TEST_CASE("RenderLoop: unchanged lines are not written again", "[indicator][renderloop]")
{
    auto fixture = LoopFixture {};
    applyNamed(fixture.tracker, "session:start", fixture.clock.now());
    fixture.clock.advance(61s);

    // The idle warning carries no spinner frame, so it stays identical
    CHECK(fixture.loop.tick());
    CHECK(fixture.loop.tick());
    CHECK(fixture.loop.tick());

    CHECK(fixture.loop.renderCount() == 3);
    CHECK(fixture.loop.writeCount() == 1);
    REQUIRE(fixture.sink.lines().size() == 1);
    CHECK(fixture.sink.lines().front() == "⚠ 61s idle (Ctrl+C to interrupt)");

    fixture.clock.advance(1s);
    CHECK(fixture.loop.tick());
    CHECK(fixture.loop.writeCount() == 2);
    CHECK(fixture.sink.lines().back() == "⚠ 62s idle (Ctrl+C to interrupt)");
}

TEST_CASE("RenderLoop: the spinner advances once per tick", "[indicator][renderloop]")
{
    auto fixture = LoopFixture {};
    applyNamed(fixture.tracker, "session:start", fixture.clock.now());
    applyNamed(fixture.tracker, "llm:request", fixture.clock.now());

    for (auto i = 0; i < 5; ++i)
        CHECK(fixture.loop.tick());

    auto const lines = fixture.sink.lines();
    REQUIRE(lines.size() == 5);
    CHECK(lines[0].starts_with("| thinking"));
    CHECK(lines[1].starts_with("/ thinking"));
    CHECK(lines[2].starts_with("- thinking"));
    CHECK(lines[3].starts_with("\\ thinking"));
    CHECK(lines[4].starts_with("| thinking"));
}

TEST_CASE("RenderLoop: write failures are not fatal", "[indicator][renderloop]")
{
    auto fixture = LoopFixture {};
    applyNamed(fixture.tracker, "session:start", fixture.clock.now());
    fixture.clock.advance(90s);

    fixture.sink.setFailing(true);
    CHECK(fixture.loop.tick());
    CHECK(fixture.loop.tick());
    CHECK(fixture.loop.writeCount() == 0);
    CHECK(fixture.loop.renderCount() == 2);

    // The failed line is retried once the sink recovers
    fixture.sink.setFailing(false);
    CHECK(fixture.loop.tick());
    CHECK(fixture.loop.writeCount() == 1);
    REQUIRE(fixture.sink.lines().size() == 1);
    CHECK(fixture.sink.lines().front() == "⚠ 90s idle (Ctrl+C to interrupt)");
}

TEST_CASE("RenderLoop: a failing final write still finishes the run", "[indicator][renderloop]")
{
    auto fixture = LoopFixture {};
    applyNamed(fixture.tracker, "session:start", fixture.clock.now());
    applyNamed(fixture.tracker, "session:error", fixture.clock.now(), { { "error", "boom" } });

    fixture.sink.setFailing(true);
    CHECK_FALSE(fixture.loop.tick());
    CHECK(fixture.loop.finished());
    CHECK(fixture.sink.finishes() == 1);
    CHECK(fixture.loop.writeCount() == 0);
}

TEST_CASE("RenderLoop: lines are truncated to the sink width", "[indicator][renderloop]")
{
    auto fixture = LoopFixture {};
    fixture.sink.setColumns(22);
    applyNamed(fixture.tracker, "session:start", fixture.clock.now());
    fixture.clock.advance(90s);

    CHECK(fixture.loop.tick());
    REQUIRE(fixture.sink.lines().size() == 1);
    CHECK(fixture.sink.lines().front() == "⚠ 90s idle (Ctrl+...");
    CHECK(tui::displayWidth(fixture.sink.lines().front()) == 20);
}

TEST_CASE("RenderLoop: worker thread finishes on its own", "[indicator][renderloop]")
{
    auto fixture = LoopFixture {};
    applyNamed(fixture.tracker, "session:start", fixture.clock.now());

    fixture.loop.start();
    REQUIRE(waitUntil([&] { return fixture.loop.writeCount() >= 1; }));
    CHECK(fixture.sink.begins() == 1);
    CHECK(fixture.loop.running());

    applyNamed(fixture.tracker, "session:end", fixture.clock.now());
    REQUIRE(waitUntil([&] { return fixture.loop.finished(); }));
    CHECK_FALSE(fixture.loop.running());
    CHECK(fixture.sink.finishes() == 1);
    CHECK(fixture.sink.lines().back().starts_with("✓ Session complete"));

    SECTION("and can be started again for a new session")
    {
        applyNamed(fixture.tracker, "session:start", fixture.clock.now());
        auto const writesBefore = fixture.loop.writeCount();

        fixture.loop.start();
        REQUIRE(waitUntil([&] { return fixture.loop.writeCount() > writesBefore; }));
        CHECK(fixture.sink.begins() == 2);
        CHECK_FALSE(fixture.loop.finished());

        fixture.loop.stop();
        CHECK_FALSE(fixture.loop.running());
    }
}

TEST_CASE("RenderLoop: the sink is prepared on the worker thread", "[indicator][renderloop]")
{
    auto fixture = LoopFixture {};
    applyNamed(fixture.tracker, "session:start", fixture.clock.now());

    fixture.loop.start();
    REQUIRE(waitUntil([&] { return fixture.sink.begins() == 1; }));
    CHECK(fixture.sink.beginThread() != std::this_thread::get_id());

    fixture.loop.stop();
}

TEST_CASE("RenderLoop: stop is idempotent", "[indicator][renderloop]")
{
    auto fixture = LoopFixture {};
    fixture.loop.stop();
    fixture.loop.start();
    fixture.loop.stop();
    fixture.loop.stop();
    CHECK_FALSE(fixture.loop.running());
}
