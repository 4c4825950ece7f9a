// SPDX-License-Identifier: Apache-2.0
#include "RenderLoop.hpp"

#include <core/Log.hpp>
#include <session/StuckDetector.hpp>

#include <condition_variable>
#include <mutex>
#include <thread>

namespace sessionpulse
{

namespace
{
    // Columns kept free to the right of the line so that it never wraps.
    constexpr auto RightMargin = 2;

    auto elapsedOf(SessionState const& state, Clock::TimePoint now) -> Clock::Duration
    {
        if (!state.started)
            return Clock::Duration::zero();

        // A finished session reports the time up to its last event.
        auto const end = state.terminal ? state.lastActivityAt : now;
        return end > state.sessionStart ? end - state.sessionStart : Clock::Duration::zero();
    }
} // namespace

auto makeRenderSnapshot(StateTracker const& tracker,
                        EscalationStateMachine const& escalation,
                        Clock::TimePoint now,
                        Clock::Duration stuckThreshold,
                        std::string spinnerFrame) -> RenderSnapshot
{
    auto snapshot = RenderSnapshot {};
    snapshot.session = tracker.snapshot();
    snapshot.stuck = detectStuck(snapshot.session, now, stuckThreshold);
    snapshot.elapsed = elapsedOf(snapshot.session, now);
    snapshot.escalation = escalation.levelAt(now);
    snapshot.spinnerFrame = std::move(spinnerFrame);
    return snapshot;
}

struct RenderLoop::Impl
{
    StateTracker const& tracker;
    EscalationStateMachine const& escalation;
    Clock const& clock;
    LineSink& sink;
    RenderLoopConfig config;

    // Serializes tick() so that at most one render is in flight.
    std::mutex tickMutex;
    tui::Spinner spinner;
    std::string previousLine;
    bool hasPreviousLine = false;
    std::size_t writeFailures = 0;

    mutable std::mutex stateMutex;
    std::condition_variable_any cv;
    bool finished = false;
    std::size_t renders = 0;
    std::size_t writes = 0;

    std::jthread worker;

    Impl(StateTracker const& tracker,
         EscalationStateMachine const& escalation,
         Clock const& clock,
         LineSink& sink,
         RenderLoopConfig config):
        tracker(tracker), escalation(escalation), clock(clock), sink(sink), config(config), spinner(config.spinner)
    {
    }

    auto tick() -> bool
    {
        auto const tickLock = std::lock_guard(tickMutex);
        {
            auto const lock = std::lock_guard(stateMutex);
            if (finished)
                return false;
        }

        auto const now = clock.now();
        auto const snapshot =
            makeRenderSnapshot(tracker, escalation, now, config.stuckThreshold, std::string(spinner.currentFrame()));

        auto display = config.display;
        auto const columns = sink.columns();
        display.maxColumns = columns > RightMargin + 3 ? columns - RightMargin : 0;

        auto line = renderStatusLine(snapshot, display);
        auto const terminal = snapshot.session.terminal;

        auto wrote = false;
        if (!hasPreviousLine || line != previousLine)
        {
            if (auto result = sink.writeLine(line); result)
            {
                previousLine = std::move(line);
                hasPreviousLine = true;
                wrote = true;
            }
            else
            {
                ++writeFailures;
                if (writeFailures == 1)
                    log::warning("Failed to write status line: {}", result.error().message);
                else
                    log::trace("Failed to write status line ({} failures): {}", writeFailures, result.error().message);
            }
        }

        spinner.tick();

        if (terminal)
        {
            sink.finish();
            log::debug("Rendered final status line ({})", activityToString(snapshot.session.activity));
        }

        {
            auto const lock = std::lock_guard(stateMutex);
            ++renders;
            if (wrote)
                ++writes;
            if (terminal)
                finished = true;
        }

        return !terminal;
    }

    void run(const std::stop_token& stopToken)
    {
        // Every sink call of a run happens on this thread
        sink.begin();

        while (!stopToken.stop_requested())
        {
            if (!tick())
                return;

            auto lock = std::unique_lock(stateMutex);
            cv.wait_for(lock, stopToken, config.interval, [] { return false; });
        }
    }
};

RenderLoop::RenderLoop(StateTracker const& tracker,
                       EscalationStateMachine const& escalation,
                       Clock const& clock,
                       LineSink& sink,
                       RenderLoopConfig config):
    _impl(std::make_unique<Impl>(tracker, escalation, clock, sink, config))
{
    if (_impl->config.interval <= Clock::Duration::zero())
        _impl->config.interval = std::chrono::milliseconds(100);
    else if (_impl->config.interval > RenderLoopConfig::MaxInterval)
        _impl->config.interval = RenderLoopConfig::MaxInterval;
}

RenderLoop::~RenderLoop()
{
    stop();
}

void RenderLoop::start()
{
    if (running())
        return;

    if (_impl->worker.joinable())
        _impl->worker.join();

    {
        auto const tickLock = std::lock_guard(_impl->tickMutex);
        auto const lock = std::lock_guard(_impl->stateMutex);
        _impl->finished = false;
        _impl->previousLine.clear();
        _impl->hasPreviousLine = false;
        _impl->writeFailures = 0;
        _impl->spinner.reset();
    }

    log::debug("Starting render loop ({} ms interval)",
               std::chrono::duration_cast<std::chrono::milliseconds>(_impl->config.interval).count());
    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
}

void RenderLoop::stop()
{
    if (!_impl->worker.joinable())
        return;

    _impl->worker.request_stop();
    _impl->cv.notify_all();
    _impl->worker.join();
}

auto RenderLoop::tick() -> bool
{
    return _impl->tick();
}

auto RenderLoop::running() const -> bool
{
    auto const lock = std::lock_guard(_impl->stateMutex);
    return _impl->worker.joinable() && !_impl->finished;
}

auto RenderLoop::finished() const -> bool
{
    auto const lock = std::lock_guard(_impl->stateMutex);
    return _impl->finished;
}

auto RenderLoop::renderCount() const -> std::size_t
{
    auto const lock = std::lock_guard(_impl->stateMutex);
    return _impl->renders;
}

auto RenderLoop::writeCount() const -> std::size_t
{
    auto const lock = std::lock_guard(_impl->stateMutex);
    return _impl->writes;
}

} // namespace sessionpulse
