// SPDX-License-Identifier: Apache-2.0
#include "EventIngestor.hpp"

#include <core/Log.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace sessionpulse
{

namespace
{
    auto isSessionBoundary(EventKind kind) -> bool
    {
        return kind == EventKind::SessionStart || kind == EventKind::SessionEnd || kind == EventKind::SessionError;
    }
} // namespace

struct EventIngestor::Impl
{
    StateTracker& tracker;
    Clock const& clock;
    EventIngestorConfig config;
    EventAppliedCallback onApplied;

    std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<SessionEvent> queue;
    std::size_t dropped = 0;
    bool busy = false;
    bool shutdownRequested = false;

    std::jthread worker;

    Impl(StateTracker& tracker, Clock const& clock, EventIngestorConfig config, EventAppliedCallback onApplied):
        tracker(tracker), clock(clock), config(config), onApplied(std::move(onApplied))
    {
    }

    /// @brief Worker thread function that drains the event queue into the tracker.
    /// @param stopToken The stop token for cooperative cancellation.
    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto event = SessionEvent {};
            {
                auto lock = std::unique_lock(mutex);
                cv.wait(lock, stopToken, [this] { return !queue.empty() || shutdownRequested; });

                if (stopToken.stop_requested() || shutdownRequested)
                {
                    // Release flush waiters before exiting
                    cv.notify_all();
                    return;
                }

                event = std::move(queue.front());
                queue.pop_front();
                busy = true;
            }

            auto const result = tracker.apply(event);
            if (onApplied)
                onApplied(event, result);

            {
                auto lock = std::lock_guard(mutex);
                busy = false;
                if (queue.empty())
                    cv.notify_all();
            }
        }
    }

    /// @brief Enqueues an event, applying the overflow policy.
    /// @return False if the event itself was dropped.
    auto enqueue(SessionEvent event) -> bool
    {
        auto accepted = true;
        auto droppedName = std::string {};
        auto droppedTotal = std::size_t { 0 };
        {
            auto lock = std::lock_guard(mutex);
            if (shutdownRequested)
                return false;

            if (queue.size() >= config.queueCapacity)
            {
                if (isSessionBoundary(event.kind) && !queue.empty())
                {
                    droppedName = queue.front().name;
                    queue.pop_front();
                }
                else
                {
                    droppedName = event.name;
                    accepted = false;
                }
                droppedTotal = ++dropped;
            }

            if (accepted)
                queue.push_back(std::move(event));
            cv.notify_all();
        }

        if (droppedTotal == 1)
            log::warning("Event queue full ({} events), dropping '{}'", config.queueCapacity, droppedName);
        else if (droppedTotal > 1)
            log::debug("Event queue full, dropping '{}' ({} dropped so far)", droppedName, droppedTotal);

        return accepted;
    }
};

EventIngestor::EventIngestor(StateTracker& tracker,
                             Clock const& clock,
                             EventIngestorConfig config,
                             EventAppliedCallback onApplied):
    _impl(std::make_unique<Impl>(tracker, clock, config, std::move(onApplied)))
{
    if (_impl->config.queueCapacity == 0)
        _impl->config.queueCapacity = 1;

    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
}

EventIngestor::~EventIngestor()
{
    shutdown();
}

auto EventIngestor::submit(std::string_view name, nlohmann::json const& payload) -> bool
{
    auto decoded = decodeEvent(name, payload, _impl->clock.now());
    if (!decoded)
    {
        log::debug("Ignoring malformed event: {}", decoded.error().message);
        return false;
    }

    return _impl->enqueue(std::move(*decoded));
}

auto EventIngestor::submit(SessionEvent event) -> bool
{
    return _impl->enqueue(std::move(event));
}

void EventIngestor::flush()
{
    auto lock = std::unique_lock(_impl->mutex);
    _impl->cv.wait(lock, [this] { return (_impl->queue.empty() && !_impl->busy) || _impl->shutdownRequested; });
}

auto EventIngestor::droppedCount() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->dropped;
}

void EventIngestor::shutdown()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested)
            return;
        _impl->shutdownRequested = true;
        _impl->queue.clear();
    }

    _impl->cv.notify_all();

    if (_impl->worker.joinable())
    {
        _impl->worker.request_stop();
        _impl->worker.join();
    }
}

} // namespace sessionpulse
