// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <session/SessionEvent.hpp>
#include <session/StateTracker.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>

namespace sessionpulse
{

/// @brief Configuration for the event ingestor.
struct EventIngestorConfig
{
    /// @brief Maximum number of events waiting to be applied.
    std::size_t queueCapacity = 1024;
};

/// @brief Called on the ingestion thread after an event was handed to the tracker.
using EventAppliedCallback = std::function<void(SessionEvent const& event, ApplyResult result)>;

/// @brief Adapts host lifecycle events into StateTracker mutations.
///
/// submit() only timestamps, decodes and enqueues, so the host's event delivery never
/// waits for the tracker or the terminal. A background worker thread drains the queue.
///
/// When the queue is full the incoming event is dropped, except session:* events, which
/// evict the oldest queued event instead so that session boundaries are never lost.
class EventIngestor
{
  public:
    /// @brief Constructs the ingestor and starts its worker thread.
    /// @param tracker The tracker events are applied to. Must outlive the ingestor.
    /// @param clock The clock used to timestamp events. Must outlive the ingestor.
    /// @param config Queue configuration.
    /// @param onApplied Optional observer invoked after each applied event.
    EventIngestor(StateTracker& tracker,
                  Clock const& clock,
                  EventIngestorConfig config = {},
                  EventAppliedCallback onApplied = {});
    ~EventIngestor();

    EventIngestor(const EventIngestor&) = delete;
    EventIngestor& operator=(const EventIngestor&) = delete;

    /// @brief Accepts a host event (non-blocking).
    /// @param name The event name.
    /// @param payload The event payload.
    /// @return False if the event was malformed or dropped.
    auto submit(std::string_view name, nlohmann::json const& payload) -> bool;

    /// @brief Accepts an already decoded event (non-blocking).
    /// @return False if the event was dropped because the queue is full.
    auto submit(SessionEvent event) -> bool;

    /// @brief Blocks until every event submitted so far has been applied.
    void flush();

    /// @brief Returns the number of events dropped due to a full queue.
    [[nodiscard]] auto droppedCount() const -> std::size_t;

    /// @brief Stops the worker thread. Pending events are discarded.
    void shutdown();

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace sessionpulse
