// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <indicator/RenderLoop.hpp>
#include <session/EscalationStateMachine.hpp>
#include <session/EventIngestor.hpp>
#include <session/StateTracker.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <mutex>
#include <string_view>

namespace sessionpulse
{

/// @brief Host callbacks for escalated interrupts.
///
/// Invoked on the thread that called SessionIndicator::onInterrupt().
struct InterruptActions
{
    std::function<void()> onCancel;        ///< First interrupt: cancel the current operation.
    std::function<void()> onAbort;         ///< Second interrupt: abort the current turn.
    std::function<void()> onEmergencyExit; ///< Third interrupt: leave the process.
};

/// @brief Runtime options of a SessionIndicator.
struct IndicatorOptions
{
    RenderLoopConfig render;
    EventIngestorConfig ingest;
    Clock::Duration escalationWindow = EscalationStateMachine::DefaultWindow;
    bool renderingEnabled = true; ///< When false events are still tracked but nothing is drawn.
};

/// @brief Live status indicator for one agent session.
///
/// Wires the event ingestor, state tracker, escalation machine and render loop together.
/// The render loop starts when a session:start event has been applied and stops by
/// itself after rendering the end of the session.
class SessionIndicator
{
  public:
    /// @brief Constructs the indicator. @p clock and @p sink must outlive it.
    SessionIndicator(Clock const& clock, LineSink& sink, IndicatorOptions options, InterruptActions actions = {});
    ~SessionIndicator();

    SessionIndicator(const SessionIndicator&) = delete;
    SessionIndicator& operator=(const SessionIndicator&) = delete;

    /// @brief Hands a host lifecycle event over (non-blocking).
    /// @return False if the event was malformed or dropped.
    auto onEvent(std::string_view name, nlohmann::json const& payload) -> bool;

    /// @brief Registers one user interrupt and dispatches the matching action.
    /// @return The escalation level reached by this interrupt.
    auto onInterrupt() -> EscalationLevel;

    /// @brief Blocks until all submitted events have been applied.
    void flush();

    /// @brief Stops event ingestion and rendering. Idempotent.
    void stop();

    /// @brief Returns a copy of the current session state.
    [[nodiscard]] auto snapshot() const -> SessionState;

    /// @brief Returns the escalation level as of now, committing an expired window.
    auto escalationLevel() -> EscalationLevel;

    [[nodiscard]] auto renderLoop() noexcept -> RenderLoop&;

  private:
    Clock const& _clock;
    IndicatorOptions _options;
    InterruptActions _actions;
    StateTracker _tracker;
    EscalationStateMachine _escalation;
    RenderLoop _renderLoop;
    std::mutex _lifecycleMutex;
    bool _stopped = false;
    EventIngestor _ingestor; // last: its worker calls into the members above

    void onApplied(SessionEvent const& event, ApplyResult result);
};

} // namespace sessionpulse
