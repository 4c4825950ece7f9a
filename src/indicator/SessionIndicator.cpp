// SPDX-License-Identifier: Apache-2.0
#include "SessionIndicator.hpp"

#include <core/Log.hpp>

namespace sessionpulse
{

SessionIndicator::SessionIndicator(Clock const& clock,
                                   LineSink& sink,
                                   IndicatorOptions options,
                                   InterruptActions actions):
    _clock(clock),
    _options(std::move(options)),
    _actions(std::move(actions)),
    _escalation(_options.escalationWindow),
    _renderLoop(_tracker, _escalation, clock, sink, _options.render),
    _ingestor(_tracker,
              clock,
              _options.ingest,
              [this](SessionEvent const& event, ApplyResult result) { onApplied(event, result); })
{
}

SessionIndicator::~SessionIndicator()
{
    stop();
}

auto SessionIndicator::onEvent(std::string_view name, nlohmann::json const& payload) -> bool
{
    return _ingestor.submit(name, payload);
}

auto SessionIndicator::onInterrupt() -> EscalationLevel
{
    auto const level = _escalation.pulse(_clock.now());
    log::info("Interrupt received, escalation level: {}", escalationLevelToString(level));

    switch (level)
    {
        case EscalationLevel::Cancel:
            if (_actions.onCancel)
                _actions.onCancel();
            break;
        case EscalationLevel::Abort:
            if (_actions.onAbort)
                _actions.onAbort();
            break;
        case EscalationLevel::Emergency:
            if (_actions.onEmergencyExit)
                _actions.onEmergencyExit();
            _escalation.consumeEmergency();
            break;
        case EscalationLevel::Normal:
            break;
    }

    return level;
}

void SessionIndicator::flush()
{
    _ingestor.flush();
}

void SessionIndicator::stop()
{
    {
        auto const lock = std::lock_guard(_lifecycleMutex);
        if (_stopped)
            return;
        _stopped = true;
    }

    _ingestor.shutdown();
    _renderLoop.stop();
}

auto SessionIndicator::snapshot() const -> SessionState
{
    return _tracker.snapshot();
}

auto SessionIndicator::escalationLevel() -> EscalationLevel
{
    auto const pending = _escalation.state().level;
    auto const level = _escalation.expire(_clock.now());
    if (level != pending)
        log::debug("Interrupt window lapsed, escalation back to {}", escalationLevelToString(level));
    return level;
}

auto SessionIndicator::renderLoop() noexcept -> RenderLoop&
{
    return _renderLoop;
}

void SessionIndicator::onApplied(SessionEvent const& event, ApplyResult result)
{
    if (result != ApplyResult::Applied || event.kind != EventKind::SessionStart || !_options.renderingEnabled)
        return;

    auto const lock = std::lock_guard(_lifecycleMutex);
    if (_stopped)
        return;

    _renderLoop.start();
}

} // namespace sessionpulse
