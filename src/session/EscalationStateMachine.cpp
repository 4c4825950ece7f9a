// SPDX-License-Identifier: Apache-2.0
#include "EscalationStateMachine.hpp"

namespace sessionpulse
{

EscalationStateMachine::EscalationStateMachine(Clock::Duration window): _window(window)
{
}

auto EscalationStateMachine::windowExpired(Clock::TimePoint now) const -> bool
{
    // A reading before windowStart comes from a stale clock; treat it as a fresh window.
    return now < _state.windowStart || now - _state.windowStart >= _window;
}

auto EscalationStateMachine::pulse(Clock::TimePoint now) -> EscalationLevel
{
    auto const lock = std::lock_guard(_mutex);

    if (_state.pressCount == 0 || windowExpired(now))
    {
        _state = EscalationState { .level = EscalationLevel::Cancel, .pressCount = 1, .windowStart = now };
        return _state.level;
    }

    if (_state.level == EscalationLevel::Emergency)
        return _state.level;

    ++_state.pressCount;
    _state.level = _state.pressCount >= 3 ? EscalationLevel::Emergency : EscalationLevel::Abort;
    return _state.level;
}

auto EscalationStateMachine::levelAt(Clock::TimePoint now) const -> EscalationLevel
{
    auto const lock = std::lock_guard(_mutex);
    if (_state.level != EscalationLevel::Emergency && _state.pressCount > 0 && windowExpired(now))
        return EscalationLevel::Normal;
    return _state.level;
}

auto EscalationStateMachine::expire(Clock::TimePoint now) -> EscalationLevel
{
    auto const lock = std::lock_guard(_mutex);
    if (_state.level != EscalationLevel::Emergency && _state.pressCount > 0 && windowExpired(now))
        _state = EscalationState {};
    return _state.level;
}

auto EscalationStateMachine::consumeEmergency() -> bool
{
    auto const lock = std::lock_guard(_mutex);
    if (_state.level != EscalationLevel::Emergency)
        return false;
    _state = EscalationState {};
    return true;
}

auto EscalationStateMachine::state() const -> EscalationState
{
    auto const lock = std::lock_guard(_mutex);
    return _state;
}

auto EscalationStateMachine::window() const noexcept -> Clock::Duration
{
    return _window;
}

} // namespace sessionpulse
