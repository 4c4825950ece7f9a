// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string_view>

namespace sessionpulse
{

/// @brief How far the user has escalated their interrupt request.
enum class EscalationLevel : std::uint8_t
{
    Normal,    ///< No interrupt pending.
    Cancel,    ///< Cancel the current operation.
    Abort,     ///< Abort the current turn.
    Emergency, ///< Exit the process.
};

/// @brief Converts an EscalationLevel to its string representation.
[[nodiscard]] constexpr auto escalationLevelToString(EscalationLevel level) -> std::string_view
{
    switch (level)
    {
        case EscalationLevel::Normal: return "normal";
        case EscalationLevel::Cancel: return "cancel";
        case EscalationLevel::Abort: return "abort";
        case EscalationLevel::Emergency: return "emergency";
    }
    return "unknown";
}

/// @brief Value view of the escalation machine.
struct EscalationState
{
    EscalationLevel level = EscalationLevel::Normal;
    int pressCount = 0;
    Clock::TimePoint windowStart {};
};

/// @brief Turns interrupt pulses into cancel / abort / emergency-exit requests.
///
/// Pulses within one window escalate Cancel -> Abort -> Emergency. A pulse at or past
/// the end of the window (now - windowStart >= window) opens a new window at Cancel.
/// A window that expires below Emergency silently returns to Normal; Emergency holds
/// until consumeEmergency() is called. Window expiry is evaluated lazily from the
/// supplied time, so the machine needs no timer.
///
/// All members are thread safe.
class EscalationStateMachine
{
  public:
    static constexpr auto DefaultWindow = Clock::Duration { std::chrono::seconds { 2 } };

    explicit EscalationStateMachine(Clock::Duration window = DefaultWindow);

    EscalationStateMachine(const EscalationStateMachine&) = delete;
    EscalationStateMachine& operator=(const EscalationStateMachine&) = delete;

    /// @brief Registers one interrupt pulse.
    /// @param now The time of the pulse.
    /// @return The level after the pulse.
    auto pulse(Clock::TimePoint now) -> EscalationLevel;

    /// @brief Returns the effective level at @p now without changing the machine.
    [[nodiscard]] auto levelAt(Clock::TimePoint now) const -> EscalationLevel;

    /// @brief Commits a window expiry that levelAt() would report.
    /// @return The level after the expiry.
    auto expire(Clock::TimePoint now) -> EscalationLevel;

    /// @brief Resets an Emergency level to Normal.
    /// @return True if the machine was at Emergency.
    auto consumeEmergency() -> bool;

    /// @brief Returns a copy of the raw state (no expiry applied).
    [[nodiscard]] auto state() const -> EscalationState;

    /// @brief Returns the escalation window length.
    [[nodiscard]] auto window() const noexcept -> Clock::Duration;

  private:
    mutable std::mutex _mutex;
    EscalationState _state;
    Clock::Duration _window;

    [[nodiscard]] auto windowExpired(Clock::TimePoint now) const -> bool;
};

} // namespace sessionpulse
