// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <session/SessionEvent.hpp>
#include <session/SessionState.hpp>

#include <cstdint>
#include <mutex>

namespace sessionpulse
{

/// @brief Outcome of StateTracker::apply().
enum class ApplyResult : std::uint8_t
{
    Applied,          ///< The event changed the session state.
    Ignored,          ///< Unknown event kind; the state is untouched.
    RejectedTerminal, ///< The session already ended and the event is not a session:start.
};

/// @brief Owns the SessionState and applies lifecycle events to it.
///
/// apply() is the single writer; snapshot() may be called concurrently from any thread
/// and always observes the state either before or after a given apply(), never in between.
/// Both hold the lock only for the copy or the O(1) mutation.
class StateTracker
{
  public:
    StateTracker() = default;

    StateTracker(const StateTracker&) = delete;
    StateTracker& operator=(const StateTracker&) = delete;

    /// @brief Applies an event to the session state.
    /// @param event The decoded event, timestamped at ingestion.
    /// @return Whether the event was applied, ignored or rejected.
    auto apply(SessionEvent const& event) -> ApplyResult;

    /// @brief Returns an isolated copy of the current session state.
    [[nodiscard]] auto snapshot() const -> SessionState;

  private:
    mutable std::mutex _mutex;
    SessionState _state;
};

} // namespace sessionpulse
