// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <session/SessionState.hpp>

namespace sessionpulse
{

/// @brief Result of a stuck check.
struct StuckStatus
{
    bool stuck = false;
    Clock::Duration idle {}; ///< Time since the last recorded activity (never negative).
};

/// @brief Decides whether a session looks stuck.
///
/// Stateless: idle time is always recomputed from the authoritative lastActivityAt.
/// A session is stuck when idle >= threshold (inclusive) and it has not ended.
/// @param state A snapshot of the session state.
/// @param now The current time.
/// @param threshold The configured stuck threshold.
[[nodiscard]] auto detectStuck(SessionState const& state, Clock::TimePoint now, Clock::Duration threshold)
    -> StuckStatus;

} // namespace sessionpulse
