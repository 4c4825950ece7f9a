// SPDX-License-Identifier: Apache-2.0
#include "StuckDetector.hpp"

namespace sessionpulse
{

auto detectStuck(SessionState const& state, Clock::TimePoint now, Clock::Duration threshold) -> StuckStatus
{
    if (!state.started)
        return {};

    auto const idle = now > state.lastActivityAt ? now - state.lastActivityAt : Clock::Duration::zero();
    return StuckStatus { .stuck = idle >= threshold && !state.terminal, .idle = idle };
}

} // namespace sessionpulse
