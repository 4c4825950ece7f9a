// SPDX-License-Identifier: Apache-2.0
#include "Clock.hpp"

namespace sessionpulse
{

auto SteadyClock::now() const -> TimePoint
{
    return std::chrono::steady_clock::now();
}

ManualClock::ManualClock(): _now(TimePoint {} + std::chrono::hours { 1 })
{
}

auto ManualClock::now() const -> TimePoint
{
    auto const lock = std::lock_guard(_mutex);
    return _now;
}

void ManualClock::advance(Duration delta)
{
    auto const lock = std::lock_guard(_mutex);
    _now += delta;
}

void ManualClock::set(TimePoint timePoint)
{
    auto const lock = std::lock_guard(_mutex);
    _now = timePoint;
}

} // namespace sessionpulse
