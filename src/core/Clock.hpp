// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <mutex>

namespace sessionpulse
{

/// @brief Monotonic time source used by all timing logic.
///
/// Implementations must be safe to call from any thread.
class Clock
{
  public:
    using Duration = std::chrono::steady_clock::duration;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    /// @brief Returns the current monotonic time.
    [[nodiscard]] virtual auto now() const -> TimePoint = 0;
};

/// @brief Clock backed by std::chrono::steady_clock.
class SteadyClock final: public Clock
{
  public:
    [[nodiscard]] auto now() const -> TimePoint override;
};

/// @brief Manually advanced clock for deterministic tests.
///
/// Starts at an arbitrary non-zero epoch so that default-constructed time points
/// are distinguishable from real readings.
class ManualClock final: public Clock
{
  public:
    ManualClock();

    [[nodiscard]] auto now() const -> TimePoint override;

    /// @brief Moves the clock forward by the given duration.
    void advance(Duration delta);

    /// @brief Sets the clock to an absolute time point (may move backwards).
    void set(TimePoint timePoint);

  private:
    mutable std::mutex _mutex;
    TimePoint _now;
};

/// @brief Converts a floating point number of seconds into a clock duration.
///
/// Values beyond the range of Clock::Duration saturate at Clock::Duration::max().
/// Negative and NaN values yield zero.
[[nodiscard]] inline auto secondsToDuration(double seconds) -> Clock::Duration
{
    auto const value = std::chrono::duration<double>(seconds);
    if (!(value > std::chrono::duration<double>::zero()))
        return Clock::Duration::zero();
    if (value >= std::chrono::duration<double>(Clock::Duration::max()))
        return Clock::Duration::max();
    return std::chrono::duration_cast<Clock::Duration>(value);
}

} // namespace sessionpulse
