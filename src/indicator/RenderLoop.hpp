// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <indicator/Renderer.hpp>
#include <session/EscalationStateMachine.hpp>
#include <session/StateTracker.hpp>

#include <cstddef>
#include <memory>
#include <string_view>

#include <tui/Spinner.hpp>

namespace sessionpulse
{

/// @brief Destination of rendered status lines.
class LineSink
{
  public:
    virtual ~LineSink() = default;

    /// @brief Replaces the visible status line with @p line.
    /// @return Success or a TerminalError.
    [[nodiscard]] virtual auto writeLine(std::string_view line) -> VoidResult = 0;

    /// @brief Returns the available width in columns.
    [[nodiscard]] virtual auto columns() const -> int = 0;

    /// @brief Called on the render thread when a run starts, before its first line.
    virtual void begin() {}

    /// @brief Called once after the final (terminal) line was written.
    virtual void finish() {}
};

/// @brief Settings of the render loop.
struct RenderLoopConfig
{
    static constexpr auto MaxInterval = Clock::Duration { std::chrono::hours { 1 } };

    Clock::Duration interval = std::chrono::milliseconds(100);
    Clock::Duration stuckThreshold = std::chrono::seconds(60);
    DisplayConfig display;
    tui::SpinnerType spinner = tui::SpinnerType::Dots;
};

/// @brief Builds the frame data for one render from live state.
[[nodiscard]] auto makeRenderSnapshot(StateTracker const& tracker,
                                      EscalationStateMachine const& escalation,
                                      Clock::TimePoint now,
                                      Clock::Duration stuckThreshold,
                                      std::string spinnerFrame) -> RenderSnapshot;

/// @brief Periodically renders the session state into a LineSink.
///
/// Each tick takes a snapshot, computes the stuck status, reads the escalation level,
/// renders, and writes to the sink only when the line differs from the previous one.
/// The tick that renders a terminal state is the last: the sink is finished and the
/// loop stops on its own.
class RenderLoop
{
  public:
    /// @brief Constructs the loop. All references must outlive it.
    RenderLoop(StateTracker const& tracker,
               EscalationStateMachine const& escalation,
               Clock const& clock,
               LineSink& sink,
               RenderLoopConfig config);
    ~RenderLoop();

    RenderLoop(const RenderLoop&) = delete;
    RenderLoop& operator=(const RenderLoop&) = delete;

    /// @brief Starts the worker thread. No-op while already running.
    ///
    /// All sink calls of the run happen on the worker thread.
    void start();

    /// @brief Stops the worker thread and waits for it.
    void stop();

    /// @brief Performs one render cycle on the calling thread.
    /// @return False once the terminal line has been rendered.
    auto tick() -> bool;

    /// @brief Returns whether the worker thread is running.
    [[nodiscard]] auto running() const -> bool;

    /// @brief Returns whether the terminal line of the current run was rendered.
    [[nodiscard]] auto finished() const -> bool;

    /// @brief Number of lines rendered (including unchanged ones) since construction.
    [[nodiscard]] auto renderCount() const -> std::size_t;

    /// @brief Number of lines handed to the sink since construction.
    [[nodiscard]] auto writeCount() const -> std::size_t;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace sessionpulse
