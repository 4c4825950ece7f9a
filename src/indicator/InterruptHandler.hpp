// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <memory>

namespace sessionpulse
{

/// @brief Called on the watcher thread once per received interrupt.
using InterruptCallback = std::function<void()>;

/// @brief Turns SIGINT into interrupt pulses delivered on a regular thread.
///
/// The signal handler only writes one byte into a non-blocking self-pipe; a watcher
/// thread polls the pipe and invokes the callback once per byte. Only one handler can be
/// installed per process.
class InterruptHandler
{
  public:
    explicit InterruptHandler(InterruptCallback callback);
    ~InterruptHandler();

    InterruptHandler(const InterruptHandler&) = delete;
    InterruptHandler& operator=(const InterruptHandler&) = delete;

    /// @brief Installs the SIGINT handler and starts the watcher thread.
    ///
    /// Installing twice is a no-op.
    /// @return Success, or a SignalError if another handler is installed or setup fails.
    [[nodiscard]] auto install() -> VoidResult;

    /// @brief Restores the previous SIGINT disposition and stops the watcher thread.
    void uninstall();

    /// @brief Delivers a pulse exactly as the signal handler would.
    void notify();

    [[nodiscard]] auto installed() const noexcept -> bool;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace sessionpulse
