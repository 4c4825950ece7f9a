// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <sessionpulse/Config.hpp>

#include <memory>
#include <string>
#include <string_view>

#include <unistd.h>

namespace sessionpulse
{

/// @brief Process-level settings of the sidecar.
struct AppOptions
{
    int inputFd = STDIN_FILENO;    ///< Event stream, one JSON object per line.
    int controlFd = STDOUT_FILENO; ///< Control messages for the host.
    int statusFd = STDERR_FILENO;  ///< Terminal the status line is drawn on.
    std::string logFile;           ///< Log destination; empty logs to stderr.
    bool handleSigint = true;      ///< Install the SIGINT handler.
};

/// @brief Exit code after an emergency exit request (128 + SIGINT).
constexpr auto EmergencyExitCode = 130;

/// @brief The sessionpulse sidecar: reads host events from a stream and draws the status line.
///
/// Input lines look like {"event": "tool:pre", "data": {...}}. Each escalated interrupt is
/// reported on the control stream as {"control": "cancel" | "abort" | "exit"}.
class App
{
  public:
    /// @brief Constructs the application.
    /// @param config The resolved indicator configuration.
    /// @param options File descriptors and logging.
    explicit App(IndicatorConfig config, AppOptions options = {});
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Opens the log file and installs the signal handling.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Processes input until end of stream or an emergency exit.
    /// @return 0 on end of input, EmergencyExitCode after an emergency exit.
    [[nodiscard]] auto run() -> int;

    /// @brief Handles one input line.
    /// @return False if the line was not a valid event.
    auto processLine(std::string_view line) -> bool;

    /// @brief Handles one user interrupt as if SIGINT was received.
    void interrupt();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace sessionpulse
