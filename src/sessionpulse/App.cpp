// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Clock.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <indicator/InterruptHandler.hpp>
#include <indicator/SessionIndicator.hpp>
#include <indicator/StatusLine.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <fstream>
#include <mutex>

#include <poll.h>

namespace sessionpulse
{

namespace
{
    // Input is polled with a timeout so that an emergency exit is noticed promptly.
    constexpr auto InputPollTimeoutMs = 100;

    auto writeAll(int fd, std::string_view data) -> VoidResult
    {
        while (!data.empty())
        {
            auto const n = ::write(fd, data.data(), data.size());
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                return makeError(ErrorCode::IoError, std::strerror(errno));
            }
            data.remove_prefix(static_cast<std::size_t>(n));
        }
        return {};
    }
} // namespace

struct App::Impl
{
    IndicatorConfig config;
    AppOptions options;
    SteadyClock clock;
    StatusLine statusLine;
    SessionIndicator indicator;
    InterruptHandler interruptHandler;

    std::atomic<bool> exitRequested = false;
    std::mutex controlMutex;

    std::mutex logMutex;
    std::ofstream logStream;

    Impl(IndicatorConfig config, AppOptions options):
        config(config),
        options(std::move(options)),
        statusLine(this->options.statusFd, config.position),
        indicator(clock,
                  statusLine,
                  toIndicatorOptions(config),
                  InterruptActions {
                      .onCancel = [this] { sendControl("cancel"); },
                      .onAbort = [this] { sendControl("abort"); },
                      .onEmergencyExit =
                          [this] {
                              sendControl("exit");
                              exitRequested = true;
                          },
                  }),
        interruptHandler([this] { indicator.onInterrupt(); })
    {
    }

    void sendControl(std::string_view action)
    {
        auto const message = nlohmann::json { { "control", std::string(action) } }.dump() + "\n";

        auto const lock = std::lock_guard(controlMutex);
        if (auto result = writeAll(options.controlFd, message); !result)
            log::warning("Failed to send '{}' control message: {}", action, result.error().message);
    }

    void writeLog(log::Level level, std::string_view message)
    {
        auto const lock = std::lock_guard(logMutex);
        logStream << '[' << log::levelName(level) << "] " << message << '\n';
        logStream.flush();
    }

    auto processLine(std::string_view line) -> bool
    {
        if (line.find_first_not_of(" \t\r") == std::string_view::npos)
            return false;

        auto parsed = json::parse(line);
        if (!parsed)
        {
            log::debug("Ignoring input line: {}", parsed.error().message);
            return false;
        }

        auto const name = json::findString(*parsed, "event");
        if (!name)
        {
            log::debug("Ignoring input line without \"event\" field");
            return false;
        }

        auto const it = parsed->find("data");
        auto const payload = it != parsed->end() ? *it : nlohmann::json {};
        return indicator.onEvent(*name, payload);
    }

    /// @brief Renders the final line if the session ended, otherwise takes the line off screen.
    void finishStatusLine()
    {
        auto& loop = indicator.renderLoop();
        if (!loop.running())
            return;

        if (indicator.snapshot().terminal)
        {
            loop.tick();
            return;
        }

        loop.stop();
        if (auto result = statusLine.hide(); !result)
            log::debug("Failed to clear status line: {}", result.error().message);
    }
};

App::App(IndicatorConfig config, AppOptions options):
    _impl(std::make_unique<Impl>(std::move(config), std::move(options)))
{
}

App::~App()
{
    _impl->interruptHandler.uninstall();
    _impl->indicator.stop();
    if (_impl->logStream.is_open())
        log::setCallback(nullptr);
}

auto App::initialize() -> VoidResult
{
    if (!_impl->options.logFile.empty())
    {
        _impl->logStream.open(_impl->options.logFile, std::ios::app);
        if (!_impl->logStream.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot open log file: {}", _impl->options.logFile));

        log::setCallback([this](log::Level level, std::string_view message) { _impl->writeLog(level, message); });
    }

    // A host that goes away must not kill us while writing control messages
    std::signal(SIGPIPE, SIG_IGN);

    if (_impl->options.handleSigint)
    {
        if (auto result = _impl->interruptHandler.install(); !result)
            return result;
    }

    log::info("sessionpulse ready (position: {}, status line {})",
              statusLinePositionToString(_impl->config.position),
              _impl->config.renderingEnabled ? "enabled" : "disabled");
    return {};
}

auto App::run() -> int
{
    auto pending = std::string {};
    auto buffer = std::array<char, 4096> {};
    auto fds = pollfd { .fd = _impl->options.inputFd, .events = POLLIN, .revents = 0 };
    auto endOfInput = false;
    auto inputFailed = false;

    while (!endOfInput && !_impl->exitRequested)
    {
        auto const pollResult = ::poll(&fds, 1, InputPollTimeoutMs);
        if (pollResult < 0)
        {
            if (errno == EINTR)
                continue;
            log::error("Failed to poll input: {}", std::strerror(errno));
            inputFailed = true;
            break;
        }
        if (pollResult == 0)
        {
            // Idle input: let a lapsed interrupt window fall back to normal
            _impl->indicator.escalationLevel();
            continue;
        }

        auto const n = ::read(_impl->options.inputFd, buffer.data(), buffer.size());
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            log::error("Failed to read input: {}", std::strerror(errno));
            inputFailed = true;
            break;
        }

        if (n == 0)
        {
            endOfInput = true;
            if (!pending.empty())
                processLine(pending);
            pending.clear();
            break;
        }

        pending.append(buffer.data(), static_cast<std::size_t>(n));
        auto start = std::size_t { 0 };
        for (auto newline = pending.find('\n'); newline != std::string::npos; newline = pending.find('\n', start))
        {
            processLine(std::string_view(pending).substr(start, newline - start));
            start = newline + 1;
        }
        pending.erase(0, start);
    }

    _impl->interruptHandler.uninstall();

    if (_impl->exitRequested)
    {
        log::info("Emergency exit requested");
        _impl->indicator.stop();
        return EmergencyExitCode;
    }

    _impl->indicator.flush();
    _impl->finishStatusLine();
    _impl->indicator.stop();

    auto const state = _impl->indicator.snapshot();
    log::info("Input closed after {} turns ({} tokens in, {} tokens out)",
              state.turnCount,
              state.tokensIn,
              state.tokensOut);
    return inputFailed ? 1 : 0;
}

auto App::processLine(std::string_view line) -> bool
{
    return _impl->processLine(line);
}

void App::interrupt()
{
    _impl->indicator.onInterrupt();
}

} // namespace sessionpulse
