// SPDX-License-Identifier: Apache-2.0
#include "InterruptHandler.hpp"

#include <core/Log.hpp>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace sessionpulse
{

namespace
{
    // Write end of the active handler's pipe, read by the signal handler.
    std::atomic<int> gInterruptPipe { -1 }; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigint {};        // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    constexpr auto PulseByte = char { 1 };
    constexpr auto QuitByte = char { 0 };

    void sigintHandler(int /*sig*/)
    {
        auto const savedErrno = errno;
        auto const fd = gInterruptPipe.load();
        if (fd != -1)
        {
            auto const result = ::write(fd, &PulseByte, 1);
            static_cast<void>(result);
        }
        errno = savedErrno;
    }

    auto setNonBlocking(int fd) -> bool
    {
        auto const flags = fcntl(fd, F_GETFL, 0);
        return flags != -1 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
    }
} // namespace

struct InterruptHandler::Impl
{
    InterruptCallback callback;
    int pipe[2] = { -1, -1 };
    bool installed = false;
    std::jthread watcher;

    explicit Impl(InterruptCallback callback): callback(std::move(callback)) {}

    void closePipe()
    {
        for (auto& fd: pipe)
        {
            if (fd != -1)
            {
                close(fd);
                fd = -1;
            }
        }
    }

    void watch(const std::stop_token& stopToken)
    {
        auto fds = pollfd { .fd = pipe[0], .events = POLLIN, .revents = 0 };

        while (!stopToken.stop_requested())
        {
            auto const pollResult = ::poll(&fds, 1, -1);
            if (pollResult < 0)
            {
                if (errno == EINTR)
                    continue;
                log::error("Interrupt watcher poll failed: {}", std::strerror(errno));
                return;
            }

            auto byte = char {};
            while (::read(pipe[0], &byte, 1) == 1)
            {
                if (byte == QuitByte)
                    return;
                if (callback)
                    callback();
            }
        }
    }
};

InterruptHandler::InterruptHandler(InterruptCallback callback): _impl(std::make_unique<Impl>(std::move(callback)))
{
}

InterruptHandler::~InterruptHandler()
{
    uninstall();
}

auto InterruptHandler::install() -> VoidResult
{
    if (_impl->installed)
        return {};

    if (gInterruptPipe.load() != -1)
        return makeError(ErrorCode::SignalError, "Another interrupt handler is already installed");

    if (::pipe(_impl->pipe) == -1)
        return makeError(ErrorCode::SignalError,
                         std::format("Failed to create interrupt pipe: {}", std::strerror(errno)));

    if (!setNonBlocking(_impl->pipe[0]) || !setNonBlocking(_impl->pipe[1]))
    {
        _impl->closePipe();
        return makeError(ErrorCode::SignalError, "Failed to make interrupt pipe non-blocking");
    }

    gInterruptPipe.store(_impl->pipe[1]);

    struct sigaction sa {};
    sa.sa_handler = sigintHandler;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGINT, &sa, &gPrevSigint) == -1)
    {
        gInterruptPipe.store(-1);
        _impl->closePipe();
        return makeError(ErrorCode::SignalError,
                         std::format("Failed to install SIGINT handler: {}", std::strerror(errno)));
    }

    _impl->watcher = std::jthread([this](const std::stop_token& token) { _impl->watch(token); });
    _impl->installed = true;
    log::debug("SIGINT handler installed");
    return {};
}

void InterruptHandler::uninstall()
{
    if (!_impl->installed)
        return;

    sigaction(SIGINT, &gPrevSigint, nullptr);
    gInterruptPipe.store(-1);

    _impl->watcher.request_stop();
    auto const result = ::write(_impl->pipe[1], &QuitByte, 1);
    static_cast<void>(result);
    _impl->watcher.join();

    _impl->closePipe();
    _impl->installed = false;
    log::debug("SIGINT handler removed");
}

void InterruptHandler::notify()
{
    if (!_impl->installed)
        return;

    auto const result = ::write(_impl->pipe[1], &PulseByte, 1);
    static_cast<void>(result);
}

auto InterruptHandler::installed() const noexcept -> bool
{
    return _impl->installed;
}

} // namespace sessionpulse
