// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <cerrno>
#include <cstring>
#include <format>

#include <unistd.h>

#include <tui/TerminalOutput.hpp>

namespace sessionpulse::tui
{

TerminalOutput::TerminalOutput(bool colorsEnabled): _colorsEnabled(colorsEnabled)
{
}

auto TerminalOutput::colorsEnabled() const noexcept -> bool
{
    return _colorsEnabled;
}

void TerminalOutput::write(std::string_view text, Style const& style)
{
    if (!_colorsEnabled || isDefault(style))
    {
        _buffer.append(text);
        return;
    }

    appendSgr(style);
    _buffer.append(text);
    appendSgrReset();
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

void TerminalOutput::moveTo(int row, int col)
{
    _buffer += std::format("\033[{};{}H", row, col);
}

void TerminalOutput::moveToColumn(int col)
{
    _buffer += std::format("\033[{}G", col);
}

void TerminalOutput::moveUp(int n)
{
    if (n > 0)
        _buffer += std::format("\033[{}A", n);
}

void TerminalOutput::clearLine()
{
    _buffer += "\033[2K";
}

void TerminalOutput::saveCursor()
{
    _buffer += "\0337";
}

void TerminalOutput::restoreCursor()
{
    _buffer += "\0338";
}

auto TerminalOutput::buffer() const noexcept -> std::string_view
{
    return _buffer;
}

auto TerminalOutput::take() -> std::string
{
    auto result = std::move(_buffer);
    _buffer.clear();
    return result;
}

auto TerminalOutput::flushTo(int fd) -> VoidResult
{
    auto const data = take();
    auto offset = std::size_t { 0 };

    while (offset < data.size())
    {
        auto const n = ::write(fd, data.data() + offset, data.size() - offset);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TerminalError,
                             std::format("Failed to write status line: {}", std::strerror(errno)));
        }
        if (n == 0)
            return makeError(ErrorCode::TerminalError, "Failed to write status line: stream closed");
        offset += static_cast<std::size_t>(n);
    }

    return {};
}

auto TerminalOutput::isDefault(Style const& style) noexcept -> bool
{
    return !style.fg && !style.bold && !style.dim;
}

void TerminalOutput::appendSgr(Style const& style)
{
    _buffer += "\033[";
    auto needSemicolon = false;
    auto const appendSep = [&]() {
        if (needSemicolon)
            _buffer += ';';
        needSemicolon = true;
    };

    if (style.bold)
    {
        appendSep();
        _buffer += '1';
    }
    if (style.dim)
    {
        appendSep();
        _buffer += '2';
    }
    if (style.fg)
    {
        appendSep();
        _buffer += std::format("38;5;{}", *style.fg);
    }

    _buffer += 'm';
}

void TerminalOutput::appendSgrReset()
{
    _buffer += "\033[0m";
}

auto terminalColumns(int fd, int fallback) -> int
{
    auto ws = winsize {};
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return fallback;
}

} // namespace sessionpulse::tui
