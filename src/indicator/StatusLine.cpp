// SPDX-License-Identifier: Apache-2.0
#include "StatusLine.hpp"

#include <core/Log.hpp>

#include <tui/TerminalOutput.hpp>

namespace sessionpulse
{

namespace
{
    // Terminals clamp the row, so this always addresses the last one.
    constexpr auto BottomRow = 999;
} // namespace

auto statusLinePositionToString(StatusLinePosition position) -> std::string_view
{
    switch (position)
    {
        case StatusLinePosition::Bottom: return "bottom";
        case StatusLinePosition::Inline: return "inline";
    }
    return "bottom";
}

auto statusLinePositionFromString(std::string_view name) -> std::optional<StatusLinePosition>
{
    if (name == "bottom")
        return StatusLinePosition::Bottom;
    if (name == "inline")
        return StatusLinePosition::Inline;
    return std::nullopt;
}

StatusLine::StatusLine(int fd, StatusLinePosition position): _fd(fd), _position(position)
{
}

auto StatusLine::show() -> VoidResult
{
    auto const lock = std::lock_guard(_mutex);
    if (_visible)
        return {};

    _visible = true;
    if (_position != StatusLinePosition::Bottom)
        return {};

    auto output = tui::TerminalOutput(false);
    output.writeRaw("\n");
    return output.flushTo(_fd);
}

auto StatusLine::hide() -> VoidResult
{
    auto const lock = std::lock_guard(_mutex);
    if (!_visible)
        return {};

    _visible = false;

    auto output = tui::TerminalOutput(false);
    if (_position == StatusLinePosition::Bottom)
    {
        output.saveCursor();
        output.moveTo(BottomRow, 1);
        output.clearLine();
        output.restoreCursor();
        output.moveUp();
    }
    else
    {
        output.clearLine();
        output.moveToColumn(1);
    }
    return output.flushTo(_fd);
}

void StatusLine::begin()
{
    if (auto result = show(); !result)
        log::warning("Failed to reserve status line: {}", result.error().message);
}

auto StatusLine::writeLine(std::string_view line) -> VoidResult
{
    auto const lock = std::lock_guard(_mutex);

    auto output = tui::TerminalOutput(false);
    if (_position == StatusLinePosition::Bottom)
    {
        output.saveCursor();
        output.moveTo(BottomRow, 1);
        output.clearLine();
        output.writeRaw(line);
        output.restoreCursor();
    }
    else
    {
        output.moveToColumn(1);
        output.clearLine();
        output.writeRaw(line);
    }

    if (auto result = output.flushTo(_fd); !result)
    {
        // A closed stream cannot be written again
        _visible = false;
        return result;
    }

    return {};
}

auto StatusLine::columns() const -> int
{
    return tui::terminalColumns(_fd);
}

void StatusLine::finish()
{
    auto const lock = std::lock_guard(_mutex);
    if (_position != StatusLinePosition::Inline)
        return;

    auto output = tui::TerminalOutput(false);
    output.writeRaw("\n");
    if (auto result = output.flushTo(_fd); !result)
        log::trace("Failed to finish status line: {}", result.error().message);
}

auto StatusLine::visible() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _visible;
}

auto StatusLine::position() const noexcept -> StatusLinePosition
{
    return _position;
}

} // namespace sessionpulse
