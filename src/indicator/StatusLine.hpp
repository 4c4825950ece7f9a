// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <indicator/RenderLoop.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

namespace sessionpulse
{

/// @brief Where the status line is drawn.
enum class StatusLinePosition : std::uint8_t
{
    Bottom, ///< On the last terminal row; the cursor is saved and restored around each write.
    Inline, ///< On the current row, rewritten from column 1.
};

/// @brief Converts a StatusLinePosition to its configuration name.
[[nodiscard]] auto statusLinePositionToString(StatusLinePosition position) -> std::string_view;

/// @brief Parses a configuration name ("bottom", "inline") into a StatusLinePosition.
[[nodiscard]] auto statusLinePositionFromString(std::string_view name) -> std::optional<StatusLinePosition>;

/// @brief A single continuously rewritten terminal line on a file descriptor.
///
/// Every write replaces the whole line: bottom mode saves the cursor, jumps to the last
/// row, clears it, writes and restores the cursor; inline mode returns to column 1,
/// clears and writes. The descriptor is not owned.
class StatusLine final: public LineSink
{
  public:
    /// @brief Constructs a status line writing to @p fd.
    /// @param fd The output file descriptor (typically stderr).
    /// @param position Where to draw the line.
    explicit StatusLine(int fd, StatusLinePosition position = StatusLinePosition::Bottom);

    /// @brief Reserves the line. In bottom mode this scrolls the content up by one row.
    [[nodiscard]] auto show() -> VoidResult;

    /// @brief Clears the line and gives the row back.
    [[nodiscard]] auto hide() -> VoidResult;

    /// @brief Shows the line; failures are logged.
    void begin() override;

    [[nodiscard]] auto writeLine(std::string_view line) -> VoidResult override;
    [[nodiscard]] auto columns() const -> int override;

    /// @brief Leaves the final line on screen. Inline mode moves to the next row.
    void finish() override;

    /// @brief Returns whether the line is currently reserved.
    [[nodiscard]] auto visible() const -> bool;

    [[nodiscard]] auto position() const noexcept -> StatusLinePosition;

  private:
    int _fd;
    StatusLinePosition _position;
    mutable std::mutex _mutex;
    bool _visible = false;
};

} // namespace sessionpulse
