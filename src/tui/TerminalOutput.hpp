// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sessionpulse::tui
{

/// @brief Text styling attributes for terminal output.
struct Style
{
    std::optional<std::uint8_t> fg; ///< Foreground color (256-color index).
    bool bold = false;              ///< Bold text.
    bool dim = false;               ///< Dim/faint text.
};

/// @brief Builds styled terminal output in an internal buffer.
///
/// Text and cursor control sequences are appended to the buffer; flushTo() writes
/// the buffer to a file descriptor. When colors are disabled, styles are ignored and
/// no SGR sequence is ever emitted.
class TerminalOutput
{
  public:
    /// @brief Constructs an output buffer.
    /// @param colorsEnabled Whether SGR styling is emitted.
    explicit TerminalOutput(bool colorsEnabled = true);

    /// @brief Returns whether SGR styling is emitted.
    [[nodiscard]] auto colorsEnabled() const noexcept -> bool;

    /// @brief Writes styled text at the current cursor position.
    /// @param text The text to write.
    /// @param style The style to apply.
    void write(std::string_view text, Style const& style = {});

    /// @brief Writes raw text without styling.
    /// @param text The text to write directly to the buffer.
    void writeRaw(std::string_view text);

    /// @brief Moves the cursor to an absolute position.
    /// @param row Row (1-based). Terminals clamp rows past the bottom to the last row.
    /// @param col Column (1-based).
    void moveTo(int row, int col);

    /// @brief Moves the cursor to a column on the current row (1-based).
    void moveToColumn(int col);

    /// @brief Moves the cursor up by n rows.
    void moveUp(int n = 1);

    /// @brief Clears the entire current line.
    void clearLine();

    /// @brief Saves the cursor position (ESC 7).
    void saveCursor();

    /// @brief Restores the cursor position (ESC 8).
    void restoreCursor();

    /// @brief Returns the buffered, not yet flushed output.
    [[nodiscard]] auto buffer() const noexcept -> std::string_view;

    /// @brief Returns the buffered output and clears the buffer.
    [[nodiscard]] auto take() -> std::string;

    /// @brief Writes the buffer to a file descriptor and clears it.
    ///
    /// Retries on EINTR and partial writes. The buffer is cleared even on failure so a
    /// broken stream does not accumulate output.
    /// @param fd The file descriptor to write to.
    /// @return Success or a TerminalError.
    [[nodiscard]] auto flushTo(int fd) -> VoidResult;

  private:
    std::string _buffer; ///< Output buffer for batching writes.
    bool _colorsEnabled = true;

    /// @brief Appends SGR (Select Graphic Rendition) sequences for the given style.
    void appendSgr(Style const& style);

    /// @brief Appends the SGR reset sequence.
    void appendSgrReset();

    [[nodiscard]] static auto isDefault(Style const& style) noexcept -> bool;
};

/// @brief Queries the width in columns of the terminal behind a file descriptor.
/// @param fd The file descriptor.
/// @param fallback The width returned when the descriptor is not a terminal.
[[nodiscard]] auto terminalColumns(int fd, int fallback = 80) -> int;

} // namespace sessionpulse::tui
