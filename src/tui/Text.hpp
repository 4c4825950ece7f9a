// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace sessionpulse::tui
{

/// @brief A styled text span within a line.
struct TextSpan
{
    std::string text; ///< The text content.
    Style style;      ///< The style for this span.
};

/// @brief A line of styled text composed of multiple spans.
struct TextLine
{
    std::vector<TextSpan> spans; ///< The spans in this line.

    /// @brief Returns the total display width of the line.
    [[nodiscard]] auto width() const noexcept -> int;

    /// @brief Appends a span to the line.
    void append(std::string text, Style const& style = {});

    /// @brief Returns the concatenated text of all spans, without styling.
    [[nodiscard]] auto plainText() const -> std::string;

    /// @brief Cuts the line down to at most @p width columns.
    ///
    /// Lines that fit are left untouched. Otherwise the line is cut at a grapheme cluster
    /// boundary and @p ellipsis (unstyled) is appended so the result is exactly @p width wide.
    /// @param width The maximum width in columns.
    /// @param ellipsis The marker appended after the cut.
    void truncate(int width, std::string_view ellipsis = "...");

    /// @brief Writes all spans into the output buffer with their styles.
    void render(TerminalOutput& output) const;
};

/// @brief Truncates plain text to a display width.
/// @param text The text to truncate.
/// @param width Maximum width in columns, including the ellipsis.
/// @param ellipsis The marker appended when the text is cut.
/// @return The truncated string.
[[nodiscard]] auto truncate(std::string_view text, int width, std::string_view ellipsis = "...") -> std::string;

/// @brief Returns the display width of UTF-8 text.
///
/// Counts one column per grapheme cluster; wide East Asian characters are not special-cased.
[[nodiscard]] auto displayWidth(std::string_view text) -> int;

} // namespace sessionpulse::tui
