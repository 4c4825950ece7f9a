// SPDX-License-Identifier: Apache-2.0
#include <libunicode/utf8_grapheme_segmenter.h>

#include <tui/Text.hpp>

namespace sessionpulse::tui
{

namespace
{
    /// @brief Returns the byte length of the longest prefix that is at most @p width columns wide.
    ///
    /// Cuts only at grapheme cluster boundaries, so combining marks and variation
    /// selectors stay with their base character.
    auto prefixBytes(std::string_view text, int width) -> std::size_t
    {
        auto segmenter = unicode::utf8_grapheme_segmenter(text);
        auto columns = 0;
        for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        {
            if (columns == width)
                return static_cast<std::size_t>(it._clusterStart - text.data());
            ++columns;
        }
        return text.size();
    }
} // namespace

// =============================================================================
// TextLine
// =============================================================================

auto TextLine::width() const noexcept -> int
{
    auto total = 0;
    for (auto const& span: spans)
        total += displayWidth(span.text);
    return total;
}

void TextLine::append(std::string text, Style const& style)
{
    spans.push_back(TextSpan { .text = std::move(text), .style = style });
}

auto TextLine::plainText() const -> std::string
{
    auto result = std::string {};
    for (auto const& span: spans)
        result += span.text;
    return result;
}

void TextLine::truncate(int width, std::string_view ellipsis)
{
    if (width <= 0)
    {
        spans.clear();
        return;
    }

    if (this->width() <= width)
        return;

    auto const ellipsisWidth = displayWidth(ellipsis);
    if (width <= ellipsisWidth)
    {
        spans.clear();
        append(std::string(static_cast<std::size_t>(width), '.'));
        return;
    }

    auto remaining = width - ellipsisWidth;
    auto kept = std::vector<TextSpan> {};
    for (auto& span: spans)
    {
        if (remaining == 0)
            break;

        auto const spanWidth = displayWidth(span.text);
        if (spanWidth <= remaining)
        {
            remaining -= spanWidth;
            kept.push_back(std::move(span));
            continue;
        }

        span.text.resize(prefixBytes(span.text, remaining));
        remaining = 0;
        kept.push_back(std::move(span));
    }

    spans = std::move(kept);
    append(std::string(ellipsis));
}

void TextLine::render(TerminalOutput& output) const
{
    for (auto const& span: spans)
        output.write(span.text, span.style);
}

// =============================================================================
// Free functions
// =============================================================================

auto truncate(std::string_view text, int width, std::string_view ellipsis) -> std::string
{
    if (width <= 0)
        return "";

    if (displayWidth(text) <= width)
        return std::string(text);

    auto const ellipsisWidth = displayWidth(ellipsis);
    if (width <= ellipsisWidth)
        return std::string(static_cast<std::size_t>(width), '.');

    auto result = std::string(text.substr(0, prefixBytes(text, width - ellipsisWidth)));
    result += ellipsis;
    return result;
}

auto displayWidth(std::string_view text) -> int
{
    auto segmenter = unicode::utf8_grapheme_segmenter(text);
    auto columns = 0;
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        ++columns;
    return columns;
}

} // namespace sessionpulse::tui
