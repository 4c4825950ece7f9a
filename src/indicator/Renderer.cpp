// SPDX-License-Identifier: Apache-2.0
#include "Renderer.hpp"

#include <chrono>
#include <format>

#include <tui/TerminalOutput.hpp>

namespace sessionpulse
{

namespace
{
    constexpr auto WarningGlyph = std::string_view { "\u26A0" };  // ⚠
    constexpr auto CompleteGlyph = std::string_view { "\u2713" }; // ✓
    constexpr auto FailedGlyph = std::string_view { "\u2717" };   // ✗
    constexpr auto DelegateGlyph = std::string_view { "\u2192" }; // →
    constexpr auto UpArrow = std::string_view { "\u2191" };       // ↑
    constexpr auto DownArrow = std::string_view { "\u2193" };     // ↓

    constexpr auto MaxToolNameWidth = 20;

    // Style helpers for the status line segments
    auto colorStyle(std::uint8_t color, bool bold = false) -> tui::Style
    {
        auto style = tui::Style {};
        style.fg = color;
        style.bold = bold;
        return style;
    }

    auto dimStyle() -> tui::Style
    {
        auto style = tui::Style {};
        style.dim = true;
        return style;
    }

    auto spinnerStyle() -> tui::Style { return colorStyle(6); }  // Cyan
    auto warningStyle() -> tui::Style { return colorStyle(3); }  // Yellow
    auto successStyle() -> tui::Style { return colorStyle(2); }  // Green
    auto failureStyle() -> tui::Style { return colorStyle(1); }  // Red

    void appendSeparator(tui::TextLine& line)
    {
        line.append(std::string(FieldSeparator), dimStyle());
    }

    /// @brief Appends the enabled metric fields, each preceded by a separator.
    void appendMetrics(tui::TextLine& line, RenderSnapshot const& snapshot, DisplayConfig const& config)
    {
        if (config.showTokens)
        {
            appendSeparator(line);
            line.append(formatTokens(snapshot.session.tokensIn, snapshot.session.tokensOut), dimStyle());
        }

        if (config.showElapsed)
        {
            appendSeparator(line);
            line.append(formatElapsed(snapshot.elapsed), dimStyle());
        }
    }

    void appendEscalation(tui::TextLine& line, EscalationLevel level)
    {
        auto const hint = [level]() -> std::string_view {
            switch (level)
            {
                case EscalationLevel::Cancel: return "cancelling (Ctrl+C again to abort turn)";
                case EscalationLevel::Abort: return "aborting turn (Ctrl+C again to exit)";
                case EscalationLevel::Emergency: return "emergency exit";
                case EscalationLevel::Normal: break;
            }
            return {};
        }();

        if (hint.empty())
            return;

        appendSeparator(line);
        auto const style = level == EscalationLevel::Emergency ? failureStyle() : warningStyle();
        line.append(std::format("{} {}", WarningGlyph, hint), style);
    }

    void buildTerminalLine(tui::TextLine& line, RenderSnapshot const& snapshot, DisplayConfig const& config)
    {
        auto const& session = snapshot.session;
        if (session.activity == Activity::Errored)
        {
            auto const text = session.errorMessage && !session.errorMessage->empty()
                                  ? std::format("{} Session failed: {}", FailedGlyph, *session.errorMessage)
                                  : std::format("{} Session failed", FailedGlyph);
            line.append(text, failureStyle());
        }
        else
        {
            line.append(std::format("{} Session complete", CompleteGlyph), successStyle());
        }

        appendMetrics(line, snapshot, config);
        appendSeparator(line);
        line.append(std::format("{} turns", session.turnCount), dimStyle());
    }

    void buildStuckLine(tui::TextLine& line, RenderSnapshot const& snapshot, DisplayConfig const& config)
    {
        auto const idleSeconds = std::chrono::duration_cast<std::chrono::seconds>(snapshot.stuck.idle).count();
        line.append(std::format("{} {}s idle", WarningGlyph, idleSeconds), warningStyle());
        if (config.unstickHint)
            line.append(" (Ctrl+C to interrupt)", dimStyle());
    }

    void buildActiveLine(tui::TextLine& line, RenderSnapshot const& snapshot, DisplayConfig const& config)
    {
        line.append(snapshot.spinnerFrame, spinnerStyle());
        line.append(" " + activityPhrase(snapshot.session));
        appendMetrics(line, snapshot, config);
    }
} // namespace

auto formatTokenCount(std::uint64_t count) -> std::string
{
    if (count < 1'000)
        return std::format("{}", count);

    if (count < 1'000'000)
    {
        auto text = std::format("{:.1f}K", static_cast<double>(count) / 1'000.0);
        // 999,950 and up would round to "1000.0K"
        if (text != "1000.0K")
            return text;
    }

    return std::format("{:.1f}M", static_cast<double>(count) / 1'000'000.0);
}

auto formatTokens(std::uint64_t tokensIn, std::uint64_t tokensOut) -> std::string
{
    return std::format("{}{} {}{}", formatTokenCount(tokensIn), UpArrow, formatTokenCount(tokensOut), DownArrow);
}

auto formatElapsed(Clock::Duration elapsed) -> std::string
{
    auto const totalSeconds = std::max<std::int64_t>(
        0, static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()));

    auto const hours = totalSeconds / 3600;
    auto const minutes = (totalSeconds % 3600) / 60;
    auto const seconds = totalSeconds % 60;

    if (hours > 0)
        return std::format("{:02}:{:02}:{:02}", hours, minutes, seconds);
    return std::format("{:02}:{:02}", minutes, seconds);
}

auto activityPhrase(SessionState const& state) -> std::string
{
    if (state.delegateName)
        return std::format("{} {}", DelegateGlyph, *state.delegateName);

    switch (state.activity)
    {
        case Activity::Idle:
            return "waiting for input";
        case Activity::Thinking:
            return "thinking";
        case Activity::Executing:
            if (state.toolName)
                return std::format("executing: {}", tui::truncate(*state.toolName, MaxToolNameWidth));
            return "executing";
        case Activity::Streaming:
            return "streaming response";
        case Activity::Done:
            return "done";
        case Activity::Errored:
            return "error";
    }
    return std::string(activityToString(state.activity));
}

auto buildStatusLine(RenderSnapshot const& snapshot, DisplayConfig const& config) -> tui::TextLine
{
    auto line = tui::TextLine {};

    if (snapshot.session.terminal)
        buildTerminalLine(line, snapshot, config);
    else if (snapshot.stuck.stuck)
        buildStuckLine(line, snapshot, config);
    else
        buildActiveLine(line, snapshot, config);

    if (!snapshot.session.terminal)
        appendEscalation(line, snapshot.escalation);

    if (config.maxColumns > 0)
        line.truncate(config.maxColumns);

    return line;
}

auto renderStatusLine(RenderSnapshot const& snapshot, DisplayConfig const& config) -> std::string
{
    auto output = tui::TerminalOutput(config.colorsEnabled);
    buildStatusLine(snapshot, config).render(output);
    return output.take();
}

} // namespace sessionpulse
