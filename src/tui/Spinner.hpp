// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace sessionpulse::tui
{

/// @brief Predefined spinner animation patterns.
enum class SpinnerType : std::uint8_t
{
    Dots,     ///< ⠋ ⠙ ⠹ ⠸ ⠼ ⠴ ⠦ ⠧ ⠇ ⠏
    Line,     ///< | / - \ .
    Box,      ///< ◰ ◳ ◲ ◱
    Arrow,    ///< ← ↖ ↑ ↗ → ↘ ↓ ↙
    Bounce,   ///< ⠁ ⠂ ⠄ ⡀ ⢀ ⠠ ⠐ ⠈
    Circle,   ///< ◜ ◝ ◞ ◟
    Grow,     ///< ⣀ ⣄ ⣤ ⣦ ⣶ ⣷ ⣿ ⣾ ⣼ ⣸
    Ellipsis, ///< "   " ".  " ".. " "..."
};

/// @brief Returns the frames for a given spinner type.
[[nodiscard]] auto spinnerFrames(SpinnerType type) -> std::span<std::string_view const>;

/// @brief Returns the configuration name of a spinner type ("dots", "line", ...).
[[nodiscard]] auto spinnerTypeToString(SpinnerType type) -> std::string_view;

/// @brief Parses a spinner configuration name.
/// @return The spinner type, or std::nullopt if the name is unknown.
[[nodiscard]] auto spinnerTypeFromString(std::string_view name) -> std::optional<SpinnerType>;

/// @brief A tick-driven spinner animation.
///
/// Each call to tick() advances exactly one frame, so the animation speed equals the
/// rate at which the owner ticks it.
class Spinner
{
  public:
    /// @brief Constructs a spinner with the given type.
    /// @param type The spinner animation pattern.
    explicit Spinner(SpinnerType type = SpinnerType::Dots);

    /// @brief Advances the spinner to the next frame.
    void tick() noexcept;

    /// @brief Returns the current frame as a string.
    [[nodiscard]] auto currentFrame() const noexcept -> std::string_view;

    /// @brief Returns the current frame index.
    [[nodiscard]] auto frameIndex() const noexcept -> std::size_t;

    /// @brief Returns the number of frames in the animation.
    [[nodiscard]] auto frameCount() const noexcept -> std::size_t;

    /// @brief Resets the spinner to the first frame.
    void reset() noexcept;

  private:
    std::span<std::string_view const> _frames;
    std::size_t _frameIndex = 0;
};

} // namespace sessionpulse::tui
