// SPDX-License-Identifier: Apache-2.0
#include <tui/Spinner.hpp>

#include <array>

namespace sessionpulse::tui
{

namespace
{

// Spinner frame definitions
constexpr std::array DotsFrames = {
    std::string_view { "\u280B" }, // ⠋
    std::string_view { "\u2819" }, // ⠙
    std::string_view { "\u2839" }, // ⠹
    std::string_view { "\u2838" }, // ⠸
    std::string_view { "\u283C" }, // ⠼
    std::string_view { "\u2834" }, // ⠴
    std::string_view { "\u2826" }, // ⠦
    std::string_view { "\u2827" }, // ⠧
    std::string_view { "\u2807" }, // ⠇
    std::string_view { "\u280F" }, // ⠏
};

constexpr std::array LineFrames = {
    std::string_view { "|" },
    std::string_view { "/" },
    std::string_view { "-" },
    std::string_view { "\\" },
};

constexpr std::array BoxFrames = {
    std::string_view { "\u25F0" }, // ◰
    std::string_view { "\u25F3" }, // ◳
    std::string_view { "\u25F2" }, // ◲
    std::string_view { "\u25F1" }, // ◱
};

constexpr std::array ArrowFrames = {
    std::string_view { "\u2190" }, // ←
    std::string_view { "\u2196" }, // ↖
    std::string_view { "\u2191" }, // ↑
    std::string_view { "\u2197" }, // ↗
    std::string_view { "\u2192" }, // →
    std::string_view { "\u2198" }, // ↘
    std::string_view { "\u2193" }, // ↓
    std::string_view { "\u2199" }, // ↙
};

constexpr std::array BounceFrames = {
    std::string_view { "\u2801" }, // ⠁
    std::string_view { "\u2802" }, // ⠂
    std::string_view { "\u2804" }, // ⠄
    std::string_view { "\u2840" }, // ⡀
    std::string_view { "\u2880" }, // ⢀
    std::string_view { "\u2820" }, // ⠠
    std::string_view { "\u2810" }, // ⠐
    std::string_view { "\u2808" }, // ⠈
};

constexpr std::array CircleFrames = {
    std::string_view { "\u25DC" }, // ◜
    std::string_view { "\u25DD" }, // ◝
    std::string_view { "\u25DE" }, // ◞
    std::string_view { "\u25DF" }, // ◟
};

constexpr std::array GrowFrames = {
    std::string_view { "\u28C0" }, // ⣀
    std::string_view { "\u28C4" }, // ⣄
    std::string_view { "\u28E4" }, // ⣤
    std::string_view { "\u28E6" }, // ⣦
    std::string_view { "\u28F6" }, // ⣶
    std::string_view { "\u28F7" }, // ⣷
    std::string_view { "\u28FF" }, // ⣿
    std::string_view { "\u28FE" }, // ⣾
    std::string_view { "\u28FC" }, // ⣼
    std::string_view { "\u28F8" }, // ⣸
};

constexpr std::array EllipsisFrames = {
    std::string_view { "   " },
    std::string_view { ".  " },
    std::string_view { ".. " },
    std::string_view { "..." },
};

struct SpinnerName
{
    SpinnerType type;
    std::string_view name;
};

constexpr std::array SpinnerNames = {
    SpinnerName { SpinnerType::Dots, "dots" },     SpinnerName { SpinnerType::Line, "line" },
    SpinnerName { SpinnerType::Box, "box" },       SpinnerName { SpinnerType::Arrow, "arrow" },
    SpinnerName { SpinnerType::Bounce, "bounce" }, SpinnerName { SpinnerType::Circle, "circle" },
    SpinnerName { SpinnerType::Grow, "grow" },     SpinnerName { SpinnerType::Ellipsis, "ellipsis" },
};

} // namespace

auto spinnerFrames(SpinnerType type) -> std::span<std::string_view const>
{
    switch (type)
    {
        case SpinnerType::Dots:
            return DotsFrames;
        case SpinnerType::Line:
            return LineFrames;
        case SpinnerType::Box:
            return BoxFrames;
        case SpinnerType::Arrow:
            return ArrowFrames;
        case SpinnerType::Bounce:
            return BounceFrames;
        case SpinnerType::Circle:
            return CircleFrames;
        case SpinnerType::Grow:
            return GrowFrames;
        case SpinnerType::Ellipsis:
            return EllipsisFrames;
    }
    return DotsFrames;
}

auto spinnerTypeToString(SpinnerType type) -> std::string_view
{
    for (auto const& entry: SpinnerNames)
        if (entry.type == type)
            return entry.name;
    return "dots";
}

auto spinnerTypeFromString(std::string_view name) -> std::optional<SpinnerType>
{
    for (auto const& entry: SpinnerNames)
        if (entry.name == name)
            return entry.type;
    return std::nullopt;
}

Spinner::Spinner(SpinnerType type): _frames(spinnerFrames(type))
{
}

void Spinner::tick() noexcept
{
    if (!_frames.empty())
        _frameIndex = (_frameIndex + 1) % _frames.size();
}

auto Spinner::currentFrame() const noexcept -> std::string_view
{
    if (_frames.empty())
        return "";
    return _frames[_frameIndex];
}

auto Spinner::frameIndex() const noexcept -> std::size_t
{
    return _frameIndex;
}

auto Spinner::frameCount() const noexcept -> std::size_t
{
    return _frames.size();
}

void Spinner::reset() noexcept
{
    _frameIndex = 0;
}

} // namespace sessionpulse::tui
