#pragma once

#include <tonestyle/theme/StyleTypes.hpp>
#include <tonestyle/theme/ThemeColors.hpp>

namespace TS::Theme {

inline constexpr double kDisabledTrackOffAlpha = 0.12;
inline constexpr double kDisabledTrackOnAlpha  = 0.38;

enum class SwitchSize {
    Small,
    Medium,
    Large,
};

// Base track sizes follow the iOS (51x31) and Android (52x32) platform switches.
enum class SwitchPlatform {
    Ios,
    Android,
};

struct SwitchSizeMetrics {
    float track_width  = 0.0f;
    float track_height = 0.0f;
    float thumb_size   = 0.0f;
    float thumb_margin = 0.0f;

    // Horizontal thumb offset inside the track.
    auto thumb_offset(bool on) const -> float {
        return on ? track_width - thumb_size - thumb_margin : thumb_margin;
    }

    auto operator==(SwitchSizeMetrics const&) const -> bool = default;
};

// Track colors for the off and on positions of a switch.
auto ResolveSwitchTrackColors(ThemeColors const& colors, bool disabled = false) -> SwitchTrackColors;

/**
 * Medium is the platform size; small and large scale every dimension by 0.8
 * and 1.2, rounded to whole points. The thumb margin stays 2.
 */
auto ResolveSwitchSizeMetrics(SwitchSize size = SwitchSize::Medium,
                              SwitchPlatform platform = SwitchPlatform::Ios) -> SwitchSizeMetrics;

} // namespace TS::Theme
