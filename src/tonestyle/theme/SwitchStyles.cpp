#include <tonestyle/theme/SwitchStyles.hpp>

#include <tonestyle/theme/ColorUtils.hpp>

#include <cmath>

namespace TS::Theme {

namespace {

constexpr float kThumbMargin = 2.0f;

auto scaled(float value, double scale) -> float {
    return static_cast<float>(std::lround(value * scale));
}

} // namespace

auto ResolveSwitchTrackColors(ThemeColors const& colors, bool disabled) -> SwitchTrackColors {
    if (disabled) {
        return SwitchTrackColors{
            .off = Color::WithAlpha(colors.text_secondary, kDisabledTrackOffAlpha),
            .on  = Color::WithAlpha(colors.tint_primary, kDisabledTrackOnAlpha),
        };
    }
    return SwitchTrackColors{.off = colors.border, .on = colors.tint_primary};
}

auto ResolveSwitchSizeMetrics(SwitchSize size, SwitchPlatform platform) -> SwitchSizeMetrics {
    auto const base = platform == SwitchPlatform::Android
                              ? SwitchSizeMetrics{.track_width = 52.0f, .track_height = 32.0f, .thumb_size = 28.0f, .thumb_margin = kThumbMargin}
                              : SwitchSizeMetrics{.track_width = 51.0f, .track_height = 31.0f, .thumb_size = 27.0f, .thumb_margin = kThumbMargin};
    double scale = 1.0;
    switch (size) {
        case SwitchSize::Small:
            scale = 0.8;
            break;
        case SwitchSize::Large:
            scale = 1.2;
            break;
        case SwitchSize::Medium:
        default:
            return base;
    }
    return SwitchSizeMetrics{
        .track_width  = scaled(base.track_width, scale),
        .track_height = scaled(base.track_height, scale),
        .thumb_size   = scaled(base.thumb_size, scale),
        .thumb_margin = kThumbMargin,
    };
}

} // namespace TS::Theme
