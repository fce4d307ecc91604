#include <tonestyle/theme/ChipStyles.hpp>

#include <tonestyle/theme/ColorUtils.hpp>
#include <tonestyle/theme/ToneResolver.hpp>

namespace TS::Theme {

namespace {

constexpr double kBadgeFillAlpha   = 0.10;
constexpr double kBadgeBorderAlpha = 0.20;
constexpr std::string_view kSelectedBadgeText = "#FFFFFF";

} // namespace

auto ChipSizeMetrics(ChipSize size) -> SizeMetrics {
    switch (size) {
    case ChipSize::Small:
        return SizeMetrics{.height = 28.0f, .padding_horizontal = 8.0f, .corner_radius = 8.0f, .text_size = 12.0f};
    case ChipSize::Medium:
    default:
        return SizeMetrics{.height = 32.0f, .padding_horizontal = 12.0f, .corner_radius = 16.0f, .text_size = 13.0f};
    }
}

auto ResolveChipStyle(ThemeColors const& colors, ChipOptions const& options) -> StyleDescriptor {
    auto const metrics = ChipSizeMetrics(options.size);
    auto const palette = ResolveToneColors(colors, options.tone, options.selected);

    StyleDescriptor style;
    style.container.height             = metrics.height;
    style.container.height_is_minimum  = true;
    style.container.padding_horizontal = metrics.padding_horizontal;
    style.container.corner_radius      = metrics.corner_radius;
    style.container.background_color   = palette.background;
    style.container.border_width       = 1.0f;
    style.container.border_color       = palette.border;

    style.text.font_size   = metrics.text_size;
    style.text.font_weight = kChipFontWeight;
    style.text.color       = palette.text;
    return style;
}

auto GetBadgeVisuals(ThemeColors const& colors, BadgeOptions const& options) -> BadgeVisuals {
    auto base   = ToneBaseColor(colors, options.tone);
    auto ripple = Color::WithAlpha(base, kSoftToneAlpha);
    if (options.selected) {
        return BadgeVisuals{
            .background_color = base,
            .border_color     = base,
            .text_color       = std::string(kSelectedBadgeText),
            .ripple_color     = std::move(ripple),
        };
    }
    return BadgeVisuals{
        .background_color = Color::WithAlpha(base, kBadgeFillAlpha),
        .border_color     = Color::WithAlpha(base, kBadgeBorderAlpha),
        .text_color       = base,
        .ripple_color     = std::move(ripple),
    };
}

} // namespace TS::Theme
