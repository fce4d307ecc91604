#include <tonestyle/theme/BadgeStyles.hpp>

#include <tonestyle/theme/ToneTransform.hpp>

namespace TS::Theme {

auto ResolveBadgeStyle(ThemeColors const& colors, BadgeStyleOptions const& options) -> StyleDescriptor {
    auto background = options.background_color.value_or(colors.card);
    auto border     = options.border_color.value_or(colors.border);
    if (options.pressed) {
        background = Vibrant(background, kPressedVibrantFactor);
        border     = Vibrant(border, kPressedVibrantFactor);
    }

    StyleDescriptor style;
    style.container.padding_horizontal = options.padding_horizontal;
    style.container.padding_vertical   = options.padding_vertical;
    style.container.corner_radius      = options.corner_radius;
    style.container.background_color   = std::move(background);
    style.container.border_width       = options.bordered ? 1.0f : 0.0f;
    style.container.border_color       = std::move(border);

    style.text.font_size   = kBadgeTextSize;
    style.text.font_weight = kBadgeFontWeight;
    style.text.color       = options.text_color.value_or(colors.text_secondary);
    return style;
}

} // namespace TS::Theme
