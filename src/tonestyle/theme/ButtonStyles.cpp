#include <tonestyle/theme/ButtonStyles.hpp>

#include <tonestyle/theme/ToneResolver.hpp>
#include <tonestyle/theme/ToneTransform.hpp>

namespace TS::Theme {

auto ButtonSizeMetrics(ButtonSize size) -> SizeMetrics {
    switch (size) {
    case ButtonSize::Small:
        return SizeMetrics{.height = 36.0f, .padding_horizontal = 8.0f, .corner_radius = 8.0f, .text_size = 14.0f};
    case ButtonSize::Large:
        return SizeMetrics{.height = 52.0f, .padding_horizontal = 20.0f, .corner_radius = 14.0f, .text_size = 17.0f};
    case ButtonSize::Medium:
    default:
        return SizeMetrics{.height = 44.0f, .padding_horizontal = 16.0f, .corner_radius = 12.0f, .text_size = 16.0f};
    }
}

auto ResolveButtonStyle(ThemeColors const& colors, ButtonOptions const& options) -> StyleDescriptor {
    auto const metrics = ButtonSizeMetrics(options.size);
    auto const palette = options.disabled ? MakeDisabledColors(colors, options.variant)
                                          : ResolveVariantColors(colors, options.variant);

    StyleDescriptor style;
    style.container.height             = metrics.height;
    style.container.padding_horizontal = metrics.padding_horizontal;
    style.container.corner_radius      = metrics.corner_radius;
    style.container.background_color   = palette.background;
    if (!palette.border.empty()) {
        style.container.border_width = 1.0f;
        style.container.border_color = palette.border;
    }

    style.text.font_size   = metrics.text_size;
    style.text.font_weight = kButtonFontWeight;
    style.text.color       = palette.text;
    return style;
}

} // namespace TS::Theme
