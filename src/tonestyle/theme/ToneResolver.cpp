#include <tonestyle/theme/ToneResolver.hpp>

#include <tonestyle/theme/ColorUtils.hpp>
#include <tonestyle/theme/ToneTransform.hpp>

#include "../log/TaggedLogger.hpp"

namespace TS::Theme {

namespace {

constexpr std::string_view kOnSolidText = "#FFFFFF";

auto solid(std::string fill) -> ElementColors {
    auto text = Color::ChooseReadableText(fill);
    return ElementColors{.background = fill, .border = fill, .text = std::move(text)};
}

} // namespace

auto ToneBaseColor(ThemeColors const& colors, Tone tone) -> std::string {
    switch (tone) {
    case Tone::Success:
        return colors.positive;
    case Tone::Warning:
        return colors.warning;
    case Tone::Danger:
        return colors.negative;
    case Tone::Accent:
        return colors.tint_primary;
    case Tone::Neutral:
    default:
        return colors.tint_primary;
    }
}

auto ResolveToneColors(ThemeColors const& colors, Tone tone, bool selected) -> ElementColors {
    switch (tone) {
    case Tone::Accent:
        if (selected) {
            return solid(Vibrant(colors.tint_primary));
        }
        return ElementColors{.background = colors.tint_soft_bg,
                             .border     = colors.border,
                             .text       = Muted(colors.tint_primary, colors.background)};
    case Tone::Success:
    case Tone::Warning:
    case Tone::Danger: {
        auto tone_color = ToneBaseColor(colors, tone);
        if (selected) {
            return solid(Vibrant(tone_color));
        }
        return ElementColors{.background = Color::WithAlpha(tone_color, kSoftToneAlpha),
                             .border     = colors.border,
                             .text       = Muted(tone_color, colors.background)};
    }
    case Tone::Neutral:
    default:
        if (tone != Tone::Neutral) {
            ts_log("Unknown tone " + std::to_string(static_cast<int>(tone)) + " resolved as neutral", "ToneResolver");
        }
        if (selected) {
            return solid(Vibrant(colors.text_secondary));
        }
        return ElementColors{.background = colors.card,
                             .border     = colors.border,
                             .text       = Muted(colors.text_secondary, colors.background)};
    }
}

auto ResolveVariantColors(ThemeColors const& colors, ButtonVariant variant) -> ElementColors {
    switch (variant) {
    case ButtonVariant::Secondary:
        return ElementColors{.background = colors.card, .border = colors.border, .text = colors.text_primary};
    case ButtonVariant::Ghost:
        return ElementColors{.background = std::string(Color::kTransparent), .border = {}, .text = colors.tint_primary};
    case ButtonVariant::Danger:
        return ElementColors{.background = colors.negative, .border = {}, .text = std::string(kOnSolidText)};
    case ButtonVariant::Primary:
    default:
        if (variant != ButtonVariant::Primary) {
            ts_log("Unknown button variant " + std::to_string(static_cast<int>(variant)) + " resolved as primary", "ToneResolver");
        }
        return ElementColors{.background = colors.tint_primary, .border = {}, .text = std::string(kOnSolidText)};
    }
}

} // namespace TS::Theme
