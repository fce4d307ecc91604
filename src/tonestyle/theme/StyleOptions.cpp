#include <tonestyle/theme/StyleOptions.hpp>

namespace TS::Theme {

auto ToneName(Tone tone) -> std::string_view {
    switch (tone) {
    case Tone::Accent:
        return "accent";
    case Tone::Success:
        return "success";
    case Tone::Warning:
        return "warning";
    case Tone::Danger:
        return "danger";
    case Tone::Neutral:
    default:
        return "neutral";
    }
}

auto ButtonVariantName(ButtonVariant variant) -> std::string_view {
    switch (variant) {
    case ButtonVariant::Secondary:
        return "secondary";
    case ButtonVariant::Ghost:
        return "ghost";
    case ButtonVariant::Danger:
        return "danger";
    case ButtonVariant::Primary:
    default:
        return "primary";
    }
}

auto ButtonSizeName(ButtonSize size) -> std::string_view {
    switch (size) {
    case ButtonSize::Small:
        return "sm";
    case ButtonSize::Large:
        return "lg";
    case ButtonSize::Medium:
    default:
        return "md";
    }
}

auto ChipSizeName(ChipSize size) -> std::string_view {
    switch (size) {
    case ChipSize::Small:
        return "sm";
    case ChipSize::Medium:
    default:
        return "md";
    }
}

auto ParseTone(std::string_view name) -> std::optional<Tone> {
    for (auto tone : kAllTones) {
        if (ToneName(tone) == name) {
            return tone;
        }
    }
    return std::nullopt;
}

auto ParseButtonVariant(std::string_view name) -> std::optional<ButtonVariant> {
    for (auto variant : kAllButtonVariants) {
        if (ButtonVariantName(variant) == name) {
            return variant;
        }
    }
    return std::nullopt;
}

auto ParseButtonSize(std::string_view name) -> std::optional<ButtonSize> {
    for (auto size : kAllButtonSizes) {
        if (ButtonSizeName(size) == name) {
            return size;
        }
    }
    return std::nullopt;
}

auto ParseChipSize(std::string_view name) -> std::optional<ChipSize> {
    for (auto size : kAllChipSizes) {
        if (ChipSizeName(size) == name) {
            return size;
        }
    }
    return std::nullopt;
}

} // namespace TS::Theme
