#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace TS::Theme {

enum class Tone {
    Neutral,
    Accent,
    Success,
    Warning,
    Danger,
};

enum class ButtonVariant {
    Primary,
    Secondary,
    Ghost,
    Danger,
};

enum class ButtonSize {
    Small,
    Medium,
    Large,
};

enum class ChipSize {
    Small,
    Medium,
};

struct ButtonOptions {
    ButtonVariant variant  = ButtonVariant::Primary;
    ButtonSize    size     = ButtonSize::Medium;
    bool          disabled = false;

    auto operator==(ButtonOptions const&) const -> bool = default;
};

struct ChipOptions {
    Tone     tone     = Tone::Neutral;
    ChipSize size     = ChipSize::Medium;
    bool     selected = false;

    auto operator==(ChipOptions const&) const -> bool = default;
};

struct BadgeOptions {
    Tone tone     = Tone::Neutral;
    bool selected = false;
    // Any of the sm/md/lg names; colors do not depend on it.
    std::optional<ButtonSize> size;

    auto operator==(BadgeOptions const&) const -> bool = default;
};

// Free-form badge container (label pill with optional press feedback).
struct BadgeStyleOptions {
    bool bordered = true;
    bool pressed  = false;
    std::optional<std::string> background_color;
    std::optional<std::string> border_color;
    std::optional<std::string> text_color;
    float padding_horizontal = 5.0f;
    float padding_vertical   = 5.0f;
    float corner_radius      = 14.0f;

    auto operator==(BadgeStyleOptions const&) const -> bool = default;
};

auto ToneName(Tone tone) -> std::string_view;
auto ButtonVariantName(ButtonVariant variant) -> std::string_view;
auto ButtonSizeName(ButtonSize size) -> std::string_view;
auto ChipSizeName(ChipSize size) -> std::string_view;

// Names are the lowercase identifiers used in configuration ("success", "ghost", "sm").
auto ParseTone(std::string_view name) -> std::optional<Tone>;
auto ParseButtonVariant(std::string_view name) -> std::optional<ButtonVariant>;
auto ParseButtonSize(std::string_view name) -> std::optional<ButtonSize>;
auto ParseChipSize(std::string_view name) -> std::optional<ChipSize>;

inline constexpr Tone kAllTones[] = {Tone::Neutral, Tone::Accent, Tone::Success, Tone::Warning, Tone::Danger};
inline constexpr ButtonVariant kAllButtonVariants[] = {ButtonVariant::Primary, ButtonVariant::Secondary, ButtonVariant::Ghost, ButtonVariant::Danger};
inline constexpr ButtonSize kAllButtonSizes[] = {ButtonSize::Small, ButtonSize::Medium, ButtonSize::Large};
inline constexpr ChipSize kAllChipSizes[] = {ChipSize::Small, ChipSize::Medium};

} // namespace TS::Theme
