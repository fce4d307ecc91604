#pragma once

#include <tonestyle/core/Error.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace TS::Theme {

/**
 * Semantic palette consumed by every style resolver. Values are color strings
 * in `#RRGGBB` or `rgba(r, g, b, a)` form. The palette is passed by value or
 * const reference per call; resolvers never keep a reference to it.
 */
struct ThemeColors {
    std::string background;
    std::string card;
    std::string border;
    std::string text_primary;
    std::string text_secondary;
    std::string tint_primary;
    std::string tint_soft_bg;
    std::string positive;
    std::string negative;
    std::string warning;

    // Status surfaces. Not read by the resolvers.
    std::string error_bg;
    std::string success_bg;
    std::string warning_bg;

    auto operator==(ThemeColors const&) const -> bool = default;
};

enum class ThemeMode {
    Light,
    Dark,
};

auto MakeLightThemeColors() -> ThemeColors;
auto MakeDarkThemeColors() -> ThemeColors;
auto MakeThemeColors(ThemeMode mode) -> ThemeColors;

auto ThemeModeName(ThemeMode mode) -> std::string_view;
auto ParseThemeMode(std::string_view name) -> std::optional<ThemeMode>;

struct ThemeColorToken {
    std::string_view name;
    std::string ThemeColors::*field;
    bool required;
};

// camelCase token names, in declaration order.
inline constexpr std::array<ThemeColorToken, 13> kThemeColorTokens{{
    {"background", &ThemeColors::background, true},
    {"card", &ThemeColors::card, true},
    {"border", &ThemeColors::border, true},
    {"textPrimary", &ThemeColors::text_primary, true},
    {"textSecondary", &ThemeColors::text_secondary, true},
    {"tintPrimary", &ThemeColors::tint_primary, true},
    {"tintSoftBg", &ThemeColors::tint_soft_bg, true},
    {"positive", &ThemeColors::positive, true},
    {"negative", &ThemeColors::negative, true},
    {"warning", &ThemeColors::warning, true},
    {"errorBg", &ThemeColors::error_bg, false},
    {"successBg", &ThemeColors::success_bg, false},
    {"warningBg", &ThemeColors::warning_bg, false},
}};

auto FindThemeColor(ThemeColors const& colors, std::string_view token) -> std::optional<std::string>;

/**
 * Assigns `value` to `token`. The value must parse as a color; `#RGB` input
 * is stored expanded to `#RRGGBB` and rgb()/rgba() input is stored in the
 * canonical `rgba(r, g, b, a)` form.
 */
auto SetThemeColor(ThemeColors& colors, std::string_view token, std::string_view value) -> Expected<void>;

// Canonical form of a palette value, or an InvalidColor error.
auto NormalizeThemeColor(std::string_view value) -> Expected<std::string>;

// Every required token holds a parseable color; optional tokens are empty or parseable.
auto ValidateThemeColors(ThemeColors const& colors) -> Expected<void>;

} // namespace TS::Theme
