#include <tonestyle/theme/ThemeColors.hpp>

#include <tonestyle/theme/ColorUtils.hpp>

#include "../log/TaggedLogger.hpp"

namespace TS::Theme {

namespace {

constexpr std::string_view kBrandTint = "#0F766E";

auto find_token(std::string_view token) -> ThemeColorToken const* {
    for (auto const& entry : kThemeColorTokens) {
        if (entry.name == token) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace

auto MakeLightThemeColors() -> ThemeColors {
    ThemeColors colors;
    colors.background     = "#F8FAFC";
    colors.card           = "#FFFFFF";
    colors.text_primary   = "#111827";
    colors.text_secondary = "#374151";
    colors.border         = "#E5E7EB";
    colors.tint_primary   = std::string(kBrandTint);
    colors.positive       = "#10B981";
    colors.negative       = "#EF4444";
    colors.warning        = "#F59E0B";
    colors.error_bg       = "#FEE2E2";
    colors.success_bg     = "#ECFDF5";
    colors.warning_bg     = "#FFFBEB";
    colors.tint_soft_bg   = Color::WithAlpha(kBrandTint, 0.1);
    return colors;
}

auto MakeDarkThemeColors() -> ThemeColors {
    ThemeColors colors;
    colors.background     = "#0B1220";
    colors.card           = "#111827";
    colors.text_primary   = "#E5E7EB";
    colors.text_secondary = "#9CA3AF";
    colors.border         = "#1F2937";
    colors.tint_primary   = std::string(kBrandTint);
    colors.positive       = "#10B981";
    colors.negative       = "#EF4444";
    colors.warning        = "#F59E0B";
    colors.error_bg       = "#3A1D1D";
    colors.success_bg     = "#102A24";
    colors.warning_bg     = "#2A2314";
    colors.tint_soft_bg   = Color::WithAlpha(kBrandTint, 0.24);
    return colors;
}

auto MakeThemeColors(ThemeMode mode) -> ThemeColors {
    switch (mode) {
    case ThemeMode::Dark:
        return MakeDarkThemeColors();
    case ThemeMode::Light:
    default:
        return MakeLightThemeColors();
    }
}

auto ThemeModeName(ThemeMode mode) -> std::string_view {
    switch (mode) {
    case ThemeMode::Dark:
        return "dark";
    case ThemeMode::Light:
    default:
        return "light";
    }
}

auto ParseThemeMode(std::string_view name) -> std::optional<ThemeMode> {
    if (name == "light") {
        return ThemeMode::Light;
    }
    if (name == "dark") {
        return ThemeMode::Dark;
    }
    return std::nullopt;
}

auto FindThemeColor(ThemeColors const& colors, std::string_view token) -> std::optional<std::string> {
    auto const* entry = find_token(token);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return colors.*(entry->field);
}

auto NormalizeThemeColor(std::string_view value) -> Expected<std::string> {
    auto parsed = Color::Parse(value);
    if (!parsed) {
        return fail(Error::Code::InvalidColor, "'" + std::string(value) + "' is not a #RRGGBB, #RGB or rgba() color");
    }
    if (value.find('(') != std::string_view::npos) {
        return Color::ToRgba(*parsed);
    }
    return Color::ToHex(*parsed);
}

auto SetThemeColor(ThemeColors& colors, std::string_view token, std::string_view value) -> Expected<void> {
    auto const* entry = find_token(token);
    if (entry == nullptr) {
        return fail(Error::Code::InvalidToken, "unknown theme color token '" + std::string(token) + "'");
    }
    auto normalized = NormalizeThemeColor(value);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }
    colors.*(entry->field) = std::move(*normalized);
    ts_log("Set theme color " + std::string(token) + " = " + colors.*(entry->field), "ThemeColors");
    return {};
}

auto ValidateThemeColors(ThemeColors const& colors) -> Expected<void> {
    for (auto const& entry : kThemeColorTokens) {
        auto const& value = colors.*(entry.field);
        if (value.empty() && !entry.required) {
            continue;
        }
        if (!Color::Parse(value)) {
            return fail(Error::Code::InvalidColor,
                        "theme color '" + std::string(entry.name) + "' holds '" + value + "', which is not a color");
        }
    }
    return {};
}

} // namespace TS::Theme
