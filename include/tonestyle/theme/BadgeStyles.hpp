#pragma once

#include <tonestyle/theme/StyleOptions.hpp>
#include <tonestyle/theme/StyleTypes.hpp>
#include <tonestyle/theme/ThemeColors.hpp>

namespace TS::Theme {

inline constexpr float kBadgeTextSize   = 13.0f;
inline constexpr int   kBadgeFontWeight = 600;

/**
 * Label pill whose colors default to the palette's card, border and
 * secondary text. Pressed badges deepen background and border with
 * `Vibrant(color, kPressedVibrantFactor)`.
 */
auto ResolveBadgeStyle(ThemeColors const& colors, BadgeStyleOptions const& options = {}) -> StyleDescriptor;

} // namespace TS::Theme
