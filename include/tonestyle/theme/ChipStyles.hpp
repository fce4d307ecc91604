#pragma once

#include <tonestyle/theme/StyleOptions.hpp>
#include <tonestyle/theme/StyleTypes.hpp>
#include <tonestyle/theme/ThemeColors.hpp>

namespace TS::Theme {

inline constexpr int kChipFontWeight = 600;

// sm 28/8/8/12, md 32/12/16/13. Unknown sizes map to md.
auto ChipSizeMetrics(ChipSize size) -> SizeMetrics;

// Chip container and label style; the height is a minimum height.
auto ResolveChipStyle(ThemeColors const& colors, ChipOptions const& options = {}) -> StyleDescriptor;

/**
 * Colors for toggleable filter badges. The ripple is the tone color at 12%
 * alpha in both states; selected badges are solid with white text,
 * unselected ones translucent (10% fill, 20% border) with tone-colored text.
 */
auto GetBadgeVisuals(ThemeColors const& colors, BadgeOptions const& options) -> BadgeVisuals;

} // namespace TS::Theme
