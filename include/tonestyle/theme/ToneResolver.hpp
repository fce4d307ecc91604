#pragma once

#include <tonestyle/theme/StyleOptions.hpp>
#include <tonestyle/theme/StyleTypes.hpp>
#include <tonestyle/theme/ThemeColors.hpp>

#include <string>

namespace TS::Theme {

// Alpha of the soft background behind unselected status chips and of the ripple overlay.
inline constexpr double kSoftToneAlpha = 0.12;

/**
 * Palette color carrying a tone's meaning. Neutral and accent share
 * `tint_primary` so neutral controls still get the brand ripple; values
 * outside the enumeration resolve like neutral.
 */
auto ToneBaseColor(ThemeColors const& colors, Tone tone) -> std::string;

/**
 * Chip colors for a tone. Selected tones are a solid `Vibrant` fill with a
 * contrast-picked text color; unselected tones use a card, soft-tint or
 * translucent background with muted text.
 */
auto ResolveToneColors(ThemeColors const& colors, Tone tone, bool selected) -> ElementColors;

// Enabled button colors. Only secondary carries a border.
auto ResolveVariantColors(ThemeColors const& colors, ButtonVariant variant) -> ElementColors;

} // namespace TS::Theme
