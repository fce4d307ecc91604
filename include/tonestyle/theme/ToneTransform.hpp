#pragma once

#include <tonestyle/theme/StyleOptions.hpp>
#include <tonestyle/theme/StyleTypes.hpp>
#include <tonestyle/theme/ThemeColors.hpp>

#include <string>
#include <string_view>

namespace TS::Theme {

// Share of the base color kept by Muted; the rest comes from the background.
inline constexpr double kMutedBlendFactor = 0.3;
inline constexpr double kVibrantFactor    = 0.15;
inline constexpr double kPressedVibrantFactor = 0.1;

/**
 * Washes `base` out toward `background` for disabled and inactive
 * presentation. Both inputs are flattened to opaque colors first (rgba over
 * the background, the background over white) and the result is
 * `base * kMutedBlendFactor + background * (1 - kMutedBlendFactor)` as
 * `#RRGGBB`. When rounding lands on the background, one channel steps toward
 * the base, so only inputs a single channel unit apart can come back equal to
 * an input. Unparseable inputs are treated as white.
 */
auto Muted(std::string_view base, std::string_view background) -> std::string;

/**
 * Pushes every channel of `base` away from the middle: channels above 127
 * move toward 255 by `factor`, the rest toward 0. A result whose luminance
 * lands exactly on 0.5 is stepped back to the side of 0.5 the input was on.
 * Result is `#RRGGBB`; unparseable input is treated as black.
 */
auto Vibrant(std::string_view base, double factor = kVibrantFactor) -> std::string;

// Muted resting colors of a button variant against `colors.background`.
auto MakeDisabledColors(ThemeColors const& colors, ButtonVariant variant) -> ElementColors;

} // namespace TS::Theme
