#pragma once

#include <tonestyle/theme/StyleOptions.hpp>
#include <tonestyle/theme/StyleTypes.hpp>
#include <tonestyle/theme/ThemeColors.hpp>

namespace TS::Theme {

inline constexpr int kButtonFontWeight = 700;

// sm 36/8/8/14, md 44/16/12/16, lg 52/20/14/17. Unknown sizes map to md.
auto ButtonSizeMetrics(ButtonSize size) -> SizeMetrics;

/**
 * Button container and label style. Disabled buttons keep full opacity and
 * reduce emphasis by running every non-transparent color through `Muted`
 * against the palette background.
 */
auto ResolveButtonStyle(ThemeColors const& colors, ButtonOptions const& options = {}) -> StyleDescriptor;

} // namespace TS::Theme
