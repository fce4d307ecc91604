#pragma once

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>

namespace TS::Theme::Color {

inline constexpr std::string_view kReadableLight = "#FFFFFF";
inline constexpr std::string_view kReadableDark  = "#0B1220";
inline constexpr std::string_view kTransparent   = "transparent";

// Channels are integers in [0,255], alpha in [0,1].
struct Rgba {
    int    r = 0;
    int    g = 0;
    int    b = 0;
    double a = 1.0;

    auto operator==(Rgba const&) const -> bool = default;
};

inline auto ClampAlpha(double alpha) -> double {
    if (std::isnan(alpha)) {
        return 0.0;
    }
    return std::clamp(alpha, 0.0, 1.0);
}

// Interpolates the rgb channels of `base` toward `target`; alpha is kept from `base`.
inline auto Mix(Rgba base, Rgba target, double amount) -> Rgba {
    amount = std::clamp(amount, 0.0, 1.0);
    auto channel = [amount](int from, int to) {
        auto mixed = std::lround(from * (1.0 - amount) + to * amount);
        return static_cast<int>(std::clamp<long>(mixed, 0, 255));
    };
    return Rgba{channel(base.r, target.r), channel(base.g, target.g), channel(base.b, target.b), ClampAlpha(base.a)};
}

// Source-over composite of `color` onto an opaque `backdrop`.
inline auto Composite(Rgba color, Rgba backdrop) -> Rgba {
    auto flattened = Mix(backdrop, color, ClampAlpha(color.a));
    flattened.a    = 1.0;
    return flattened;
}

/**
 * Parses `#RGB`, `#RRGGBB` (leading '#' optional, case-insensitive) and
 * `rgb(r, g, b)` / `rgba(r, g, b[, a])`. Returns std::nullopt for anything
 * else, including channels outside [0,255].
 */
auto Parse(std::string_view color) -> std::optional<Rgba>;

// `#RRGGBB`, uppercase. Alpha is ignored.
auto ToHex(Rgba const& color) -> std::string;

// `rgba(r, g, b, a)` with the alpha in shortest round-trip form.
auto ToRgba(Rgba const& color) -> std::string;

/**
 * Replaces (or adds) the alpha channel of a parseable color and returns it in
 * rgba() notation. Alpha is clamped to [0,1]. Unparseable input is returned
 * unchanged.
 */
auto WithAlpha(std::string_view color, double alpha) -> std::string;

// Defined for `#RRGGBB` only.
auto RelativeLuminance(std::string_view color) -> std::optional<double>;
auto RelativeLuminance(Rgba const& color) -> double;

/**
 * Picks `dark` when the background luminance is strictly above 0.5 and
 * `light` otherwise. A background that is not `#RRGGBB` gets `light`.
 */
auto ChooseReadableText(std::string_view background,
                        std::string_view light = kReadableLight,
                        std::string_view dark  = kReadableDark) -> std::string;

} // namespace TS::Theme::Color
