#include <tonestyle/theme/ToneTransform.hpp>

#include <tonestyle/theme/ColorUtils.hpp>
#include <tonestyle/theme/ToneResolver.hpp>

#include "../log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace TS::Theme {

namespace {

constexpr Color::Rgba kWhite{255, 255, 255, 1.0};
constexpr Color::Rgba kBlack{0, 0, 0, 1.0};

auto parse_or(std::string_view color, Color::Rgba fallback) -> Color::Rgba {
    if (auto parsed = Color::Parse(color)) {
        return *parsed;
    }
    ts_log("Tone transform substituted a fallback for '" + std::string(color) + "'", "ColorParse");
    return fallback;
}

auto push_channel(int channel, double factor) -> int {
    if (channel > 127) {
        auto lifted = std::lround(channel + (255 - channel) * factor);
        return static_cast<int>(std::min<long>(255, lifted));
    }
    auto lowered = std::lround(channel * (1.0 - factor));
    return static_cast<int>(std::max<long>(0, lowered));
}

// Moves the channel farthest from `target` one step toward it.
auto step_toward(Color::Rgba color, Color::Rgba const& target) -> Color::Rgba {
    int* channels[]      = {&color.r, &color.g, &color.b};
    int const targets[]  = {target.r, target.g, target.b};
    std::size_t farthest = 0;
    for (std::size_t i = 1; i < 3; ++i) {
        if (std::abs(targets[i] - *channels[i]) > std::abs(targets[farthest] - *channels[farthest])) {
            farthest = i;
        }
    }
    *channels[farthest] += targets[farthest] > *channels[farthest] ? 1 : -1;
    return color;
}

// Luminance of exactly 0.5 makes ChooseReadableText flip to the light text; keep the input's side.
auto keep_luminance_side(Color::Rgba pushed, Color::Rgba const& input) -> Color::Rgba {
    auto const before = Color::RelativeLuminance(input);
    if (Color::RelativeLuminance(pushed) != 0.5 || before == 0.5) {
        return pushed;
    }
    int const step = before > 0.5 ? 1 : -1;
    for (int* channel : {&pushed.g, &pushed.r, &pushed.b}) {
        if (*channel + step >= 0 && *channel + step <= 255) {
            *channel += step;
            break;
        }
    }
    return pushed;
}

auto muted_or_transparent(std::string const& color, std::string_view background) -> std::string {
    if (color.empty() || color == Color::kTransparent) {
        return color;
    }
    return Muted(color, background);
}

} // namespace

auto Muted(std::string_view base, std::string_view background) -> std::string {
    auto surface = Color::Composite(parse_or(background, kWhite), kWhite);
    auto source  = Color::Composite(parse_or(base, kWhite), surface);
    auto blended = Color::Mix(surface, source, kMutedBlendFactor);
    // Rounding can land back on the background when the inputs are a few units apart.
    if (blended == surface && source != surface) {
        blended = step_toward(blended, source);
    }
    return Color::ToHex(blended);
}

auto Vibrant(std::string_view base, double factor) -> std::string {
    factor      = std::clamp(factor, 0.0, 1.0);
    auto color  = parse_or(base, kBlack);
    auto pushed = Color::Rgba{push_channel(color.r, factor),
                              push_channel(color.g, factor),
                              push_channel(color.b, factor),
                              1.0};
    return Color::ToHex(keep_luminance_side(pushed, color));
}

auto MakeDisabledColors(ThemeColors const& colors, ButtonVariant variant) -> ElementColors {
    auto enabled = ResolveVariantColors(colors, variant);
    return ElementColors{
        .background = muted_or_transparent(enabled.background, colors.background),
        .border     = muted_or_transparent(enabled.border, colors.background),
        .text       = muted_or_transparent(enabled.text, colors.background),
    };
}

} // namespace TS::Theme
