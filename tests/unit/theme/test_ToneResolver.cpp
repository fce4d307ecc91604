#include <doctest/doctest.h>

#include <tonestyle/theme/ColorUtils.hpp>
#include <tonestyle/theme/ToneResolver.hpp>
#include <tonestyle/theme/ToneTransform.hpp>

using namespace TS::Theme;

TEST_SUITE("theme.tone_resolver") {

TEST_CASE("ToneBaseColor maps tones onto palette tokens") {
    auto colors = MakeLightThemeColors();
    CHECK(ToneBaseColor(colors, Tone::Success) == colors.positive);
    CHECK(ToneBaseColor(colors, Tone::Warning) == colors.warning);
    CHECK(ToneBaseColor(colors, Tone::Danger) == colors.negative);
    CHECK(ToneBaseColor(colors, Tone::Accent) == colors.tint_primary);
    CHECK(ToneBaseColor(colors, Tone::Neutral) == colors.tint_primary);
    CHECK(ToneBaseColor(colors, static_cast<Tone>(42)) == colors.tint_primary);
}

TEST_CASE("Unselected tones in the light palette") {
    auto colors = MakeLightThemeColors();

    auto neutral = ResolveToneColors(colors, Tone::Neutral, false);
    CHECK(neutral.background == "#FFFFFF");
    CHECK(neutral.border == "#E5E7EB");
    CHECK(neutral.text == "#BEC3C9");

    auto accent = ResolveToneColors(colors, Tone::Accent, false);
    CHECK(accent.background == "rgba(15, 118, 110, 0.1)");
    CHECK(accent.text == "#B2D2D1");

    auto success = ResolveToneColors(colors, Tone::Success, false);
    CHECK(success.background == "rgba(16, 185, 129, 0.12)");
    CHECK(success.border == colors.border);
    CHECK(success.text == "#B2E7D7");

    auto danger = ResolveToneColors(colors, Tone::Danger, false);
    CHECK(danger.background == "rgba(239, 68, 68, 0.12)");
    CHECK(danger.text == "#F5C3C5");
}

TEST_CASE("Selected tones are solid vibrant fills with readable text") {
    auto colors = MakeLightThemeColors();

    auto neutral = ResolveToneColors(colors, Tone::Neutral, true);
    CHECK(neutral.background == "#2F3745");
    CHECK(neutral.border == "#2F3745");
    CHECK(neutral.text == "#FFFFFF");

    auto accent = ResolveToneColors(colors, Tone::Accent, true);
    CHECK(accent.background == "#0D645E");
    CHECK(accent.text == "#FFFFFF");

    auto success = ResolveToneColors(colors, Tone::Success, true);
    CHECK(success.background == "#0EC494");
    CHECK(success.text == "#0B1220");

    auto warning = ResolveToneColors(colors, Tone::Warning, true);
    CHECK(warning.background == "#F7AD09");
    CHECK(warning.text == "#0B1220");

    auto danger = ResolveToneColors(colors, Tone::Danger, true);
    CHECK(danger.background == "#F13A3A");
    CHECK(danger.text == "#FFFFFF");
}

TEST_CASE("Dark neutral selection picks dark text") {
    auto colors  = MakeDarkThemeColors();
    auto neutral = ResolveToneColors(colors, Tone::Neutral, true);
    CHECK(neutral.background == "#ABB1BB");
    CHECK(neutral.text == "#0B1220");
    CHECK(ResolveToneColors(colors, Tone::Neutral, false).background == "#111827");
    CHECK(ResolveToneColors(colors, Tone::Accent, false).background == "rgba(15, 118, 110, 0.24)");
}

TEST_CASE("Selected text is one of the two readable defaults") {
    for (auto mode : {ThemeMode::Light, ThemeMode::Dark}) {
        auto colors = MakeThemeColors(mode);
        for (auto tone : kAllTones) {
            CAPTURE(ToneName(tone));
            auto text = ResolveToneColors(colors, tone, true).text;
            CHECK((text == "#FFFFFF" || text == "#0B1220"));
        }
    }
}

TEST_CASE("Unknown tones resolve like neutral") {
    auto colors  = MakeLightThemeColors();
    auto unknown = static_cast<Tone>(42);
    CHECK(ResolveToneColors(colors, unknown, false) == ResolveToneColors(colors, Tone::Neutral, false));
    CHECK(ResolveToneColors(colors, unknown, true) == ResolveToneColors(colors, Tone::Neutral, true));
}

TEST_CASE("Variant colors") {
    auto colors = MakeLightThemeColors();

    auto primary = ResolveVariantColors(colors, ButtonVariant::Primary);
    CHECK(primary == ElementColors{colors.tint_primary, "", "#FFFFFF"});

    auto secondary = ResolveVariantColors(colors, ButtonVariant::Secondary);
    CHECK(secondary == ElementColors{colors.card, colors.border, colors.text_primary});

    auto ghost = ResolveVariantColors(colors, ButtonVariant::Ghost);
    CHECK(ghost == ElementColors{"transparent", "", colors.tint_primary});

    auto danger = ResolveVariantColors(colors, ButtonVariant::Danger);
    CHECK(danger == ElementColors{colors.negative, "", "#FFFFFF"});

    CHECK(ResolveVariantColors(colors, static_cast<ButtonVariant>(99)) == primary);
}

} // TEST_SUITE
