#include <doctest/doctest.h>

#include <tonestyle/theme/ThemeColors.hpp>

#include <set>
#include <string>

using namespace TS::Theme;
using TS::Error;

TEST_SUITE("theme.theme_colors") {

TEST_CASE("Stock palettes validate") {
    CHECK(ValidateThemeColors(MakeLightThemeColors()).has_value());
    CHECK(ValidateThemeColors(MakeDarkThemeColors()).has_value());
    CHECK(MakeThemeColors(ThemeMode::Dark) == MakeDarkThemeColors());
    CHECK(MakeThemeColors(ThemeMode::Light) == MakeLightThemeColors());
}

TEST_CASE("Stock palettes share the brand tint") {
    auto light = MakeLightThemeColors();
    auto dark  = MakeDarkThemeColors();
    CHECK(light.tint_primary == "#0F766E");
    CHECK(dark.tint_primary == light.tint_primary);
    CHECK(light.tint_soft_bg == "rgba(15, 118, 110, 0.1)");
    CHECK(dark.tint_soft_bg == "rgba(15, 118, 110, 0.24)");
    CHECK(light.background == "#F8FAFC");
    CHECK(dark.background == "#0B1220");
}

TEST_CASE("Mode names") {
    CHECK(ThemeModeName(ThemeMode::Light) == "light");
    CHECK(ThemeModeName(ThemeMode::Dark) == "dark");
    CHECK(ParseThemeMode("dark") == ThemeMode::Dark);
    CHECK_FALSE(ParseThemeMode("Dark").has_value());
    CHECK_FALSE(ParseThemeMode("").has_value());
}

TEST_CASE("Token table covers every field once") {
    std::set<std::string_view> names;
    auto colors = MakeLightThemeColors();
    for (auto const& token : kThemeColorTokens) {
        CHECK(names.insert(token.name).second);
        auto value = FindThemeColor(colors, token.name);
        REQUIRE(value.has_value());
        CHECK(*value == colors.*(token.field));
    }
    CHECK(names.size() == kThemeColorTokens.size());
    CHECK_FALSE(FindThemeColor(colors, "tint_primary").has_value());
}

TEST_CASE("SetThemeColor normalizes values") {
    auto colors = MakeLightThemeColors();

    REQUIRE(SetThemeColor(colors, "card", "#abc").has_value());
    CHECK(colors.card == "#AABBCC");

    REQUIRE(SetThemeColor(colors, "tintSoftBg", "rgba(1,2,3,.5)").has_value());
    CHECK(colors.tint_soft_bg == "rgba(1, 2, 3, 0.5)");

    REQUIRE(SetThemeColor(colors, "warningBg", " 2a2314 ").has_value());
    CHECK(colors.warning_bg == "#2A2314");
}

TEST_CASE("SetThemeColor rejects unknown tokens and bad colors") {
    auto colors   = MakeLightThemeColors();
    auto original = colors;

    auto unknown = SetThemeColor(colors, "accent", "#000000");
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code == Error::Code::InvalidToken);

    auto invalid = SetThemeColor(colors, "card", "blue");
    REQUIRE_FALSE(invalid.has_value());
    CHECK(invalid.error().code == Error::Code::InvalidColor);

    CHECK(colors == original);
}

TEST_CASE("Validation requires the core tokens") {
    auto colors = MakeLightThemeColors();
    colors.error_bg.clear();
    CHECK(ValidateThemeColors(colors).has_value());

    colors.border.clear();
    auto missing = ValidateThemeColors(colors);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::InvalidColor);
    REQUIRE(missing.error().message.has_value());
    CHECK(missing.error().message->find("border") != std::string::npos);

    auto garbled          = MakeDarkThemeColors();
    garbled.success_bg    = "greenish";
    CHECK_FALSE(ValidateThemeColors(garbled).has_value());
}

} // TEST_SUITE
