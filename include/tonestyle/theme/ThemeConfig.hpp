#pragma once

#include <tonestyle/core/Error.hpp>
#include <tonestyle/theme/StyleOptions.hpp>
#include <tonestyle/theme/StyleTypes.hpp>
#include <tonestyle/theme/ThemeColors.hpp>

#include <filesystem>
#include <string>

namespace TS::Theme::Config {

/**
 * Reads a palette from a JSON object of camelCase token -> color string.
 * Tokens that are not listed keep the value from `base`, or from the stock
 * palette named by an optional `"mode": "light" | "dark"` entry. Unknown
 * tokens, non-string values and unparseable colors are rejected; the
 * resulting palette is validated before it is returned.
 */
auto ParseThemeColors(std::string const& payload,
                      ThemeColors const& base) -> Expected<ThemeColors>;
auto ParseThemeColors(std::string const& payload) -> Expected<ThemeColors>;

auto LoadThemeColorsFile(std::filesystem::path const& path,
                         ThemeColors const& base = MakeLightThemeColors()) -> Expected<ThemeColors>;

// Every token that holds a value, keyed by camelCase name.
auto SerializeThemeColors(ThemeColors const& colors, int indent = 2) -> std::string;

/**
 * Option records from JSON objects such as
 * `{"variant": "ghost", "size": "lg", "disabled": true}`. Missing fields keep
 * their defaults; unknown fields or names are InvalidOption errors.
 */
auto ParseButtonOptions(std::string const& payload) -> Expected<ButtonOptions>;
auto ParseChipOptions(std::string const& payload) -> Expected<ChipOptions>;
auto ParseBadgeOptions(std::string const& payload) -> Expected<BadgeOptions>;

auto SerializeStyleDescriptor(StyleDescriptor const& style, int indent = -1) -> std::string;
auto SerializeBadgeVisuals(BadgeVisuals const& visuals, int indent = -1) -> std::string;

// Every button, chip and badge combination resolved against `colors`.
auto SerializeStyleSheet(ThemeColors const& colors, int indent = 2) -> std::string;

} // namespace TS::Theme::Config
