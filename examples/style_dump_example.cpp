#include <tonestyle/theme/ButtonStyles.hpp>
#include <tonestyle/theme/ChipStyles.hpp>
#include <tonestyle/theme/ThemeColors.hpp>
#include <tonestyle/theme/ThemeConfig.hpp>
#include <tonestyle/tools/cli/ToolCli.hpp>

#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace Config = TS::Theme::Config;

namespace {

struct DumpOptions {
    TS::Theme::ThemeMode       mode = TS::Theme::ThemeMode::Light;
    std::optional<std::string> palette_path;
    std::optional<std::string> button_json;
    std::optional<std::string> chip_json;
    std::optional<std::string> badge_json;
    bool                       print_colors = false;
    bool                       print_all    = false;
    bool                       show_help    = false;
    int                        indent       = 2;
};

auto report(std::string_view context, TS::Error const& error) -> int {
    std::cerr << "[tonestyle_dump] " << context << ": " << TS::describeError(error) << '\n';
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char** argv) {
    DumpOptions options;

    TS::Tools::CLI::ToolCli cli("tonestyle_dump");
    cli.add_value("--mode", "light|dark", "stock palette the overrides start from", [&](std::string_view value) -> TS::Tools::CLI::ToolCli::ParseError {
        auto mode = TS::Theme::ParseThemeMode(value);
        if (!mode) {
            return std::string("--mode expects 'light' or 'dark'");
        }
        options.mode = *mode;
        return std::nullopt;
    });
    cli.add_value("--palette", "file", "JSON object of palette token overrides", [&](std::string_view value) -> TS::Tools::CLI::ToolCli::ParseError {
        options.palette_path = std::string(value);
        return std::nullopt;
    });
    cli.add_value("--button", "json", "print one button style, e.g. {\"variant\":\"ghost\"}", [&](std::string_view value) -> TS::Tools::CLI::ToolCli::ParseError {
        options.button_json = std::string(value);
        return std::nullopt;
    });
    cli.add_value("--chip", "json", "print one chip style", [&](std::string_view value) -> TS::Tools::CLI::ToolCli::ParseError {
        options.chip_json = std::string(value);
        return std::nullopt;
    });
    cli.add_value("--badge", "json", "print one set of badge visuals", [&](std::string_view value) -> TS::Tools::CLI::ToolCli::ParseError {
        options.badge_json = std::string(value);
        return std::nullopt;
    });
    cli.add_int("--indent", "n", "JSON indent, -1 for a single line", [&](int value) -> TS::Tools::CLI::ToolCli::ParseError {
        if (value < -1) {
            return std::string("--indent must be -1 or larger");
        }
        options.indent = value;
        return std::nullopt;
    });
    cli.add_flag("--colors", "print the resolved palette", [&] { options.print_colors = true; });
    cli.add_flag("--all", "print the full style sheet", [&] { options.print_all = true; });
    cli.add_flag("--help", "show this message", [&] { options.show_help = true; });
    cli.add_alias("-h", "--help");
    cli.add_alias("-p", "--palette");
    cli.add_alias("-m", "--mode");

    if (!cli.parse(argc, argv)) {
        std::cerr << cli.usage();
        return EXIT_FAILURE;
    }
    if (options.show_help) {
        std::cout << cli.usage();
        return EXIT_SUCCESS;
    }

#ifdef TS_LOG_DEBUG
    TS::set_thread_name("Main");
#endif

    auto colors = TS::Theme::MakeThemeColors(options.mode);
    if (options.palette_path) {
        auto loaded = Config::LoadThemeColorsFile(*options.palette_path, colors);
        if (!loaded) {
            return report("loading palette", loaded.error());
        }
        colors = std::move(*loaded);
    }

    bool printed = false;
    if (options.print_colors) {
        std::cout << Config::SerializeThemeColors(colors, options.indent) << '\n';
        printed = true;
    }
    if (options.button_json) {
        auto button = Config::ParseButtonOptions(*options.button_json);
        if (!button) {
            return report("--button", button.error());
        }
        std::cout << Config::SerializeStyleDescriptor(TS::Theme::ResolveButtonStyle(colors, *button), options.indent) << '\n';
        printed = true;
    }
    if (options.chip_json) {
        auto chip = Config::ParseChipOptions(*options.chip_json);
        if (!chip) {
            return report("--chip", chip.error());
        }
        std::cout << Config::SerializeStyleDescriptor(TS::Theme::ResolveChipStyle(colors, *chip), options.indent) << '\n';
        printed = true;
    }
    if (options.badge_json) {
        auto badge = Config::ParseBadgeOptions(*options.badge_json);
        if (!badge) {
            return report("--badge", badge.error());
        }
        std::cout << Config::SerializeBadgeVisuals(TS::Theme::GetBadgeVisuals(colors, *badge), options.indent) << '\n';
        printed = true;
    }
    if (options.print_all || !printed) {
        std::cout << Config::SerializeStyleSheet(colors, options.indent) << '\n';
    }
    return EXIT_SUCCESS;
}
