#include <tonestyle/theme/ThemeConfig.hpp>

#include <tonestyle/theme/ButtonStyles.hpp>
#include <tonestyle/theme/ChipStyles.hpp>

#include "../log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace TS::Theme::Config {

namespace {

[[nodiscard]] auto parse_object(std::string const& payload, std::string_view what) -> Expected<nlohmann::json> {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded()) {
        return fail(Error::Code::MalformedInput, "invalid " + std::string(what) + " JSON");
    }
    if (!json.is_object()) {
        return fail(Error::Code::MalformedInput, std::string(what) + " must be a JSON object");
    }
    return json;
}

[[nodiscard]] auto read_string(nlohmann::json const& value, std::string const& key) -> Expected<std::string> {
    if (!value.is_string()) {
        return fail(Error::Code::MalformedInput, "'" + key + "' must be a string");
    }
    return value.get<std::string>();
}

[[nodiscard]] auto read_bool(nlohmann::json const& value, std::string const& key) -> Expected<bool> {
    if (!value.is_boolean()) {
        return fail(Error::Code::MalformedInput, "'" + key + "' must be a boolean");
    }
    return value.get<bool>();
}

template <typename Enum>
[[nodiscard]] auto read_enum(nlohmann::json const& value,
                             std::string const& key,
                             std::optional<Enum> (*parse)(std::string_view)) -> Expected<Enum> {
    auto name = read_string(value, key);
    if (!name) {
        return std::unexpected(name.error());
    }
    auto parsed = parse(*name);
    if (!parsed) {
        return fail(Error::Code::InvalidOption, "unknown " + key + " '" + *name + "'");
    }
    return *parsed;
}

[[nodiscard]] auto unknown_field(std::string const& key, std::string_view record) -> std::unexpected<Error> {
    return fail(Error::Code::InvalidOption, "unknown " + std::string(record) + " option '" + key + "'");
}

[[nodiscard]] auto to_json(StyleDescriptor const& style) -> nlohmann::json {
    nlohmann::json container{
        {style.container.height_is_minimum ? "minHeight" : "height", style.container.height},
        {"paddingHorizontal", style.container.padding_horizontal},
        {"borderRadius", style.container.corner_radius},
        {"backgroundColor", style.container.background_color},
    };
    if (style.container.padding_vertical != 0.0f) {
        container["paddingVertical"] = style.container.padding_vertical;
    }
    if (style.container.border_color) {
        container["borderWidth"] = style.container.border_width;
        container["borderColor"] = *style.container.border_color;
    }
    return nlohmann::json{
        {"container", std::move(container)},
        {"text",
         {
             {"fontSize", style.text.font_size},
             {"fontWeight", std::to_string(style.text.font_weight)},
             {"color", style.text.color},
         }},
    };
}

[[nodiscard]] auto to_json(BadgeVisuals const& visuals) -> nlohmann::json {
    return nlohmann::json{
        {"backgroundColor", visuals.background_color},
        {"borderColor", visuals.border_color},
        {"textColor", visuals.text_color},
        {"rippleColor", visuals.ripple_color},
    };
}

[[nodiscard]] auto colors_to_json(ThemeColors const& colors) -> nlohmann::json {
    nlohmann::json json = nlohmann::json::object();
    for (auto const& token : kThemeColorTokens) {
        auto const& value = colors.*(token.field);
        if (!value.empty()) {
            json[std::string(token.name)] = value;
        }
    }
    return json;
}

} // namespace

auto ParseThemeColors(std::string const& payload,
                      ThemeColors const& base) -> Expected<ThemeColors> {
    auto json = parse_object(payload, "theme colors");
    if (!json) {
        return std::unexpected(json.error());
    }

    ThemeColors colors = base;
    if (auto mode_it = json->find("mode"); mode_it != json->end()) {
        auto mode = read_enum<ThemeMode>(*mode_it, "mode", &ParseThemeMode);
        if (!mode) {
            return std::unexpected(mode.error());
        }
        colors = MakeThemeColors(*mode);
    }

    for (auto const& [key, value] : json->items()) {
        if (key == "mode") {
            continue;
        }
        auto color = read_string(value, key);
        if (!color) {
            return std::unexpected(color.error());
        }
        auto status = SetThemeColor(colors, key, *color);
        if (!status) {
            return std::unexpected(status.error());
        }
    }

    auto valid = ValidateThemeColors(colors);
    if (!valid) {
        return std::unexpected(valid.error());
    }
    return colors;
}

auto ParseThemeColors(std::string const& payload) -> Expected<ThemeColors> {
    return ParseThemeColors(payload, MakeLightThemeColors());
}

auto LoadThemeColorsFile(std::filesystem::path const& path,
                         ThemeColors const& base) -> Expected<ThemeColors> {
    std::ifstream stream(path);
    if (!stream) {
        return fail(Error::Code::NotFound, "cannot open theme file '" + path.string() + "'");
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    ts_log("Loading theme colors from " + path.string(), "ThemeConfig");
    return ParseThemeColors(buffer.str(), base);
}

auto SerializeThemeColors(ThemeColors const& colors, int indent) -> std::string {
    return colors_to_json(colors).dump(indent);
}

auto ParseButtonOptions(std::string const& payload) -> Expected<ButtonOptions> {
    auto json = parse_object(payload, "button options");
    if (!json) {
        return std::unexpected(json.error());
    }
    ButtonOptions options;
    for (auto const& [key, value] : json->items()) {
        if (key == "variant") {
            auto variant = read_enum<ButtonVariant>(value, key, &ParseButtonVariant);
            if (!variant) {
                return std::unexpected(variant.error());
            }
            options.variant = *variant;
        } else if (key == "size") {
            auto size = read_enum<ButtonSize>(value, key, &ParseButtonSize);
            if (!size) {
                return std::unexpected(size.error());
            }
            options.size = *size;
        } else if (key == "disabled") {
            auto disabled = read_bool(value, key);
            if (!disabled) {
                return std::unexpected(disabled.error());
            }
            options.disabled = *disabled;
        } else {
            return unknown_field(key, "button");
        }
    }
    return options;
}

auto ParseChipOptions(std::string const& payload) -> Expected<ChipOptions> {
    auto json = parse_object(payload, "chip options");
    if (!json) {
        return std::unexpected(json.error());
    }
    ChipOptions options;
    for (auto const& [key, value] : json->items()) {
        if (key == "tone") {
            auto tone = read_enum<Tone>(value, key, &ParseTone);
            if (!tone) {
                return std::unexpected(tone.error());
            }
            options.tone = *tone;
        } else if (key == "size") {
            auto size = read_enum<ChipSize>(value, key, &ParseChipSize);
            if (!size) {
                return std::unexpected(size.error());
            }
            options.size = *size;
        } else if (key == "selected") {
            auto selected = read_bool(value, key);
            if (!selected) {
                return std::unexpected(selected.error());
            }
            options.selected = *selected;
        } else {
            return unknown_field(key, "chip");
        }
    }
    return options;
}

auto ParseBadgeOptions(std::string const& payload) -> Expected<BadgeOptions> {
    auto json = parse_object(payload, "badge options");
    if (!json) {
        return std::unexpected(json.error());
    }
    if (!json->contains("tone")) {
        return fail(Error::Code::InvalidOption, "badge options require a tone");
    }
    BadgeOptions options;
    for (auto const& [key, value] : json->items()) {
        if (key == "tone") {
            auto tone = read_enum<Tone>(value, key, &ParseTone);
            if (!tone) {
                return std::unexpected(tone.error());
            }
            options.tone = *tone;
        } else if (key == "size") {
            auto size = read_enum<ButtonSize>(value, key, &ParseButtonSize);
            if (!size) {
                return std::unexpected(size.error());
            }
            options.size = *size;
        } else if (key == "selected") {
            auto selected = read_bool(value, key);
            if (!selected) {
                return std::unexpected(selected.error());
            }
            options.selected = *selected;
        } else {
            return unknown_field(key, "badge");
        }
    }
    return options;
}

auto SerializeStyleDescriptor(StyleDescriptor const& style, int indent) -> std::string {
    return to_json(style).dump(indent);
}

auto SerializeBadgeVisuals(BadgeVisuals const& visuals, int indent) -> std::string {
    return to_json(visuals).dump(indent);
}

auto SerializeStyleSheet(ThemeColors const& colors, int indent) -> std::string {
    nlohmann::json buttons = nlohmann::json::object();
    for (auto variant : kAllButtonVariants) {
        nlohmann::json by_size = nlohmann::json::object();
        for (auto size : kAllButtonSizes) {
            by_size[std::string(ButtonSizeName(size))] = {
                {"enabled", to_json(ResolveButtonStyle(colors, {.variant = variant, .size = size, .disabled = false}))},
                {"disabled", to_json(ResolveButtonStyle(colors, {.variant = variant, .size = size, .disabled = true}))},
            };
        }
        buttons[std::string(ButtonVariantName(variant))] = std::move(by_size);
    }

    nlohmann::json chips  = nlohmann::json::object();
    nlohmann::json badges = nlohmann::json::object();
    for (auto tone : kAllTones) {
        nlohmann::json by_size = nlohmann::json::object();
        for (auto size : kAllChipSizes) {
            by_size[std::string(ChipSizeName(size))] = {
                {"resting", to_json(ResolveChipStyle(colors, {.tone = tone, .size = size, .selected = false}))},
                {"selected", to_json(ResolveChipStyle(colors, {.tone = tone, .size = size, .selected = true}))},
            };
        }
        chips[std::string(ToneName(tone))] = std::move(by_size);
        badges[std::string(ToneName(tone))] = {
            {"resting", to_json(GetBadgeVisuals(colors, {.tone = tone, .selected = false}))},
            {"selected", to_json(GetBadgeVisuals(colors, {.tone = tone, .selected = true}))},
        };
    }

    nlohmann::json sheet{
        {"colors", colors_to_json(colors)},
        {"buttons", std::move(buttons)},
        {"chips", std::move(chips)},
        {"badges", std::move(badges)},
    };
    return sheet.dump(indent);
}

} // namespace TS::Theme::Config
