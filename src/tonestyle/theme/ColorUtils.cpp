#include <tonestyle/theme/ColorUtils.hpp>

#include "../log/TaggedLogger.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <system_error>

namespace TS::Theme::Color {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

auto starts_with_icase(std::string_view text, std::string_view prefix) -> bool {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) != prefix[i]) {
            return false;
        }
    }
    return true;
}

auto hex_digit(char ch) -> std::optional<int> {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (lower >= 'a' && lower <= 'f') {
        return 10 + (lower - 'a');
    }
    return std::nullopt;
}

auto parse_hex_digits(std::string_view digits) -> std::optional<Rgba> {
    std::array<int, 6> nibbles{};
    if (digits.size() == 3) {
        for (std::size_t i = 0; i < 3; ++i) {
            auto value = hex_digit(digits[i]);
            if (!value) {
                return std::nullopt;
            }
            nibbles[i * 2]     = *value;
            nibbles[i * 2 + 1] = *value;
        }
    } else if (digits.size() == 6) {
        for (std::size_t i = 0; i < 6; ++i) {
            auto value = hex_digit(digits[i]);
            if (!value) {
                return std::nullopt;
            }
            nibbles[i] = *value;
        }
    } else {
        return std::nullopt;
    }
    return Rgba{nibbles[0] * 16 + nibbles[1],
                nibbles[2] * 16 + nibbles[3],
                nibbles[4] * 16 + nibbles[5],
                1.0};
}

auto parse_channel(std::string_view token) -> std::optional<int> {
    token = trim(token);
    if (token.empty()) {
        return std::nullopt;
    }
    for (char ch : token) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
    }
    int value = 0;
    auto result = std::from_chars(token.data(), token.data() + token.size(), value);
    if (result.ec != std::errc{} || value > 255) {
        return std::nullopt;
    }
    return value;
}

auto parse_alpha(std::string_view token) -> std::optional<double> {
    token = trim(token);
    if (token.empty()) {
        return std::nullopt;
    }
    for (char ch : token) {
        if (!std::isdigit(static_cast<unsigned char>(ch)) && ch != '.') {
            return std::nullopt;
        }
    }
    double value = 0.0;
    auto result = std::from_chars(token.data(), token.data() + token.size(), value);
    if (result.ec != std::errc{} || result.ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return ClampAlpha(value);
}

auto parse_function(std::string_view text) -> std::optional<Rgba> {
    std::size_t name_length = starts_with_icase(text, "rgba(") ? 5 : (starts_with_icase(text, "rgb(") ? 4 : 0);
    if (name_length == 0 || text.back() != ')') {
        return std::nullopt;
    }
    auto body = text.substr(name_length, text.size() - name_length - 1);

    std::array<std::string_view, 4> parts{};
    std::size_t count = 0;
    while (true) {
        auto comma = body.find(',');
        if (count == parts.size()) {
            return std::nullopt;
        }
        parts[count++] = body.substr(0, comma);
        if (comma == std::string_view::npos) {
            break;
        }
        body.remove_prefix(comma + 1);
    }
    if (count < 3) {
        return std::nullopt;
    }

    auto r = parse_channel(parts[0]);
    auto g = parse_channel(parts[1]);
    auto b = parse_channel(parts[2]);
    if (!r || !g || !b) {
        return std::nullopt;
    }
    Rgba color{*r, *g, *b, 1.0};
    if (count == 4) {
        auto alpha = parse_alpha(parts[3]);
        if (!alpha) {
            return std::nullopt;
        }
        color.a = *alpha;
    }
    return color;
}

auto format_alpha(double alpha) -> std::string {
    alpha = ClampAlpha(alpha);
    if (alpha == 0.0) {
        return "0";
    }
    std::array<char, 32> buffer{};
    auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), alpha);
    if (result.ec != std::errc{}) {
        return "1";
    }
    return std::string(buffer.data(), result.ptr);
}

} // namespace

auto Parse(std::string_view color) -> std::optional<Rgba> {
    auto text = trim(color);
    if (text.empty()) {
        return std::nullopt;
    }
    if (auto functional = parse_function(text)) {
        return functional;
    }
    if (text.front() == '#') {
        text.remove_prefix(1);
    }
    return parse_hex_digits(text);
}

auto ToHex(Rgba const& color) -> std::string {
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string out{"#"};
    out.reserve(7);
    for (int channel : {color.r, color.g, color.b}) {
        auto value = static_cast<unsigned>(std::clamp(channel, 0, 255));
        out.push_back(kDigits[value >> 4u]);
        out.push_back(kDigits[value & 0x0Fu]);
    }
    return out;
}

auto ToRgba(Rgba const& color) -> std::string {
    std::string out{"rgba("};
    out.append(std::to_string(std::clamp(color.r, 0, 255)));
    out.append(", ");
    out.append(std::to_string(std::clamp(color.g, 0, 255)));
    out.append(", ");
    out.append(std::to_string(std::clamp(color.b, 0, 255)));
    out.append(", ");
    out.append(format_alpha(color.a));
    out.push_back(')');
    return out;
}

auto WithAlpha(std::string_view color, double alpha) -> std::string {
    auto parsed = Parse(color);
    if (!parsed) {
        ts_log("WithAlpha left unparsed color '" + std::string(color) + "' unchanged", "ColorParse");
        return std::string(color);
    }
    parsed->a = ClampAlpha(alpha);
    return ToRgba(*parsed);
}

auto RelativeLuminance(std::string_view color) -> std::optional<double> {
    auto text = trim(color);
    if (text.size() != 7 || text.front() != '#') {
        return std::nullopt;
    }
    auto parsed = parse_hex_digits(text.substr(1));
    if (!parsed) {
        return std::nullopt;
    }
    return RelativeLuminance(*parsed);
}

auto RelativeLuminance(Rgba const& color) -> double {
    auto const r = color.r / 255.0;
    auto const g = color.g / 255.0;
    auto const b = color.b / 255.0;
    return 0.2126 * r + 0.7152 * g + 0.0722 * b;
}

auto ChooseReadableText(std::string_view background,
                        std::string_view light,
                        std::string_view dark) -> std::string {
    auto luminance = RelativeLuminance(background);
    if (!luminance) {
        ts_log("ChooseReadableText fell back to the light text color for '" + std::string(background) + "'", "ColorParse");
        return std::string(light);
    }
    return *luminance > 0.5 ? std::string(dark) : std::string(light);
}

} // namespace TS::Theme::Color
