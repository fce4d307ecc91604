#pragma once

#include <optional>
#include <string>

namespace TS::Theme {

struct SizeMetrics {
    float height             = 0.0f;
    float padding_horizontal = 0.0f;
    float corner_radius      = 0.0f;
    float text_size          = 0.0f;

    auto operator==(SizeMetrics const&) const -> bool = default;
};

struct ContainerStyle {
    float height = 0.0f;
    // Chips and badges grow past `height` when their content needs it.
    bool  height_is_minimum  = false;
    float padding_horizontal = 0.0f;
    float padding_vertical   = 0.0f;
    float corner_radius      = 0.0f;
    std::string background_color;
    float border_width = 0.0f;
    std::optional<std::string> border_color;

    auto operator==(ContainerStyle const&) const -> bool = default;
};

struct TextStyle {
    float font_size   = 0.0f;
    int   font_weight = 400;
    std::string color;

    auto operator==(TextStyle const&) const -> bool = default;
};

struct StyleDescriptor {
    ContainerStyle container;
    TextStyle      text;

    auto operator==(StyleDescriptor const&) const -> bool = default;
};

// Resting colors of a control before sizing is applied. An empty border means none.
struct ElementColors {
    std::string background;
    std::string border;
    std::string text;

    auto operator==(ElementColors const&) const -> bool = default;
};

struct SwitchTrackColors {
    std::string off;
    std::string on;

    auto operator==(SwitchTrackColors const&) const -> bool = default;
};

struct BadgeVisuals {
    std::string background_color;
    std::string border_color;
    std::string text_color;
    std::string ripple_color;

    auto operator==(BadgeVisuals const&) const -> bool = default;
};

} // namespace TS::Theme
