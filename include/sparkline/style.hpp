#pragma once

#include <cstdint>
#include <optional>
#include <sparkline/color.hpp>
#include <sparkline/geometry.hpp>
#include <sparkline/gradient.hpp>
#include <string>
#include <string_view>

namespace sparkline
{

// ─── Modes ───────────────────────────────────────────────────────────────────

enum class FillMode : uint8_t
{
    None,    // line only
    Above,   // region between the line and the top edge
    Below,   // region between the line and the bottom edge
};

enum class PointsMode : uint8_t
{
    None,   // no markers
    All,    // a marker on every sample
    Last,   // a marker on the last sample only
};

constexpr const char* fill_mode_name(FillMode m)
{
    switch (m)
    {
        case FillMode::None:
            return "none";
        case FillMode::Above:
            return "above";
        case FillMode::Below:
            return "below";
    }
    return "none";
}

constexpr const char* points_mode_name(PointsMode m)
{
    switch (m)
    {
        case PointsMode::None:
            return "none";
        case PointsMode::All:
            return "all";
        case PointsMode::Last:
            return "last";
    }
    return "none";
}

std::optional<FillMode>   parse_fill_mode(std::string_view name);
std::optional<PointsMode> parse_points_mode(std::string_view name);

// ─── Sparkline Style ─────────────────────────────────────────────────────────
// Every rendering option of a sparkline. Validated once when a renderer is
// constructed and never mutated during a render.

struct SparklineStyle
{
    // Line
    float                         line_width = 2.0f;
    Color                         line_color = colors::light_blue;
    std::optional<LinearGradient> line_gradient;   // overrides line_color
    bool                          sharp_corners          = false;   // miter joins
    bool                          cubic_smoothing        = false;
    float                         cubic_smoothing_factor = 0.15f;   // 0.1 - 0.3 looks best

    // Fill
    FillMode                      fill_mode  = FillMode::None;
    Color                         fill_color = colors::light_blue_200;
    std::optional<LinearGradient> fill_gradient;   // overrides fill_color

    // Point markers. Unset size/color inherit the line's width/color.
    PointsMode           points_mode = PointsMode::None;
    std::optional<float> point_size;
    std::optional<Color> point_color;

    // Grid lines with value labels on the right margin
    bool        grid_lines            = false;
    Color       grid_line_color       = colors::grey;
    int         grid_line_amount      = 5;
    float       grid_line_width       = 0.5f;
    Color       grid_label_color      = colors::grey;
    std::string grid_label_prefix;   // prepended verbatim, e.g. "$"
    float       grid_label_font_size  = 10.0f;

    // Scale overrides. Unset bounds come from the dataset.
    std::optional<float> min;
    std::optional<float> max;

    // Size used when the host offers unbounded space
    float fallback_width  = 300.0f;
    float fallback_height = 100.0f;

    float effective_point_size() const { return point_size.value_or(line_width); }
    Color effective_point_color() const { return point_color.value_or(line_color); }

    bool operator==(const SparklineStyle&) const = default;
};

// Throws std::invalid_argument describing the first offending field.
void validate_style(const SparklineStyle& style);

// Applies the fallback size on any axis the host left unbounded (+infinity).
Size resolve_canvas_size(Size constraints, const SparklineStyle& style);

}   // namespace sparkline
