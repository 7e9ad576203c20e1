#include <cmath>
#include <sparkline/logger.hpp>
#include <sparkline/style.hpp>
#include <stdexcept>
#include <string>

namespace sparkline
{

namespace
{

constexpr const char* kCategory = "sparkline.style";

constexpr float kRecommendedSmoothingMin = 0.1f;
constexpr float kRecommendedSmoothingMax = 0.3f;

[[noreturn]] void reject(const std::string& what)
{
    SPARKLINE_LOG_ERROR(kCategory, "invalid style: {}", what);
    throw std::invalid_argument("invalid style: " + what);
}

void require_non_negative(float value, const char* field)
{
    if (!std::isfinite(value) || value < 0.0f)
        reject(std::string(field) + " must be a finite non-negative number");
}

void require_finite_color(const Color& c, const char* field)
{
    if (!std::isfinite(c.r) || !std::isfinite(c.g) || !std::isfinite(c.b) || !std::isfinite(c.a))
        reject(std::string(field) + " has a non-finite component");
}

void require_valid_gradient(const std::optional<LinearGradient>& gradient, const char* field)
{
    if (!gradient)
        return;
    if (gradient->stops.empty())
        reject(std::string(field) + " has no color stops");

    float previous = -INFINITY;
    for (const auto& stop : gradient->stops)
    {
        if (!std::isfinite(stop.offset) || stop.offset < previous)
            reject(std::string(field) + " stop offsets must be finite and ascending");
        previous = stop.offset;
        require_finite_color(stop.color, field);
    }
}

}   // anonymous namespace

std::optional<FillMode> parse_fill_mode(std::string_view name)
{
    if (name == "none")
        return FillMode::None;
    if (name == "above")
        return FillMode::Above;
    if (name == "below")
        return FillMode::Below;
    return std::nullopt;
}

std::optional<PointsMode> parse_points_mode(std::string_view name)
{
    if (name == "none")
        return PointsMode::None;
    if (name == "all")
        return PointsMode::All;
    if (name == "last")
        return PointsMode::Last;
    return std::nullopt;
}

void validate_style(const SparklineStyle& style)
{
    require_non_negative(style.line_width, "line_width");
    require_finite_color(style.line_color, "line_color");
    require_valid_gradient(style.line_gradient, "line_gradient");
    require_finite_color(style.fill_color, "fill_color");
    require_valid_gradient(style.fill_gradient, "fill_gradient");

    if (!std::isfinite(style.cubic_smoothing_factor))
        reject("cubic_smoothing_factor must be finite");
    if (style.cubic_smoothing
        && (style.cubic_smoothing_factor < kRecommendedSmoothingMin
            || style.cubic_smoothing_factor > kRecommendedSmoothingMax))
    {
        SPARKLINE_LOG_WARN(kCategory,
                           "cubic_smoothing_factor {} is outside [0.1, 0.3], curves may distort",
                           style.cubic_smoothing_factor);
    }

    if (style.point_size)
        require_non_negative(*style.point_size, "point_size");
    if (style.point_color)
        require_finite_color(*style.point_color, "point_color");

    if (style.grid_lines && style.grid_line_amount < 2)
        reject("grid_line_amount must be at least 2, got " + std::to_string(style.grid_line_amount));
    require_non_negative(style.grid_line_width, "grid_line_width");
    require_finite_color(style.grid_line_color, "grid_line_color");
    require_finite_color(style.grid_label_color, "grid_label_color");
    if (!std::isfinite(style.grid_label_font_size) || style.grid_label_font_size <= 0.0f)
        reject("grid_label_font_size must be positive");

    if (style.min && !std::isfinite(*style.min))
        reject("min must be finite");
    if (style.max && !std::isfinite(*style.max))
        reject("max must be finite");

    if (!(style.fallback_width > 0.0f) || !std::isfinite(style.fallback_width))
        reject("fallback_width must be positive");
    if (!(style.fallback_height > 0.0f) || !std::isfinite(style.fallback_height))
        reject("fallback_height must be positive");
}

Size resolve_canvas_size(Size constraints, const SparklineStyle& style)
{
    Size size = constraints;
    // Only +inf means "unbounded"; -inf and NaN stay degenerate.
    if (std::isinf(size.width) && size.width > 0.0f)
        size.width = style.fallback_width;
    if (std::isinf(size.height) && size.height > 0.0f)
        size.height = style.fallback_height;
    return size;
}

}   // namespace sparkline
