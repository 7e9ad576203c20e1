#include "render/sparkline_geometry.hpp"

#include <algorithm>
#include <cstddef>

namespace sparkline::detail
{

PlotFrame make_plot_frame(Size size, float stroke_width, float label_width)
{
    PlotFrame frame;
    frame.size            = size;
    frame.stroke_width    = stroke_width;
    frame.drawable_width  = std::max(0.0f, size.width - stroke_width - label_width);
    frame.drawable_height = std::max(0.0f, size.height - stroke_width);
    return frame;
}

Bounds resolve_bounds(std::span<const float> data,
                      std::optional<float>   min_override,
                      std::optional<float>   max_override)
{
    Bounds bounds;
    if (min_override && max_override)
    {
        bounds.min = *min_override;
        bounds.max = *max_override;
        return bounds;
    }

    auto [lo, hi] = std::minmax_element(data.begin(), data.end());
    bounds.min    = min_override.value_or(*lo);
    bounds.max    = max_override.value_or(*hi);
    return bounds;
}

std::vector<Point> normalize_points(std::span<const float> data,
                                    const Bounds&          bounds,
                                    const PlotFrame&       frame)
{
    const size_t n          = data.size();
    const float  half_width = frame.stroke_width / 2.0f;
    const float  height     = frame.drawable_height;

    std::vector<Point> points;
    points.reserve(n);
    if (n == 0)
        return points;

    // A lone sample has no horizontal spacing; center it.
    const float width_normalizer =
        n > 1 ? frame.drawable_width / static_cast<float>(n - 1) : 0.0f;
    const float x_offset = n > 1 ? half_width : frame.drawable_width / 2.0f + half_width;

    // Scaling runs in double; only the final pixel coordinate is narrowed.
    const bool   flat              = bounds.is_flat();
    const double height_normalizer = flat ? 0.0 : height / bounds.range();

    for (size_t i = 0; i < n; ++i)
    {
        float x = static_cast<float>(i) * width_normalizer + x_offset;
        float y = flat ? height / 2.0f + half_width
                       : static_cast<float>(
                             height
                             - (static_cast<double>(data[i]) - bounds.min) * height_normalizer
                             + half_width);
        points.push_back(Point{x, y});
    }
    return points;
}

Path build_line_path(std::span<const Point> points, std::optional<float> smoothing_factor)
{
    Path path;
    if (points.empty())
        return path;

    path.move_to(points[0]);
    const size_t n = points.size();

    if (!smoothing_factor)
    {
        for (size_t i = 1; i < n; ++i)
            path.line_to(points[i]);
        return path;
    }

    const float k = *smoothing_factor;
    Point       a = points[0];
    Point       b = points[0];
    Point       c = points[std::min<size_t>(1, n - 1)];
    for (size_t i = 1; i < n; ++i)
    {
        Point control1 = b + (c - a) * k;
        a              = b;
        b              = c;
        c              = points[std::min(n - 1, i + 1)];
        Point control2 = b + (a - c) * k;
        path.cubic_to(control1, control2, b);
    }
    return path;
}

std::optional<Path> build_fill_path(const Path& line, FillMode mode, Size size, float stroke_width)
{
    if (mode == FillMode::None || line.empty())
        return std::nullopt;

    const Point start      = line.commands().front().to;
    const float half_width = stroke_width / 2.0f;
    const float edge_y     = mode == FillMode::Below ? size.height : 0.0f;

    Path fill;
    fill.add_path(line);
    fill.relative_line_to(half_width, 0.0f);
    fill.line_to(Point{size.width, edge_y});
    fill.line_to(Point{0.0f, edge_y});
    fill.line_to(Point{start.x - half_width, start.y});
    fill.close();
    return fill;
}

std::vector<Point> select_marker_points(std::span<const Point> points, PointsMode mode)
{
    switch (mode)
    {
        case PointsMode::None:
            return {};
        case PointsMode::All:
            return {points.begin(), points.end()};
        case PointsMode::Last:
            if (points.empty())
                return {};
            return {points.back()};
    }
    return {};
}

}   // namespace sparkline::detail
