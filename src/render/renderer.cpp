#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sparkline/logger.hpp>
#include <sparkline/renderer.hpp>
#include <stdexcept>
#include <string>

#include "render/grid_labels.hpp"
#include "render/paint_resolver.hpp"
#include "render/sparkline_geometry.hpp"

namespace sparkline
{

namespace
{

constexpr const char* kCategory = "sparkline.render";

// Gap between the end of a grid line and its label.
constexpr float kLabelGap = 2.0f;

}   // anonymous namespace

void validate_data(std::span<const float> data)
{
    if (data.empty())
    {
        SPARKLINE_LOG_ERROR(kCategory, "rejected empty dataset");
        throw std::invalid_argument("invalid input: empty dataset");
    }
    for (size_t i = 0; i < data.size(); ++i)
    {
        if (!std::isfinite(data[i]))
        {
            SPARKLINE_LOG_ERROR(kCategory, "rejected non-finite sample at index {}", i);
            throw std::invalid_argument("invalid input: non-finite value at index "
                                        + std::to_string(i));
        }
    }
}

bool should_repaint(const RenderInputs& previous, const RenderInputs& next)
{
    return !(previous == next);
}

SparklineRenderer::SparklineRenderer(SparklineStyle style) : style_(std::move(style))
{
    validate_style(style_);
}

const std::vector<std::string>& SparklineRenderer::grid_label_texts(const Bounds& bounds)
{
    if (label_bounds_ && *label_bounds_ == bounds)
        return label_texts_;

    label_texts_.clear();
    for (double value : detail::grid_line_values(bounds, style_.grid_line_amount))
        label_texts_.push_back(detail::format_grid_label(value, style_.grid_label_prefix));
    label_bounds_ = bounds;
    return label_texts_;
}

void SparklineRenderer::render(Canvas& canvas, std::span<const float> data, Size constraints)
{
    validate_data(data);

    const Size size = resolve_canvas_size(constraints, style_);
    if (size.is_empty())
    {
        SPARKLINE_LOG_DEBUG(kCategory, "empty canvas {}x{}, nothing to draw", size.width, size.height);
        return;
    }

    const Bounds bounds = detail::resolve_bounds(data, style_.min, style_.max);

    // Labels are laid out first: the widest one decides the right margin.
    std::vector<TextLayout> labels;
    float                   label_width = 0.0f;
    if (style_.grid_lines)
    {
        const TextStyle label_style = detail::resolve_label_style(style_);
        for (const auto& text : grid_label_texts(bounds))
        {
            labels.push_back(canvas.layout_text(text, label_style));
            label_width = std::max(label_width, labels.back().width);
        }
    }

    const detail::PlotFrame frame = detail::make_plot_frame(size, style_.line_width, label_width);

    SPARKLINE_LOG_TRACE(kCategory,
                        "render n={} bounds=[{}, {}] drawable={}x{}",
                        data.size(),
                        bounds.min,
                        bounds.max,
                        frame.drawable_width,
                        frame.drawable_height);

    if (style_.grid_lines)
    {
        const Paint grid_paint = detail::resolve_grid_paint(style_);
        const int   amount     = style_.grid_line_amount;
        for (int i = 0; i < amount; ++i)
        {
            const float y = detail::grid_line_y(i, amount, frame.drawable_height);
            canvas.draw_line(Point{0.0f, y}, Point{frame.drawable_width, y}, grid_paint);

            const TextLayout& label = labels[static_cast<size_t>(i)];
            canvas.draw_text(label, Point{frame.drawable_width + kLabelGap, y - label.height / 2.0f});
        }
    }

    const std::vector<Point> points = detail::normalize_points(data, bounds, frame);

    // A single sample has no segment to stroke; mark it instead.
    if (points.size() == 1)
    {
        Paint dot = style_.points_mode == PointsMode::None
                        ? detail::resolve_stroke_paint(style_, frame)
                        : detail::resolve_marker_paint(style_);
        canvas.draw_points(points, dot);
        return;
    }

    const std::optional<float> smoothing =
        style_.cubic_smoothing ? std::optional<float>(style_.cubic_smoothing_factor) : std::nullopt;
    const Path line = detail::build_line_path(points, smoothing);

    if (auto fill = detail::build_fill_path(line, style_.fill_mode, size, style_.line_width))
        canvas.draw_path(*fill, detail::resolve_fill_paint(style_, frame));

    canvas.draw_path(line, detail::resolve_stroke_paint(style_, frame));

    const std::vector<Point> markers = detail::select_marker_points(points, style_.points_mode);
    if (!markers.empty())
        canvas.draw_points(markers, detail::resolve_marker_paint(style_));
}

}   // namespace sparkline
