#pragma once

#include <optional>
#include <sparkline/geometry.hpp>
#include <sparkline/path.hpp>
#include <sparkline/style.hpp>
#include <span>
#include <vector>

namespace sparkline::detail
{

// Canvas size plus the area left for the line after the stroke margin and
// the grid-label column are taken out.
struct PlotFrame
{
    Size  size;
    float stroke_width    = 0.0f;
    float drawable_width  = 0.0f;
    float drawable_height = 0.0f;

    // (0, 0) - (drawable_width, drawable_height); gradients are evaluated here.
    Rect drawable_rect() const { return Rect{0.0f, 0.0f, drawable_width, drawable_height}; }
};

// `label_width` is the width reserved on the right for grid labels (0 when
// grid lines are off). Negative drawable extents clamp to 0.
PlotFrame make_plot_frame(Size size, float stroke_width, float label_width = 0.0f);

// Per-bound override, else the dataset extreme. `data` must be non-empty.
Bounds resolve_bounds(std::span<const float>     data,
                      std::optional<float>       min_override,
                      std::optional<float>       max_override);

// One canvas point per sample, index-aligned with `data`.
std::vector<Point> normalize_points(std::span<const float> data,
                                    const Bounds&          bounds,
                                    const PlotFrame&       frame);

// Open path through `points`. With a smoothing factor each segment becomes a
// cubic whose control points follow the neighbouring samples. The first
// sample acts as its own predecessor and the last as its own successor.
Path build_line_path(std::span<const Point> points, std::optional<float> smoothing_factor);

// Closes `line` against the top (Above) or bottom (Below) edge of `size`.
// Returns nullopt for FillMode::None or an empty line.
std::optional<Path> build_fill_path(const Path& line,
                                    FillMode    mode,
                                    Size        size,
                                    float       stroke_width);

// Points that get a marker under `mode`.
std::vector<Point> select_marker_points(std::span<const Point> points, PointsMode mode);

}   // namespace sparkline::detail
