#pragma once

#include <sparkline/canvas.hpp>
#include <sparkline/style.hpp>

#include "render/sparkline_geometry.hpp"

namespace sparkline::detail
{

// Round caps; round joins unless sharp corners were asked for. A line
// gradient becomes a shader over the drawable rect.
Paint resolve_stroke_paint(const SparklineStyle& style, const PlotFrame& frame);

Paint resolve_fill_paint(const SparklineStyle& style, const PlotFrame& frame);

Paint resolve_marker_paint(const SparklineStyle& style);

Paint resolve_grid_paint(const SparklineStyle& style);

TextStyle resolve_label_style(const SparklineStyle& style);

}   // namespace sparkline::detail
