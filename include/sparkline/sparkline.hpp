#pragma once

#include <sparkline/canvas.hpp>
#include <sparkline/color.hpp>
#include <sparkline/export.hpp>
#include <sparkline/fwd.hpp>
#include <sparkline/geometry.hpp>
#include <sparkline/gradient.hpp>
#include <sparkline/logger.hpp>
#include <sparkline/path.hpp>
#include <sparkline/recording_canvas.hpp>
#include <sparkline/renderer.hpp>
#include <sparkline/style.hpp>
#include <sparkline/style_config.hpp>

// ─── Convenience API ─────────────────────────────────────────────────────────
//
//   std::vector<float> samples = {0.0f, 1.0f, 1.5f, 2.0f, 0.0f};
//   std::string svg = sparkline::to_svg(samples);
//
// Hosts with their own drawing surface implement sparkline::Canvas and call
// SparklineRenderer::render directly.

namespace sparkline
{

// SVG document for `data` at the style's fallback size.
inline std::string to_svg(std::span<const float> data, const SparklineStyle& style = {})
{
    return SvgExporter::to_string(data, Size{style.fallback_width, style.fallback_height}, style);
}

}   // namespace sparkline
