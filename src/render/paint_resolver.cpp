#include "render/paint_resolver.hpp"

namespace sparkline::detail
{

Paint resolve_stroke_paint(const SparklineStyle& style, const PlotFrame& frame)
{
    Paint paint;
    paint.style        = PaintStyle::Stroke;
    paint.color        = style.line_color;
    paint.stroke_width = style.line_width;
    paint.cap          = StrokeCap::Round;
    paint.join         = style.sharp_corners ? StrokeJoin::Miter : StrokeJoin::Round;
    if (style.line_gradient)
        paint.shader = style.line_gradient->create_shader(frame.drawable_rect());
    return paint;
}

Paint resolve_fill_paint(const SparklineStyle& style, const PlotFrame& frame)
{
    Paint paint;
    paint.style        = PaintStyle::Fill;
    paint.color        = style.fill_color;
    paint.stroke_width = 0.0f;
    if (style.fill_gradient)
        paint.shader = style.fill_gradient->create_shader(frame.drawable_rect());
    return paint;
}

Paint resolve_marker_paint(const SparklineStyle& style)
{
    Paint paint;
    paint.style        = PaintStyle::Stroke;
    paint.color        = style.effective_point_color();
    paint.stroke_width = style.effective_point_size();
    paint.cap          = StrokeCap::Round;
    return paint;
}

Paint resolve_grid_paint(const SparklineStyle& style)
{
    Paint paint;
    paint.style        = PaintStyle::Stroke;
    paint.color        = style.grid_line_color;
    paint.stroke_width = style.grid_line_width;
    return paint;
}

TextStyle resolve_label_style(const SparklineStyle& style)
{
    return TextStyle{
        .color = style.grid_label_color, .font_size = style.grid_label_font_size, .bold = true};
}

}   // namespace sparkline::detail
