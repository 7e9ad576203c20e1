#pragma once

#include <cstdint>
#include <optional>
#include <sparkline/color.hpp>
#include <sparkline/geometry.hpp>
#include <sparkline/gradient.hpp>
#include <sparkline/path.hpp>
#include <span>
#include <string>
#include <string_view>

namespace sparkline
{

enum class PaintStyle : uint8_t
{
    Fill,
    Stroke,
};

enum class StrokeCap : uint8_t
{
    Butt,
    Round,
    Square,
};

enum class StrokeJoin : uint8_t
{
    Miter,
    Round,
    Bevel,
};

struct Paint
{
    PaintStyle            style        = PaintStyle::Fill;
    Color                 color        = colors::black;
    float                 stroke_width = 0.0f;
    StrokeCap             cap          = StrokeCap::Butt;
    StrokeJoin            join         = StrokeJoin::Miter;
    std::optional<Shader> shader;   // takes precedence over color

    bool operator==(const Paint&) const = default;
};

struct TextStyle
{
    Color color     = colors::black;
    float font_size = 10.0f;
    bool  bold      = false;

    bool operator==(const TextStyle&) const = default;
};

// A label shaped and measured by the canvas that will draw it.
struct TextLayout
{
    std::string text;
    TextStyle   style;
    float       width  = 0.0f;
    float       height = 0.0f;

    bool operator==(const TextLayout&) const = default;
};

// Drawing surface the renderer issues its program against. Implementations
// own rasterization, shading and glyph handling.
class Canvas
{
   public:
    virtual ~Canvas() = default;

    // Strokes or fills depending on paint.style.
    virtual void draw_path(const Path& path, const Paint& paint) = 0;

    virtual void draw_line(Point from, Point to, const Paint& paint) = 0;

    // Each point is a dot of diameter paint.stroke_width, shaped by paint.cap.
    virtual void draw_points(std::span<const Point> points, const Paint& paint) = 0;

    virtual TextLayout layout_text(std::string_view text, const TextStyle& style) = 0;

    // `origin` is the top-left corner of the layout box.
    virtual void draw_text(const TextLayout& layout, Point origin) = 0;
};

// Fixed-advance metrics: 0.6 em per glyph, 1.2 em line height.
TextLayout fixed_advance_layout(std::string_view text, const TextStyle& style);

}   // namespace sparkline
