#include <cstdio>
#include <fstream>
#include <sparkline/export.hpp>
#include <sparkline/logger.hpp>
#include <sparkline/renderer.hpp>

namespace sparkline
{

// ─── SVG Helpers ────────────────────────────────────────────────────────────

namespace
{

constexpr const char* kCategory = "sparkline.svg";

int channel(float v)
{
    if (v <= 0.0f)
        return 0;
    if (v >= 1.0f)
        return 255;
    return static_cast<int>(v * 255.0f + 0.5f);
}

// Convert a Color to an SVG rgb() string
std::string svg_color(const Color& c)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "rgb(%d,%d,%d)", channel(c.r), channel(c.g), channel(c.b));
    return buf;
}

// Convert a float to a compact string (no trailing zeros)
std::string fmt(float v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", static_cast<double>(v));
    return buf;
}

// XML-escape a string for safe embedding in SVG attributes/text content
std::string xml_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

std::string path_data(const Path& path)
{
    std::string d;
    for (const auto& cmd : path.commands())
    {
        if (!d.empty())
            d += ' ';
        switch (cmd.verb)
        {
            case PathVerb::MoveTo:
                d += "M" + fmt(cmd.to.x) + "," + fmt(cmd.to.y);
                break;
            case PathVerb::LineTo:
                d += "L" + fmt(cmd.to.x) + "," + fmt(cmd.to.y);
                break;
            case PathVerb::CubicTo:
                d += "C" + fmt(cmd.control1.x) + "," + fmt(cmd.control1.y) + " "
                     + fmt(cmd.control2.x) + "," + fmt(cmd.control2.y) + " " + fmt(cmd.to.x)
                     + "," + fmt(cmd.to.y);
                break;
            case PathVerb::Close:
                d += "Z";
                break;
        }
    }
    return d;
}

const char* svg_linecap(StrokeCap cap)
{
    switch (cap)
    {
        case StrokeCap::Butt:
            return "butt";
        case StrokeCap::Round:
            return "round";
        case StrokeCap::Square:
            return "square";
    }
    return "butt";
}

const char* svg_linejoin(StrokeJoin join)
{
    switch (join)
    {
        case StrokeJoin::Miter:
            return "miter";
        case StrokeJoin::Round:
            return "round";
        case StrokeJoin::Bevel:
            return "bevel";
    }
    return "miter";
}

// A shader carries its own alpha in the gradient stops.
float paint_opacity(const Paint& paint)
{
    return paint.shader ? 1.0f : paint.color.a;
}

}   // anonymous namespace

// ─── SvgCanvas ──────────────────────────────────────────────────────────────

SvgCanvas::SvgCanvas(Size size, std::optional<Color> background)
    : size_(size), background_(background)
{
}

std::string SvgCanvas::paint_source(const Paint& paint)
{
    if (!paint.shader)
        return svg_color(paint.color);

    const Shader& shader = *paint.shader;
    std::string   id     = "sparkline-gradient-" + std::to_string(gradient_count_++);

    defs_ << "    <linearGradient id=\"" << id << "\" gradientUnits=\"userSpaceOnUse\" x1=\""
          << fmt(shader.start.x) << "\" y1=\"" << fmt(shader.start.y) << "\" x2=\""
          << fmt(shader.end.x) << "\" y2=\"" << fmt(shader.end.y) << "\">\n";
    for (const auto& stop : shader.stops)
    {
        defs_ << "      <stop offset=\"" << fmt(stop.offset) << "\" stop-color=\""
              << svg_color(stop.color) << "\" stop-opacity=\"" << fmt(stop.color.a) << "\"/>\n";
    }
    defs_ << "    </linearGradient>\n";
    return "url(#" + id + ")";
}

void SvgCanvas::draw_path(const Path& path, const Paint& paint)
{
    if (path.empty())
        return;

    const std::string source = paint_source(paint);
    body_ << "  <path d=\"" << path_data(path) << "\"";
    if (paint.style == PaintStyle::Fill)
    {
        body_ << " fill=\"" << source << "\" fill-opacity=\"" << fmt(paint_opacity(paint))
              << "\" stroke=\"none\"";
    }
    else
    {
        body_ << " fill=\"none\" stroke=\"" << source << "\" stroke-opacity=\""
              << fmt(paint_opacity(paint)) << "\" stroke-width=\"" << fmt(paint.stroke_width)
              << "\" stroke-linecap=\"" << svg_linecap(paint.cap) << "\" stroke-linejoin=\""
              << svg_linejoin(paint.join) << "\"";
    }
    body_ << "/>\n";
}

void SvgCanvas::draw_line(Point from, Point to, const Paint& paint)
{
    body_ << "  <line x1=\"" << fmt(from.x) << "\" y1=\"" << fmt(from.y) << "\" x2=\""
          << fmt(to.x) << "\" y2=\"" << fmt(to.y) << "\" stroke=\"" << paint_source(paint)
          << "\" stroke-opacity=\"" << fmt(paint_opacity(paint)) << "\" stroke-width=\""
          << fmt(paint.stroke_width) << "\" stroke-linecap=\"" << svg_linecap(paint.cap)
          << "\"/>\n";
}

void SvgCanvas::draw_points(std::span<const Point> points, const Paint& paint)
{
    if (points.empty())
        return;

    const float r = paint.stroke_width / 2.0f;
    body_ << "  <g fill=\"" << paint_source(paint) << "\" fill-opacity=\""
          << fmt(paint_opacity(paint)) << "\">\n";
    for (const auto& p : points)
    {
        if (paint.cap == StrokeCap::Round)
        {
            body_ << "    <circle cx=\"" << fmt(p.x) << "\" cy=\"" << fmt(p.y) << "\" r=\""
                  << fmt(r) << "\"/>\n";
        }
        else
        {
            body_ << "    <rect x=\"" << fmt(p.x - r) << "\" y=\"" << fmt(p.y - r)
                  << "\" width=\"" << fmt(2.0f * r) << "\" height=\"" << fmt(2.0f * r)
                  << "\"/>\n";
        }
    }
    body_ << "  </g>\n";
}

TextLayout SvgCanvas::layout_text(std::string_view text, const TextStyle& style)
{
    return fixed_advance_layout(text, style);
}

void SvgCanvas::draw_text(const TextLayout& layout, Point origin)
{
    // SVG positions text by its baseline; the layout box starts at the top.
    const float baseline = origin.y + layout.style.font_size;
    body_ << "  <text x=\"" << fmt(origin.x) << "\" y=\"" << fmt(baseline)
          << "\" font-family=\"sans-serif\" font-size=\"" << fmt(layout.style.font_size) << "\"";
    if (layout.style.bold)
        body_ << " font-weight=\"bold\"";
    body_ << " fill=\"" << svg_color(layout.style.color) << "\" fill-opacity=\""
          << fmt(layout.style.color.a) << "\">" << xml_escape(layout.text) << "</text>\n";
}

std::string SvgCanvas::to_string() const
{
    std::ostringstream svg;
    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << fmt(size_.width)
        << "\" height=\"" << fmt(size_.height) << "\" viewBox=\"0 0 " << fmt(size_.width) << " "
        << fmt(size_.height) << "\">\n";

    const std::string defs = defs_.str();
    if (!defs.empty())
        svg << "  <defs>\n" << defs << "  </defs>\n";

    if (background_)
    {
        svg << "  <rect width=\"100%\" height=\"100%\" fill=\"" << svg_color(*background_)
            << "\" fill-opacity=\"" << fmt(background_->a) << "\"/>\n";
    }

    svg << body_.str();
    svg << "</svg>\n";
    return svg.str();
}

// ─── SvgExporter ────────────────────────────────────────────────────────────

std::string SvgExporter::to_string(std::span<const float> data,
                                   Size                   size,
                                   const SparklineStyle&  style)
{
    SparklineRenderer renderer(style);
    SvgCanvas         canvas(resolve_canvas_size(size, style));
    renderer.render(canvas, data, size);
    return canvas.to_string();
}

bool SvgExporter::write_svg(const std::string&     path,
                            std::span<const float> data,
                            Size                   size,
                            const SparklineStyle&  style)
{
    std::string content = to_string(data, size, style);

    std::ofstream file(path);
    if (!file.is_open())
    {
        SPARKLINE_LOG_ERROR(kCategory, "cannot open '{}' for writing", path);
        return false;
    }

    file << content;
    return file.good();
}

}   // namespace sparkline
