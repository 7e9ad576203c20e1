#pragma once

#include <optional>
#include <sparkline/canvas.hpp>
#include <sparkline/style.hpp>
#include <span>
#include <sstream>
#include <string>

namespace sparkline
{

// Canvas that writes an SVG document. Paths become <path>, point markers
// <circle>, shaders <linearGradient> defs in user space, labels <text>.
class SvgCanvas : public Canvas
{
   public:
    explicit SvgCanvas(Size size, std::optional<Color> background = colors::white);

    void       draw_path(const Path& path, const Paint& paint) override;
    void       draw_line(Point from, Point to, const Paint& paint) override;
    void       draw_points(std::span<const Point> points, const Paint& paint) override;
    TextLayout layout_text(std::string_view text, const TextStyle& style) override;
    void       draw_text(const TextLayout& layout, Point origin) override;

    // Complete document for everything drawn so far.
    std::string to_string() const;

   private:
    // Returns the fill/stroke attribute value for `paint`, registering a
    // gradient definition when it carries a shader.
    std::string paint_source(const Paint& paint);

    Size                 size_;
    std::optional<Color> background_;
    std::ostringstream   defs_;
    std::ostringstream   body_;
    int                  gradient_count_ = 0;
};

class SvgExporter
{
   public:
    // Renders `data` with `style` straight into an SVG document.
    // Input errors propagate as std::invalid_argument.
    static std::string to_string(std::span<const float> data,
                                 Size                   size,
                                 const SparklineStyle&  style = {});

    // Writes the document to `path`. Returns false if the file cannot be written.
    static bool write_svg(const std::string&     path,
                          std::span<const float> data,
                          Size                   size,
                          const SparklineStyle&  style = {});
};

}   // namespace sparkline
