#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <sparkline/canvas.hpp>
#include <sparkline/renderer.hpp>
#include <vector>

namespace sparkline
{

enum class DrawOpKind : uint8_t
{
    Path,
    Line,
    Points,
    Text,
};

// One recorded canvas call. Only the fields of its kind are meaningful:
// Path uses path/paint, Line from/to/paint, Points points/paint, Text text/from.
struct DrawOp
{
    DrawOpKind         kind = DrawOpKind::Path;
    Path               path;
    Point              from;
    Point              to;
    std::vector<Point> points;
    Paint              paint;
    TextLayout         text;

    bool operator==(const DrawOp&) const = default;
};

// Canvas that keeps the draw program instead of rasterizing it. Text is
// measured with fixed_advance_layout.
class RecordingCanvas : public Canvas
{
   public:
    void       draw_path(const Path& path, const Paint& paint) override;
    void       draw_line(Point from, Point to, const Paint& paint) override;
    void       draw_points(std::span<const Point> points, const Paint& paint) override;
    TextLayout layout_text(std::string_view text, const TextStyle& style) override;
    void       draw_text(const TextLayout& layout, Point origin) override;

    const std::vector<DrawOp>& ops() const { return ops_; }
    size_t                     count(DrawOpKind kind) const;
    void                       clear() { ops_.clear(); }

    // Issues the recorded program, in order, against `target`.
    void replay(Canvas& target) const;

   private:
    std::vector<DrawOp> ops_;
};

// Repaint-skip wrapper for hosts that paint every frame: the renderer only
// runs when should_repaint() says the inputs changed; otherwise the recorded
// program is replayed. Replayed labels keep the recording canvas metrics.
class PaintCache
{
   public:
    // Returns true when the renderer ran, false when the cached program was
    // replayed. Style and data errors propagate from the renderer.
    bool paint(Canvas&                canvas,
               std::span<const float> data,
               Size                   size,
               const SparklineStyle&  style);

    void invalidate();

    const std::vector<DrawOp>& program() const { return recording_.ops(); }

   private:
    std::optional<RenderInputs>        last_inputs_;
    std::unique_ptr<SparklineRenderer> renderer_;
    RecordingCanvas                    recording_;
};

}   // namespace sparkline
