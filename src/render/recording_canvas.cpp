#include <algorithm>
#include <cstddef>
#include <sparkline/logger.hpp>
#include <sparkline/recording_canvas.hpp>

namespace sparkline
{

void RecordingCanvas::draw_path(const Path& path, const Paint& paint)
{
    DrawOp op;
    op.kind  = DrawOpKind::Path;
    op.path  = path;
    op.paint = paint;
    ops_.push_back(std::move(op));
}

void RecordingCanvas::draw_line(Point from, Point to, const Paint& paint)
{
    DrawOp op;
    op.kind  = DrawOpKind::Line;
    op.from  = from;
    op.to    = to;
    op.paint = paint;
    ops_.push_back(std::move(op));
}

void RecordingCanvas::draw_points(std::span<const Point> points, const Paint& paint)
{
    DrawOp op;
    op.kind   = DrawOpKind::Points;
    op.points = std::vector<Point>(points.begin(), points.end());
    op.paint  = paint;
    ops_.push_back(std::move(op));
}

TextLayout RecordingCanvas::layout_text(std::string_view text, const TextStyle& style)
{
    return fixed_advance_layout(text, style);
}

void RecordingCanvas::draw_text(const TextLayout& layout, Point origin)
{
    DrawOp op;
    op.kind = DrawOpKind::Text;
    op.text = layout;
    op.from = origin;
    ops_.push_back(std::move(op));
}

size_t RecordingCanvas::count(DrawOpKind kind) const
{
    return static_cast<size_t>(
        std::count_if(ops_.begin(), ops_.end(), [kind](const DrawOp& op) { return op.kind == kind; }));
}

void RecordingCanvas::replay(Canvas& target) const
{
    for (const auto& op : ops_)
    {
        switch (op.kind)
        {
            case DrawOpKind::Path:
                target.draw_path(op.path, op.paint);
                break;
            case DrawOpKind::Line:
                target.draw_line(op.from, op.to, op.paint);
                break;
            case DrawOpKind::Points:
                target.draw_points(op.points, op.paint);
                break;
            case DrawOpKind::Text:
                target.draw_text(op.text, op.from);
                break;
        }
    }
}

bool PaintCache::paint(Canvas&                canvas,
                       std::span<const float> data,
                       Size                   size,
                       const SparklineStyle&  style)
{
    RenderInputs inputs{.data = std::vector<float>(data.begin(), data.end()), .size = size, .style = style};

    if (last_inputs_ && !should_repaint(*last_inputs_, inputs))
    {
        SPARKLINE_LOG_TRACE("sparkline.render", "inputs unchanged, replaying {} ops", recording_.ops().size());
        recording_.replay(canvas);
        return false;
    }

    if (!renderer_ || renderer_->style() != style)
        renderer_ = std::make_unique<SparklineRenderer>(style);

    // Drop the old program before rendering so a failed render leaves no
    // stale frame behind.
    last_inputs_.reset();
    recording_.clear();
    renderer_->render(recording_, data, size);
    last_inputs_ = std::move(inputs);

    recording_.replay(canvas);
    return true;
}

void PaintCache::invalidate()
{
    last_inputs_.reset();
    recording_.clear();
}

}   // namespace sparkline
