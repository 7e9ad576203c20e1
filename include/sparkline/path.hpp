#pragma once

#include <cstddef>
#include <cstdint>
#include <sparkline/geometry.hpp>
#include <vector>

namespace sparkline
{

enum class PathVerb : uint8_t
{
    MoveTo,
    LineTo,
    CubicTo,
    Close,
};

// MoveTo/LineTo use `to` only. CubicTo uses both control points.
struct PathCommand
{
    PathVerb verb = PathVerb::MoveTo;
    Point    control1;
    Point    control2;
    Point    to;

    bool operator==(const PathCommand&) const = default;
};

// Vector path geometry handed to Canvas::draw_path. Stores verbs only;
// stroking and filling are up to the canvas.
class Path
{
   public:
    Path& move_to(Point p);
    Path& line_to(Point p);
    Path& relative_line_to(float dx, float dy);
    Path& cubic_to(Point control1, Point control2, Point to);
    Path& close();

    // Appends every command of `other`. The pen ends where `other` ends.
    Path& add_path(const Path& other);

    const std::vector<PathCommand>& commands() const { return commands_; }
    bool                            empty() const { return commands_.empty(); }
    size_t                          size() const { return commands_.size(); }

    // Number of LineTo + CubicTo commands.
    size_t segment_count() const;

    // Pen position after the last command (start of the subpath after Close).
    Point current_point() const { return current_; }

    // Every point a command moves the pen to, in order.
    std::vector<Point> vertices() const;

    bool operator==(const Path&) const = default;

   private:
    std::vector<PathCommand> commands_;
    Point                    current_;
    Point                    subpath_start_;
};

}   // namespace sparkline
