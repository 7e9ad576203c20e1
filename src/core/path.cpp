#include <cstddef>
#include <sparkline/path.hpp>

namespace sparkline
{

Path& Path::move_to(Point p)
{
    commands_.push_back({.verb = PathVerb::MoveTo, .to = p});
    current_       = p;
    subpath_start_ = p;
    return *this;
}

Path& Path::line_to(Point p)
{
    // A path without a MoveTo starts at the origin.
    if (commands_.empty())
        move_to(Point{});
    commands_.push_back({.verb = PathVerb::LineTo, .to = p});
    current_ = p;
    return *this;
}

Path& Path::relative_line_to(float dx, float dy)
{
    return line_to(Point{current_.x + dx, current_.y + dy});
}

Path& Path::cubic_to(Point control1, Point control2, Point to)
{
    if (commands_.empty())
        move_to(Point{});
    commands_.push_back(
        {.verb = PathVerb::CubicTo, .control1 = control1, .control2 = control2, .to = to});
    current_ = to;
    return *this;
}

Path& Path::close()
{
    if (commands_.empty())
        return *this;
    commands_.push_back({.verb = PathVerb::Close});
    current_ = subpath_start_;
    return *this;
}

Path& Path::add_path(const Path& other)
{
    commands_.insert(commands_.end(), other.commands_.begin(), other.commands_.end());
    if (!other.commands_.empty())
    {
        current_       = other.current_;
        subpath_start_ = other.subpath_start_;
    }
    return *this;
}

size_t Path::segment_count() const
{
    size_t count = 0;
    for (const auto& cmd : commands_)
    {
        if (cmd.verb == PathVerb::LineTo || cmd.verb == PathVerb::CubicTo)
            ++count;
    }
    return count;
}

std::vector<Point> Path::vertices() const
{
    std::vector<Point> out;
    out.reserve(commands_.size());
    for (const auto& cmd : commands_)
    {
        if (cmd.verb != PathVerb::Close)
            out.push_back(cmd.to);
    }
    return out;
}

}   // namespace sparkline
