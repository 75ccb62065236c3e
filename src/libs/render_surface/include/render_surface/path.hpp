#pragma once

#include <array>
#include <string>
#include <vector>

namespace render_surface {

struct PathPoint {
    double x = 0;
    double y = 0;
};

enum class PathVerb { MoveTo, LineTo, CubicTo, Close };

struct PathElement {
    PathVerb verb = PathVerb::MoveTo;
    // MoveTo/LineTo use points[0]; CubicTo uses all three.
    std::array<PathPoint, 3> points{};
};

class Path {
public:
    Path& move_to(double x, double y);
    // Starts a subpath at (x, y) when there is no current point.
    Path& line_to(double x, double y);
    Path& cubic_to(double x1, double y1, double x2, double y2, double x3, double y3);
    Path& close();

    const std::vector<PathElement>& elements() const { return elements_; }
    bool empty() const { return elements_.empty(); }

    static Path rectangle(double x, double y, double width, double height);
    static Path polygon(const std::vector<PathPoint>& points);

private:
    std::vector<PathElement> elements_;
    bool has_current_ = false;
};

// SVG path data ("M 1.00 2.00 L ..."), C locale, two decimals.
std::string to_svg_path_data(const Path& path);

} // namespace render_surface
