#include <render_surface/path.hpp>
#include <iomanip>
#include <locale>
#include <sstream>

namespace render_surface {

Path& Path::move_to(double x, double y) {
    PathElement e;
    e.verb = PathVerb::MoveTo;
    e.points[0] = { x, y };
    elements_.push_back(e);
    has_current_ = true;
    return *this;
}

Path& Path::line_to(double x, double y) {
    if (!has_current_) return move_to(x, y);
    PathElement e;
    e.verb = PathVerb::LineTo;
    e.points[0] = { x, y };
    elements_.push_back(e);
    return *this;
}

Path& Path::cubic_to(double x1, double y1, double x2, double y2, double x3, double y3) {
    if (!has_current_) move_to(x1, y1);
    PathElement e;
    e.verb = PathVerb::CubicTo;
    e.points = { PathPoint{ x1, y1 }, PathPoint{ x2, y2 }, PathPoint{ x3, y3 } };
    elements_.push_back(e);
    return *this;
}

Path& Path::close() {
    if (!has_current_) return *this;
    PathElement e;
    e.verb = PathVerb::Close;
    elements_.push_back(e);
    has_current_ = false;
    return *this;
}

Path Path::rectangle(double x, double y, double width, double height) {
    Path p;
    p.move_to(x, y).line_to(x + width, y).line_to(x + width, y + height).line_to(x, y + height).close();
    return p;
}

Path Path::polygon(const std::vector<PathPoint>& points) {
    Path p;
    for (const auto& pt : points) p.line_to(pt.x, pt.y);
    return p.close();
}

std::string to_svg_path_data(const Path& path) {
    std::ostringstream os;
    os.imbue(std::locale::classic());
    os << std::fixed << std::setprecision(2);
    bool first = true;
    for (const auto& e : path.elements()) {
        if (!first) os << ' ';
        first = false;
        switch (e.verb) {
        case PathVerb::MoveTo:
            os << "M " << e.points[0].x << ' ' << e.points[0].y;
            break;
        case PathVerb::LineTo:
            os << "L " << e.points[0].x << ' ' << e.points[0].y;
            break;
        case PathVerb::CubicTo:
            os << "C " << e.points[0].x << ' ' << e.points[0].y << ' '
               << e.points[1].x << ' ' << e.points[1].y << ' '
               << e.points[2].x << ' ' << e.points[2].y;
            break;
        case PathVerb::Close:
            os << 'Z';
            break;
        }
    }
    return os.str();
}

} // namespace render_surface
