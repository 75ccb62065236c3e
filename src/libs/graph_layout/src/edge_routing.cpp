#include <graph_layout/edge_routing.hpp>
#include <graph_layout/layout_constants.hpp>
#include <algorithm>
#include <cmath>

namespace graph_layout {

namespace {

using namespace layout;
using graph_model::EdgeRouting;
using graph_model::RankDirection;

struct AnchorPair {
    Point from;
    Point to;
};

// Forward layered edge: side facing the next rank -> opposite side of the target.
AnchorPair rank_anchors(const Rect& from, const Rect& to, RankDirection dir) {
    if (dir == RankDirection::LeftToRight) {
        return { { from.right(), from.cy() }, { to.x, to.cy() } };
    }
    return { { from.cx(), from.bottom() }, { to.cx(), to.y } };
}

AnchorPair closest_anchors(const Rect& from, const Rect& to) {
    // 4 candidate pairs: from-right to to-left, from-left to to-right,
    // from-bottom to to-top, from-top to to-bottom.
    struct Candidate { AnchorPair pair; double dist; };
    Candidate candidates[4] = {
        { { { from.right(), from.cy() }, { to.x, to.cy() } }, 0.0 },
        { { { from.x, from.cy() }, { to.right(), to.cy() } }, 0.0 },
        { { { from.cx(), from.bottom() }, { to.cx(), to.y } }, 0.0 },
        { { { from.cx(), from.y }, { to.cx(), to.bottom() } }, 0.0 },
    };
    for (auto& c : candidates) {
        const double dx = c.pair.to.x - c.pair.from.x;
        const double dy = c.pair.to.y - c.pair.from.y;
        c.dist = dx * dx + dy * dy;
    }
    const Candidate* best = &candidates[0];
    for (int i = 1; i < 4; ++i) {
        if (candidates[i].dist < best->dist) best = &candidates[i];
    }
    return best->pair;
}

AnchorPair center_line_anchors(const Rect& from, graph_model::ShapeKind from_shape,
    const Rect& to, graph_model::ShapeKind to_shape)
{
    return {
        boundary_point(from, from_shape, { to.cx(), to.cy() }),
        boundary_point(to, to_shape, { from.cx(), from.cy() }),
    };
}

std::vector<Point> orthogonal_points(const AnchorPair& a, bool vertical) {
    std::vector<Point> pts{ a.from };
    if (vertical) {
        // If not roughly vertical, add a midpoint for an orthogonal bend.
        if (std::abs(a.to.x - a.from.x) > orthogonal_snap) {
            const double mid_y = (a.from.y + a.to.y) * 0.5;
            pts.push_back({ a.from.x, mid_y });
            pts.push_back({ a.to.x, mid_y });
        }
    } else if (std::abs(a.to.y - a.from.y) > orthogonal_snap) {
        const double mid_x = (a.from.x + a.to.x) * 0.5;
        pts.push_back({ mid_x, a.from.y });
        pts.push_back({ mid_x, a.to.y });
    }
    pts.push_back(a.to);
    return pts;
}

std::vector<Point> curve_points(const AnchorPair& a, bool vertical) {
    const double dx = a.to.x - a.from.x;
    const double dy = a.to.y - a.from.y;
    if (vertical) {
        return { a.from, { a.from.x, a.from.y + dy * 0.5 }, { a.to.x, a.to.y - dy * 0.5 }, a.to };
    }
    return { a.from, { a.from.x + dx * 0.5, a.from.y }, { a.to.x - dx * 0.5, a.to.y }, a.to };
}

// Loop on the right side of the node.
PlacedEdge self_loop(const Rect& r, graph_model::ShapeKind shape, EdgeRouting routing) {
    PlacedEdge out;
    const double q = r.height * 0.25;
    const Point upper = boundary_point(r, shape, { r.right(), r.cy() - q });
    const Point lower = boundary_point(r, shape, { r.right(), r.cy() + q });
    const double far_x = r.right() + self_loop_extent;

    if (routing == EdgeRouting::Curved) {
        out.points = { upper, { far_x + self_loop_extent * 0.35, upper.y - q },
            { far_x + self_loop_extent * 0.35, lower.y + q }, lower };
        out.curved = true;
        out.label_anchor = cubic_point(out.points[0], out.points[1], out.points[2], out.points[3], 0.5);
    } else {
        out.points = { upper, { far_x, upper.y }, { far_x, lower.y }, lower };
        out.label_anchor = { far_x, r.cy() };
    }
    out.back_edge = true;
    return out;
}

} // namespace

Point boundary_point(const Rect& rect, graph_model::ShapeKind shape, Point toward) {
    const double hw = rect.width * 0.5;
    const double hh = rect.height * 0.5;
    const double dx = toward.x - rect.cx();
    const double dy = toward.y - rect.cy();
    if ((dx == 0.0 && dy == 0.0) || hw <= 0.0 || hh <= 0.0) {
        return { rect.cx(), rect.cy() };
    }

    double t = 0.0;
    switch (shape) {
    case graph_model::ShapeKind::Ellipse:
        t = 1.0 / std::sqrt((dx / hw) * (dx / hw) + (dy / hh) * (dy / hh));
        break;
    case graph_model::ShapeKind::Diamond:
        t = 1.0 / (std::abs(dx) / hw + std::abs(dy) / hh);
        break;
    case graph_model::ShapeKind::Rectangle:
    case graph_model::ShapeKind::RoundedRectangle:
        t = std::min(dx != 0.0 ? hw / std::abs(dx) : HUGE_VAL, dy != 0.0 ? hh / std::abs(dy) : HUGE_VAL);
        break;
    }
    return { rect.cx() + dx * t, rect.cy() + dy * t };
}

Point polyline_midpoint(const std::vector<Point>& points) {
    if (points.empty()) return {};
    double total = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i)
        total += std::hypot(points[i].x - points[i - 1].x, points[i].y - points[i - 1].y);
    double remaining = total * 0.5;
    for (std::size_t i = 1; i < points.size(); ++i) {
        const double len = std::hypot(points[i].x - points[i - 1].x, points[i].y - points[i - 1].y);
        if (len > 0.0 && remaining <= len) {
            const double t = remaining / len;
            return { points[i - 1].x + (points[i].x - points[i - 1].x) * t,
                points[i - 1].y + (points[i].y - points[i - 1].y) * t };
        }
        remaining -= len;
    }
    return points.back();
}

Point cubic_point(Point p0, Point p1, Point p2, Point p3, double t) {
    const double u = 1.0 - t;
    const double a = u * u * u;
    const double b = 3.0 * u * u * t;
    const double c = 3.0 * u * t * t;
    const double d = t * t * t;
    return { a * p0.x + b * p1.x + c * p2.x + d * p3.x, a * p0.y + b * p1.y + c * p2.y + d * p3.y };
}

std::vector<PlacedEdge> route_edges(const graph_model::Graph& graph,
    const std::vector<Rect>& rects,
    const std::vector<bool>& back_edges,
    const RoutingOptions& options)
{
    std::vector<PlacedEdge> out;
    out.reserve(graph.edge_count());
    const bool lr = options.direction == RankDirection::LeftToRight;

    for (std::size_t ei = 0; ei < graph.edge_count(); ++ei) {
        const auto& edge = graph.edges()[ei];
        const std::size_t si = *graph.index_of(edge.source_node_id);
        const std::size_t ti = *graph.index_of(edge.target_node_id);
        const Rect& from = rects[si];
        const Rect& to = rects[ti];
        const auto from_shape = graph.nodes()[si].shape;
        const auto to_shape = graph.nodes()[ti].shape;

        PlacedEdge placed;
        if (si == ti) {
            placed = self_loop(from, from_shape, options.routing);
        } else {
            const bool back = ei < back_edges.size() && back_edges[ei];
            const bool forward = options.layered && !back
                && (lr ? to.x >= from.right() - 1e-6 : to.y >= from.bottom() - 1e-6);

            AnchorPair anchors;
            if (forward) {
                anchors = rank_anchors(from, to, options.direction);
            } else if (options.layered || options.routing == EdgeRouting::Orthogonal) {
                anchors = closest_anchors(from, to);
            } else {
                anchors = center_line_anchors(from, from_shape, to, to_shape);
            }

            const double dx = anchors.to.x - anchors.from.x;
            const double dy = anchors.to.y - anchors.from.y;
            const bool vertical = forward ? !lr : std::abs(dy) >= std::abs(dx);

            switch (options.routing) {
            case EdgeRouting::Straight:
                placed.points = { anchors.from, anchors.to };
                break;
            case EdgeRouting::Orthogonal:
                placed.points = orthogonal_points(anchors, vertical);
                break;
            case EdgeRouting::Curved:
                placed.points = curve_points(anchors, vertical);
                placed.curved = true;
                break;
            }
            placed.back_edge = back;
            placed.label_anchor = placed.curved
                ? cubic_point(placed.points[0], placed.points[1], placed.points[2], placed.points[3], 0.5)
                : polyline_midpoint(placed.points);
        }

        placed.edge_index = ei;
        placed.source_node_id = edge.source_node_id;
        placed.target_node_id = edge.target_node_id;
        out.push_back(std::move(placed));
    }
    return out;
}

} // namespace graph_layout
