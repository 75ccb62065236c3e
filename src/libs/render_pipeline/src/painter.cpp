#include <render_pipeline/painter.hpp>
#include <graph_layout/layout_constants.hpp>
#include <graph_layout/node_sizing.hpp>
#include <cmath>

namespace render_pipeline {

namespace {

using graph_layout::Point;
using render_surface::Path;

constexpr double kEdgeLabelScale = 0.85;
constexpr double kEdgeLabelPad = 2.0;

struct Painter {
    render_surface::Surface& surface;
    const graph_model::Style& style;
    double dx;
    double dy;

    Point shift(const Point& p) const { return { p.x + dx, p.y + dy }; }

    Path edge_path(const graph_layout::PlacedEdge& e) const {
        Path path;
        if (e.points.empty()) return path;
        const Point p0 = shift(e.points[0]);
        path.move_to(p0.x, p0.y);
        if (e.curved) {
            for (std::size_t i = 1; i + 2 < e.points.size(); i += 3) {
                const Point c1 = shift(e.points[i]);
                const Point c2 = shift(e.points[i + 1]);
                const Point p3 = shift(e.points[i + 2]);
                path.cubic_to(c1.x, c1.y, c2.x, c2.y, p3.x, p3.y);
            }
        } else {
            for (std::size_t i = 1; i < e.points.size(); ++i) {
                const Point p = shift(e.points[i]);
                path.line_to(p.x, p.y);
            }
        }
        return path;
    }

    void arrowhead(const graph_layout::PlacedEdge& e, const graph_model::EdgeStyle& es) {
        if (e.points.size() < 2) return;
        const Point tip = shift(e.points.back());
        // Direction from the last distinct point (a curve's c2 may coincide with p3).
        double ux = 0.0;
        double uy = 0.0;
        double len = 0.0;
        for (std::size_t i = e.points.size() - 1; i-- > 0 && len <= 0.0;) {
            const Point from = shift(e.points[i]);
            ux = tip.x - from.x;
            uy = tip.y - from.y;
            len = std::hypot(ux, uy);
        }
        if (len <= 0.0) return;
        ux /= len;
        uy /= len;

        const double l = graph_layout::layout::arrow_length;
        const double hw = graph_layout::layout::arrow_half_width;
        const Point base{ tip.x - ux * l, tip.y - uy * l };
        const Point left{ base.x - uy * hw, base.y + ux * hw };
        const Point right{ base.x + uy * hw, base.y - ux * hw };

        switch (es.arrow) {
        case graph_model::ArrowKind::Normal:
            surface.fill_path(Path::polygon({ { tip.x, tip.y }, { left.x, left.y }, { right.x, right.y } }),
                render_surface::FillStyle{ es.color });
            break;
        case graph_model::ArrowKind::Open: {
            Path chevron;
            chevron.move_to(left.x, left.y).line_to(tip.x, tip.y).line_to(right.x, right.y);
            surface.draw_path(chevron, render_surface::StrokeStyle{ es.color, es.width });
            break;
        }
        case graph_model::ArrowKind::Diamond: {
            const Point back{ tip.x - ux * l * 2.0, tip.y - uy * l * 2.0 };
            surface.fill_path(Path::polygon({ { tip.x, tip.y }, { left.x, left.y }, { back.x, back.y },
                                  { right.x, right.y } }),
                render_surface::FillStyle{ es.color });
            break;
        }
        case graph_model::ArrowKind::None:
            break;
        }
    }

    void edge_label(const graph_layout::PlacedEdge& e, const std::string& label, const graph_model::EdgeStyle& es) {
        if (label.empty()) return;
        const Point at = shift(e.label_anchor);
        const double size = style.font_size * kEdgeLabelScale;
        const double w = surface.measure_text(label, size) + 2.0 * kEdgeLabelPad;
        const double h = size * graph_layout::layout::line_height_ratio;
        surface.fill_path(Path::rectangle(at.x - w * 0.5, at.y - h * 0.5, w, h),
            render_surface::FillStyle{ style.background });

        render_surface::TextStyle ts;
        ts.color = es.color;
        ts.size = size;
        ts.font_family = style.font_family;
        surface.draw_text(at.x, at.y, label, ts);
    }

    void node(const graph_model::Node& n, const graph_layout::PlacedNode& placed) {
        const Point origin = shift({ placed.rect.x, placed.rect.y });
        render_surface::Box box{ origin.x, origin.y, placed.rect.width, placed.rect.height };

        render_surface::ShapeStyle ss;
        ss.fill = n.style.fill;
        ss.border = n.style.border;
        ss.border_width = n.style.border_width;
        ss.corner_radius = graph_layout::layout::rounded_corner_radius;
        surface.stroke_shape(n.shape, box, ss);

        const auto lines = graph_layout::split_lines(n.label);
        if (lines.empty()) return;
        render_surface::TextStyle ts;
        ts.color = n.style.text;
        ts.size = style.font_size;
        ts.font_family = style.font_family;
        const double line_height = style.font_size * graph_layout::layout::line_height_ratio;
        const double cx = box.x + box.width * 0.5;
        double y = box.y + box.height * 0.5 - line_height * static_cast<double>(lines.size() - 1) * 0.5;
        for (const auto& line : lines) {
            surface.draw_text(cx, y, line, ts);
            y += line_height;
        }
    }
};

} // namespace

void paint_layout(render_surface::Surface& surface,
    const graph_model::Graph& graph,
    const graph_layout::Layout& layout,
    const graph_model::Style& style,
    double offset_x,
    double offset_y)
{
    Painter painter{ surface, style, offset_x, offset_y };

    surface.fill_path(Path::rectangle(0.0, 0.0, surface.width(), surface.height()),
        render_surface::FillStyle{ style.background });

    // Edges first so they sit beneath nodes.
    for (const auto& placed : layout.edges) {
        const auto& edge = graph.edges()[placed.edge_index];
        surface.draw_path(painter.edge_path(placed),
            render_surface::StrokeStyle{ edge.style.color, edge.style.width, edge.style.dash });
        if (edge.directed && edge.style.arrow != graph_model::ArrowKind::None) {
            painter.arrowhead(placed, edge.style);
        }
        painter.edge_label(placed, edge.label, edge.style);
    }

    for (std::size_t i = 0; i < layout.nodes.size(); ++i) {
        painter.node(graph.nodes()[i], layout.nodes[i]);
    }
}

} // namespace render_pipeline
