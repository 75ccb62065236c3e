#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace graph_layout {

struct Point {
    double x = 0;
    double y = 0;

    friend bool operator==(const Point&, const Point&) = default;
};

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double cx() const { return x + width * 0.5; }
    double cy() const { return y + height * 0.5; }
    double right() const { return x + width; }
    double bottom() const { return y + height; }

    bool intersects(const Rect& o, double gap = 0.0) const {
        return x < o.right() + gap && o.x < right() + gap
            && y < o.bottom() + gap && o.y < bottom() + gap;
    }

    friend bool operator==(const Rect&, const Rect&) = default;
};

struct PlacedNode {
    std::string node_id;
    Rect rect;
    // Layer index for hierarchical layout, 0 otherwise.
    int rank = 0;
};

struct PlacedEdge {
    std::size_t edge_index = 0;
    std::string source_node_id;
    std::string target_node_id;
    // Polyline, or the cubic Bezier control polygon p0 c1 c2 p3 when curved.
    std::vector<Point> points;
    bool curved = false;
    // Suppressed from ranking (cycle-closing edge or self-loop).
    bool back_edge = false;
    Point label_anchor;
};

// Read-only result of one layout run. nodes[i] and edges[i] follow graph insertion order.
struct Layout {
    std::vector<PlacedNode> nodes;
    std::vector<PlacedEdge> edges;
    Rect bounds;

    const PlacedNode* find_node(const std::string& node_id) const;
};

} // namespace graph_layout
