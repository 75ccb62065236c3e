#include <graph_layout/components.hpp>
#include <graph_layout/layout_constants.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace graph_layout {

namespace {

class DisjointSet {
public:
    explicit DisjointSet(std::size_t n) : parent_(n) {
        std::iota(parent_.begin(), parent_.end(), std::size_t{0});
    }

    std::size_t find(std::size_t v) {
        while (parent_[v] != v) {
            parent_[v] = parent_[parent_[v]];
            v = parent_[v];
        }
        return v;
    }

    // Smaller index becomes the representative so roots are stable.
    void unite(std::size_t a, std::size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (b < a) std::swap(a, b);
        parent_[b] = a;
    }

private:
    std::vector<std::size_t> parent_;
};

} // namespace

std::vector<Component> connected_components(const graph_model::Graph& graph) {
    const std::size_t n = graph.node_count();
    DisjointSet sets(n);
    std::vector<std::pair<std::size_t, std::size_t>> endpoints;
    endpoints.reserve(graph.edge_count());
    for (const auto& e : graph.edges()) {
        const std::size_t s = *graph.index_of(e.source_node_id);
        const std::size_t t = *graph.index_of(e.target_node_id);
        sets.unite(s, t);
        endpoints.emplace_back(s, t);
    }

    std::vector<Component> out;
    std::vector<std::size_t> slot(n, 0);
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t root = sets.find(i);
        if (root == i) {
            slot[i] = out.size();
            out.emplace_back();
        }
        out[slot[root]].nodes.push_back(i);
    }
    for (std::size_t ei = 0; ei < endpoints.size(); ++ei) {
        out[slot[sets.find(endpoints[ei].first)]].edges.push_back(ei);
    }
    return out;
}

std::vector<Point> pack_components(const std::vector<Rect>& extents, double gap) {
    std::vector<Point> offsets(extents.size());
    if (extents.empty()) return offsets;
    gap = std::max(gap, layout::min_component_gap);

    double widest = 0.0;
    double area = 0.0;
    for (const auto& r : extents) {
        widest = std::max(widest, r.width);
        area += (r.width + gap) * (r.height + gap);
    }
    const double row_limit = std::max(widest, layout::shelf_aspect * std::sqrt(area));

    double x = 0.0;
    double y = 0.0;
    double row_height = 0.0;
    for (std::size_t i = 0; i < extents.size(); ++i) {
        const auto& r = extents[i];
        if (x > 0.0 && x + r.width > row_limit) {
            x = 0.0;
            y += row_height + gap;
            row_height = 0.0;
        }
        offsets[i] = { x, y };
        x += r.width + gap;
        row_height = std::max(row_height, r.height);
    }
    return offsets;
}

void pack_in_place(const std::vector<Component>& components, std::vector<Rect>& rects, double gap) {
    std::vector<Rect> extents;
    extents.reserve(components.size());
    for (const auto& c : components) {
        std::vector<Rect> members;
        members.reserve(c.nodes.size());
        for (std::size_t ni : c.nodes) members.push_back(rects[ni]);
        extents.push_back(bounding_rect(members));
    }

    const auto offsets = pack_components(extents, gap);
    for (std::size_t ci = 0; ci < components.size(); ++ci) {
        const double dx = offsets[ci].x - extents[ci].x;
        const double dy = offsets[ci].y - extents[ci].y;
        for (std::size_t ni : components[ci].nodes) {
            rects[ni].x += dx;
            rects[ni].y += dy;
        }
    }
}

Rect bounding_rect(const std::vector<Rect>& rects) {
    if (rects.empty()) return {};
    double min_x = rects.front().x;
    double min_y = rects.front().y;
    double max_x = rects.front().right();
    double max_y = rects.front().bottom();
    for (const auto& r : rects) {
        min_x = std::min(min_x, r.x);
        min_y = std::min(min_y, r.y);
        max_x = std::max(max_x, r.right());
        max_y = std::max(max_y, r.bottom());
    }
    return { min_x, min_y, max_x - min_x, max_y - min_y };
}

} // namespace graph_layout
