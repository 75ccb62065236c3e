#include <graph_layout/layout_engine.hpp>
#include <graph_layout/components.hpp>
#include <graph_layout/edge_routing.hpp>
#include <graph_layout/force_directed_layout.hpp>
#include <graph_layout/hierarchical_layout.hpp>
#include <clipper_log/log.hpp>
#include <algorithm>

namespace graph_layout {

const PlacedNode* Layout::find_node(const std::string& node_id) const {
    for (const auto& n : nodes) {
        if (n.node_id == node_id) return &n;
    }
    return nullptr;
}

std::unique_ptr<LayoutEngine> make_layout_engine(graph_model::LayoutAlgorithm algorithm) {
    switch (algorithm) {
    case graph_model::LayoutAlgorithm::ForceDirected:
        return std::make_unique<ForceDirectedLayout>();
    case graph_model::LayoutAlgorithm::Hierarchical:
        break;
    }
    return std::make_unique<HierarchicalLayout>();
}

std::vector<std::pair<std::size_t, std::size_t>> find_overlaps(const std::vector<Rect>& rects) {
    std::vector<std::pair<std::size_t, std::size_t>> out;
    for (std::size_t i = 0; i < rects.size(); ++i) {
        for (std::size_t j = i + 1; j < rects.size(); ++j) {
            if (rects[i].intersects(rects[j])) out.emplace_back(i, j);
        }
    }
    return out;
}

Layout assemble_layout(const graph_model::Graph& graph,
    const graph_model::Style& style,
    const std::vector<Rect>& rects,
    const std::vector<int>& ranks,
    const std::vector<bool>& back_edges,
    bool layered)
{
    Layout out;
    out.nodes.reserve(graph.node_count());
    for (std::size_t i = 0; i < graph.node_count(); ++i) {
        PlacedNode n;
        n.node_id = graph.nodes()[i].id;
        n.rect = rects[i];
        n.rank = i < ranks.size() ? ranks[i] : 0;
        out.nodes.push_back(std::move(n));
    }

    RoutingOptions routing;
    routing.routing = style.edge_routing;
    routing.direction = style.rank_direction;
    routing.layered = layered;
    out.edges = route_edges(graph, rects, back_edges, routing);

    std::vector<Rect> extents = rects;
    for (const auto& e : out.edges) {
        for (const auto& p : e.points) extents.push_back({ p.x, p.y, 0.0, 0.0 });
    }
    out.bounds = bounding_rect(extents);

    auto logger = clipper_log::logger();
    for (const auto& [a, b] : find_overlaps(rects)) {
        const Rect& ra = rects[a];
        const Rect& rb = rects[b];
        logger->warn(
            "overlap_detected a={} b={} "
            "a_rect=({}, {}, {}, {}) b_rect=({}, {}, {}, {})",
            out.nodes[a].node_id, out.nodes[b].node_id,
            ra.x, ra.y, ra.width, ra.height,
            rb.x, rb.y, rb.width, rb.height);
    }
    return out;
}

} // namespace graph_layout
