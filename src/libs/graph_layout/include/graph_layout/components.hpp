#pragma once

#include <graph_layout/types.hpp>
#include <graph_model/graph.hpp>
#include <cstddef>
#include <vector>

namespace graph_layout {

// Weakly connected component. Indices refer to graph.nodes() / graph.edges(),
// ascending (insertion order).
struct Component {
    std::vector<std::size_t> nodes;
    std::vector<std::size_t> edges;
};

// Components ordered by their first node's insertion index.
std::vector<Component> connected_components(const graph_model::Graph& graph);

// Top-left offsets for component extents (width/height used), shelf packing:
// left to right, wrapping at max(widest, shelf_aspect * sqrt(total area)).
std::vector<Point> pack_components(const std::vector<Rect>& extents, double gap);

// Moves each component so its bounding box starts at its packed offset.
// rects are indexed like graph.nodes().
void pack_in_place(const std::vector<Component>& components, std::vector<Rect>& rects, double gap);

// Bounding rect of the given rects (empty rect at origin when none).
Rect bounding_rect(const std::vector<Rect>& rects);

} // namespace graph_layout
