#pragma once

#include <graph_layout/types.hpp>
#include <graph_model/graph.hpp>
#include <graph_model/style.hpp>
#include <vector>

namespace graph_layout {

struct RoutingOptions {
    graph_model::EdgeRouting routing = graph_model::EdgeRouting::Straight;
    graph_model::RankDirection direction = graph_model::RankDirection::TopToBottom;
    // Forward edges leave the side facing the next rank and enter the opposite one.
    bool layered = false;
};

// Routes every edge of the graph. rects are indexed like graph.nodes();
// back_edges (indexed like graph.edges()) may be empty.
std::vector<PlacedEdge> route_edges(const graph_model::Graph& graph,
    const std::vector<Rect>& rects,
    const std::vector<bool>& back_edges,
    const RoutingOptions& options);

// Where the ray from the shape's center toward `toward` crosses its outline.
Point boundary_point(const Rect& rect, graph_model::ShapeKind shape, Point toward);

// Point at half the arc length of a polyline.
Point polyline_midpoint(const std::vector<Point>& points);
Point cubic_point(Point p0, Point p1, Point p2, Point p3, double t);

} // namespace graph_layout
