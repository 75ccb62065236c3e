#include <gtest/gtest.h>
#include <graph_layout/edge_routing.hpp>
#include <graph_model/graph.hpp>

using namespace graph_layout;
using graph_model::EdgeRouting;
using graph_model::ShapeKind;

namespace {

graph_model::Graph pair_graph(bool self_loop = false) {
    graph_model::GraphBuilder b;
    b.add_node("a").add_node("b");
    b.add_edge("a", self_loop ? "a" : "b");
    return b.finalize();
}

const std::vector<Rect> kRects{ { 0, 0, 60, 36 }, { 200, 100, 60, 36 } };

RoutingOptions with_routing(EdgeRouting routing) {
    RoutingOptions o;
    o.routing = routing;
    return o;
}

} // namespace

TEST(BoundaryPointTest, RectangleEllipseDiamond) {
    const Rect r{ 0, 0, 100, 50 };
    const Point right = boundary_point(r, ShapeKind::Rectangle, { 200, 25 });
    EXPECT_NEAR(right.x, 100.0, 1e-9);
    EXPECT_NEAR(right.y, 25.0, 1e-9);
    const Point top = boundary_point(r, ShapeKind::Rectangle, { 50, -300 });
    EXPECT_NEAR(top.x, 50.0, 1e-9);
    EXPECT_NEAR(top.y, 0.0, 1e-9);

    const Point e = boundary_point(r, ShapeKind::Ellipse, { 50, 100 });
    EXPECT_NEAR(e.x, 50.0, 1e-9);
    EXPECT_NEAR(e.y, 50.0, 1e-9);

    const Point d = boundary_point(r, ShapeKind::Diamond, { 100, 50 });
    EXPECT_NEAR(d.x, 75.0, 1e-9);
    EXPECT_NEAR(d.y, 37.5, 1e-9);

    EXPECT_EQ(boundary_point(r, ShapeKind::Rectangle, { 50, 25 }), (Point{ 50, 25 }));
}

TEST(CurveMathTest, MidpointsAndEndpoints) {
    EXPECT_EQ(polyline_midpoint({ { 0, 0 }, { 10, 0 }, { 10, 10 } }), (Point{ 10, 0 }));
    EXPECT_EQ(polyline_midpoint({}), Point{});
    const Point p0{ 0, 0 }, p1{ 0, 10 }, p2{ 10, 10 }, p3{ 10, 0 };
    EXPECT_EQ(cubic_point(p0, p1, p2, p3, 0.0), p0);
    EXPECT_EQ(cubic_point(p0, p1, p2, p3, 1.0), p3);
    const Point mid = cubic_point(p0, p1, p2, p3, 0.5);
    EXPECT_NEAR(mid.x, 5.0, 1e-9);
    EXPECT_NEAR(mid.y, 7.5, 1e-9);
}

TEST(RouteEdgesTest, StraightEdgesEndOnTheOutline) {
    const auto edges = route_edges(pair_graph(), kRects, {}, with_routing(EdgeRouting::Straight));
    ASSERT_EQ(edges.size(), 1u);
    const auto& e = edges[0];
    ASSERT_EQ(e.points.size(), 2u);
    EXPECT_FALSE(e.curved);
    EXPECT_FALSE(e.back_edge);
    EXPECT_EQ(e.source_node_id, "a");
    EXPECT_EQ(e.target_node_id, "b");
    // Start on a's right side, end on b's left side.
    EXPECT_NEAR(e.points[0].x, 60.0, 1e-9);
    EXPECT_NEAR(e.points[1].x, 200.0, 1e-9);
    EXPECT_EQ(e.label_anchor, polyline_midpoint(e.points));
}

TEST(RouteEdgesTest, OrthogonalSegmentsAreAxisAligned) {
    const auto edges = route_edges(pair_graph(), kRects, {}, with_routing(EdgeRouting::Orthogonal));
    const auto& pts = edges[0].points;
    ASSERT_EQ(pts.size(), 4u);
    for (std::size_t i = 1; i < pts.size(); ++i) {
        EXPECT_TRUE(pts[i].x == pts[i - 1].x || pts[i].y == pts[i - 1].y) << "segment " << i;
    }
    EXPECT_EQ(pts.front(), (Point{ 60, 18 }));
    EXPECT_EQ(pts.back(), (Point{ 200, 118 }));
}

TEST(RouteEdgesTest, CurvedEdgesCarryControlPolygon) {
    const auto edges = route_edges(pair_graph(), kRects, {}, with_routing(EdgeRouting::Curved));
    const auto& e = edges[0];
    ASSERT_EQ(e.points.size(), 4u);
    EXPECT_TRUE(e.curved);
    EXPECT_EQ(e.label_anchor, cubic_point(e.points[0], e.points[1], e.points[2], e.points[3], 0.5));
}

TEST(RouteEdgesTest, SelfLoopLeavesAndReentersTheNode) {
    for (auto routing : { EdgeRouting::Straight, EdgeRouting::Orthogonal, EdgeRouting::Curved }) {
        const auto edges = route_edges(pair_graph(true), kRects, {}, with_routing(routing));
        const auto& e = edges[0];
        ASSERT_EQ(e.points.size(), 4u);
        EXPECT_TRUE(e.back_edge);
        EXPECT_NEAR(e.points.front().x, kRects[0].right(), 1e-9);
        EXPECT_NEAR(e.points.back().x, kRects[0].right(), 1e-9);
        EXPECT_LT(e.points.front().y, e.points.back().y);
    }
}

TEST(RouteEdgesTest, BackEdgeFlagIsCarried) {
    RoutingOptions o;
    o.layered = true;
    const auto edges = route_edges(pair_graph(), kRects, { true }, o);
    EXPECT_TRUE(edges[0].back_edge);
}
