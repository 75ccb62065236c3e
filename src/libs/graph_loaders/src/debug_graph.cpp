#include <graph_loaders/debug_graph.hpp>

namespace graph_loaders {

graph_model::GraphDescription generate_debug_graph() {
    using graph_model::ArrowKind;
    using graph_model::DashPattern;
    using graph_model::ShapeKind;

    graph_model::GraphDescription out;
    out.name = "Build pipeline (debug)";

    auto add_node = [&](const char* id, const char* label, ShapeKind shape,
        graph_model::Color fill = { 236, 240, 247, 255 })
    {
        graph_model::NodeRecord n;
        n.id = id;
        n.attrs.label = label;
        n.attrs.shape = shape;
        n.attrs.style.fill = fill;
        out.nodes.push_back(std::move(n));
    };
    auto add_edge = [&](const char* source, const char* target, const char* label = "",
        DashPattern dash = DashPattern::Solid, ArrowKind arrow = ArrowKind::Normal, bool directed = true)
    {
        graph_model::EdgeRecord e;
        e.source = source;
        e.target = target;
        e.attrs.label = label;
        e.attrs.directed = directed;
        e.attrs.style.dash = dash;
        e.attrs.style.arrow = arrow;
        out.edges.push_back(std::move(e));
    };

    const graph_model::Color start_fill{ 214, 234, 216, 255 };
    const graph_model::Color check_fill{ 252, 243, 207, 255 };
    const graph_model::Color fail_fill{ 248, 215, 218, 255 };

    add_node("checkout", "Checkout", ShapeKind::Ellipse, start_fill);
    add_node("configure", "Configure", ShapeKind::Rectangle);
    add_node("build", "Build", ShapeKind::Rectangle);
    add_node("unit", "Unit tests", ShapeKind::RoundedRectangle);
    add_node("integration", "Integration\ntests", ShapeKind::RoundedRectangle);
    add_node("gate", "All green?", ShapeKind::Diamond, check_fill);
    add_node("package", "Package", ShapeKind::Rectangle);
    add_node("publish", "Publish", ShapeKind::Ellipse, start_fill);
    add_node("triage", "Triage", ShapeKind::Rectangle, fail_fill);
    add_node("cache", "Artifact cache", ShapeKind::RoundedRectangle);
    add_node("mirror", "Mirror", ShapeKind::RoundedRectangle);

    add_edge("checkout", "configure");
    add_edge("configure", "build");
    add_edge("build", "unit");
    add_edge("build", "integration");
    add_edge("unit", "gate");
    add_edge("integration", "gate");
    add_edge("gate", "package", "yes");
    add_edge("gate", "triage", "no");
    add_edge("package", "publish");
    add_edge("triage", "build", "retry", DashPattern::Dashed, ArrowKind::Open);
    add_edge("build", "build", "incremental", DashPattern::Dotted);
    add_edge("cache", "mirror", "sync", DashPattern::Solid, ArrowKind::None, false);

    return out;
}

} // namespace graph_loaders
