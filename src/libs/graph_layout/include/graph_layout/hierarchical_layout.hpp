#pragma once

#include <graph_layout/layout_engine.hpp>
#include <cstddef>
#include <vector>

namespace graph_layout {

// Layered (Sugiyama-style) layout. Bounded work; ignores the context deadline.
class HierarchicalLayout final : public LayoutEngine {
public:
    Layout compute(const graph_model::Graph& graph,
        const graph_model::Style& style,
        const LayoutContext& context) const override;

    const char* name() const override { return "hierarchical"; }
};

struct RankAssignment {
    // Indexed like graph.nodes() / graph.edges().
    std::vector<int> rank;
    std::vector<bool> suppressed;
};

// DFS in insertion order marks back-edges and self-loops as suppressed;
// ranks are longest paths from sources over the remaining edges.
RankAssignment assign_ranks(const graph_model::Graph& graph);

} // namespace graph_layout
