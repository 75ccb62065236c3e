#include <graph_layout/hierarchical_layout.hpp>
#include <graph_layout/components.hpp>
#include <graph_layout/layout_constants.hpp>
#include <graph_layout/node_sizing.hpp>
#include <algorithm>
#include <functional>
#include <queue>
#include <utility>

namespace graph_layout {

namespace {

using namespace layout;

struct Adjacency {
    // (edge index, other endpoint) in edge insertion order.
    std::vector<std::vector<std::pair<std::size_t, std::size_t>>> out;
};

Adjacency build_adjacency(const graph_model::Graph& graph) {
    Adjacency adj;
    adj.out.resize(graph.node_count());
    for (std::size_t ei = 0; ei < graph.edge_count(); ++ei) {
        const auto& e = graph.edges()[ei];
        const std::size_t s = *graph.index_of(e.source_node_id);
        const std::size_t t = *graph.index_of(e.target_node_id);
        adj.out[s].emplace_back(ei, t);
    }
    return adj;
}

class RowOrdering {
public:
    RowOrdering(const graph_model::Graph& graph,
        const Component& component,
        const RankAssignment& ranks,
        const std::vector<Rect>& sizes,
        const graph_model::Style& style)
        : sizes_(sizes)
        , spacing_(style.node_spacing)
        , left_to_right_(style.rank_direction == graph_model::RankDirection::LeftToRight)
        , pos_(graph.node_count(), 0.0)
        , preds_(graph.node_count())
        , succs_(graph.node_count())
    {
        int max_rank = 0;
        for (std::size_t ni : component.nodes) max_rank = std::max(max_rank, ranks.rank[ni]);
        rows_.resize(static_cast<std::size_t>(max_rank) + 1);
        for (std::size_t ni : component.nodes)
            rows_[static_cast<std::size_t>(ranks.rank[ni])].push_back(ni);

        for (std::size_t ei : component.edges) {
            if (ranks.suppressed[ei]) continue;
            const auto& e = graph.edges()[ei];
            const std::size_t s = *graph.index_of(e.source_node_id);
            const std::size_t t = *graph.index_of(e.target_node_id);
            succs_[s].push_back(t);
            preds_[t].push_back(s);
        }

        for (auto& row : rows_) place_row(row);
    }

    void sweep(int rounds) {
        const std::size_t depth = rows_.size();
        for (int iter = 0; iter < rounds; ++iter) {
            // Down-sweep over predecessors.
            for (std::size_t r = 1; r < depth; ++r) reorder(rows_[r], preds_);
            // Up-sweep over successors.
            for (std::size_t r = depth - 1; r-- > 0;) reorder(rows_[r], succs_);
        }
    }

    // Writes rect x/y for every component node, rows centered on the widest.
    void assign_coordinates(std::vector<Rect>& rects, double rank_spacing) const {
        double widest = 0.0;
        std::vector<double> totals;
        totals.reserve(rows_.size());
        for (const auto& row : rows_) {
            double total = 0.0;
            for (std::size_t ni : row) total += across(ni);
            if (row.size() > 1) total += static_cast<double>(row.size() - 1) * spacing_;
            totals.push_back(total);
            widest = std::max(widest, total);
        }

        double band_start = 0.0;
        for (std::size_t r = 0; r < rows_.size(); ++r) {
            double band = 0.0;
            for (std::size_t ni : rows_[r]) band = std::max(band, along(ni));

            double a = (widest - totals[r]) * 0.5;
            for (std::size_t ni : rows_[r]) {
                const double centered = band_start + (band - along(ni)) * 0.5;
                if (left_to_right_) {
                    rects[ni].x = centered;
                    rects[ni].y = a;
                } else {
                    rects[ni].x = a;
                    rects[ni].y = centered;
                }
                a += across(ni) + spacing_;
            }
            band_start += band + rank_spacing;
        }
    }

private:
    double across(std::size_t ni) const {
        return left_to_right_ ? sizes_[ni].height : sizes_[ni].width;
    }

    double along(std::size_t ni) const {
        return left_to_right_ ? sizes_[ni].width : sizes_[ni].height;
    }

    void place_row(const std::vector<std::size_t>& row) {
        double a = 0.0;
        for (std::size_t ni : row) {
            pos_[ni] = a + across(ni) * 0.5;
            a += across(ni) + spacing_;
        }
    }

    void reorder(std::vector<std::size_t>& row, const std::vector<std::vector<std::size_t>>& neighbours) {
        std::vector<std::pair<double, std::size_t>> bary_ids;
        bary_ids.reserve(row.size());
        for (std::size_t ni : row) {
            double sum = 0.0;
            int count = 0;
            for (std::size_t nb : neighbours[ni]) {
                sum += pos_[nb];
                ++count;
            }
            const double bary = (count > 0) ? sum / count : pos_[ni];
            bary_ids.emplace_back(bary, ni);
        }
        // Ties keep the previous order.
        std::stable_sort(bary_ids.begin(), bary_ids.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
        row.clear();
        for (const auto& bi : bary_ids) row.push_back(bi.second);
        place_row(row);
    }

    const std::vector<Rect>& sizes_;
    double spacing_;
    bool left_to_right_;
    std::vector<std::vector<std::size_t>> rows_;
    std::vector<double> pos_;
    std::vector<std::vector<std::size_t>> preds_;
    std::vector<std::vector<std::size_t>> succs_;
};

} // namespace

RankAssignment assign_ranks(const graph_model::Graph& graph) {
    const std::size_t n = graph.node_count();
    RankAssignment out;
    out.rank.assign(n, 0);
    out.suppressed.assign(graph.edge_count(), false);

    const Adjacency adj = build_adjacency(graph);

    // Cycle breaking: iterative DFS, roots and children in insertion order.
    enum class Mark { Unvisited, OnStack, Done };
    std::vector<Mark> mark(n, Mark::Unvisited);
    std::vector<std::pair<std::size_t, std::size_t>> stack; // (node, next out-edge slot)
    for (std::size_t root = 0; root < n; ++root) {
        if (mark[root] != Mark::Unvisited) continue;
        mark[root] = Mark::OnStack;
        stack.emplace_back(root, 0);
        while (!stack.empty()) {
            auto& [v, next] = stack.back();
            if (next == adj.out[v].size()) {
                mark[v] = Mark::Done;
                stack.pop_back();
                continue;
            }
            const auto [ei, w] = adj.out[v][next++];
            if (w == v || mark[w] == Mark::OnStack) {
                out.suppressed[ei] = true;
            } else if (mark[w] == Mark::Unvisited) {
                mark[w] = Mark::OnStack;
                stack.emplace_back(w, 0);
            }
        }
    }

    // Longest path from sources (Kahn, smallest index first).
    std::vector<int> in_degree(n, 0);
    for (std::size_t v = 0; v < n; ++v) {
        for (const auto& [ei, w] : adj.out[v]) {
            if (!out.suppressed[ei]) ++in_degree[w];
        }
    }
    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
    for (std::size_t v = 0; v < n; ++v) {
        if (in_degree[v] == 0) ready.push(v);
    }
    while (!ready.empty()) {
        const std::size_t v = ready.top();
        ready.pop();
        for (const auto& [ei, w] : adj.out[v]) {
            if (out.suppressed[ei]) continue;
            out.rank[w] = std::max(out.rank[w], out.rank[v] + 1);
            if (--in_degree[w] == 0) ready.push(w);
        }
    }
    return out;
}

Layout HierarchicalLayout::compute(const graph_model::Graph& graph,
    const graph_model::Style& style,
    const LayoutContext& /*context*/) const
{
    const auto components = connected_components(graph);
    const RankAssignment ranks = assign_ranks(graph);
    std::vector<Rect> rects = node_sizes(graph, style);

    for (const auto& component : components) {
        RowOrdering ordering(graph, component, ranks, rects, style);
        ordering.sweep(barycenter_rounds);
        ordering.assign_coordinates(rects, style.rank_spacing);
    }

    pack_in_place(components, rects, style.node_spacing);
    return assemble_layout(graph, style, rects, ranks.rank, ranks.suppressed, true);
}

} // namespace graph_layout
