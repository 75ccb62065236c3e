#pragma once

#include <graph_layout/types.hpp>
#include <graph_model/graph.hpp>
#include <graph_model/style.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace graph_layout {

class LayoutTimeoutError : public std::runtime_error {
public:
    explicit LayoutTimeoutError(const std::string& what) : std::runtime_error(what) {}
};

struct LayoutContext {
    using Clock = std::chrono::steady_clock;

    // Seeds the force-directed initial placement.
    std::uint64_t seed = 0;
    Clock::time_point deadline = Clock::time_point::max();
    std::stop_token stop;
    // Total force-directed iterations allowed over all components.
    std::int64_t iteration_budget = 200000;

    bool expired() const {
        return stop.stop_requested() || Clock::now() >= deadline;
    }
};

class LayoutEngine {
public:
    virtual ~LayoutEngine() = default;

    virtual Layout compute(const graph_model::Graph& graph,
        const graph_model::Style& style,
        const LayoutContext& context) const = 0;

    virtual const char* name() const = 0;
};

std::unique_ptr<LayoutEngine> make_layout_engine(graph_model::LayoutAlgorithm algorithm);

// Shared tail of both engines: takes positioned node rects (indexed like
// graph.nodes()), routes edges and computes bounds. Logs residual overlaps.
Layout assemble_layout(const graph_model::Graph& graph,
    const graph_model::Style& style,
    const std::vector<Rect>& rects,
    const std::vector<int>& ranks,
    const std::vector<bool>& back_edges,
    bool layered);

// Pairs of node indices whose rects intersect.
std::vector<std::pair<std::size_t, std::size_t>> find_overlaps(const std::vector<Rect>& rects);

} // namespace graph_layout
