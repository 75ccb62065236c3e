#pragma once

#include <graph_layout/layout_engine.hpp>
#include <cstdint>
#include <vector>

namespace graph_layout {

// Deterministic 64-bit generator for initial placement.
class SplitMix64 {
public:
    explicit SplitMix64(std::uint64_t seed) : state_(seed) {}

    std::uint64_t next() {
        std::uint64_t z = (state_ += 0x9e3779b97f4a7c15ull);
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
        return z ^ (z >> 31);
    }

    // Uniform in [0, 1).
    double next_unit() {
        return static_cast<double>(next() >> 11) * 0x1.0p-53;
    }

private:
    std::uint64_t state_;
};

// Fruchterman-Reingold forces integrated by a Box2D world (one box per node).
// Throws LayoutTimeoutError on deadline, stop request or exhausted budget.
class ForceDirectedLayout final : public LayoutEngine {
public:
    Layout compute(const graph_model::Graph& graph,
        const graph_model::Style& style,
        const LayoutContext& context) const override;

    const char* name() const override { return "force_directed"; }
};

// Pushes intersecting rects apart (with `gap`) along the axis of least overlap.
// Returns false if overlaps remain after `rounds`.
bool separate_overlaps(std::vector<Rect>& rects, double gap, int rounds);

} // namespace graph_layout
