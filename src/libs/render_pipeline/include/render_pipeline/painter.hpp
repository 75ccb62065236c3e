#pragma once

#include <graph_layout/types.hpp>
#include <graph_model/graph.hpp>
#include <graph_model/style.hpp>
#include <render_surface/surface.hpp>

namespace render_pipeline {

// Paints a computed layout in fixed order: background, every edge in insertion
// order (path, arrowhead, label), then every node in insertion order (shape, label).
// Layout coordinates are shifted by (offset_x, offset_y).
void paint_layout(render_surface::Surface& surface,
    const graph_model::Graph& graph,
    const graph_layout::Layout& layout,
    const graph_model::Style& style,
    double offset_x,
    double offset_y);

} // namespace render_pipeline
