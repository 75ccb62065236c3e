#pragma once

namespace graph_layout {

// Shared layout constants (used by the layout engines and the painter).
// All values in world units (px at 96 dpi).

namespace layout {

// Label text metrics estimate; font-independent so that layout is reproducible.
constexpr double char_width_ratio = 0.6;
constexpr double line_height_ratio = 1.4;

constexpr double label_padding_x = 12.0;
constexpr double label_padding_y = 8.0;
constexpr double min_node_width = 60.0;
constexpr double min_node_height = 36.0;
// Ellipse must contain the label rect's corners.
constexpr double ellipse_inflation = 1.42;
// Diamond: corner (w/2, h/2) lies on the boundary when half-extents are doubled.
constexpr double diamond_inflation = 2.0;
constexpr double rounded_corner_radius = 8.0;

// Hierarchical ordering.
constexpr int barycenter_rounds = 4;

// Edge routing.
constexpr double self_loop_extent = 26.0;
constexpr double orthogonal_snap = 1.0;
constexpr double arrow_length = 10.0;
constexpr double arrow_half_width = 5.0;

// Component packing.
constexpr double min_component_gap = 10.0;
constexpr double shelf_aspect = 1.5;

// Overlap separation after physics settle.
constexpr int separation_rounds = 200;

} // namespace layout
} // namespace graph_layout
