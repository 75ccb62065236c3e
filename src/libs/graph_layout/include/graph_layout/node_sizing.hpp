#pragma once

#include <graph_layout/types.hpp>
#include <graph_model/graph.hpp>
#include <graph_model/style.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace graph_layout {

// Label split on '\n'. An empty label yields no lines.
std::vector<std::string> split_lines(std::string_view text);
// UTF-8 code points (continuation bytes are not counted).
std::size_t count_code_points(std::string_view text);

// Estimated text block extent (widest line x line count) for a font size.
double estimate_text_width(std::string_view text, double font_size);
double estimate_text_height(std::string_view text, double font_size);

// Width/height in rect.width/rect.height; x, y are zero. Explicit size hints win.
Rect node_size(const graph_model::Node& node, const graph_model::Style& style);
std::vector<Rect> node_sizes(const graph_model::Graph& graph, const graph_model::Style& style);

} // namespace graph_layout
