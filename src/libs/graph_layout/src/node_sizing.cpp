#include <graph_layout/node_sizing.hpp>
#include <graph_layout/layout_constants.hpp>
#include <algorithm>

namespace graph_layout {

using namespace layout;

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    if (text.empty()) return lines;
    std::size_t start = 0;
    while (true) {
        const std::size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::size_t count_code_points(std::string_view text) {
    std::size_t n = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xc0u) != 0x80u) ++n;
    }
    return n;
}

double estimate_text_width(std::string_view text, double font_size) {
    std::size_t widest = 0;
    for (const auto& line : split_lines(text))
        widest = std::max(widest, count_code_points(line));
    return static_cast<double>(widest) * font_size * char_width_ratio;
}

double estimate_text_height(std::string_view text, double font_size) {
    return static_cast<double>(split_lines(text).size()) * font_size * line_height_ratio;
}

Rect node_size(const graph_model::Node& node, const graph_model::Style& style) {
    double w = estimate_text_width(node.label, style.font_size) + 2.0 * label_padding_x;
    double h = estimate_text_height(node.label, style.font_size) + 2.0 * label_padding_y;

    switch (node.shape) {
    case graph_model::ShapeKind::Ellipse:
        w *= ellipse_inflation;
        h *= ellipse_inflation;
        break;
    case graph_model::ShapeKind::Diamond:
        w *= diamond_inflation;
        h *= diamond_inflation;
        break;
    case graph_model::ShapeKind::Rectangle:
    case graph_model::ShapeKind::RoundedRectangle:
        break;
    }

    Rect r;
    r.width = node.width > 0 ? node.width : std::max(w, min_node_width);
    r.height = node.height > 0 ? node.height : std::max(h, min_node_height);
    return r;
}

std::vector<Rect> node_sizes(const graph_model::Graph& graph, const graph_model::Style& style) {
    std::vector<Rect> out;
    out.reserve(graph.node_count());
    for (const auto& n : graph.nodes())
        out.push_back(node_size(n, style));
    return out;
}

} // namespace graph_layout
