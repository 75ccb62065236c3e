#pragma once

#include <graph_model/types.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace graph_model {

enum class EdgeRouting { Straight, Orthogonal, Curved };
enum class LayoutAlgorithm { Hierarchical, ForceDirected };
enum class RankDirection { TopToBottom, LeftToRight };
enum class ImageFormat { Svg, Png };

std::optional<EdgeRouting> edge_routing_from_string(std::string_view s);
std::optional<LayoutAlgorithm> layout_algorithm_from_string(std::string_view s);
std::optional<RankDirection> rank_direction_from_string(std::string_view s);
std::optional<ImageFormat> image_format_from_string(std::string_view s);
const char* to_string(EdgeRouting routing);
const char* to_string(LayoutAlgorithm algorithm);
const char* to_string(RankDirection direction);
const char* to_string(ImageFormat format);
const char* content_type(ImageFormat format);

// Rendering options. Every field has a default so an empty option set is a valid Style;
// the fingerprint always covers every field.
struct Style {
    Color background{ 255, 255, 255, 255 };
    std::string font_family = "sans-serif";
    double font_size = 14.0;
    EdgeRouting edge_routing = EdgeRouting::Straight;
    int dpi = 96;
    LayoutAlgorithm layout = LayoutAlgorithm::Hierarchical;
    RankDirection rank_direction = RankDirection::TopToBottom;
    ImageFormat format = ImageFormat::Svg;
    double node_spacing = 40.0;
    double rank_spacing = 60.0;
    double margin = 20.0;
    int force_iterations = 300;
};

// dpi / 96, clamped to a sane range.
double raster_scale(const Style& style);

} // namespace graph_model
