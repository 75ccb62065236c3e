#include <graph_model/style.hpp>
#include <algorithm>

namespace graph_model {

namespace {

const double reference_dpi = 96.0;
const int min_dpi = 24;
const int max_dpi = 1200;

} // namespace

std::optional<EdgeRouting> edge_routing_from_string(std::string_view s) {
    if (s == "straight") return EdgeRouting::Straight;
    if (s == "orthogonal") return EdgeRouting::Orthogonal;
    if (s == "curved") return EdgeRouting::Curved;
    return std::nullopt;
}

std::optional<LayoutAlgorithm> layout_algorithm_from_string(std::string_view s) {
    if (s == "hierarchical") return LayoutAlgorithm::Hierarchical;
    if (s == "force_directed") return LayoutAlgorithm::ForceDirected;
    return std::nullopt;
}

std::optional<RankDirection> rank_direction_from_string(std::string_view s) {
    if (s == "top_to_bottom") return RankDirection::TopToBottom;
    if (s == "left_to_right") return RankDirection::LeftToRight;
    return std::nullopt;
}

std::optional<ImageFormat> image_format_from_string(std::string_view s) {
    if (s == "svg") return ImageFormat::Svg;
    if (s == "png") return ImageFormat::Png;
    return std::nullopt;
}

const char* to_string(EdgeRouting routing) {
    switch (routing) {
    case EdgeRouting::Straight: return "straight";
    case EdgeRouting::Orthogonal: return "orthogonal";
    case EdgeRouting::Curved: return "curved";
    }
    return "straight";
}

const char* to_string(LayoutAlgorithm algorithm) {
    switch (algorithm) {
    case LayoutAlgorithm::Hierarchical: return "hierarchical";
    case LayoutAlgorithm::ForceDirected: return "force_directed";
    }
    return "hierarchical";
}

const char* to_string(RankDirection direction) {
    switch (direction) {
    case RankDirection::TopToBottom: return "top_to_bottom";
    case RankDirection::LeftToRight: return "left_to_right";
    }
    return "top_to_bottom";
}

const char* to_string(ImageFormat format) {
    switch (format) {
    case ImageFormat::Svg: return "svg";
    case ImageFormat::Png: return "png";
    }
    return "svg";
}

const char* content_type(ImageFormat format) {
    switch (format) {
    case ImageFormat::Svg: return "image/svg+xml";
    case ImageFormat::Png: return "image/png";
    }
    return "application/octet-stream";
}

double raster_scale(const Style& style) {
    return static_cast<double>(std::clamp(style.dpi, min_dpi, max_dpi)) / reference_dpi;
}

} // namespace graph_model
