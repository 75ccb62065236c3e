#include <render_surface/surface.hpp>
#include <render_surface/raster_surface.hpp>
#include <render_surface/svg_surface.hpp>
#include <algorithm>

namespace render_surface {

std::unique_ptr<Surface> make_surface(graph_model::ImageFormat format,
    double width, double height, const SurfaceOptions& options)
{
    switch (format) {
    case graph_model::ImageFormat::Png:
        return make_raster_surface(width, height, options);
    case graph_model::ImageFormat::Svg:
        break;
    }
    return std::make_unique<SvgSurface>(width, height);
}

double estimated_text_width(std::string_view text, double size) {
    std::size_t n = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xc0u) != 0x80u) ++n;
    }
    return static_cast<double>(n) * size * 0.6;
}

std::vector<double> dash_array(graph_model::DashPattern dash, double stroke_width) {
    const double w = std::max(stroke_width, 1.0);
    switch (dash) {
    case graph_model::DashPattern::Dashed:
        return { 4.0 * w, 3.0 * w };
    case graph_model::DashPattern::Dotted:
        return { w, 2.0 * w };
    case graph_model::DashPattern::Solid:
        break;
    }
    return {};
}

} // namespace render_surface
