#pragma once

#include <graph_model/style.hpp>
#include <graph_model/types.hpp>
#include <render_surface/path.hpp>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace render_surface {

class SurfaceError : public std::runtime_error {
public:
    explicit SurfaceError(const std::string& what) : std::runtime_error(what) {}
};

struct StrokeStyle {
    graph_model::Color color{ 0, 0, 0, 255 };
    double width = 1.0;
    graph_model::DashPattern dash = graph_model::DashPattern::Solid;
};

struct FillStyle {
    graph_model::Color color{ 0, 0, 0, 255 };
};

struct ShapeStyle {
    graph_model::Color fill{ 255, 255, 255, 255 };
    graph_model::Color border{ 0, 0, 0, 255 };
    double border_width = 1.0;
    // RoundedRectangle only.
    double corner_radius = 8.0;
};

enum class TextAnchor { Start, Middle, End };

// (x, y) passed to draw_text is the anchor point on the line's vertical middle.
struct TextStyle {
    graph_model::Color color{ 0, 0, 0, 255 };
    double size = 14.0;
    std::string font_family = "sans-serif";
    TextAnchor anchor = TextAnchor::Middle;
};

struct Box {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
};

struct EncodedImage {
    std::vector<std::uint8_t> bytes;
    graph_model::ImageFormat format = graph_model::ImageFormat::Svg;
    std::string content_type;
    // Output pixels (raster) or CSS px (vector).
    int width = 0;
    int height = 0;
};

struct SurfaceOptions {
    double dpi = 96.0;
    // Candidate font files for raster text; the first loadable one is used.
    std::vector<std::string> font_paths;
};

// Drawing target in world units (px at 96 dpi). Not thread-safe; one per render.
class Surface {
public:
    virtual ~Surface() = default;

    virtual void draw_path(const Path& path, const StrokeStyle& stroke) = 0;
    virtual void fill_path(const Path& path, const FillStyle& fill) = 0;
    virtual void stroke_shape(graph_model::ShapeKind shape, const Box& box, const ShapeStyle& style) = 0;
    virtual void draw_text(double x, double y, std::string_view text, const TextStyle& style) = 0;
    virtual double measure_text(std::string_view text, double size) const = 0;
    virtual EncodedImage encode() = 0;

    virtual double width() const = 0;
    virtual double height() const = 0;
};

std::unique_ptr<Surface> make_surface(graph_model::ImageFormat format,
    double width, double height, const SurfaceOptions& options);

// Font-independent single-line estimate (0.6 * size per code point).
double estimated_text_width(std::string_view text, double size);

// Dash lengths scaled by the stroke width; empty for solid.
std::vector<double> dash_array(graph_model::DashPattern dash, double stroke_width);

} // namespace render_surface
