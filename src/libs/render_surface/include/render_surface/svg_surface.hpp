#pragma once

#include <render_surface/surface.hpp>
#include <sstream>
#include <string>
#include <string_view>

namespace render_surface {

// Vector target: accumulates SVG 1.1 elements, encode() wraps them in a document.
// Throws SurfaceError if the size is negative, not finite, or does not fit in an int.
class SvgSurface final : public Surface {
public:
    SvgSurface(double width, double height);

    void draw_path(const Path& path, const StrokeStyle& stroke) override;
    void fill_path(const Path& path, const FillStyle& fill) override;
    void stroke_shape(graph_model::ShapeKind shape, const Box& box, const ShapeStyle& style) override;
    void draw_text(double x, double y, std::string_view text, const TextStyle& style) override;
    double measure_text(std::string_view text, double size) const override;
    EncodedImage encode() override;

    double width() const override { return width_; }
    double height() const override { return height_; }

private:
    void write_paint(const char* attr, const graph_model::Color& color);

    double width_;
    double height_;
    std::ostringstream body_;
};

// &, <, >, ", ' replaced by entities. Control characters other than tab are dropped.
std::string xml_escape(std::string_view text);

} // namespace render_surface
