#include <render_surface/svg_surface.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <string>

namespace render_surface {

namespace {

const char* anchor_name(TextAnchor anchor) {
    switch (anchor) {
    case TextAnchor::Start: return "start";
    case TextAnchor::End: return "end";
    case TextAnchor::Middle: break;
    }
    return "middle";
}

std::string opaque_hex(const graph_model::Color& c) {
    return graph_model::to_hex(graph_model::Color{ c.r, c.g, c.b, 255 });
}

} // namespace

std::string xml_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&apos;"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20 && c != '\t') break;
            out += c;
        }
    }
    return out;
}

SvgSurface::SvgSurface(double width, double height)
    : width_(width)
    , height_(height)
{
    // encode() writes the rounded-up size as an int.
    const double limit = std::numeric_limits<int>::max();
    if (!std::isfinite(width) || !std::isfinite(height) || width < 0 || height < 0
        || std::ceil(width) > limit || std::ceil(height) > limit) {
        throw SurfaceError("svg surface size out of range: " + std::to_string(width) + "x" + std::to_string(height));
    }
    body_.imbue(std::locale::classic());
    body_ << std::fixed << std::setprecision(2);
}

void SvgSurface::write_paint(const char* attr, const graph_model::Color& color) {
    body_ << ' ' << attr << "=\"" << opaque_hex(color) << '"';
    if (color.a != 255) {
        body_ << ' ' << attr << "-opacity=\"" << static_cast<double>(color.a) / 255.0 << '"';
    }
}

void SvgSurface::draw_path(const Path& path, const StrokeStyle& stroke) {
    if (path.empty()) return;
    body_ << "<path d=\"" << to_svg_path_data(path) << "\" fill=\"none\"";
    write_paint("stroke", stroke.color);
    body_ << " stroke-width=\"" << stroke.width << '"'
          << " stroke-linecap=\"round\" stroke-linejoin=\"round\"";
    const auto dashes = dash_array(stroke.dash, stroke.width);
    if (!dashes.empty()) {
        body_ << " stroke-dasharray=\"";
        for (std::size_t i = 0; i < dashes.size(); ++i) {
            if (i) body_ << ',';
            body_ << dashes[i];
        }
        body_ << '"';
    }
    body_ << "/>\n";
}

void SvgSurface::fill_path(const Path& path, const FillStyle& fill) {
    if (path.empty()) return;
    body_ << "<path d=\"" << to_svg_path_data(path) << '"';
    write_paint("fill", fill.color);
    body_ << " stroke=\"none\"/>\n";
}

void SvgSurface::stroke_shape(graph_model::ShapeKind shape, const Box& box, const ShapeStyle& style) {
    switch (shape) {
    case graph_model::ShapeKind::Rectangle:
        body_ << "<rect x=\"" << box.x << "\" y=\"" << box.y
              << "\" width=\"" << box.width << "\" height=\"" << box.height << '"';
        break;
    case graph_model::ShapeKind::RoundedRectangle: {
        const double r = std::min(style.corner_radius, std::min(box.width, box.height) * 0.5);
        body_ << "<rect x=\"" << box.x << "\" y=\"" << box.y
              << "\" width=\"" << box.width << "\" height=\"" << box.height
              << "\" rx=\"" << r << "\" ry=\"" << r << '"';
        break;
    }
    case graph_model::ShapeKind::Ellipse:
        body_ << "<ellipse cx=\"" << box.x + box.width * 0.5 << "\" cy=\"" << box.y + box.height * 0.5
              << "\" rx=\"" << box.width * 0.5 << "\" ry=\"" << box.height * 0.5 << '"';
        break;
    case graph_model::ShapeKind::Diamond: {
        const double cx = box.x + box.width * 0.5;
        const double cy = box.y + box.height * 0.5;
        body_ << "<polygon points=\""
              << cx << ',' << box.y << ' '
              << box.x + box.width << ',' << cy << ' '
              << cx << ',' << box.y + box.height << ' '
              << box.x << ',' << cy << '"';
        break;
    }
    }
    write_paint("fill", style.fill);
    write_paint("stroke", style.border);
    body_ << " stroke-width=\"" << style.border_width << "\"/>\n";
}

void SvgSurface::draw_text(double x, double y, std::string_view text, const TextStyle& style) {
    if (text.empty()) return;
    body_ << "<text x=\"" << x << "\" y=\"" << y << '"'
          << " font-family=\"" << xml_escape(style.font_family) << '"'
          << " font-size=\"" << style.size << '"';
    write_paint("fill", style.color);
    body_ << " text-anchor=\"" << anchor_name(style.anchor) << "\" dominant-baseline=\"central\">"
          << xml_escape(text) << "</text>\n";
}

double SvgSurface::measure_text(std::string_view text, double size) const {
    return estimated_text_width(text, size);
}

EncodedImage SvgSurface::encode() {
    std::ostringstream doc;
    doc.imbue(std::locale::classic());
    doc << std::fixed << std::setprecision(2);

    EncodedImage out;
    out.format = graph_model::ImageFormat::Svg;
    out.content_type = graph_model::content_type(out.format);
    out.width = static_cast<int>(std::ceil(width_));
    out.height = static_cast<int>(std::ceil(height_));

    doc << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>\n"
        << "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\""
        << " width=\"" << out.width << "\" height=\"" << out.height << '"'
        << " viewBox=\"0 0 " << width_ << ' ' << height_ << "\">\n"
        << body_.str()
        << "</svg>\n";

    const std::string text = doc.str();
    out.bytes.assign(text.begin(), text.end());
    return out;
}

} // namespace render_surface
