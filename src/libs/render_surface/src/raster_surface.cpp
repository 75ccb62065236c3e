#include <render_surface/raster_surface.hpp>
#include <clipper_log/log.hpp>
#include <plutovg.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <filesystem>
#include <string>

namespace render_surface {

namespace {

// Per side, in output pixels.
constexpr int kMaxPixels = 16384;

std::atomic<bool> g_missing_font_warned{ false };

void append_png_bytes(void* closure, void* data, int size) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(closure);
    const auto* p = static_cast<const std::uint8_t*>(data);
    out->insert(out->end(), p, p + size);
}

plutovg_font_face_t* load_font(const std::vector<std::string>& font_paths) {
    for (const auto& path : font_paths) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) continue;
        if (plutovg_font_face_t* face = plutovg_font_face_load_from_file(path.c_str(), 0)) {
            return face;
        }
        clipper_log::logger()->debug("raster_font_rejected path={}", path);
    }
    if (!g_missing_font_warned.exchange(true)) {
        clipper_log::logger()->warn(
            "raster_font_missing candidates={} (PNG output will have no text)", font_paths.size());
    }
    return nullptr;
}

class RasterSurface final : public Surface {
public:
    RasterSurface(double width, double height, const SurfaceOptions& options)
        : width_(width)
        , height_(height)
        , scale_(options.dpi / 96.0)
    {
        const double scaled_w = std::ceil(width * scale_);
        const double scaled_h = std::ceil(height * scale_);
        if (!std::isfinite(scaled_w) || !std::isfinite(scaled_h)) {
            throw SurfaceError("raster surface size is not finite");
        }
        if (scaled_w > kMaxPixels || scaled_h > kMaxPixels) {
            throw SurfaceError("raster surface too large: " + std::to_string(scaled_w) + "x" + std::to_string(scaled_h));
        }
        const int px_w = static_cast<int>(std::max(1.0, scaled_w));
        const int px_h = static_cast<int>(std::max(1.0, scaled_h));
        surface_ = plutovg_surface_create(px_w, px_h);
        if (!surface_) {
            throw SurfaceError("raster surface allocation failed");
        }
        canvas_ = plutovg_canvas_create(surface_);
        if (!canvas_) {
            plutovg_surface_destroy(surface_);
            throw SurfaceError("raster canvas allocation failed");
        }
        plutovg_canvas_scale(canvas_, static_cast<float>(scale_), static_cast<float>(scale_));
        plutovg_canvas_set_line_cap(canvas_, PLUTOVG_LINE_CAP_ROUND);
        plutovg_canvas_set_line_join(canvas_, PLUTOVG_LINE_JOIN_ROUND);
        font_ = load_font(options.font_paths);
    }

    ~RasterSurface() override {
        if (font_) plutovg_font_face_destroy(font_);
        plutovg_canvas_destroy(canvas_);
        plutovg_surface_destroy(surface_);
    }

    RasterSurface(const RasterSurface&) = delete;
    RasterSurface& operator=(const RasterSurface&) = delete;

    void draw_path(const Path& path, const StrokeStyle& stroke) override {
        if (path.empty()) return;
        set_color(stroke.color);
        plutovg_canvas_set_line_width(canvas_, static_cast<float>(stroke.width));
        const auto dashes = dash_array(stroke.dash, stroke.width);
        std::vector<float> fdashes(dashes.begin(), dashes.end());
        plutovg_canvas_set_dash_array(canvas_, fdashes.empty() ? nullptr : fdashes.data(),
            static_cast<int>(fdashes.size()));
        apply_path(path);
        plutovg_canvas_stroke(canvas_);
        plutovg_canvas_set_dash_array(canvas_, nullptr, 0);
    }

    void fill_path(const Path& path, const FillStyle& fill) override {
        if (path.empty()) return;
        set_color(fill.color);
        apply_path(path);
        plutovg_canvas_fill(canvas_);
    }

    void stroke_shape(graph_model::ShapeKind shape, const Box& box, const ShapeStyle& style) override {
        const auto x = static_cast<float>(box.x);
        const auto y = static_cast<float>(box.y);
        const auto w = static_cast<float>(box.width);
        const auto h = static_cast<float>(box.height);

        plutovg_canvas_new_path(canvas_);
        switch (shape) {
        case graph_model::ShapeKind::Rectangle:
            plutovg_canvas_rect(canvas_, x, y, w, h);
            break;
        case graph_model::ShapeKind::RoundedRectangle: {
            const auto r = static_cast<float>(std::min(style.corner_radius, std::min(box.width, box.height) * 0.5));
            plutovg_canvas_round_rect(canvas_, x, y, w, h, r, r);
            break;
        }
        case graph_model::ShapeKind::Ellipse:
            plutovg_canvas_ellipse(canvas_, x + w * 0.5f, y + h * 0.5f, w * 0.5f, h * 0.5f);
            break;
        case graph_model::ShapeKind::Diamond:
            plutovg_canvas_move_to(canvas_, x + w * 0.5f, y);
            plutovg_canvas_line_to(canvas_, x + w, y + h * 0.5f);
            plutovg_canvas_line_to(canvas_, x + w * 0.5f, y + h);
            plutovg_canvas_line_to(canvas_, x, y + h * 0.5f);
            plutovg_canvas_close_path(canvas_);
            break;
        }

        set_color(style.fill);
        plutovg_canvas_fill_preserve(canvas_);
        set_color(style.border);
        plutovg_canvas_set_line_width(canvas_, static_cast<float>(style.border_width));
        plutovg_canvas_stroke(canvas_);
    }

    void draw_text(double x, double y, std::string_view text, const TextStyle& style) override {
        if (text.empty() || !font_) return;
        const auto size = static_cast<float>(style.size);
        plutovg_canvas_set_font(canvas_, font_, size);

        const auto length = static_cast<int>(text.size());
        const float advance = plutovg_canvas_text_extents(canvas_, text.data(), length,
            PLUTOVG_TEXT_ENCODING_UTF8, nullptr);
        float ascent = 0.0f;
        float descent = 0.0f;
        float line_gap = 0.0f;
        plutovg_font_face_get_metrics(font_, size, &ascent, &descent, &line_gap, nullptr);

        float start = static_cast<float>(x);
        if (style.anchor == TextAnchor::Middle) start -= advance * 0.5f;
        else if (style.anchor == TextAnchor::End) start -= advance;
        // descent is negative; centers the ascent..descent band on y.
        const float baseline = static_cast<float>(y) + (ascent + descent) * 0.5f;

        set_color(style.color);
        plutovg_canvas_fill_text(canvas_, text.data(), length, PLUTOVG_TEXT_ENCODING_UTF8, start, baseline);
    }

    double measure_text(std::string_view text, double size) const override {
        if (!font_) return estimated_text_width(text, size);
        plutovg_canvas_set_font(canvas_, font_, static_cast<float>(size));
        return plutovg_canvas_text_extents(canvas_, text.data(), static_cast<int>(text.size()),
            PLUTOVG_TEXT_ENCODING_UTF8, nullptr);
    }

    EncodedImage encode() override {
        EncodedImage out;
        out.format = graph_model::ImageFormat::Png;
        out.content_type = graph_model::content_type(out.format);
        out.width = plutovg_surface_get_width(surface_);
        out.height = plutovg_surface_get_height(surface_);
        if (!plutovg_surface_write_to_png_stream(surface_, append_png_bytes, &out.bytes)) {
            throw SurfaceError("PNG encoding failed");
        }
        return out;
    }

    double width() const override { return width_; }
    double height() const override { return height_; }

private:
    void set_color(const graph_model::Color& c) {
        plutovg_canvas_set_rgba(canvas_, c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, c.a / 255.0f);
    }

    void apply_path(const Path& path) {
        plutovg_canvas_new_path(canvas_);
        for (const auto& e : path.elements()) {
            const auto& p = e.points;
            switch (e.verb) {
            case PathVerb::MoveTo:
                plutovg_canvas_move_to(canvas_, static_cast<float>(p[0].x), static_cast<float>(p[0].y));
                break;
            case PathVerb::LineTo:
                plutovg_canvas_line_to(canvas_, static_cast<float>(p[0].x), static_cast<float>(p[0].y));
                break;
            case PathVerb::CubicTo:
                plutovg_canvas_cubic_to(canvas_,
                    static_cast<float>(p[0].x), static_cast<float>(p[0].y),
                    static_cast<float>(p[1].x), static_cast<float>(p[1].y),
                    static_cast<float>(p[2].x), static_cast<float>(p[2].y));
                break;
            case PathVerb::Close:
                plutovg_canvas_close_path(canvas_);
                break;
            }
        }
    }

    double width_;
    double height_;
    double scale_;
    plutovg_surface_t* surface_ = nullptr;
    plutovg_canvas_t* canvas_ = nullptr;
    plutovg_font_face_t* font_ = nullptr;
};

} // namespace

std::unique_ptr<Surface> make_raster_surface(double width, double height, const SurfaceOptions& options) {
    return std::make_unique<RasterSurface>(width, height, options);
}

} // namespace render_surface
