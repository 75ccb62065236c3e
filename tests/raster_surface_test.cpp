#include <gtest/gtest.h>
#include <render_surface/raster_surface.hpp>
#include <render_surface/surface.hpp>
#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>

using namespace render_surface;

namespace {

const std::array<std::uint8_t, 8> kPngSignature{ 0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n' };

bool has_png_signature(const std::vector<std::uint8_t>& bytes) {
    return bytes.size() > kPngSignature.size()
        && std::equal(kPngSignature.begin(), kPngSignature.end(), bytes.begin());
}

} // namespace

TEST(RasterSurfaceTest, EncodesPng) {
    auto s = make_raster_surface(64, 32, SurfaceOptions{});
    FillStyle fill;
    fill.color = { 255, 255, 255, 255 };
    s->fill_path(Path::rectangle(0, 0, 64, 32), fill);
    ShapeStyle shape;
    s->stroke_shape(graph_model::ShapeKind::Ellipse, { 4, 4, 40, 20 }, shape);

    const EncodedImage img = s->encode();
    EXPECT_EQ(img.format, graph_model::ImageFormat::Png);
    EXPECT_EQ(img.content_type, "image/png");
    EXPECT_EQ(img.width, 64);
    EXPECT_EQ(img.height, 32);
    EXPECT_TRUE(has_png_signature(img.bytes));
}

TEST(RasterSurfaceTest, DpiScalesPixelSize) {
    SurfaceOptions options;
    options.dpi = 192;
    auto s = make_surface(graph_model::ImageFormat::Png, 50.2, 10, options);
    EXPECT_DOUBLE_EQ(s->width(), 50.2);
    const EncodedImage img = s->encode();
    EXPECT_EQ(img.width, 101);
    EXPECT_EQ(img.height, 20);
}

TEST(RasterSurfaceTest, EveryShapeAndDashDraws) {
    auto s = make_raster_surface(120, 120, SurfaceOptions{});
    ShapeStyle shape;
    for (auto kind : { graph_model::ShapeKind::Rectangle, graph_model::ShapeKind::RoundedRectangle,
             graph_model::ShapeKind::Ellipse, graph_model::ShapeKind::Diamond }) {
        s->stroke_shape(kind, { 10, 10, 60, 40 }, shape);
    }
    Path p;
    p.move_to(0, 0).cubic_to(20, 0, 40, 100, 110, 110);
    for (auto dash : { graph_model::DashPattern::Solid, graph_model::DashPattern::Dashed,
             graph_model::DashPattern::Dotted }) {
        StrokeStyle stroke;
        stroke.dash = dash;
        s->draw_path(p, stroke);
    }
    EXPECT_TRUE(has_png_signature(s->encode().bytes));
}

TEST(RasterSurfaceTest, TextWithoutFontIsSkipped) {
    SurfaceOptions options;
    options.font_paths = { "/nonexistent/font.ttf" };
    auto s = make_raster_surface(40, 20, options);
    EXPECT_NO_THROW(s->draw_text(20, 10, "hello", TextStyle{}));
    EXPECT_DOUBLE_EQ(s->measure_text("abcd", 10.0), estimated_text_width("abcd", 10.0));
    EXPECT_TRUE(has_png_signature(s->encode().bytes));
}

TEST(RasterSurfaceTest, OversizeSurfaceIsRejected) {
    EXPECT_THROW(make_raster_surface(20000, 10, SurfaceOptions{}), SurfaceError);
}

TEST(RasterSurfaceTest, SizeBeyondIntRangeIsRejected) {
    EXPECT_THROW(make_raster_surface(3e9 + 40.0, 76.0, SurfaceOptions{}), SurfaceError);
    EXPECT_THROW(make_raster_surface(76.0, 3e9, SurfaceOptions{}), SurfaceError);
    EXPECT_THROW(make_raster_surface(std::numeric_limits<double>::infinity(), 10, SurfaceOptions{}), SurfaceError);
    // Negative sizes clamp to one pixel instead of wrapping.
    EXPECT_NO_THROW(make_raster_surface(-3e9, 10, SurfaceOptions{}));

    // 10000 px at 96 dpi is fine, doubled by dpi it is not.
    SurfaceOptions hidpi;
    hidpi.dpi = 192;
    EXPECT_NO_THROW(make_raster_surface(10000, 10, SurfaceOptions{}));
    EXPECT_THROW(make_raster_surface(10000, 10, hidpi), SurfaceError);
}
