#include <gtest/gtest.h>
#include <graph_layout/layout_engine.hpp>
#include <graph_loaders/debug_graph.hpp>
#include <graph_model/description.hpp>
#include <render_pipeline/painter.hpp>
#include <render_pipeline/pipeline.hpp>
#include <render_surface/svg_surface.hpp>
#include <chrono>
#include <exception>
#include <string>

using namespace render_pipeline;

namespace {

graph_model::Graph two_nodes(const char* edge_label = "") {
    graph_model::GraphBuilder b;
    graph_model::NodeAttributes a;
    a.label = "Start";
    a.width = 80;
    a.height = 40;
    b.add_node("a", a).add_node("b");
    graph_model::EdgeAttributes e;
    e.label = edge_label;
    b.add_edge("a", "b", e);
    return b.finalize();
}

std::string as_text(const render_cache::ArtifactPtr& a) {
    return std::string(a->bytes.begin(), a->bytes.end());
}

class RenderPipelineTest : public ::testing::Test {
protected:
    std::shared_ptr<render_cache::RenderCache> cache_ = std::make_shared<render_cache::RenderCache>(1u << 20);
    RenderPipeline pipeline_{ cache_, PipelineOptions{} };
};

// Rethrows the cause of a RenderError so its type can be checked.
template <typename Fn>
void rethrow_cause(Fn&& fn) {
    try {
        fn();
    } catch (const RenderError& e) {
        ASSERT_TRUE(e.cause());
        std::rethrow_exception(e.cause());
    }
}

} // namespace

TEST_F(RenderPipelineTest, RendersSvgDocument) {
    const auto art = pipeline_.render(two_nodes(), graph_model::Style{});
    ASSERT_TRUE(art);
    EXPECT_EQ(art->content_type, "image/svg+xml");
    EXPECT_EQ(art->format, graph_model::ImageFormat::Svg);
    // One column: an 80x40 node over a 60x36 one, 60 apart, plus a 20 px margin all round.
    EXPECT_EQ(art->width, 120);
    EXPECT_EQ(art->height, 176);
    const std::string text = as_text(art);
    EXPECT_EQ(text.rfind("<?xml", 0), 0u);
    EXPECT_NE(text.find(">Start</text>"), std::string::npos);
    EXPECT_EQ(art->fingerprint, graph_model::compute_fingerprint(two_nodes(), graph_model::Style{}));
}

TEST_F(RenderPipelineTest, SecondRenderIsServedFromCache) {
    const auto first = pipeline_.render(two_nodes(), graph_model::Style{});
    const auto second = pipeline_.render(two_nodes(), graph_model::Style{});
    EXPECT_EQ(first, second);
    EXPECT_EQ(pipeline_.layout_runs(), 1u);
    EXPECT_EQ(cache_->stats().hits, 1u);

    graph_model::Style other;
    other.margin = 5;
    pipeline_.render(two_nodes(), other);
    EXPECT_EQ(pipeline_.layout_runs(), 2u);
}

TEST_F(RenderPipelineTest, InvalidateForcesRerender) {
    const auto first = pipeline_.render(two_nodes(), graph_model::Style{});
    EXPECT_TRUE(pipeline_.invalidate(first->fingerprint));
    const auto second = pipeline_.render(two_nodes(), graph_model::Style{});
    EXPECT_EQ(pipeline_.layout_runs(), 2u);
    EXPECT_EQ(first->bytes, second->bytes);
}

TEST_F(RenderPipelineTest, OutputIsDeterministicAcrossPipelines) {
    const auto g = graph_model::build_graph(graph_loaders::generate_debug_graph());
    for (auto algorithm : { graph_model::LayoutAlgorithm::Hierarchical, graph_model::LayoutAlgorithm::ForceDirected }) {
        graph_model::Style style;
        style.layout = algorithm;
        style.force_iterations = 80;
        RenderPipeline other(std::make_shared<render_cache::RenderCache>(1u << 20), PipelineOptions{});
        EXPECT_EQ(pipeline_.render(g, style)->bytes, other.render(g, style)->bytes)
            << graph_model::to_string(algorithm);
    }
}

TEST_F(RenderPipelineTest, EmptyGraphIsJustBackground) {
    graph_model::Style style;
    style.margin = 8;
    const auto art = pipeline_.render(graph_model::Graph{}, style);
    EXPECT_EQ(art->width, 16);
    EXPECT_EQ(art->height, 16);
    const std::string text = as_text(art);
    EXPECT_EQ(text.find("<rect"), std::string::npos);
    EXPECT_NE(text.find("<path"), std::string::npos);
}

TEST_F(RenderPipelineTest, RendersPng) {
    graph_model::Style style;
    style.format = graph_model::ImageFormat::Png;
    style.dpi = 192;
    const auto art = pipeline_.render(two_nodes("go"), style);
    EXPECT_EQ(art->content_type, "image/png");
    EXPECT_EQ(art->width, 240);
    EXPECT_EQ(art->height, 352);
    ASSERT_GT(art->bytes.size(), 8u);
    EXPECT_EQ(art->bytes[1], 'P');
    EXPECT_EQ(art->bytes[2], 'N');
    EXPECT_EQ(art->bytes[3], 'G');
}

TEST_F(RenderPipelineTest, LayoutFailureIsWrappedAndNotCached) {
    RenderPipeline tight(cache_, PipelineOptions{ std::chrono::milliseconds(5000), std::chrono::milliseconds(10000), 3, {} });
    graph_model::Style style;
    style.layout = graph_model::LayoutAlgorithm::ForceDirected;
    EXPECT_THROW(rethrow_cause([&] { tight.render(two_nodes(), style); }), graph_layout::LayoutTimeoutError);
    EXPECT_FALSE(cache_->contains(graph_model::compute_fingerprint(two_nodes(), style)));
}

TEST_F(RenderPipelineTest, CancelAllAbortsForceLayouts) {
    pipeline_.cancel_all();
    graph_model::Style style;
    style.layout = graph_model::LayoutAlgorithm::ForceDirected;
    EXPECT_THROW(rethrow_cause([&] { pipeline_.render(two_nodes(), style); }), graph_layout::LayoutTimeoutError);
    // Hierarchical layout has no cancellation points.
    EXPECT_NO_THROW(pipeline_.render(two_nodes(), graph_model::Style{}));
}

TEST_F(RenderPipelineTest, ExhaustedRenderBudgetTimesOut) {
    PipelineOptions options;
    options.render_timeout = std::chrono::milliseconds(0);
    RenderPipeline expired(cache_, options);
    EXPECT_THROW(rethrow_cause([&] { expired.render(two_nodes(), graph_model::Style{}); }), RenderTimeoutError);
}

TEST_F(RenderPipelineTest, OversizeSizeHintFailsWithSurfaceError) {
    graph_model::GraphBuilder b;
    graph_model::NodeAttributes huge;
    huge.width = 3e9;
    huge.height = 76;
    b.add_node("wide", huge);
    const graph_model::Graph graph = b.finalize();

    graph_model::Style svg;
    EXPECT_THROW(rethrow_cause([&] { pipeline_.render(graph, svg); }), render_surface::SurfaceError);
    graph_model::Style png;
    png.format = graph_model::ImageFormat::Png;
    EXPECT_THROW(rethrow_cause([&] { pipeline_.render(graph, png); }), render_surface::SurfaceError);
    EXPECT_EQ(cache_->stats().entries, 0u);
}

TEST(PainterTest, EdgesArePaintedBeneathNodes) {
    const auto g = two_nodes("go");
    const graph_model::Style style;
    const auto layout = graph_layout::make_layout_engine(style.layout)->compute(g, style, {});
    render_surface::SvgSurface surface(200, 200);
    paint_layout(surface, g, layout, style, 10, 10);
    const auto img = surface.encode();
    const std::string text(img.bytes.begin(), img.bytes.end());

    const auto edge = text.find("fill=\"none\"");
    const auto label = text.find(">go</text>");
    const auto node = text.find("<rect");
    ASSERT_NE(edge, std::string::npos);
    ASSERT_NE(label, std::string::npos);
    ASSERT_NE(node, std::string::npos);
    EXPECT_LT(edge, label);
    EXPECT_LT(label, node);
}

TEST_F(RenderPipelineTest, SelfLoopIsStillDrawn) {
    graph_model::GraphBuilder b;
    b.add_node("a");
    b.add_edge("a", "a");
    const auto art = pipeline_.render(b.finalize(), graph_model::Style{});
    const std::string text = as_text(art);
    // Edge strokes are the only unfilled paths.
    EXPECT_NE(text.find("fill=\"none\""), std::string::npos);
    EXPECT_NE(text.find("<rect"), std::string::npos);
    EXPECT_EQ(pipeline_.layout_runs(), 1u);
}
