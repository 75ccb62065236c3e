#include <render_pipeline/pipeline.hpp>
#include <render_pipeline/painter.hpp>
#include <graph_layout/layout_engine.hpp>
#include <render_surface/surface.hpp>
#include <clipper_log/log.hpp>
#include <algorithm>

namespace render_pipeline {

namespace {

long long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

} // namespace

RenderPipeline::RenderPipeline(std::shared_ptr<render_cache::RenderCache> cache, PipelineOptions options)
    : cache_(std::move(cache))
    , options_(std::move(options))
{
}

render_cache::ArtifactPtr RenderPipeline::render(const graph_model::Graph& graph,
    const graph_model::Style& style,
    std::stop_token stop)
{
    const auto deadline = Clock::now() + options_.render_timeout;

    graph_model::Fingerprint fingerprint;
    try {
        fingerprint = graph_model::compute_fingerprint(graph, style);
    } catch (const std::exception& e) {
        throw RenderError(std::string("fingerprint failed: ") + e.what(), std::current_exception());
    }

    try {
        return cache_->get_or_render(fingerprint,
            [&] { return render_uncached(graph, style, fingerprint, deadline); },
            stop);
    } catch (const render_cache::WaitCancelledError&) {
        throw;
    } catch (const std::exception& e) {
        clipper_log::logger()->warn("render_failed fp={} error={}", fingerprint.hex(), e.what());
        throw RenderError(std::string("render failed: ") + e.what(), std::current_exception());
    }
}

render_cache::ArtifactPtr RenderPipeline::render_uncached(const graph_model::Graph& graph,
    const graph_model::Style& style,
    const graph_model::Fingerprint& fingerprint,
    Clock::time_point deadline)
{
    const auto started = Clock::now();
    auto check_deadline = [&](const char* stage) {
        if (Clock::now() >= deadline) {
            throw RenderTimeoutError(std::string("render deadline exceeded before ") + stage);
        }
    };

    graph_layout::LayoutContext context;
    context.seed = fingerprint.seed();
    context.deadline = std::min(started + options_.layout_timeout, deadline);
    context.stop = cancel_.get_token();
    context.iteration_budget = options_.layout_iteration_budget;

    auto engine = graph_layout::make_layout_engine(style.layout);
    ++layout_runs_;
    const graph_layout::Layout layout = engine->compute(graph, style, context);
    const long long layout_ms = elapsed_ms(started);

    check_deadline("paint");
    const double width = layout.bounds.width + 2.0 * style.margin;
    const double height = layout.bounds.height + 2.0 * style.margin;

    render_surface::SurfaceOptions surface_options;
    surface_options.dpi = graph_model::raster_scale(style) * 96.0;
    surface_options.font_paths = options_.font_paths;
    auto surface = render_surface::make_surface(style.format, width, height, surface_options);
    paint_layout(*surface, graph, layout, style,
        style.margin - layout.bounds.x, style.margin - layout.bounds.y);

    check_deadline("encode");
    render_surface::EncodedImage image = surface->encode();

    auto artifact = std::make_shared<render_cache::RenderArtifact>();
    artifact->bytes = std::move(image.bytes);
    artifact->content_type = std::move(image.content_type);
    artifact->format = image.format;
    artifact->width = image.width;
    artifact->height = image.height;
    artifact->fingerprint = fingerprint;

    clipper_log::logger()->info(
        "render_done fp={} engine={} format={} nodes={} edges={} size={}x{} bytes={} layout_ms={} total_ms={}",
        fingerprint.hex(), engine->name(), graph_model::to_string(style.format),
        graph.node_count(), graph.edge_count(), artifact->width, artifact->height,
        artifact->size_bytes(), layout_ms, elapsed_ms(started));
    return artifact;
}

bool RenderPipeline::invalidate(const graph_model::Fingerprint& fingerprint) {
    return cache_->invalidate(fingerprint);
}

void RenderPipeline::cancel_all() {
    cancel_.request_stop();
}

} // namespace render_pipeline
