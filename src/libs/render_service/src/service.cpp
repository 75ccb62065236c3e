#include <render_service/service.hpp>
#include <clipper_log/log.hpp>

namespace render_service {

namespace {

ServiceConfig configure_logging(ServiceConfig config) {
    clipper_log::configure(config.log);
    return config;
}

render_pipeline::PipelineOptions pipeline_options(const ServiceConfig& config) {
    render_pipeline::PipelineOptions o;
    o.layout_timeout = config.layout_timeout;
    o.render_timeout = config.render_timeout;
    o.layout_iteration_budget = config.layout_iteration_budget;
    o.font_paths = config.font_paths;
    return o;
}

} // namespace

RenderService::RenderService(ServiceConfig config)
    : config_(configure_logging(std::move(config)))
    , cache_(std::make_shared<render_cache::RenderCache>(config_.cache_budget_bytes))
    , pipeline_(cache_, pipeline_options(config_))
    , pool_(config_.worker_threads)
{
    clipper_log::logger()->info(
        "service_started workers={} cache_budget_bytes={} layout_timeout_ms={} render_timeout_ms={}",
        pool_.size(), config_.cache_budget_bytes,
        config_.layout_timeout.count(), config_.render_timeout.count());
}

RenderService::~RenderService() {
    shutdown();
}

void RenderService::ensure_running() const {
    if (shut_down_.load()) {
        throw ServiceShutDownError();
    }
}

render_cache::ArtifactPtr RenderService::render(const graph_model::GraphDescription& description,
    const graph_model::Style& style,
    std::stop_token stop)
{
    ensure_running();
    const graph_model::Graph graph = graph_model::build_graph(description);
    return pipeline_.render(graph, style, stop);
}

render_cache::ArtifactPtr RenderService::render(const graph_model::Graph& graph,
    const graph_model::Style& style,
    std::stop_token stop)
{
    ensure_running();
    return pipeline_.render(graph, style, stop);
}

std::future<render_cache::ArtifactPtr> RenderService::submit(graph_model::GraphDescription description,
    graph_model::Style style)
{
    ensure_running();
    // Accepted jobs run to completion even if shutdown() starts while they are queued.
    return pool_.submit([this, description = std::move(description), style = std::move(style)] {
        return pipeline_.render(graph_model::build_graph(description), style);
    });
}

bool RenderService::invalidate(std::string_view fingerprint_hex) {
    const auto fingerprint = graph_model::parse_fingerprint(fingerprint_hex);
    if (!fingerprint) {
        clipper_log::logger()->warn("invalidate_rejected reason=malformed_fingerprint value={}", fingerprint_hex);
        return false;
    }
    const bool dropped = pipeline_.invalidate(*fingerprint);
    clipper_log::logger()->info("invalidate fp={} dropped={}", fingerprint->hex(), dropped);
    return dropped;
}

ServiceStats RenderService::stats() const {
    ServiceStats s;
    s.cache = cache_->stats();
    s.layout_runs = pipeline_.layout_runs();
    s.workers = pool_.size();
    s.queued = pool_.queued();
    return s;
}

void RenderService::shutdown() {
    if (shut_down_.exchange(true)) return;
    pool_.shutdown();
    // Only direct render() callers can still be inside the pipeline here.
    pipeline_.cancel_all();
    const auto cs = cache_->stats();
    clipper_log::logger()->info("service_stopped entries={} bytes={} hits={} misses={} renders={} evictions={}",
        cs.entries, cs.bytes, cs.hits, cs.misses, cs.renders, cs.evictions);
    clipper_log::logger()->flush();
}

} // namespace render_service
