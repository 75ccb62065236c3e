#pragma once

#include <render_service/config.hpp>
#include <render_service/worker_pool.hpp>
#include <render_pipeline/pipeline.hpp>
#include <render_cache/render_cache.hpp>
#include <graph_model/description.hpp>
#include <graph_model/graph.hpp>
#include <graph_model/style.hpp>
#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>

namespace render_service {

struct ServiceStats {
    render_cache::CacheStats cache;
    std::uint64_t layout_runs = 0;
    std::size_t workers = 0;
    std::size_t queued = 0;
};

class ServiceShutDownError : public std::runtime_error {
public:
    ServiceShutDownError() : std::runtime_error("render service is shut down") {}
};

// Process-scoped render core: one cache, one pipeline, one worker pool.
// Construction configures logging from config.log.
class RenderService {
public:
    explicit RenderService(ServiceConfig config);
    ~RenderService();

    RenderService(const RenderService&) = delete;
    RenderService& operator=(const RenderService&) = delete;

    // Builds the graph (DuplicateNodeError / UnknownNodeError surface as-is),
    // then renders it. Throws render_pipeline::RenderError on render failure.
    render_cache::ArtifactPtr render(const graph_model::GraphDescription& description,
        const graph_model::Style& style,
        std::stop_token stop = {});
    render_cache::ArtifactPtr render(const graph_model::Graph& graph,
        const graph_model::Style& style,
        std::stop_token stop = {});

    // Runs the render on the worker pool; failures arrive through the future.
    // Once accepted, the job completes even if shutdown() follows.
    std::future<render_cache::ArtifactPtr> submit(graph_model::GraphDescription description,
        graph_model::Style style);

    // False for malformed hex or when no Ready entry exists.
    bool invalidate(std::string_view fingerprint_hex);

    ServiceStats stats() const;

    // Rejects new work, completes every accepted submit, joins the workers, then
    // cancels layouts still running for direct render() callers. Idempotent.
    void shutdown();

    const ServiceConfig& config() const { return config_; }

private:
    void ensure_running() const;

    ServiceConfig config_;
    std::shared_ptr<render_cache::RenderCache> cache_;
    render_pipeline::RenderPipeline pipeline_;
    std::atomic<bool> shut_down_{ false };
    // Last member: joined before the pipeline it calls into goes away.
    WorkerPool pool_;
};

} // namespace render_service
