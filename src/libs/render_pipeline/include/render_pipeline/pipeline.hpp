#pragma once

#include <graph_model/fingerprint.hpp>
#include <graph_model/graph.hpp>
#include <graph_model/style.hpp>
#include <render_cache/artifact.hpp>
#include <render_cache/render_cache.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

namespace render_pipeline {

// Any layout or surface failure. Transient: the cache slot is left Absent.
class RenderError : public std::runtime_error {
public:
    RenderError(const std::string& what, std::exception_ptr cause)
        : std::runtime_error(what)
        , cause_(std::move(cause))
    {
    }

    // The originating exception (LayoutTimeoutError, SurfaceError, ...).
    std::exception_ptr cause() const { return cause_; }

private:
    std::exception_ptr cause_;
};

// The overall render wall-clock budget ran out between stages.
class RenderTimeoutError : public std::runtime_error {
public:
    explicit RenderTimeoutError(const std::string& what) : std::runtime_error(what) {}
};

struct PipelineOptions {
    std::chrono::milliseconds layout_timeout{ 5000 };
    std::chrono::milliseconds render_timeout{ 10000 };
    std::int64_t layout_iteration_budget = 200000;
    std::vector<std::string> font_paths;
};

class RenderPipeline {
public:
    RenderPipeline(std::shared_ptr<render_cache::RenderCache> cache, PipelineOptions options);

    // fingerprint -> cache -> (miss) layout -> paint -> encode.
    // Throws RenderError, or render_cache::WaitCancelledError if `stop` fires
    // while waiting on another caller's render.
    render_cache::ArtifactPtr render(const graph_model::Graph& graph,
        const graph_model::Style& style,
        std::stop_token stop = {});

    bool invalidate(const graph_model::Fingerprint& fingerprint);

    // Aborts running force-directed layouts; used at shutdown.
    void cancel_all();

    std::uint64_t layout_runs() const { return layout_runs_.load(); }
    const std::shared_ptr<render_cache::RenderCache>& cache() const { return cache_; }
    const PipelineOptions& options() const { return options_; }

private:
    using Clock = std::chrono::steady_clock;

    render_cache::ArtifactPtr render_uncached(const graph_model::Graph& graph,
        const graph_model::Style& style,
        const graph_model::Fingerprint& fingerprint,
        Clock::time_point deadline);

    std::shared_ptr<render_cache::RenderCache> cache_;
    PipelineOptions options_;
    std::stop_source cancel_;
    std::atomic<std::uint64_t> layout_runs_{ 0 };
};

} // namespace render_pipeline
