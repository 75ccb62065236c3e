// clipper_render: renders a JSON graph description to SVG or PNG (C++20)
#include <graph_loaders/debug_graph.hpp>
#include <graph_loaders/json_loader.hpp>
#include <graph_model/errors.hpp>
#include <render_service/config.hpp>
#include <render_service/service.hpp>
#include <cstdio>
#include <exception>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

void print_usage(const char* argv0)
{
    (void)fprintf(stderr,
        "usage: %s [--config FILE] [--style FILE] [--format svg|png]\n"
        "          [--layout hierarchical|force_directed] [--debug-graph] [INPUT.json] OUTPUT\n",
        argv0);
}

bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Prints the originating exception of a RenderError.
void print_cause(const std::exception_ptr& cause)
{
    if (!cause) return;
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& ex) {
        (void)fprintf(stderr, "  caused by: %s\n", ex.what());
    }
}

} // namespace

int main(int argc, char* argv[])
{
    std::string config_path;
    std::string style_path;
    std::optional<graph_model::ImageFormat> format;
    std::optional<graph_model::LayoutAlgorithm> layout;
    bool debug_graph = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            config_path = argv[++i];
        } else if (arg == "--style" && has_value) {
            style_path = argv[++i];
        } else if (arg == "--format" && has_value) {
            format = graph_model::image_format_from_string(argv[++i]);
            if (!format) {
                (void)fprintf(stderr, "unknown format: %s\n", argv[i]);
                return 1;
            }
        } else if (arg == "--layout" && has_value) {
            layout = graph_model::layout_algorithm_from_string(argv[++i]);
            if (!layout) {
                (void)fprintf(stderr, "unknown layout: %s\n", argv[i]);
                return 1;
            }
        } else if (arg == "--debug-graph") {
            debug_graph = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != (debug_graph ? 1u : 2u)) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string output_path = positional.back();

    render_service::ServiceConfig config;
    if (!config_path.empty()) {
        auto loaded = render_service::load_service_config_from_json_file(config_path);
        if (!loaded) {
            (void)fprintf(stderr, "Failed to load config %s\n", config_path.c_str());
            return 1;
        }
        config = std::move(*loaded);
    }
    // One render: no point in a pool wider than one thread.
    config.worker_threads = 1;

    graph_model::Style style;
    if (!style_path.empty()) {
        auto loaded = graph_loaders::load_style_from_json_file(style_path);
        if (!loaded) {
            (void)fprintf(stderr, "Failed to load style %s\n", style_path.c_str());
            return 1;
        }
        style = std::move(*loaded);
    }
    if (format) {
        style.format = *format;
    } else if (ends_with(output_path, ".png")) {
        style.format = graph_model::ImageFormat::Png;
    } else if (ends_with(output_path, ".svg")) {
        style.format = graph_model::ImageFormat::Svg;
    }
    if (layout) style.layout = *layout;

    std::optional<graph_model::GraphDescription> description;
    if (debug_graph) {
        description = graph_loaders::generate_debug_graph();
    } else {
        description = graph_loaders::load_graph_description_from_json_file(positional.front());
        if (!description) {
            (void)fprintf(stderr, "Failed to load graph %s\n", positional.front().c_str());
            return 1;
        }
    }

    render_service::RenderService service(std::move(config));
    render_cache::ArtifactPtr artifact;
    try {
        artifact = service.render(*description, style);
    } catch (const graph_model::GraphError& ex) {
        (void)fprintf(stderr, "Invalid graph: %s\n", ex.what());
        return 1;
    } catch (const render_pipeline::RenderError& ex) {
        (void)fprintf(stderr, "Render failed: %s\n", ex.what());
        print_cause(ex.cause());
        return 2;
    }

    std::ofstream out(output_path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(artifact->bytes.data()),
        static_cast<std::streamsize>(artifact->bytes.size()));
    if (!out) {
        (void)fprintf(stderr, "Failed to write %s\n", output_path.c_str());
        return 1;
    }

    (void)printf("%s %s %dx%d %zu bytes -> %s\n",
        artifact->fingerprint.hex().c_str(), artifact->content_type.c_str(),
        artifact->width, artifact->height, artifact->bytes.size(), output_path.c_str());
    return 0;
}
