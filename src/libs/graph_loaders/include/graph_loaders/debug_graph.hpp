#pragma once

#include <graph_model/description.hpp>

namespace graph_loaders {

// Built-in sample: a build pipeline with a retry cycle, a self-loop, mixed shapes
// and a detached pair of nodes. Used by clipper_render --debug-graph and in tests.
graph_model::GraphDescription generate_debug_graph();

} // namespace graph_loaders
