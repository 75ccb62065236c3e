#pragma once

#include <graph_model/graph.hpp>
#include <graph_model/types.hpp>
#include <string>
#include <vector>

namespace graph_model {

struct NodeRecord {
    std::string id;
    NodeAttributes attrs;
};

struct EdgeRecord {
    std::string source;
    std::string target;
    EdgeAttributes attrs;
};

// Graph description as handed over by the service layer: ordered node and edge records.
struct GraphDescription {
    std::string name;
    std::vector<NodeRecord> nodes;
    std::vector<EdgeRecord> edges;
};

// Builds through GraphBuilder, so DuplicateNodeError / UnknownNodeError apply.
Graph build_graph(const GraphDescription& description);

} // namespace graph_model
