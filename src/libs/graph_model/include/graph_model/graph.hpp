#pragma once

#include <graph_model/types.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace graph_model {

// Immutable graph snapshot. Copies share the same read-only data, so a Graph can be
// handed to concurrent renders without locking. Nodes and edges keep insertion order.
class Graph {
public:
    Graph();

    const std::vector<Node>& nodes() const { return data_->nodes; }
    const std::vector<Edge>& edges() const { return data_->edges; }
    std::size_t node_count() const { return data_->nodes.size(); }
    std::size_t edge_count() const { return data_->edges.size(); }
    bool empty() const { return data_->nodes.empty(); }

    std::optional<std::size_t> index_of(const std::string& node_id) const;
    const Node* find_node(const std::string& node_id) const;

private:
    friend class GraphBuilder;

    struct Data {
        std::vector<Node> nodes;
        std::vector<Edge> edges;
        std::unordered_map<std::string, std::size_t> index;
    };

    explicit Graph(std::shared_ptr<const Data> data);

    std::shared_ptr<const Data> data_;
};

class GraphBuilder {
public:
    GraphBuilder();

    // Throws DuplicateNodeError if the id is already present, InvalidStateError after finalize().
    GraphBuilder& add_node(std::string id, NodeAttributes attrs = {});
    // Throws UnknownNodeError if either endpoint is absent, InvalidStateError after finalize().
    GraphBuilder& add_edge(std::string source, std::string target, EdgeAttributes attrs = {});

    // Hands out the snapshot; the builder rejects every later call.
    Graph finalize();
    bool finalized() const { return finalized_; }

private:
    void ensure_open(const char* operation) const;

    std::unique_ptr<Graph::Data> data_;
    bool finalized_ = false;
};

} // namespace graph_model
