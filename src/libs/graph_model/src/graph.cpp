#include <graph_model/graph.hpp>
#include <graph_model/errors.hpp>
#include <utility>

namespace graph_model {

Graph::Graph()
    : data_(std::make_shared<Data>())
{
}

Graph::Graph(std::shared_ptr<const Data> data)
    : data_(std::move(data))
{
}

std::optional<std::size_t> Graph::index_of(const std::string& node_id) const {
    auto it = data_->index.find(node_id);
    if (it == data_->index.end()) return std::nullopt;
    return it->second;
}

const Node* Graph::find_node(const std::string& node_id) const {
    auto idx = index_of(node_id);
    if (!idx) return nullptr;
    return &data_->nodes[*idx];
}

GraphBuilder::GraphBuilder()
    : data_(std::make_unique<Graph::Data>())
{
}

void GraphBuilder::ensure_open(const char* operation) const {
    if (finalized_)
        throw InvalidStateError(std::string(operation) + " called on a finalized graph builder");
}

GraphBuilder& GraphBuilder::add_node(std::string id, NodeAttributes attrs) {
    ensure_open("add_node");
    if (data_->index.count(id) != 0)
        throw DuplicateNodeError(id);

    Node node;
    node.id = std::move(id);
    node.label = std::move(attrs.label);
    node.shape = attrs.shape;
    node.width = attrs.width;
    node.height = attrs.height;
    node.style = attrs.style;
    data_->index.emplace(node.id, data_->nodes.size());
    data_->nodes.push_back(std::move(node));
    return *this;
}

GraphBuilder& GraphBuilder::add_edge(std::string source, std::string target, EdgeAttributes attrs) {
    ensure_open("add_edge");
    if (data_->index.count(source) == 0)
        throw UnknownNodeError(source);
    if (data_->index.count(target) == 0)
        throw UnknownNodeError(target);

    Edge edge;
    edge.source_node_id = std::move(source);
    edge.target_node_id = std::move(target);
    edge.directed = attrs.directed;
    edge.style = attrs.style;
    edge.label = std::move(attrs.label);
    data_->edges.push_back(std::move(edge));
    return *this;
}

Graph GraphBuilder::finalize() {
    ensure_open("finalize");
    finalized_ = true;
    return Graph(std::shared_ptr<const Graph::Data>(std::move(data_)));
}

} // namespace graph_model
