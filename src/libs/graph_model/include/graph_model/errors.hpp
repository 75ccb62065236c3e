#pragma once

#include <stdexcept>
#include <string>

namespace graph_model {

// Graph construction misuse. These are caller bugs and are never retried.
class GraphError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class DuplicateNodeError : public GraphError {
public:
    explicit DuplicateNodeError(const std::string& node_id)
        : GraphError("duplicate node id: " + node_id), node_id_(node_id) {}
    const std::string& node_id() const { return node_id_; }

private:
    std::string node_id_;
};

class UnknownNodeError : public GraphError {
public:
    explicit UnknownNodeError(const std::string& node_id)
        : GraphError("edge references unknown node id: " + node_id), node_id_(node_id) {}
    const std::string& node_id() const { return node_id_; }

private:
    std::string node_id_;
};

class InvalidStateError : public GraphError {
public:
    using GraphError::GraphError;
};

} // namespace graph_model
