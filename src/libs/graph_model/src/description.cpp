#include <graph_model/description.hpp>

namespace graph_model {

Graph build_graph(const GraphDescription& description) {
    GraphBuilder builder;
    for (const auto& n : description.nodes)
        builder.add_node(n.id, n.attrs);
    for (const auto& e : description.edges)
        builder.add_edge(e.source, e.target, e.attrs);
    return builder.finalize();
}

} // namespace graph_model
