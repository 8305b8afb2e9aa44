#include <pagegraph_model/graph_assembler.hpp>
#include <pagegraph_model/decode_error.hpp>
#include <utility>

namespace pagegraph_model {

void GraphAssembler::add_node(Node node) {
    const std::size_t pos = graph_.nodes_.size();
    if (!graph_.node_index_.emplace(node.id, pos).second)
        throw DecodeError::duplicate_identifier(node.id, "node");
    graph_.nodes_.push_back(std::move(node));
}

void GraphAssembler::add_edge(Edge edge) {
    const std::size_t pos = graph_.edges_.size();
    if (!graph_.edge_index_.emplace(edge.id, pos).second)
        throw DecodeError::duplicate_identifier(edge.id, "edge");
    graph_.edges_.push_back(std::move(edge));
}

void GraphAssembler::set_metadata(RawAttributes metadata) {
    graph_.metadata_ = std::move(metadata);
}

Graph GraphAssembler::finish() && {
    Graph& g = graph_;
    g.outgoing_.assign(g.nodes_.size(), {});
    g.incoming_.assign(g.nodes_.size(), {});
    g.endpoints_.clear();
    g.endpoints_.reserve(g.edges_.size());

    for (std::size_t edge_pos = 0; edge_pos < g.edges_.size(); ++edge_pos) {
        const Edge& e = g.edges_[edge_pos];
        auto src = g.node_index_.find(e.source);
        if (src == g.node_index_.end()) throw DecodeError::dangling_edge(e.id, e.source);
        auto dst = g.node_index_.find(e.target);
        if (dst == g.node_index_.end()) throw DecodeError::dangling_edge(e.id, e.target);

        g.endpoints_.emplace_back(src->second, dst->second);
        g.outgoing_[src->second].push_back(edge_pos);
        g.incoming_[dst->second].push_back(edge_pos);
    }

    return std::move(graph_);
}

} // namespace pagegraph_model
