#include <pagegraph_model/graph.hpp>
#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace pagegraph_model {

const Node* Graph::node(const NodeId& id) const {
    auto it = node_index_.find(id);
    if (it == node_index_.end()) return nullptr;
    return &nodes_[it->second];
}

const Edge* Graph::edge(const EdgeId& id) const {
    auto it = edge_index_.find(id);
    if (it == edge_index_.end()) return nullptr;
    return &edges_[it->second];
}

const Node& Graph::source(const Edge& edge) const {
    return nodes_[node_index_.at(edge.source)];
}

const Node& Graph::target(const Edge& edge) const {
    return nodes_[node_index_.at(edge.target)];
}

std::vector<std::size_t> Graph::incident_positions(std::size_t node_pos, Direction direction) const {
    switch (direction) {
    case Direction::Outgoing:
        return outgoing_[node_pos];
    case Direction::Incoming:
        return incoming_[node_pos];
    case Direction::Both:
        break;
    }

    // Both lists are ascending; a self-loop sits in each and is kept once.
    std::vector<std::size_t> out;
    const auto& outs = outgoing_[node_pos];
    const auto& ins = incoming_[node_pos];
    out.reserve(outs.size() + ins.size());
    std::set_union(outs.begin(), outs.end(), ins.begin(), ins.end(), std::back_inserter(out));
    return out;
}

std::optional<std::vector<const Node*>> Graph::neighbors(const NodeId& id, Direction direction) const {
    auto it = node_index_.find(id);
    if (it == node_index_.end()) return std::nullopt;
    const std::size_t self = it->second;

    std::vector<const Node*> out;
    std::unordered_set<std::size_t> seen;
    for (std::size_t edge_pos : incident_positions(self, direction)) {
        const auto& [src, dst] = endpoints_[edge_pos];
        std::size_t other;
        if (direction == Direction::Outgoing)
            other = dst;
        else if (direction == Direction::Incoming)
            other = src;
        else
            other = src == self ? dst : src;
        if (seen.insert(other).second) out.push_back(&nodes_[other]);
    }
    return out;
}

std::optional<std::vector<const Edge*>> Graph::incident_edges(const NodeId& id, Direction direction) const {
    auto it = node_index_.find(id);
    if (it == node_index_.end()) return std::nullopt;

    std::vector<const Edge*> out;
    for (std::size_t edge_pos : incident_positions(it->second, direction))
        out.push_back(&edges_[edge_pos]);
    return out;
}

} // namespace pagegraph_model
