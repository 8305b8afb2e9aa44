#pragma once

#include <pagegraph_model/types.hpp>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <variant>
#include <vector>

namespace pagegraph_model {

enum class Direction { Incoming, Outgoing, Both };

class GraphAssembler;

// Immutable PageGraph. Built only by GraphAssembler; every edge endpoint is a node
// of the same graph. Node and edge order is document order. Pointers returned by
// queries refer into this instance.
class Graph {
public:
    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }
    std::size_t node_count() const { return nodes_.size(); }
    std::size_t edge_count() const { return edges_.size(); }

    // <data> children of the <graph> element.
    const RawAttributes& metadata() const { return metadata_; }

    // nullptr when the id is not present.
    const Node* node(const NodeId& id) const;
    const Edge* edge(const EdgeId& id) const;

    const Node& source(const Edge& edge) const;
    const Node& target(const Edge& edge) const;

    template <typename Predicate>
    std::vector<const Node*> filter_nodes(Predicate&& predicate) const {
        std::vector<const Node*> out;
        for (const auto& n : nodes_) {
            if (predicate(n.type)) out.push_back(&n);
        }
        return out;
    }

    template <typename Predicate>
    std::vector<const Edge*> filter_edges(Predicate&& predicate) const {
        std::vector<const Edge*> out;
        for (const auto& e : edges_) {
            if (predicate(e.type)) out.push_back(&e);
        }
        return out;
    }

    template <typename T>
    std::vector<const Node*> nodes_of_type() const {
        return filter_nodes([](const NodeType& t) { return std::holds_alternative<T>(t); });
    }

    template <typename T>
    std::vector<const Edge*> edges_of_type() const {
        return filter_edges([](const EdgeType& t) { return std::holds_alternative<T>(t); });
    }

    // Distinct adjacent nodes, ordered by the first incident edge that reaches them.
    // std::nullopt when `id` is not a node of this graph.
    std::optional<std::vector<const Node*>> neighbors(const NodeId& id, Direction direction) const;

    // Each incident edge once, in document order.
    std::optional<std::vector<const Edge*>> incident_edges(const NodeId& id, Direction direction) const;

private:
    friend class GraphAssembler;
    Graph() = default;

    std::vector<std::size_t> incident_positions(std::size_t node_pos, Direction direction) const;

    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    RawAttributes metadata_;
    std::unordered_map<NodeId, std::size_t> node_index_;
    std::unordered_map<EdgeId, std::size_t> edge_index_;
    // Edge positions per node position, ascending.
    std::vector<std::vector<std::size_t>> outgoing_;
    std::vector<std::vector<std::size_t>> incoming_;
    // Endpoint node positions per edge position.
    std::vector<std::pair<std::size_t, std::size_t>> endpoints_;
};

} // namespace pagegraph_model
