#pragma once

#include <pagegraph_model/graph.hpp>
#include <pagegraph_model/types.hpp>
#include <unordered_map>

namespace pagegraph_model {

// Collects classified nodes and edges in document order and links them into a Graph.
// Throws DecodeError (DuplicateIdentifier, DanglingEdgeReference).
class GraphAssembler {
public:
    void add_node(Node node);
    void add_edge(Edge edge);
    void set_metadata(RawAttributes metadata);

    // Resolves edge endpoints and builds the adjacency index. Edges may have been
    // added before the nodes they reference.
    Graph finish() &&;

private:
    Graph graph_;
};

} // namespace pagegraph_model
