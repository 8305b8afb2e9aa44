#include <pagegraph_model/decode_error.hpp>
#include <pagegraph_model/graph.hpp>
#include <pagegraph_model/graph_assembler.hpp>

#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

using namespace pagegraph_model;

namespace {

Node html(const std::string& id, const std::string& tag, bool deleted = false) {
    node_types::HtmlElement el;
    el.tag_name = tag;
    el.is_deleted = deleted;
    return Node{id, el, std::nullopt};
}

Node text(const std::string& id) {
    return Node{id, node_types::TextNode{}, std::nullopt};
}

Edge structure(const std::string& id, const std::string& source, const std::string& target) {
    return Edge{id, source, target, edge_types::Structure{}, std::nullopt};
}

template <typename T>
std::vector<std::string> ids(const std::vector<const T*>& items) {
    std::vector<std::string> out;
    for (const T* item : items) out.push_back(item->id);
    return out;
}

// n1(div) -e1-> n2(text), n1 -e2-> n3(span), n3 -e3-> n1, n1 -e4-> n2, n4(p, deleted) isolated.
Graph sample_graph() {
    GraphAssembler a;
    a.add_node(html("n1", "div"));
    a.add_node(text("n2"));
    a.add_node(html("n3", "span"));
    a.add_node(html("n4", "p", true));
    a.add_edge(structure("e1", "n1", "n2"));
    a.add_edge(structure("e2", "n1", "n3"));
    a.add_edge(Edge{"e3", "n3", "n1", edge_types::SetAttribute{"id", "x", false}, 40});
    a.add_edge(structure("e4", "n1", "n2"));
    return std::move(a).finish();
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
TEST(GraphAssembler, KeepsInsertionOrder) {
    Graph g = sample_graph();
    EXPECT_EQ(g.node_count(), 4u);
    EXPECT_EQ(g.edge_count(), 4u);
    EXPECT_EQ(g.nodes()[0].id, "n1");
    EXPECT_EQ(g.nodes()[3].id, "n4");
    EXPECT_EQ(g.edges()[2].id, "e3");
}

TEST(GraphAssembler, DuplicateNodeId) {
    GraphAssembler a;
    a.add_node(text("n1"));
    try {
        a.add_node(html("n1", "div"));
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), DecodeErrorKind::DuplicateIdentifier);
        EXPECT_EQ(e.element_id(), "n1");
    }
}

TEST(GraphAssembler, DuplicateEdgeId) {
    GraphAssembler a;
    a.add_node(text("n1"));
    a.add_edge(structure("e1", "n1", "n1"));
    EXPECT_THROW(a.add_edge(structure("e1", "n1", "n1")), DecodeError);
}

TEST(GraphAssembler, NodeAndEdgeIdsAreSeparateNamespaces) {
    GraphAssembler a;
    a.add_node(text("x"));
    a.add_edge(structure("x", "x", "x"));
    Graph g = std::move(a).finish();
    EXPECT_NE(g.node("x"), nullptr);
    EXPECT_NE(g.edge("x"), nullptr);
}

TEST(GraphAssembler, DanglingTarget) {
    GraphAssembler a;
    a.add_node(text("n1"));
    a.add_edge(structure("e1", "n1", "n9"));
    try {
        (void)std::move(a).finish();
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), DecodeErrorKind::DanglingEdgeReference);
        EXPECT_STREQ(to_string(e.kind()), "DanglingEdgeReference");
        EXPECT_EQ(e.element_id(), "n9");
        EXPECT_NE(std::string(e.what()).find("e1"), std::string::npos);
    }
}

TEST(GraphAssembler, EdgesMayPrecedeTheirNodes) {
    GraphAssembler a;
    a.add_edge(structure("e1", "n1", "n2"));
    a.add_node(html("n1", "div"));
    a.add_node(text("n2"));
    Graph g = std::move(a).finish();
    const Edge* e = g.edge("e1");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(g.source(*e).id, "n1");
    EXPECT_EQ(g.target(*e).id, "n2");
}

TEST(GraphAssembler, CarriesMetadata) {
    GraphAssembler a;
    a.set_metadata({{"version", "0.7.3"}, {"url", "https://a.test/"}});
    Graph g = std::move(a).finish();
    EXPECT_EQ(g.node_count(), 0u);
    ASSERT_EQ(g.metadata().size(), 2u);
    const std::string* version = find_attribute(g.metadata(), "version");
    ASSERT_NE(version, nullptr);
    EXPECT_EQ(*version, "0.7.3");
    EXPECT_EQ(find_attribute(g.metadata(), "missing"), nullptr);
}

// ---------------------------------------------------------------------------
// Lookup and filtering
// ---------------------------------------------------------------------------
TEST(Graph, LookupById) {
    Graph g = sample_graph();
    ASSERT_NE(g.node("n3"), nullptr);
    EXPECT_EQ(std::get<node_types::HtmlElement>(g.node("n3")->type).tag_name, "span");
    EXPECT_EQ(g.node("nope"), nullptr);
    ASSERT_NE(g.edge("e3"), nullptr);
    EXPECT_EQ(g.edge("e3")->timestamp, 40);
    EXPECT_EQ(g.edge("nope"), nullptr);
}

TEST(Graph, FilterNodesKeepsDocumentOrder) {
    Graph g = sample_graph();
    auto deleted_divs = g.filter_nodes([](const NodeType& t) {
        const auto* el = std::get_if<node_types::HtmlElement>(&t);
        return el && el->is_deleted;
    });
    EXPECT_EQ(ids(deleted_divs), std::vector<std::string>{"n4"});

    auto elements = g.nodes_of_type<node_types::HtmlElement>();
    EXPECT_EQ(ids(elements), (std::vector<std::string>{"n1", "n3", "n4"}));
    // Repeating a query gives the same answer.
    EXPECT_EQ(ids(g.nodes_of_type<node_types::HtmlElement>()), ids(elements));
}

TEST(Graph, FilterEdges) {
    Graph g = sample_graph();
    EXPECT_EQ(ids(g.edges_of_type<edge_types::Structure>()), (std::vector<std::string>{"e1", "e2", "e4"}));
    EXPECT_TRUE(g.filter_edges([](const EdgeType&) { return false; }).empty());
    EXPECT_EQ(g.edges_of_type<edge_types::RequestStart>().size(), 0u);
}

// ---------------------------------------------------------------------------
// Adjacency
// ---------------------------------------------------------------------------
TEST(Graph, NeighborsByDirection) {
    Graph g = sample_graph();
    // n1 reaches n2 twice (e1, e4); it is reported once.
    EXPECT_EQ(ids(*g.neighbors("n1", Direction::Outgoing)), (std::vector<std::string>{"n2", "n3"}));
    EXPECT_EQ(ids(*g.neighbors("n1", Direction::Incoming)), std::vector<std::string>{"n3"});
    EXPECT_EQ(ids(*g.neighbors("n1", Direction::Both)), (std::vector<std::string>{"n2", "n3"}));
    EXPECT_EQ(ids(*g.neighbors("n2", Direction::Incoming)), std::vector<std::string>{"n1"});
    EXPECT_TRUE(g.neighbors("n2", Direction::Outgoing)->empty());
}

TEST(Graph, IsolatedNodeHasNoNeighbors) {
    Graph g = sample_graph();
    auto around = g.neighbors("n4", Direction::Both);
    ASSERT_TRUE(around.has_value());
    EXPECT_TRUE(around->empty());
}

TEST(Graph, UnknownNodeIsDistinguishedFromNoNeighbors) {
    Graph g = sample_graph();
    EXPECT_FALSE(g.neighbors("missing", Direction::Both).has_value());
    EXPECT_FALSE(g.incident_edges("missing", Direction::Outgoing).has_value());
}

TEST(Graph, IncidentEdgesInDocumentOrder) {
    Graph g = sample_graph();
    EXPECT_EQ(ids(*g.incident_edges("n1", Direction::Outgoing)), (std::vector<std::string>{"e1", "e2", "e4"}));
    EXPECT_EQ(ids(*g.incident_edges("n1", Direction::Incoming)), std::vector<std::string>{"e3"});
    EXPECT_EQ(ids(*g.incident_edges("n1", Direction::Both)), (std::vector<std::string>{"e1", "e2", "e3", "e4"}));
}

TEST(Graph, SelfLoop) {
    GraphAssembler a;
    a.add_node(text("n1"));
    a.add_edge(structure("loop", "n1", "n1"));
    Graph g = std::move(a).finish();
    EXPECT_EQ(ids(*g.neighbors("n1", Direction::Outgoing)), std::vector<std::string>{"n1"});
    EXPECT_EQ(ids(*g.neighbors("n1", Direction::Both)), std::vector<std::string>{"n1"});
    EXPECT_EQ(ids(*g.incident_edges("n1", Direction::Both)), std::vector<std::string>{"loop"});
}

TEST(Graph, SourceAndTarget) {
    Graph g = sample_graph();
    const Edge& e = *g.edge("e3");
    EXPECT_EQ(&g.source(e), g.node("n3"));
    EXPECT_EQ(&g.target(e), g.node("n1"));
}

// ---------------------------------------------------------------------------
// Kind names
// ---------------------------------------------------------------------------
TEST(KindName, ReportsPageGraphStrings) {
    EXPECT_EQ(kind_name(NodeType{node_types::HtmlElement{}}), "HTML element");
    EXPECT_EQ(kind_name(NodeType{node_types::Storage{StorageType::CookieJar}}), "cookie jar");
    EXPECT_EQ(kind_name(NodeType{node_types::Shield{ShieldType::Ads}}), "ads shield");
    EXPECT_EQ(kind_name(NodeType{node_types::Shield{}}), "Brave Shields");
    EXPECT_EQ(kind_name(EdgeType{edge_types::RequestStart{}}), "request start");
    EXPECT_EQ(kind_name(NodeType{node_types::Unknown{"hologram", {}}}), "hologram");
    EXPECT_EQ(kind_name(EdgeType{edge_types::Unknown{"teleport", {}}}), "teleport");
}
