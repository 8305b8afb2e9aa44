#include <pagegraph_analysis/provenance.hpp>
#include <pagegraph_model/graph_assembler.hpp>

#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace pagegraph_analysis;
using namespace pagegraph_model;

namespace {

Node element(const std::string& id, const std::string& tag) {
    node_types::HtmlElement el;
    el.tag_name = tag;
    return Node{id, el, std::nullopt};
}

Node script(const std::string& id) {
    return Node{id, node_types::Script{"classic", std::nullopt, std::nullopt, std::nullopt}, std::nullopt};
}

Node resource(const std::string& id, const std::string& url) {
    return Node{id, node_types::Resource{url}, std::nullopt};
}

Node dom_root(const std::string& id, const std::string& url) {
    node_types::DomRoot root;
    root.url = url;
    return Node{id, root, std::nullopt};
}

Edge edge(const std::string& id, const std::string& source, const std::string& target, EdgeType type,
    std::optional<Timestamp> timestamp = std::nullopt)
{
    return Edge{id, source, target, std::move(type), timestamp};
}

template <typename T>
std::vector<std::string> ids(const std::vector<const T*>& items) {
    std::vector<std::string> out;
    for (const T* item : items) out.push_back(item->id);
    return out;
}

// A page at https://page.test/ with:
//   an external <SCRIPT src=lib.js> whose script fetches data and evals a second script,
//   an inline <script>, a <div> modified by scripts and the parser, and a child frame.
Graph page_graph() {
    GraphAssembler a;
    a.add_node(dom_root("root", "https://page.test/"));
    a.add_node(Node{"parser", node_types::Parser{}, std::nullopt});
    a.add_node(element("html", "html"));
    a.add_node(element("script_el", "SCRIPT"));
    a.add_node(resource("lib", "https://cdn.test/lib.js"));
    a.add_node(script("script"));
    a.add_node(script("script2"));
    a.add_node(resource("res2", "https://api.test/data"));
    a.add_node(element("inline_el", "script"));
    a.add_node(script("inline_script"));
    a.add_node(element("div", "div"));
    a.add_node(Node{"frame_owner", node_types::FrameOwner{}, std::nullopt});
    a.add_node(dom_root("frame_root", "https://frame.test/"));

    a.add_edge(edge("s1", "root", "html", edge_types::Structure{}));
    a.add_edge(edge("s2", "html", "script_el", edge_types::Structure{}));
    a.add_edge(edge("s3", "html", "inline_el", edge_types::Structure{}));
    a.add_edge(edge("s4", "html", "div", edge_types::Structure{}));
    a.add_edge(edge("x1", "frame_owner", "frame_root", edge_types::CrossDom{}));

    a.add_edge(edge("r1", "script_el", "lib", edge_types::RequestStart{1, "script"}));
    a.add_edge(edge("r2", "lib", "script_el", edge_types::RequestComplete{1, "complete"}));
    a.add_edge(edge("x2", "script_el", "script", edge_types::Execute{}));
    a.add_edge(edge("r3", "script", "res2", edge_types::RequestStart{2, "fetch"}));
    a.add_edge(edge("r4", "res2", "script", edge_types::RequestComplete{2, "complete"}));
    a.add_edge(edge("x3", "script", "script2", edge_types::Execute{}));
    a.add_edge(edge("x4", "inline_el", "inline_script", edge_types::Execute{}));

    a.add_edge(edge("m1", "script", "div", edge_types::SetAttribute{"class", "ad", false}, 8));
    a.add_edge(edge("m2", "script2", "div", edge_types::SetAttribute{"hidden", "", false}));
    a.add_edge(edge("m3", "script", "div", edge_types::CreateNode{}, 5));
    a.add_edge(edge("m4", "parser", "div", edge_types::InsertNode{}, 6));
    return std::move(a).finish();
}

} // namespace

// ---------------------------------------------------------------------------
// Element queries
// ---------------------------------------------------------------------------
TEST(Provenance, NodesOfHtmlTagNameIgnoresCase) {
    Graph g = page_graph();
    EXPECT_EQ(ids(nodes_of_html_tag_name(g, "script")), (std::vector<std::string>{"script_el", "inline_el"}));
    EXPECT_EQ(ids(nodes_of_html_tag_name(g, "SCRIPT")), (std::vector<std::string>{"script_el", "inline_el"}));
    EXPECT_EQ(ids(nodes_of_html_tag_name(g, "Div")), std::vector<std::string>{"div"});
    EXPECT_TRUE(nodes_of_html_tag_name(g, "iframe").empty());
}

TEST(Provenance, ModificationsOrderedByTimestamp) {
    Graph g = page_graph();
    // Structure edges are not modifications; the untimed edge goes last.
    EXPECT_EQ(ids(all_html_element_modifications(g, "div")),
        (std::vector<std::string>{"m3", "m4", "m1", "m2"}));
    EXPECT_TRUE(all_html_element_modifications(g, "html").empty());
}

TEST(Provenance, ModificationsRequireAnHtmlElement) {
    Graph g = page_graph();
    EXPECT_THROW((void)all_html_element_modifications(g, "script"), AnalysisError);
    EXPECT_THROW((void)all_html_element_modifications(g, "missing"), AnalysisError);
}

// ---------------------------------------------------------------------------
// Script resources
// ---------------------------------------------------------------------------
TEST(Provenance, ResourcesFromScriptNode) {
    Graph g = page_graph();
    EXPECT_EQ(ids(resources_from_script(g, "script")), std::vector<std::string>{"res2"});
    EXPECT_TRUE(resources_from_script(g, "script2").empty());
}

TEST(Provenance, ResourcesFromScriptElementIncludeExecutedScripts) {
    Graph g = page_graph();
    EXPECT_EQ(ids(resources_from_script(g, "script_el")), (std::vector<std::string>{"lib", "res2"}));
    EXPECT_TRUE(resources_from_script(g, "inline_el").empty());
}

TEST(Provenance, ResourcesFromScriptRejectsOtherNodes) {
    Graph g = page_graph();
    EXPECT_THROW((void)resources_from_script(g, "div"), AnalysisError);
    EXPECT_THROW((void)resources_from_script(g, "lib"), AnalysisError);
    EXPECT_THROW((void)resources_from_script(g, "missing"), AnalysisError);
}

// ---------------------------------------------------------------------------
// Root URL
// ---------------------------------------------------------------------------
TEST(Provenance, RootUrlSkipsFrameRoots) {
    Graph g = page_graph();
    EXPECT_EQ(root_url(g), "https://page.test/");
}

TEST(Provenance, RootUrlWithoutRoot) {
    GraphAssembler a;
    a.add_node(element("div", "div"));
    Graph g = std::move(a).finish();
    EXPECT_FALSE(root_url(g).has_value());
}

TEST(Provenance, RootUrlAmbiguous) {
    GraphAssembler a;
    a.add_node(dom_root("a", "https://a.test/"));
    a.add_node(dom_root("b", "https://b.test/"));
    Graph g = std::move(a).finish();
    EXPECT_THROW((void)root_url(g), AnalysisError);
}

// ---------------------------------------------------------------------------
// Downstream effects
// ---------------------------------------------------------------------------
TEST(Provenance, DirectEffects) {
    Graph g = page_graph();
    EXPECT_EQ(ids(direct_downstream_effects_of(g, "script_el")), std::vector<std::string>{"lib"});
    EXPECT_EQ(ids(direct_downstream_effects_of(g, "lib")), std::vector<std::string>{"script"});
    EXPECT_EQ(ids(direct_downstream_effects_of(g, "script")), (std::vector<std::string>{"res2", "script2"}));
    EXPECT_EQ(ids(direct_downstream_effects_of(g, "inline_el")), std::vector<std::string>{"inline_script"});
    EXPECT_TRUE(direct_downstream_effects_of(g, "div").empty());
    EXPECT_THROW((void)direct_downstream_effects_of(g, "missing"), AnalysisError);
}

TEST(Provenance, AllEffectsFollowTheChain) {
    Graph g = page_graph();
    EXPECT_EQ(ids(all_downstream_effects_of(g, "script_el")),
        (std::vector<std::string>{"lib", "script", "res2", "script2"}));
    EXPECT_EQ(ids(all_downstream_effects_of(g, "inline_el")), std::vector<std::string>{"inline_script"});
    EXPECT_TRUE(all_downstream_effects_of(g, "script2").empty());
}

TEST(Provenance, AllEffectsTerminateOnCycles) {
    GraphAssembler a;
    a.add_node(script("s1"));
    a.add_node(script("s2"));
    a.add_edge(edge("x1", "s1", "s2", edge_types::Execute{}));
    a.add_edge(edge("x2", "s2", "s1", edge_types::Execute{}));
    Graph g = std::move(a).finish();
    EXPECT_EQ(ids(all_downstream_effects_of(g, "s1")), std::vector<std::string>{"s2"});
}
