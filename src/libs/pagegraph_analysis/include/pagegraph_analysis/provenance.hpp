#pragma once

#include <pagegraph_model/graph.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pagegraph_analysis {

// The queried node is missing or of a kind the analysis does not apply to.
class AnalysisError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// HtmlElement nodes whose tag name matches, ignoring ASCII case.
std::vector<const pagegraph_model::Node*> nodes_of_html_tag_name(
    const pagegraph_model::Graph& graph, std::string_view tag_name);

// Every non-structure edge into an HtmlElement, oldest first. Edges without a
// timestamp keep their document order after the timestamped ones.
std::vector<const pagegraph_model::Edge*> all_html_element_modifications(
    const pagegraph_model::Graph& graph, const pagegraph_model::NodeId& id);

// Resource nodes requested by a Script node, or by a <script> HtmlElement either
// directly (src=...) or through a Script it executed.
std::vector<const pagegraph_model::Node*> resources_from_script(
    const pagegraph_model::Graph& graph, const pagegraph_model::NodeId& id);

// URL of the top-level DOM root, i.e. the DomRoot without incoming edges.
// Throws AnalysisError when there is more than one such root.
std::optional<std::string> root_url(const pagegraph_model::Graph& graph);

// Nodes directly caused by `id`. Only resources, scripts and <script> elements
// have modelled effects; other kinds yield an empty list.
std::vector<const pagegraph_model::Node*> direct_downstream_effects_of(
    const pagegraph_model::Graph& graph, const pagegraph_model::NodeId& id);

// Transitive closure of direct_downstream_effects_of, without the start node.
std::vector<const pagegraph_model::Node*> all_downstream_effects_of(
    const pagegraph_model::Graph& graph, const pagegraph_model::NodeId& id);

} // namespace pagegraph_analysis
