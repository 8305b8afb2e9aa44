#include <pagegraph_analysis/provenance.hpp>
#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <variant>

namespace pagegraph_analysis {

namespace nt = pagegraph_model::node_types;
namespace et = pagegraph_model::edge_types;
using pagegraph_model::Direction;
using pagegraph_model::Edge;
using pagegraph_model::Graph;
using pagegraph_model::Node;
using pagegraph_model::NodeId;

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

template <typename T>
bool is(const Node& n) {
    return std::holds_alternative<T>(n.type);
}

bool is_script_element(const Node& n) {
    const auto* el = std::get_if<nt::HtmlElement>(&n.type);
    return el && iequals(el->tag_name, "script");
}

const Node& require_node(const Graph& graph, const NodeId& id) {
    const Node* n = graph.node(id);
    if (!n) throw AnalysisError("no node with id '" + id + "'");
    return *n;
}

template <typename Pred>
std::vector<const Node*> neighbors_where(const Graph& graph, const NodeId& id, Direction direction, Pred pred) {
    std::vector<const Node*> out;
    for (const Node* n : graph.neighbors(id, direction).value_or(std::vector<const Node*>{})) {
        if (pred(*n)) out.push_back(n);
    }
    return out;
}

void append_unique(std::vector<const Node*>& out, std::unordered_set<const Node*>& seen,
    const std::vector<const Node*>& more)
{
    for (const Node* n : more) {
        if (seen.insert(n).second) out.push_back(n);
    }
}

} // namespace

std::vector<const Node*> nodes_of_html_tag_name(const Graph& graph, std::string_view tag_name) {
    return graph.filter_nodes([tag_name](const pagegraph_model::NodeType& t) {
        const auto* el = std::get_if<nt::HtmlElement>(&t);
        return el && iequals(el->tag_name, tag_name);
    });
}

std::vector<const Edge*> all_html_element_modifications(const Graph& graph, const NodeId& id) {
    const Node& element = require_node(graph, id);
    if (!is<nt::HtmlElement>(element))
        throw AnalysisError("node '" + id + "' is a " + pagegraph_model::kind_name(element.type) + ", not an HTML element");

    std::vector<const Edge*> modifications;
    const auto incoming = graph.incident_edges(id, Direction::Incoming);
    for (const Edge* e : *incoming) {
        if (!std::holds_alternative<et::Structure>(e->type)) modifications.push_back(e);
    }

    std::stable_sort(modifications.begin(), modifications.end(), [](const Edge* a, const Edge* b) {
        if (!a->timestamp || !b->timestamp) return a->timestamp.has_value() && !b->timestamp.has_value();
        return *a->timestamp < *b->timestamp;
    });
    return modifications;
}

std::vector<const Node*> resources_from_script(const Graph& graph, const NodeId& id) {
    const Node& origin = require_node(graph, id);
    const bool script_node = is<nt::Script>(origin);
    if (!script_node && !is_script_element(origin)) {
        throw AnalysisError("node '" + id + "' is neither a script nor a <script> element");
    }

    std::vector<const Node*> out;
    std::unordered_set<const Node*> seen;
    append_unique(out, seen, neighbors_where(graph, id, Direction::Outgoing, is<nt::Resource>));
    if (script_node) return out;

    for (const Node* script : neighbors_where(graph, id, Direction::Outgoing, is<nt::Script>))
        append_unique(out, seen, neighbors_where(graph, script->id, Direction::Outgoing, is<nt::Resource>));
    return out;
}

std::optional<std::string> root_url(const Graph& graph) {
    const Node* top = nullptr;
    for (const Node* root : graph.nodes_of_type<nt::DomRoot>()) {
        if (!graph.incident_edges(root->id, Direction::Incoming)->empty()) continue;
        if (top) throw AnalysisError("graph has more than one top-level DOM root");
        top = root;
    }
    if (!top) return std::nullopt;
    return std::get<nt::DomRoot>(top->type).url;
}

std::vector<const Node*> direct_downstream_effects_of(const Graph& graph, const NodeId& id) {
    const Node& origin = require_node(graph, id);
    std::vector<const Node*> out;
    std::unordered_set<const Node*> seen;

    if (is<nt::Resource>(origin)) {
        // A fetched script runs through the <script> element its request completed to.
        const auto outgoing = graph.incident_edges(id, Direction::Outgoing);
        for (const Edge* e : *outgoing) {
            if (!std::holds_alternative<et::RequestComplete>(e->type)) continue;
            const Node& element = graph.target(*e);
            if (!is_script_element(element)) continue;
            append_unique(out, seen, neighbors_where(graph, element.id, Direction::Outgoing, is<nt::Script>));
        }
    } else if (is_script_element(origin)) {
        append_unique(out, seen, neighbors_where(graph, id, Direction::Outgoing, is<nt::Resource>));
        // Inline scripts request nothing and execute directly.
        if (out.empty())
            append_unique(out, seen, neighbors_where(graph, id, Direction::Outgoing, is<nt::Script>));
    } else if (is<nt::Script>(origin)) {
        const auto incoming = graph.incident_edges(id, Direction::Incoming);
        for (const Edge* e : *incoming) {
            if (std::holds_alternative<et::RequestComplete>(e->type))
                append_unique(out, seen, {&graph.source(*e)});
        }
        append_unique(out, seen, neighbors_where(graph, id, Direction::Outgoing, is<nt::Script>));
    }
    return out;
}

std::vector<const Node*> all_downstream_effects_of(const Graph& graph, const NodeId& id) {
    const Node& start = require_node(graph, id);
    std::vector<const Node*> out;
    std::unordered_set<const Node*> seen{&start};
    std::vector<const Node*> pending{&start};

    while (!pending.empty()) {
        const Node* current = pending.back();
        pending.pop_back();
        for (const Node* effect : direct_downstream_effects_of(graph, current->id)) {
            if (!seen.insert(effect).second) continue;
            out.push_back(effect);
            pending.push_back(effect);
        }
    }
    return out;
}

} // namespace pagegraph_analysis
