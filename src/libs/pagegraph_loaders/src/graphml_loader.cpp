#include <pagegraph_loaders/graphml_loader.hpp>
#include <pagegraph_loaders/attribute_decoder.hpp>
#include <pagegraph_loaders/log.hpp>
#include <pagegraph_loaders/schema_classifier.hpp>
#include <pagegraph_model/decode_error.hpp>
#include <pagegraph_model/graph_assembler.hpp>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <climits>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pagegraph_loaders {

using pagegraph_model::DecodeError;

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

struct XmlParserCtxtDeleter {
    void operator()(xmlParserCtxt* ctxt) const { xmlFreeParserCtxt(ctxt); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlParserCtxtPtr = std::unique_ptr<xmlParserCtxt, XmlParserCtxtDeleter>;

struct KeyTable {
    std::vector<KeyDeclaration> keys;
    std::unordered_map<std::string, std::size_t> by_id;

    const KeyDeclaration* find(const std::string& id) const {
        auto it = by_id.find(id);
        return it == by_id.end() ? nullptr : &keys[it->second];
    }
};

bool is_element(const xmlNode* n, const char* name) {
    return n->type == XML_ELEMENT_NODE && std::strcmp(reinterpret_cast<const char*>(n->name), name) == 0;
}

int line_of(const xmlNode* n) {
    return static_cast<int>(xmlGetLineNo(n));
}

std::optional<std::string> xml_attribute(const xmlNode* n, const char* name) {
    xmlChar* v = xmlGetProp(n, reinterpret_cast<const xmlChar*>(name));
    if (!v) return std::nullopt;
    std::string out(reinterpret_cast<const char*>(v));
    xmlFree(v);
    return out;
}

std::string xml_content(const xmlNode* n) {
    xmlChar* v = xmlNodeGetContent(n);
    if (!v) return {};
    std::string out(reinterpret_cast<const char*>(v));
    xmlFree(v);
    return out;
}

std::string required_xml_attribute(const xmlNode* n, const char* name) {
    auto v = xml_attribute(n, name);
    if (!v) {
        throw DecodeError::malformed(std::string("<") + reinterpret_cast<const char*>(n->name)
            + "> without '" + name + "' attribute", line_of(n));
    }
    return *v;
}

void init_libxml() {
    static const bool initialized = [] {
        xmlInitParser();
        return true;
    }();
    (void)initialized;
}

XmlDocPtr parse_xml(std::string_view document) {
    if (document.size() > static_cast<std::size_t>(INT_MAX))
        throw DecodeError::malformed("document exceeds the XML reader's size limit");

    init_libxml();
    XmlParserCtxtPtr ctxt(xmlNewParserCtxt());
    if (!ctxt) throw DecodeError::malformed("cannot allocate XML parser context");

    const int flags = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NOBLANKS;
    XmlDocPtr doc(xmlCtxtReadMemory(ctxt.get(), document.data(), static_cast<int>(document.size()),
        "pagegraph.graphml", nullptr, flags));
    if (doc && ctxt->wellFormed) return doc;

    const xmlError* err = xmlCtxtGetLastError(ctxt.get());
    std::string message = err && err->message ? err->message : "document is not well-formed XML";
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
        message.pop_back();
    throw DecodeError::malformed(message, err ? err->line : 0, err ? err->int2 : 0);
}

KeyTable read_keys(const xmlNode* root) {
    KeyTable table;
    for (const xmlNode* c = root->children; c; c = c->next) {
        if (!is_element(c, "key")) continue;

        KeyDeclaration key;
        key.id = required_xml_attribute(c, "id");
        key.name = xml_attribute(c, "attr.name").value_or(key.id);
        key.type = scalar_type_for(key.name, xml_attribute(c, "attr.type").value_or("string"));
        key.domain = xml_attribute(c, "for").value_or("all");
        for (const xmlNode* d = c->children; d; d = d->next) {
            if (is_element(d, "default")) key.default_value = xml_content(d);
        }

        if (table.by_id.count(key.id)) {
            throw DecodeError::malformed("duplicate <key> id '" + key.id + "'", line_of(c));
        }
        table.by_id.emplace(key.id, table.keys.size());
        table.keys.push_back(std::move(key));
    }
    return table;
}

// <data key=...> children of a node or edge, plus defaults for declared keys it omits.
RawElement read_element(const xmlNode* el, const char* element_kind, std::string_view kind_attribute,
    const KeyTable& keys)
{
    RawElement out;
    out.id = required_xml_attribute(el, "id");
    out.line = line_of(el);

    for (const xmlNode* c = el->children; c; c = c->next) {
        if (!is_element(c, "data")) continue;
        const std::string key_id = required_xml_attribute(c, "key");
        const KeyDeclaration* key = keys.find(key_id);
        if (!key) throw DecodeError::malformed("<data> references undeclared key '" + key_id + "'", line_of(c));

        DecodedAttribute attr{key->name, decode_attribute(*key, xml_content(c))};
        bool replaced = false;
        for (auto& existing : out.attributes) {
            if (existing.name == attr.name) {
                logger()->warn("{} '{}': repeated '{}' value, keeping the last one", element_kind, out.id, attr.name);
                existing = std::move(attr);
                replaced = true;
                break;
            }
        }
        if (!replaced) out.attributes.push_back(std::move(attr));
    }

    for (const auto& key : keys.keys) {
        if (!key.default_value || !key.applies_to(element_kind)) continue;
        bool present = false;
        for (const auto& a : out.attributes) {
            if (a.name == key.name) {
                present = true;
                break;
            }
        }
        if (!present) out.attributes.push_back({key.name, decode_attribute(key, *key.default_value)});
    }

    for (const auto& a : out.attributes) {
        if (a.name == kind_attribute) {
            out.kind = a.value.raw;
            break;
        }
    }
    return out;
}

pagegraph_model::RawAttributes read_metadata(const xmlNode* graph, const KeyTable& keys) {
    pagegraph_model::RawAttributes out;
    for (const xmlNode* c = graph->children; c; c = c->next) {
        if (!is_element(c, "data")) continue;
        const std::string key_id = required_xml_attribute(c, "key");
        const KeyDeclaration* key = keys.find(key_id);
        if (!key) throw DecodeError::malformed("<data> references undeclared key '" + key_id + "'", line_of(c));
        out.emplace_back(key->name, xml_content(c));
    }
    return out;
}

pagegraph_model::Graph decode_document(const xmlDoc* doc, const DecodeOptions& options) {
    const xmlNode* root = xmlDocGetRootElement(doc);
    if (!root) throw DecodeError::malformed("document has no root element");
    if (!is_element(root, "graphml")) {
        throw DecodeError::malformed(std::string("expected <graphml> root element, found <")
            + reinterpret_cast<const char*>(root->name) + ">", line_of(root));
    }

    const KeyTable keys = read_keys(root);

    const xmlNode* graph = nullptr;
    for (const xmlNode* c = root->children; c; c = c->next) {
        if (!is_element(c, "graph")) continue;
        if (!graph) graph = c;
        else logger()->warn("ignoring additional <graph> at line {}", line_of(c));
    }
    if (!graph) throw DecodeError::malformed("missing <graph> element", line_of(root));

    pagegraph_model::GraphAssembler assembler;
    assembler.set_metadata(read_metadata(graph, keys));

    for (const xmlNode* c = graph->children; c; c = c->next) {
        if (c->type != XML_ELEMENT_NODE) continue;

        if (is_element(c, "node")) {
            RawElement element = read_element(c, "node", node_kind_attribute, keys);
            pagegraph_model::Node node;
            node.type = classify_node(element, options);
            node.timestamp = extract_timestamp(element);
            node.id = std::move(element.id);
            assembler.add_node(std::move(node));
        } else if (is_element(c, "edge")) {
            std::string source = required_xml_attribute(c, "source");
            std::string target = required_xml_attribute(c, "target");
            RawElement element = read_element(c, "edge", edge_kind_attribute, keys);
            pagegraph_model::Edge edge;
            edge.type = classify_edge(element, options);
            edge.timestamp = extract_timestamp(element);
            edge.id = std::move(element.id);
            edge.source = std::move(source);
            edge.target = std::move(target);
            assembler.add_edge(std::move(edge));
        } else if (!is_element(c, "data") && !is_element(c, "desc")) {
            logger()->warn("ignoring <{}> at line {}", reinterpret_cast<const char*>(c->name), line_of(c));
        }
    }

    pagegraph_model::Graph result = std::move(assembler).finish();
    logger()->info("decoded PageGraph with {} nodes and {} edges", result.node_count(), result.edge_count());
    return result;
}

} // namespace

pagegraph_model::Graph load_graph_from_graphml(std::string_view document, const DecodeOptions& options) {
    if (options.log_level) logger()->set_level(*options.log_level);
    XmlDocPtr doc = parse_xml(document);
    return decode_document(doc.get(), options);
}

pagegraph_model::Graph load_graph_from_graphml(std::istream& in, const DecodeOptions& options) {
    std::string buffer((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw DecodeError::io("<stream>", "read failed");
    return load_graph_from_graphml(std::string_view(buffer), options);
}

pagegraph_model::Graph load_graph_from_graphml_file(const std::string& path, const DecodeOptions& options) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw DecodeError::io(path, "cannot open file");
    logger()->debug("loading {}", path);
    return load_graph_from_graphml(f, options);
}

} // namespace pagegraph_loaders
