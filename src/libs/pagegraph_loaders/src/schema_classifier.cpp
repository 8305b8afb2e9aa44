#include <pagegraph_loaders/schema_classifier.hpp>
#include <pagegraph_loaders/log.hpp>
#include <pagegraph_model/decode_error.hpp>
#include <unordered_map>

namespace pagegraph_loaders {

namespace nt = pagegraph_model::node_types;
namespace et = pagegraph_model::edge_types;
using pagegraph_model::DecodeError;
using pagegraph_model::DecodeErrorKind;
using pagegraph_model::EdgeType;
using pagegraph_model::NodeType;
using pagegraph_model::RawAttributes;

namespace {

// Pulls typed fields out of an element for one kind. Tracks which attributes were
// consumed so the rest can be kept verbatim.
class FieldReader {
public:
    FieldReader(const RawElement& element, const std::string& kind)
        : element_(element), kind_(kind), consumed_(element.attributes.size(), false)
    {
        mark(node_kind_attribute);
        mark(edge_kind_attribute);
        mark(timestamp_attribute);
    }

    std::string required_string(std::string_view field) {
        const DecodedAttribute* a = take(field);
        if (!a) throw missing(field);
        return as_string(a->value);
    }

    std::optional<std::string> optional_string(std::string_view field) {
        const DecodedAttribute* a = take(field);
        if (!a) return std::nullopt;
        return as_string(a->value);
    }

    std::int64_t required_integer(std::string_view field) {
        const DecodedAttribute* a = take(field);
        if (!a) throw missing(field);
        auto v = as_integer(a->value);
        if (!v) throw missing(field);
        return *v;
    }

    std::optional<std::int64_t> optional_integer(std::string_view field) {
        const DecodedAttribute* a = take(field);
        if (!a) return std::nullopt;
        auto v = as_integer(a->value);
        if (!v) undecodable(*a);
        return v;
    }

    bool flag(std::string_view field, bool fallback = false) {
        const DecodedAttribute* a = take(field);
        if (!a) return fallback;
        auto v = as_boolean(a->value);
        if (!v) {
            undecodable(*a);
            return fallback;
        }
        return *v;
    }

    RawAttributes remaining() const {
        RawAttributes out;
        for (std::size_t i = 0; i < element_.attributes.size(); ++i) {
            if (!consumed_[i])
                out.emplace_back(element_.attributes[i].name, element_.attributes[i].value.raw);
        }
        return out;
    }

private:
    const DecodedAttribute* take(std::string_view field) {
        const DecodedAttribute* found = nullptr;
        for (std::size_t i = 0; i < element_.attributes.size(); ++i) {
            if (element_.attributes[i].name == field) {
                consumed_[i] = true;
                found = &element_.attributes[i];
            }
        }
        return found;
    }

    void mark(std::string_view field) { (void)take(field); }

    DecodeError missing(std::string_view field) const {
        return DecodeError::missing_field(element_.id, kind_, std::string(field), element_.line);
    }

    void undecodable(const DecodedAttribute& a) const {
        logger()->debug("element '{}' ({}): ignoring '{}' value '{}', not a valid {}",
            element_.id, kind_, a.name, a.value.raw, to_string(a.value.type));
    }

    const RawElement& element_;
    const std::string& kind_;
    std::vector<bool> consumed_;
};

using NodeBuilder = NodeType (*)(FieldReader&);
using EdgeBuilder = EdgeType (*)(FieldReader&);

template <typename T>
T listener_edge(FieldReader& r) {
    T e;
    e.key = r.optional_string("key");
    e.event_listener_id = r.optional_integer("event listener id");
    return e;
}

const std::unordered_map<std::string_view, NodeBuilder>& node_table() {
    static const std::unordered_map<std::string_view, NodeBuilder> table = {
        {"HTML element", [](FieldReader& r) -> NodeType {
            nt::HtmlElement n;
            n.tag_name = r.required_string("tag name");
            n.is_deleted = r.flag("is deleted");
            n.node_id = r.optional_integer("node id");
            n.attributes = r.remaining();
            return n;
        }},
        {"text node", [](FieldReader& r) -> NodeType {
            nt::TextNode n;
            n.is_deleted = r.flag("is deleted");
            n.node_id = r.optional_integer("node id");
            n.text = r.optional_string("text");
            return n;
        }},
        {"DOM root", [](FieldReader& r) -> NodeType {
            nt::DomRoot n;
            n.url = r.optional_string("url");
            n.tag_name = r.optional_string("tag name");
            n.node_id = r.optional_integer("node id");
            n.is_deleted = r.flag("is deleted");
            return n;
        }},
        {"frame owner", [](FieldReader& r) -> NodeType {
            nt::FrameOwner n;
            n.tag_name = r.optional_string("tag name");
            n.node_id = r.optional_integer("node id");
            n.is_deleted = r.flag("is deleted");
            return n;
        }},
        {"remote frame", [](FieldReader& r) -> NodeType {
            return nt::RemoteFrame{r.required_string("frame id")};
        }},
        {"script", [](FieldReader& r) -> NodeType {
            nt::Script n;
            n.script_type = r.required_string("script type");
            n.source = r.optional_string("source");
            n.script_id = r.optional_integer("script id");
            n.url = r.optional_string("url");
            return n;
        }},
        {"storage", [](FieldReader&) -> NodeType { return nt::Storage{pagegraph_model::StorageType::Root}; }},
        {"local storage", [](FieldReader&) -> NodeType { return nt::Storage{pagegraph_model::StorageType::LocalStorage}; }},
        {"session storage", [](FieldReader&) -> NodeType { return nt::Storage{pagegraph_model::StorageType::SessionStorage}; }},
        {"cookie jar", [](FieldReader&) -> NodeType { return nt::Storage{pagegraph_model::StorageType::CookieJar}; }},
        {"web API", [](FieldReader& r) -> NodeType { return nt::WebApi{r.required_string("method")}; }},
        {"JS builtin", [](FieldReader& r) -> NodeType { return nt::JsBuiltin{r.required_string("method")}; }},
        {"resource", [](FieldReader& r) -> NodeType { return nt::Resource{r.required_string("url")}; }},
        {"parser", [](FieldReader&) -> NodeType { return nt::Parser{}; }},
        {"extensions", [](FieldReader&) -> NodeType { return nt::Extensions{}; }},
        {"ad filter", [](FieldReader& r) -> NodeType { return nt::AdFilter{r.optional_string("rule")}; }},
        {"tracker filter", [](FieldReader&) -> NodeType { return nt::TrackerFilter{}; }},
        {"fingerprinting filter", [](FieldReader&) -> NodeType { return nt::FingerprintingFilter{}; }},
        {"Brave Shields", [](FieldReader&) -> NodeType { return nt::Shield{pagegraph_model::ShieldType::Root}; }},
        {"ads shield", [](FieldReader&) -> NodeType { return nt::Shield{pagegraph_model::ShieldType::Ads}; }},
        {"trackers shield", [](FieldReader&) -> NodeType { return nt::Shield{pagegraph_model::ShieldType::Trackers}; }},
        {"javascript shield", [](FieldReader&) -> NodeType { return nt::Shield{pagegraph_model::ShieldType::Javascript}; }},
        {"fingerprinting shield", [](FieldReader&) -> NodeType { return nt::Shield{pagegraph_model::ShieldType::Fingerprinting}; }},
    };
    return table;
}

const std::unordered_map<std::string_view, EdgeBuilder>& edge_table() {
    static const std::unordered_map<std::string_view, EdgeBuilder> table = {
        {"structure", [](FieldReader&) -> EdgeType { return et::Structure{}; }},
        {"cross DOM", [](FieldReader&) -> EdgeType { return et::CrossDom{}; }},
        {"create node", [](FieldReader&) -> EdgeType { return et::CreateNode{}; }},
        {"insert node", [](FieldReader& r) -> EdgeType {
            et::InsertNode e;
            e.parent = r.optional_integer("parent");
            e.before = r.optional_integer("before");
            return e;
        }},
        {"remove node", [](FieldReader&) -> EdgeType { return et::RemoveNode{}; }},
        {"delete node", [](FieldReader&) -> EdgeType { return et::DeleteNode{}; }},
        {"set attribute", [](FieldReader& r) -> EdgeType {
            et::SetAttribute e;
            e.key = r.optional_string("key");
            e.value = r.optional_string("value");
            e.is_style = r.flag("is style");
            return e;
        }},
        {"delete attribute", [](FieldReader& r) -> EdgeType {
            et::DeleteAttribute e;
            e.key = r.optional_string("key");
            e.is_style = r.flag("is style");
            return e;
        }},
        {"text change", [](FieldReader& r) -> EdgeType { return et::TextChange{r.optional_string("text")}; }},
        {"request start", [](FieldReader& r) -> EdgeType {
            et::RequestStart e;
            e.request_id = r.required_integer("request id");
            e.request_type = r.optional_string("request type");
            return e;
        }},
        {"request complete", [](FieldReader& r) -> EdgeType {
            et::RequestComplete e;
            e.request_id = r.required_integer("request id");
            e.status = r.optional_string("status");
            return e;
        }},
        {"request error", [](FieldReader& r) -> EdgeType {
            et::RequestError e;
            e.request_id = r.required_integer("request id");
            e.status = r.optional_string("status");
            return e;
        }},
        {"execute from attribute", [](FieldReader& r) -> EdgeType {
            return et::ExecuteFromAttribute{r.optional_string("attr name")};
        }},
        {"execute", [](FieldReader&) -> EdgeType { return et::Execute{}; }},
        {"js call", [](FieldReader& r) -> EdgeType {
            et::JsCall e;
            e.method = r.optional_string("method");
            e.args = r.optional_string("args");
            return e;
        }},
        {"js result", [](FieldReader& r) -> EdgeType { return et::JsResult{r.optional_string("value")}; }},
        {"add event listener", [](FieldReader& r) -> EdgeType { return listener_edge<et::AddEventListener>(r); }},
        {"remove event listener", [](FieldReader& r) -> EdgeType { return listener_edge<et::RemoveEventListener>(r); }},
        {"event listener", [](FieldReader& r) -> EdgeType { return listener_edge<et::EventListener>(r); }},
        {"storage set", [](FieldReader& r) -> EdgeType {
            et::StorageSet e;
            e.key = r.optional_string("key");
            e.value = r.optional_string("value");
            return e;
        }},
        {"storage read result", [](FieldReader& r) -> EdgeType {
            et::StorageReadResult e;
            e.key = r.optional_string("key");
            e.value = r.optional_string("value");
            return e;
        }},
        {"read storage call", [](FieldReader& r) -> EdgeType { return et::ReadStorageCall{r.optional_string("key")}; }},
        {"delete storage", [](FieldReader& r) -> EdgeType { return et::DeleteStorage{r.optional_string("key")}; }},
        {"clear storage", [](FieldReader&) -> EdgeType { return et::ClearStorage{}; }},
        {"storage bucket", [](FieldReader&) -> EdgeType { return et::StorageBucket{}; }},
        {"filter", [](FieldReader&) -> EdgeType { return et::Filter{}; }},
        {"shield", [](FieldReader&) -> EdgeType { return et::Shield{}; }},
        {"resource block", [](FieldReader&) -> EdgeType { return et::ResourceBlock{}; }},
    };
    return table;
}

template <typename Variant, typename UnknownT, typename Table>
Variant classify(const Table& table, const RawElement& element, const DecodeOptions& options,
    const char* element_label)
{
    const std::string kind = element.kind.value_or("");
    const bool strict = options.mode == ClassificationMode::Strict;

    auto it = table.find(kind);
    if (it == table.end()) {
        if (strict) throw DecodeError::unclassifiable(element.id, kind, element.line);
        logger()->warn("{} '{}' has unknown kind '{}', keeping it as unknown", element_label, element.id, kind);
        return UnknownT{kind, raw_attributes(element)};
    }

    FieldReader reader(element, kind);
    if (strict) return it->second(reader);

    try {
        return it->second(reader);
    } catch (const DecodeError& e) {
        if (e.kind() != DecodeErrorKind::MissingRequiredField) throw;
        logger()->warn("{}, keeping it as unknown", e.what());
        return UnknownT{kind, raw_attributes(element)};
    }
}

} // namespace

NodeType classify_node(const RawElement& element, const DecodeOptions& options) {
    return classify<NodeType, nt::Unknown>(node_table(), element, options, "node");
}

EdgeType classify_edge(const RawElement& element, const DecodeOptions& options) {
    return classify<EdgeType, et::Unknown>(edge_table(), element, options, "edge");
}

std::optional<pagegraph_model::Timestamp> extract_timestamp(const RawElement& element) {
    for (const auto& a : element.attributes) {
        if (a.name != timestamp_attribute) continue;
        auto v = as_integer(a.value);
        if (!v) {
            logger()->debug("element '{}': ignoring undecodable timestamp '{}'", element.id, a.value.raw);
        }
        return v;
    }
    return std::nullopt;
}

RawAttributes raw_attributes(const RawElement& element) {
    RawAttributes out;
    out.reserve(element.attributes.size());
    for (const auto& a : element.attributes)
        out.emplace_back(a.name, a.value.raw);
    return out;
}

} // namespace pagegraph_loaders
