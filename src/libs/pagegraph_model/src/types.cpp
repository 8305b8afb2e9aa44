#include <pagegraph_model/types.hpp>

namespace pagegraph_model {

namespace {

std::string name_of(const node_types::HtmlElement&) { return "HTML element"; }
std::string name_of(const node_types::TextNode&) { return "text node"; }
std::string name_of(const node_types::DomRoot&) { return "DOM root"; }
std::string name_of(const node_types::FrameOwner&) { return "frame owner"; }
std::string name_of(const node_types::RemoteFrame&) { return "remote frame"; }
std::string name_of(const node_types::Script&) { return "script"; }
std::string name_of(const node_types::WebApi&) { return "web API"; }
std::string name_of(const node_types::JsBuiltin&) { return "JS builtin"; }
std::string name_of(const node_types::Resource&) { return "resource"; }
std::string name_of(const node_types::Parser&) { return "parser"; }
std::string name_of(const node_types::Extensions&) { return "extensions"; }
std::string name_of(const node_types::AdFilter&) { return "ad filter"; }
std::string name_of(const node_types::TrackerFilter&) { return "tracker filter"; }
std::string name_of(const node_types::FingerprintingFilter&) { return "fingerprinting filter"; }
std::string name_of(const node_types::Unknown& n) { return n.kind; }

std::string name_of(const node_types::Storage& n) {
    switch (n.storage_type) {
    case StorageType::LocalStorage: return "local storage";
    case StorageType::SessionStorage: return "session storage";
    case StorageType::CookieJar: return "cookie jar";
    case StorageType::Root: break;
    }
    return "storage";
}

std::string name_of(const node_types::Shield& n) {
    switch (n.shield_type) {
    case ShieldType::Ads: return "ads shield";
    case ShieldType::Trackers: return "trackers shield";
    case ShieldType::Javascript: return "javascript shield";
    case ShieldType::Fingerprinting: return "fingerprinting shield";
    case ShieldType::Root: break;
    }
    return "Brave Shields";
}

std::string name_of(const edge_types::Structure&) { return "structure"; }
std::string name_of(const edge_types::CrossDom&) { return "cross DOM"; }
std::string name_of(const edge_types::CreateNode&) { return "create node"; }
std::string name_of(const edge_types::InsertNode&) { return "insert node"; }
std::string name_of(const edge_types::RemoveNode&) { return "remove node"; }
std::string name_of(const edge_types::DeleteNode&) { return "delete node"; }
std::string name_of(const edge_types::SetAttribute&) { return "set attribute"; }
std::string name_of(const edge_types::DeleteAttribute&) { return "delete attribute"; }
std::string name_of(const edge_types::TextChange&) { return "text change"; }
std::string name_of(const edge_types::RequestStart&) { return "request start"; }
std::string name_of(const edge_types::RequestComplete&) { return "request complete"; }
std::string name_of(const edge_types::RequestError&) { return "request error"; }
std::string name_of(const edge_types::ExecuteFromAttribute&) { return "execute from attribute"; }
std::string name_of(const edge_types::Execute&) { return "execute"; }
std::string name_of(const edge_types::JsCall&) { return "js call"; }
std::string name_of(const edge_types::JsResult&) { return "js result"; }
std::string name_of(const edge_types::AddEventListener&) { return "add event listener"; }
std::string name_of(const edge_types::RemoveEventListener&) { return "remove event listener"; }
std::string name_of(const edge_types::EventListener&) { return "event listener"; }
std::string name_of(const edge_types::StorageSet&) { return "storage set"; }
std::string name_of(const edge_types::StorageReadResult&) { return "storage read result"; }
std::string name_of(const edge_types::ReadStorageCall&) { return "read storage call"; }
std::string name_of(const edge_types::DeleteStorage&) { return "delete storage"; }
std::string name_of(const edge_types::ClearStorage&) { return "clear storage"; }
std::string name_of(const edge_types::StorageBucket&) { return "storage bucket"; }
std::string name_of(const edge_types::Filter&) { return "filter"; }
std::string name_of(const edge_types::Shield&) { return "shield"; }
std::string name_of(const edge_types::ResourceBlock&) { return "resource block"; }
std::string name_of(const edge_types::Unknown& e) { return e.kind; }

} // namespace

const std::string* find_attribute(const RawAttributes& attributes, std::string_view name) {
    for (const auto& [key, value] : attributes) {
        if (key == name) return &value;
    }
    return nullptr;
}

std::string kind_name(const NodeType& type) {
    return std::visit([](const auto& v) { return name_of(v); }, type);
}

std::string kind_name(const EdgeType& type) {
    return std::visit([](const auto& v) { return name_of(v); }, type);
}

} // namespace pagegraph_model
