#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pagegraph_model {

using NodeId = std::string;
using EdgeId = std::string;
using Timestamp = std::int64_t;

// Untyped (name, value) pairs in document order.
using RawAttributes = std::vector<std::pair<std::string, std::string>>;

const std::string* find_attribute(const RawAttributes& attributes, std::string_view name);

enum class StorageType { Root, LocalStorage, SessionStorage, CookieJar };
enum class ShieldType { Root, Ads, Trackers, Javascript, Fingerprinting };

namespace node_types {

struct HtmlElement {
    std::string tag_name;
    bool is_deleted = false;
    std::optional<std::int64_t> node_id;
    // Everything on the element that no field above consumed.
    RawAttributes attributes;
};

struct TextNode {
    bool is_deleted = false;
    std::optional<std::int64_t> node_id;
    std::optional<std::string> text;
};

struct DomRoot {
    std::optional<std::string> url;
    std::optional<std::string> tag_name;
    std::optional<std::int64_t> node_id;
    bool is_deleted = false;
};

struct FrameOwner {
    std::optional<std::string> tag_name;
    std::optional<std::int64_t> node_id;
    bool is_deleted = false;
};

struct RemoteFrame {
    std::string frame_id;
};

struct Script {
    std::string script_type;
    std::optional<std::string> source;
    std::optional<std::int64_t> script_id;
    std::optional<std::string> url;
};

struct Storage {
    StorageType storage_type = StorageType::Root;
};

struct WebApi {
    std::string method;
};

struct JsBuiltin {
    std::string method;
};

struct Resource {
    std::string url;
};

struct Parser {};
struct Extensions {};

struct AdFilter {
    std::optional<std::string> rule;
};

struct TrackerFilter {};
struct FingerprintingFilter {};

struct Shield {
    ShieldType shield_type = ShieldType::Root;
};

struct Unknown {
    std::string kind;
    RawAttributes attributes;
};

} // namespace node_types

using NodeType = std::variant<
    node_types::HtmlElement,
    node_types::TextNode,
    node_types::DomRoot,
    node_types::FrameOwner,
    node_types::RemoteFrame,
    node_types::Script,
    node_types::Storage,
    node_types::WebApi,
    node_types::JsBuiltin,
    node_types::Resource,
    node_types::Parser,
    node_types::Extensions,
    node_types::AdFilter,
    node_types::TrackerFilter,
    node_types::FingerprintingFilter,
    node_types::Shield,
    node_types::Unknown>;

namespace edge_types {

struct Structure {};
struct CrossDom {};
struct CreateNode {};

struct InsertNode {
    std::optional<std::int64_t> parent;
    std::optional<std::int64_t> before;
};

struct RemoveNode {};
struct DeleteNode {};

struct SetAttribute {
    std::optional<std::string> key;
    std::optional<std::string> value;
    bool is_style = false;
};

struct DeleteAttribute {
    std::optional<std::string> key;
    bool is_style = false;
};

struct TextChange {
    std::optional<std::string> text;
};

struct RequestStart {
    std::int64_t request_id = 0;
    std::optional<std::string> request_type;
};

struct RequestComplete {
    std::int64_t request_id = 0;
    std::optional<std::string> status;
};

struct RequestError {
    std::int64_t request_id = 0;
    std::optional<std::string> status;
};

struct ExecuteFromAttribute {
    std::optional<std::string> attr_name;
};

struct Execute {};

struct JsCall {
    std::optional<std::string> method;
    std::optional<std::string> args;
};

struct JsResult {
    std::optional<std::string> value;
};

struct AddEventListener {
    std::optional<std::string> key;
    std::optional<std::int64_t> event_listener_id;
};

struct RemoveEventListener {
    std::optional<std::string> key;
    std::optional<std::int64_t> event_listener_id;
};

struct EventListener {
    std::optional<std::string> key;
    std::optional<std::int64_t> event_listener_id;
};

struct StorageSet {
    std::optional<std::string> key;
    std::optional<std::string> value;
};

struct StorageReadResult {
    std::optional<std::string> key;
    std::optional<std::string> value;
};

struct ReadStorageCall {
    std::optional<std::string> key;
};

struct DeleteStorage {
    std::optional<std::string> key;
};

struct ClearStorage {};
struct StorageBucket {};
struct Filter {};
struct Shield {};
struct ResourceBlock {};

struct Unknown {
    std::string kind;
    RawAttributes attributes;
};

} // namespace edge_types

using EdgeType = std::variant<
    edge_types::Structure,
    edge_types::CrossDom,
    edge_types::CreateNode,
    edge_types::InsertNode,
    edge_types::RemoveNode,
    edge_types::DeleteNode,
    edge_types::SetAttribute,
    edge_types::DeleteAttribute,
    edge_types::TextChange,
    edge_types::RequestStart,
    edge_types::RequestComplete,
    edge_types::RequestError,
    edge_types::ExecuteFromAttribute,
    edge_types::Execute,
    edge_types::JsCall,
    edge_types::JsResult,
    edge_types::AddEventListener,
    edge_types::RemoveEventListener,
    edge_types::EventListener,
    edge_types::StorageSet,
    edge_types::StorageReadResult,
    edge_types::ReadStorageCall,
    edge_types::DeleteStorage,
    edge_types::ClearStorage,
    edge_types::StorageBucket,
    edge_types::Filter,
    edge_types::Shield,
    edge_types::ResourceBlock,
    edge_types::Unknown>;

struct Node {
    NodeId id;
    NodeType type;
    std::optional<Timestamp> timestamp;
};

struct Edge {
    EdgeId id;
    NodeId source;
    NodeId target;
    EdgeType type;
    std::optional<Timestamp> timestamp;
};

// PageGraph kind string for a variant ("HTML element", "request start", ...).
// Unknown variants report the kind they were decoded from.
std::string kind_name(const NodeType& type);
std::string kind_name(const EdgeType& type);

} // namespace pagegraph_model
