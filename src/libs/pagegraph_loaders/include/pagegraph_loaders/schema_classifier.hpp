#pragma once

#include <pagegraph_loaders/attribute_decoder.hpp>
#include <pagegraph_loaders/decode_options.hpp>
#include <pagegraph_model/types.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagegraph_loaders {

inline constexpr std::string_view node_kind_attribute = "node type";
inline constexpr std::string_view edge_kind_attribute = "edge type";
inline constexpr std::string_view timestamp_attribute = "timestamp";

struct DecodedAttribute {
    std::string name;
    AttributeValue value;
};

// One <node> or <edge> as found in the document, attributes decoded but not yet typed.
struct RawElement {
    std::string id;
    // Value of the kind attribute; nullopt when the element has none.
    std::optional<std::string> kind;
    // Document order, kind attribute included.
    std::vector<DecodedAttribute> attributes;
    int line = 0;
};

// Throws pagegraph_model::DecodeError (UnclassifiableElement, MissingRequiredField)
// in strict mode; lenient mode yields the Unknown variant instead.
pagegraph_model::NodeType classify_node(const RawElement& element, const DecodeOptions& options);
pagegraph_model::EdgeType classify_edge(const RawElement& element, const DecodeOptions& options);

// nullopt when absent or not an integer.
std::optional<pagegraph_model::Timestamp> extract_timestamp(const RawElement& element);

pagegraph_model::RawAttributes raw_attributes(const RawElement& element);

} // namespace pagegraph_loaders
