#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace pagegraph_loaders {

enum class ScalarType { String, Boolean, Integer, Float, Timestamp };

// A GraphML <key> declaration.
struct KeyDeclaration {
    std::string id;
    std::string name;
    ScalarType type = ScalarType::String;
    // "node", "edge", "graph" or "all".
    std::string domain = "all";
    std::optional<std::string> default_value;

    bool applies_to(std::string_view element) const { return domain == "all" || domain == element; }
};

// Maps attr.name / attr.type to a scalar type. Integer keys named "timestamp" decode as
// Timestamp; unrecognized attr.type values decode as String.
ScalarType scalar_type_for(std::string_view attr_name, std::string_view attr_type);

struct AttributeValue {
    ScalarType type = ScalarType::String;
    // Exactly as found in the document.
    std::string raw;
    // Set when `raw` does not parse as `type`; `value` then holds `raw`.
    bool decode_failed = false;
    std::variant<std::string, bool, std::int64_t, double> value;
};

AttributeValue decode_attribute(ScalarType type, std::string raw);
AttributeValue decode_attribute(const KeyDeclaration& key, std::string raw);

// Full-string parsers; surrounding ASCII whitespace is ignored.
std::optional<bool> decode_boolean(std::string_view s);
std::optional<std::int64_t> decode_integer(std::string_view s);
std::optional<double> decode_float(std::string_view s);

// Reads a value as the type a field needs, whatever the key declared.
std::optional<std::int64_t> as_integer(const AttributeValue& v);
std::optional<bool> as_boolean(const AttributeValue& v);
inline const std::string& as_string(const AttributeValue& v) { return v.raw; }

const char* to_string(ScalarType type);

} // namespace pagegraph_loaders
