#include <pagegraph_loaders/attribute_decoder.hpp>
#include <charconv>
#include <cstdlib>
#include <utility>

namespace pagegraph_loaders {

namespace {

std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

ScalarType scalar_type_for(std::string_view attr_name, std::string_view attr_type) {
    if (attr_type == "boolean") return ScalarType::Boolean;
    if (attr_type == "int" || attr_type == "long")
        return attr_name == "timestamp" ? ScalarType::Timestamp : ScalarType::Integer;
    if (attr_type == "float" || attr_type == "double") return ScalarType::Float;
    return ScalarType::String;
}

std::optional<bool> decode_boolean(std::string_view s) {
    s = trim(s);
    if (s == "true") return true;
    if (s == "false") return false;
    return std::nullopt;
}

std::optional<std::int64_t> decode_integer(std::string_view s) {
    s = trim(s);
    if (s.empty()) return std::nullopt;
    std::int64_t out = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return out;
}

std::optional<double> decode_float(std::string_view s) {
    s = trim(s);
    if (s.empty()) return std::nullopt;
    const std::string copy(s);
    char* end = nullptr;
    const double out = std::strtod(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size()) return std::nullopt;
    return out;
}

AttributeValue decode_attribute(ScalarType type, std::string raw) {
    AttributeValue v;
    v.type = type;
    v.value = raw;

    switch (type) {
    case ScalarType::String:
        break;
    case ScalarType::Boolean:
        if (auto b = decode_boolean(raw)) v.value = *b;
        else v.decode_failed = true;
        break;
    case ScalarType::Integer:
    case ScalarType::Timestamp:
        if (auto i = decode_integer(raw)) v.value = *i;
        else v.decode_failed = true;
        break;
    case ScalarType::Float:
        if (auto f = decode_float(raw)) v.value = *f;
        else v.decode_failed = true;
        break;
    }

    v.raw = std::move(raw);
    return v;
}

AttributeValue decode_attribute(const KeyDeclaration& key, std::string raw) {
    return decode_attribute(key.type, std::move(raw));
}

std::optional<std::int64_t> as_integer(const AttributeValue& v) {
    if (const auto* i = std::get_if<std::int64_t>(&v.value)) return *i;
    return decode_integer(v.raw);
}

std::optional<bool> as_boolean(const AttributeValue& v) {
    if (const auto* b = std::get_if<bool>(&v.value)) return *b;
    return decode_boolean(v.raw);
}

const char* to_string(ScalarType type) {
    switch (type) {
    case ScalarType::String: return "string";
    case ScalarType::Boolean: return "boolean";
    case ScalarType::Integer: return "integer";
    case ScalarType::Float: return "float";
    case ScalarType::Timestamp: return "timestamp";
    }
    return "string";
}

} // namespace pagegraph_loaders
