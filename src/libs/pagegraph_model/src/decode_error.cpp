#include <pagegraph_model/decode_error.hpp>

namespace pagegraph_model {

namespace {

std::string with_line(const std::string& message, int line) {
    if (line <= 0) return message;
    return message + " (line " + std::to_string(line) + ")";
}

} // namespace

const char* to_string(DecodeErrorKind kind) {
    switch (kind) {
    case DecodeErrorKind::MalformedDocument: return "MalformedDocument";
    case DecodeErrorKind::UnclassifiableElement: return "UnclassifiableElement";
    case DecodeErrorKind::MissingRequiredField: return "MissingRequiredField";
    case DecodeErrorKind::DuplicateIdentifier: return "DuplicateIdentifier";
    case DecodeErrorKind::DanglingEdgeReference: return "DanglingEdgeReference";
    case DecodeErrorKind::Io: return "Io";
    }
    return "Unknown";
}

DecodeError::DecodeError(DecodeErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

DecodeError DecodeError::malformed(const std::string& message, int line, int column) {
    std::string text = "malformed document: " + message;
    if (line > 0) {
        text += " (line " + std::to_string(line);
        if (column > 0) text += ", column " + std::to_string(column);
        text += ")";
    }
    DecodeError e(DecodeErrorKind::MalformedDocument, text);
    e.line_ = line;
    e.column_ = column;
    return e;
}

DecodeError DecodeError::unclassifiable(const std::string& element_id, const std::string& kind_tag, int line) {
    DecodeError e(DecodeErrorKind::UnclassifiableElement,
        with_line("element '" + element_id + "' has unknown kind '" + kind_tag + "'", line));
    e.element_id_ = element_id;
    e.kind_tag_ = kind_tag;
    e.line_ = line;
    return e;
}

DecodeError DecodeError::missing_field(const std::string& element_id, const std::string& kind_tag,
    const std::string& field, int line)
{
    DecodeError e(DecodeErrorKind::MissingRequiredField,
        with_line("element '" + element_id + "' of kind '" + kind_tag
            + "' is missing required field '" + field + "'", line));
    e.element_id_ = element_id;
    e.kind_tag_ = kind_tag;
    e.field_ = field;
    e.line_ = line;
    return e;
}

DecodeError DecodeError::duplicate_identifier(const std::string& id, const char* collection) {
    DecodeError e(DecodeErrorKind::DuplicateIdentifier,
        std::string("duplicate ") + collection + " identifier '" + id + "'");
    e.element_id_ = id;
    return e;
}

DecodeError DecodeError::dangling_edge(const std::string& edge_id, const std::string& missing_node_id) {
    DecodeError e(DecodeErrorKind::DanglingEdgeReference,
        "edge '" + edge_id + "' references missing node '" + missing_node_id + "'");
    // The missing node is the offending identifier; the edge is reported in the message.
    e.element_id_ = missing_node_id;
    return e;
}

DecodeError DecodeError::io(const std::string& path, const std::string& reason) {
    return DecodeError(DecodeErrorKind::Io, "cannot read '" + path + "': " + reason);
}

} // namespace pagegraph_model
