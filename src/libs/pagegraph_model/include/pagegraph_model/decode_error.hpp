#pragma once

#include <stdexcept>
#include <string>

namespace pagegraph_model {

enum class DecodeErrorKind {
    MalformedDocument,
    UnclassifiableElement,
    MissingRequiredField,
    DuplicateIdentifier,
    DanglingEdgeReference,
    Io
};

const char* to_string(DecodeErrorKind kind);

// Raised by the decode pipeline. Context fields are empty (or 0 for line/column)
// when they do not apply to the failure kind.
class DecodeError : public std::runtime_error {
public:
    DecodeError(DecodeErrorKind kind, const std::string& message);

    static DecodeError malformed(const std::string& message, int line = 0, int column = 0);
    static DecodeError unclassifiable(const std::string& element_id, const std::string& kind_tag, int line = 0);
    static DecodeError missing_field(const std::string& element_id, const std::string& kind_tag,
        const std::string& field, int line = 0);
    static DecodeError duplicate_identifier(const std::string& id, const char* collection);
    static DecodeError dangling_edge(const std::string& edge_id, const std::string& missing_node_id);
    static DecodeError io(const std::string& path, const std::string& reason);

    DecodeErrorKind kind() const { return kind_; }
    const std::string& element_id() const { return element_id_; }
    const std::string& kind_tag() const { return kind_tag_; }
    const std::string& field() const { return field_; }
    int line() const { return line_; }
    int column() const { return column_; }

private:
    DecodeErrorKind kind_;
    std::string element_id_;
    std::string kind_tag_;
    std::string field_;
    int line_ = 0;
    int column_ = 0;
};

} // namespace pagegraph_model
