#pragma once

#include <pagegraph_loaders/decode_options.hpp>
#include <pagegraph_model/graph.hpp>
#include <istream>
#include <string>
#include <string_view>

namespace pagegraph_loaders {

// Decode a PageGraph GraphML document. Throw pagegraph_model::DecodeError on any
// failure; no partially built graph is ever returned.
pagegraph_model::Graph load_graph_from_graphml(std::string_view document, const DecodeOptions& options = {});
pagegraph_model::Graph load_graph_from_graphml(std::istream& in, const DecodeOptions& options = {});
pagegraph_model::Graph load_graph_from_graphml_file(const std::string& path, const DecodeOptions& options = {});

} // namespace pagegraph_loaders
