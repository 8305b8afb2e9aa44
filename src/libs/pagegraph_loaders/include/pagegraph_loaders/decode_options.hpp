#pragma once

#include <spdlog/common.h>
#include <istream>
#include <optional>
#include <string>

namespace pagegraph_loaders {

enum class ClassificationMode {
    // Unknown kinds and missing required fields abort the decode.
    Strict,
    // Such elements become Unknown variants and decoding continues.
    Lenient
};

struct DecodeOptions {
    ClassificationMode mode = ClassificationMode::Strict;
    // Applied to the "pagegraph" logger when a decode starts.
    std::optional<spdlog::level::level_enum> log_level;
};

// {"mode": "strict" | "lenient", "log_level": "<spdlog level name>"}; both keys optional.
std::optional<DecodeOptions> load_decode_options_from_json(std::istream& in);
std::optional<DecodeOptions> load_decode_options_from_json_file(const std::string& path);

} // namespace pagegraph_loaders
