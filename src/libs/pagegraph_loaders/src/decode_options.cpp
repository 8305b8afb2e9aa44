#include <pagegraph_loaders/decode_options.hpp>
#include <pagegraph_loaders/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace pagegraph_loaders {

namespace {

std::optional<ClassificationMode> mode_from_string(const std::string& s) {
    if (s == "strict") return ClassificationMode::Strict;
    if (s == "lenient") return ClassificationMode::Lenient;
    return std::nullopt;
}

std::optional<spdlog::level::level_enum> level_from_string(const std::string& s) {
    // from_str maps unrecognized names to "off".
    const auto level = spdlog::level::from_str(s);
    if (level == spdlog::level::off && s != "off") return std::nullopt;
    return level;
}

std::optional<DecodeOptions> parse_options_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    DecodeOptions options;

    if (j.contains("mode")) {
        if (!j["mode"].is_string()) return std::nullopt;
        auto mode = mode_from_string(j["mode"].get<std::string>());
        if (!mode) return std::nullopt;
        options.mode = *mode;
    }
    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) return std::nullopt;
        auto level = level_from_string(j["log_level"].get<std::string>());
        if (!level) return std::nullopt;
        options.log_level = *level;
    }
    return options;
}

} // namespace

std::optional<DecodeOptions> load_decode_options_from_json(std::istream& in) {
    std::optional<DecodeOptions> options;
    try {
        options = parse_options_json(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        logger()->error("decode options: {}", e.what());
        return std::nullopt;
    }
    if (!options) logger()->error("decode options: unexpected key type or value");
    return options;
}

std::optional<DecodeOptions> load_decode_options_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        logger()->error("decode options: cannot open {}", path);
        return std::nullopt;
    }
    return load_decode_options_from_json(f);
}

} // namespace pagegraph_loaders
