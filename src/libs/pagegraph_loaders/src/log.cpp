#include <pagegraph_loaders/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pagegraph_loaders {

namespace {

const char* const logger_name = "pagegraph";

std::shared_ptr<spdlog::logger> create_logger() {
    try {
        auto l = spdlog::stderr_color_mt(logger_name);
        l->set_level(spdlog::level::warn);
        l->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        return l;
    } catch (const spdlog::spdlog_ex&) {
        // Registered elsewhere under the same name.
        if (auto existing = spdlog::get(logger_name)) return existing;
        return spdlog::default_logger();
    }
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

} // namespace pagegraph_loaders
