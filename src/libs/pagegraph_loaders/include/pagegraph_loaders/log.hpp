#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace pagegraph_loaders {

// Shared "pagegraph" logger (stderr). Falls back to spdlog's default logger when
// the named logger cannot be created.
std::shared_ptr<spdlog::logger> logger();

} // namespace pagegraph_loaders
