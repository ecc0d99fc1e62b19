#include "mcpgate/log.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mcpgate {

std::shared_ptr<spdlog::logger> logger() {
    static std::mutex init_mutex;
    if (auto existing = spdlog::get(LOGGER_NAME)) return existing;

    std::lock_guard<std::mutex> lock(init_mutex);
    if (auto existing = spdlog::get(LOGGER_NAME)) return existing;
    return spdlog::stderr_color_mt(LOGGER_NAME);
}

} // namespace mcpgate
