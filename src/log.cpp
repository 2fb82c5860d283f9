#include "triggerware/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace triggerware::log {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) return existing;
        return spdlog::stderr_color_mt(LOGGER_NAME);
    }();
    return instance;
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace triggerware::log
