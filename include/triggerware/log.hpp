#pragma once
#include <spdlog/spdlog.h>
#include <memory>

namespace triggerware::log {

constexpr const char* LOGGER_NAME = "triggerware";

/// The library's logger. Created on first use with a stderr sink unless the
/// application registered a logger under LOGGER_NAME beforehand.
std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

} // namespace triggerware::log
