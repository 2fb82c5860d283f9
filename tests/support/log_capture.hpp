#pragma once
#include "triggerware/log.hpp"
#include <spdlog/sinks/ringbuffer_sink.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace triggerware::test {

/// Records what the library logs while in scope. Create it before any
/// connection whose output it should see, so it outlives their threads.
class LogCapture {
public:
    explicit LogCapture(spdlog::level::level_enum level = spdlog::level::debug)
        : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)),
          saved_level_(log::logger()->level()) {
        sink_->set_pattern("%v");
        log::logger()->sinks().push_back(sink_);
        log::set_level(level);
    }

    ~LogCapture() {
        auto& sinks = log::logger()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        log::set_level(saved_level_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<std::string> lines() { return sink_->last_formatted(); }

    bool contains(const std::string& text) {
        auto all = lines();
        return std::any_of(all.begin(), all.end(), [&](const std::string& line) {
            return line.find(text) != std::string::npos;
        });
    }

private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
    spdlog::level::level_enum saved_level_;
};

} // namespace triggerware::test
