// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Test Log Capture                                                  ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace conduit::testing {

struct LogEntry {
    spdlog::level::level_enum level;
    std::string message;
};

/// Records every formatted payload for later inspection
class CaptureSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    [[nodiscard]] std::vector<LogEntry> entries() {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    [[nodiscard]] std::size_t count(spdlog::level::level_enum level) {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(
            entries_.begin(), entries_.end(),
            [level](const LogEntry& entry) { return entry.level == level; }));
    }

    [[nodiscard]] bool contains(spdlog::level::level_enum level, const std::string& needle) {
        std::lock_guard lock(mutex_);
        return std::any_of(entries_.begin(), entries_.end(), [&](const LogEntry& entry) {
            return entry.level == level && entry.message.find(needle) != std::string::npos;
        });
    }

    void clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        entries_.push_back(LogEntry{msg.level, std::string(msg.payload.begin(), msg.payload.end())});
    }

    void flush_() override {}

private:
    std::vector<LogEntry> entries_;
};

/// Logger writing only to `sink`, accepting every level
inline std::shared_ptr<spdlog::logger> make_capture_logger(const std::shared_ptr<CaptureSink>& sink,
                                                          const std::string& name = "capture") {
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(spdlog::level::trace);
    return logger;
}

} // namespace conduit::testing
