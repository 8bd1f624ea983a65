// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Logger Implementation                                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "conduit/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace conduit {

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_console_logger(const std::string& name) {
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    return spdlog::stdout_color_mt(name);
}

} // anonymous namespace

void Logger::init(const LogConfig& config) {
    std::shared_ptr<spdlog::logger> logger;
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog(config.level));
        console_sink->set_pattern(config.console_pattern);
        sinks.push_back(console_sink);

        // File sink
        if (!config.log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, true);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern(config.file_pattern);
            sinks.push_back(file_sink);
        }

        logger = std::make_shared<spdlog::logger>(config.logger_name, sinks.begin(), sinks.end());
        logger->set_level(to_spdlog(config.level));
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);

    } catch (const spdlog::spdlog_ex& ex) {
        // Fallback to console only
        logger = make_console_logger(config.logger_name);
        logger->warn("Logger init failed, using console only: {}", ex.what());
    }

    std::lock_guard lock(g_logger_mutex);
    g_logger = std::move(logger);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = make_console_logger(LogConfig{}.logger_name);
    }
    return g_logger;
}

void Logger::set(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard lock(g_logger_mutex);
    g_logger = std::move(logger);
}

} // namespace conduit
