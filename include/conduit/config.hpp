// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Configuration                                                     ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <thread>

#ifndef CONDUIT_ENABLE_LOGGING
#define CONDUIT_ENABLE_LOGGING 1
#endif

namespace conduit {

// ==============================================================================
// Logging
// ==============================================================================

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

struct LogConfig {
    std::string logger_name{"conduit"};
    std::string log_file;                    // empty: console only
    LogLevel level{LogLevel::INFO};
    std::string console_pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};
    std::string file_pattern{"[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v"};
};

// ==============================================================================
// Dispatch
// ==============================================================================

struct MediatorConfig {
    /// Workers for send_async, publish and publish_async. 0 picks hardware concurrency.
    std::size_t worker_threads{0};

    [[nodiscard]] std::size_t effective_worker_threads() const noexcept {
        if (worker_threads != 0) return worker_threads;
        auto hw = static_cast<std::size_t>(std::thread::hardware_concurrency());
        return hw == 0 ? 1 : hw;
    }
};

// ==============================================================================
// Behaviors
// ==============================================================================

struct PerformanceLoggingConfig {
    /// Requests taking at least this long are logged as warnings
    std::chrono::milliseconds slow_request_threshold{500};
};

struct CachingConfig {
    std::string key_prefix{"conduit:cache"};
};

} // namespace conduit
