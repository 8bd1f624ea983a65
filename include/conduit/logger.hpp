// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Logger                                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "conduit/config.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

namespace conduit {

/// Process-wide spdlog logger used by the mediator and the built-in behaviors
class Logger {
public:
    static void init(const LogConfig& config = {});

    /// Shared logger; a console logger is created on first use if init() was not called
    [[nodiscard]] static std::shared_ptr<spdlog::logger> get();

    /// Replace the shared logger (nullptr restores the lazily created console logger)
    static void set(std::shared_ptr<spdlog::logger> logger);

    template<typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        get()->critical(fmt, std::forward<Args>(args)...);
    }

    [[nodiscard]] static spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
        return static_cast<spdlog::level::level_enum>(level);
    }
};

} // namespace conduit
