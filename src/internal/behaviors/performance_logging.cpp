// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Performance Logging Behavior Implementation                       ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "conduit/behaviors/performance_logging.hpp"
#include "conduit/logger.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace conduit {

namespace {

std::chrono::milliseconds::rep elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // anonymous namespace

PerformanceLoggingBehavior::PerformanceLoggingBehavior(PerformanceLoggingConfig config,
                                                       std::shared_ptr<spdlog::logger> logger)
    : config_(config)
    , logger_(logger ? std::move(logger) : Logger::get())
{
}

Result<std::any> PerformanceLoggingBehavior::process(const RequestContext& context,
                                                     const NextDelegate& next) {
    auto start = std::chrono::steady_clock::now();

    try {
        auto response = next();
        auto elapsed = elapsed_ms(start);

        if (!response) {
            logger_->error("Error handling {} after {} ms: {}",
                           context.request_name, elapsed, response.error().to_string());
            return response;
        }

        if (elapsed >= config_.slow_request_threshold.count()) {
            logger_->warn("Slow request detected: {} ({} ms)", context.request_name, elapsed);
        } else {
            logger_->info("Request: {} ({} ms)", context.request_name, elapsed);
        }
        return response;

    } catch (const std::exception& ex) {
        logger_->error("Error handling {} after {} ms: {}",
                       context.request_name, elapsed_ms(start), ex.what());
        throw;
    } catch (...) {
        logger_->error("Error handling {} after {} ms: unknown exception",
                       context.request_name, elapsed_ms(start));
        throw;
    }
}

} // namespace conduit
