// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Performance Logging Behavior                                      ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "conduit/config.hpp"
#include "conduit/pipeline.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace conduit {

/// Pass-through behavior timing the rest of the pipeline.
/// Below the threshold it logs at info, at or above it at warn; failures are
/// logged at error and handed back unchanged.
class PerformanceLoggingBehavior final : public IPipelineBehavior {
public:
    explicit PerformanceLoggingBehavior(PerformanceLoggingConfig config = {},
                                        std::shared_ptr<spdlog::logger> logger = nullptr);

    [[nodiscard]] Result<std::any> process(const RequestContext& context,
                                           const NextDelegate& next) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "performance_logging"; }

    [[nodiscard]] const PerformanceLoggingConfig& config() const noexcept { return config_; }

private:
    PerformanceLoggingConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace conduit
