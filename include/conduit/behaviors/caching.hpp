// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Caching Behavior                                                  ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "conduit/cache_store.hpp"
#include "conduit/config.hpp"
#include "conduit/pipeline.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

namespace conduit {

/// Serves cacheable requests from an external store.
/// Requests without cache metadata pass straight through. Only successful
/// responses are stored.
class CachingBehavior final : public IPipelineBehavior {
public:
    explicit CachingBehavior(std::shared_ptr<ICacheStore> store,
                             CachingConfig config = {},
                             std::shared_ptr<spdlog::logger> logger = nullptr);

    [[nodiscard]] Result<std::any> process(const RequestContext& context,
                                           const NextDelegate& next) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "caching"; }

    /// Store key: "<prefix>:<request type>:<declared key>"
    [[nodiscard]] std::string store_key(std::string_view request_name,
                                        std::string_view cache_key) const;

private:
    std::shared_ptr<ICacheStore> store_;
    CachingConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace conduit
