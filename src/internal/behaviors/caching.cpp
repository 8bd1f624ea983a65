// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Caching Behavior Implementation                                   ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "conduit/behaviors/caching.hpp"
#include "conduit/logger.hpp"

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <stdexcept>

namespace conduit {

CachingBehavior::CachingBehavior(std::shared_ptr<ICacheStore> store,
                                 CachingConfig config,
                                 std::shared_ptr<spdlog::logger> logger)
    : store_(std::move(store))
    , config_(std::move(config))
    , logger_(logger ? std::move(logger) : Logger::get())
{
    if (!store_) {
        throw std::invalid_argument("CachingBehavior requires a cache store");
    }
}

std::string CachingBehavior::store_key(std::string_view request_name,
                                       std::string_view cache_key) const {
    return fmt::format("{}:{}:{}", config_.key_prefix, request_name, cache_key);
}

Result<std::any> CachingBehavior::process(const RequestContext& context,
                                          const NextDelegate& next) {
    if (context.cacheable == nullptr) {
        return next();
    }

    const auto declared_key = context.cacheable->cache_key();
    const auto key = store_key(context.request_name, declared_key);

    if (auto cached = store_->try_get(key)) {
        logger_->debug("Cache hit for {} with key {}", context.request_name, declared_key);
        return Result<std::any>(std::move(*cached));
    }

    logger_->debug("Cache miss for {} with key {}", context.request_name, declared_key);
    auto response = next();
    if (!response) {
        return response;
    }

    const auto expiration = context.cacheable->cache_expiration();
    store_->set(key, response.value(), expiration, context.cacheable->cache_priority());
    logger_->debug("Cached response for {} with key {} for {}",
                   context.request_name, declared_key, expiration);

    return response;
}

} // namespace conduit
