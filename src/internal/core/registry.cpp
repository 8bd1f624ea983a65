// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Handler Registry Implementation                                   ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "conduit/registry.hpp"
#include "conduit/logger.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <mutex>

namespace conduit {

// ==============================================================================
// Handlers
// ==============================================================================

void HandlerRegistry::put_handler(Kind kind, const RouteKey& route, std::shared_ptr<void> handler,
                                  std::string_view request_name) {
    bool replaced = false;
    {
        std::unique_lock lock(mutex_);
        auto& handlers = kind == Kind::Request ? request_handlers_ : stream_handlers_;
        replaced = !handlers.insert_or_assign(route, std::move(handler)).second;
    }

    if (replaced) {
        Logger::warn("Handler for {} registered more than once, last registration wins",
                     request_name);
    }
}

std::shared_ptr<void> HandlerRegistry::find_handler(Kind kind, const RouteKey& route) const {
    std::shared_lock lock(mutex_);
    const auto& handlers = kind == Kind::Request ? request_handlers_ : stream_handlers_;
    auto it = handlers.find(route);
    if (it == handlers.end()) {
        return nullptr;
    }
    return it->second;
}

Error HandlerRegistry::not_found(Kind kind, std::string_view request_name,
                                 std::string_view response_name) {
    return Error(ErrorCode::HandlerNotFound,
                 fmt::format("no {} handler registered for {} -> {}",
                             kind == Kind::Request ? "request" : "stream",
                             request_name, response_name));
}

// ==============================================================================
// Notification Handlers
// ==============================================================================

void HandlerRegistry::put_notification_handler(std::type_index type,
                                               std::shared_ptr<void> handler) {
    std::unique_lock lock(mutex_);
    auto& handlers = notification_handlers_[type];
    if (std::find(handlers.begin(), handlers.end(), handler) != handlers.end()) {
        return;
    }
    handlers.push_back(std::move(handler));
}

std::vector<std::shared_ptr<void>> HandlerRegistry::find_notification_handlers(
    std::type_index type) const {
    std::shared_lock lock(mutex_);
    auto it = notification_handlers_.find(type);
    if (it == notification_handlers_.end()) {
        return {};
    }
    return it->second;
}

// ==============================================================================
// Behaviors
// ==============================================================================

HandlerRegistry& HandlerRegistry::add_behavior(std::shared_ptr<IPipelineBehavior> behavior) {
    require(behavior != nullptr, "pipeline behavior must not be null");
    put_behavior(std::nullopt, std::move(behavior));
    return *this;
}

void HandlerRegistry::put_behavior(std::optional<RouteKey> route,
                                   std::shared_ptr<IPipelineBehavior> behavior) {
    std::unique_lock lock(mutex_);
    behaviors_.push_back(BehaviorEntry{std::move(route), std::move(behavior)});
}

std::vector<std::shared_ptr<IPipelineBehavior>> HandlerRegistry::resolve_behaviors(
    const RouteKey& route) const {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<IPipelineBehavior>> matching;
    matching.reserve(behaviors_.size());
    for (const auto& entry : behaviors_) {
        if (!entry.route || *entry.route == route) {
            matching.push_back(entry.behavior);
        }
    }
    return matching;
}

// ==============================================================================
// Introspection
// ==============================================================================

std::size_t HandlerRegistry::handler_count() const {
    std::shared_lock lock(mutex_);
    return request_handlers_.size() + stream_handlers_.size();
}

std::size_t HandlerRegistry::behavior_count() const {
    std::shared_lock lock(mutex_);
    return behaviors_.size();
}

} // namespace conduit
