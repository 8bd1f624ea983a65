// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Handler Registry                                                  ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "conduit/handler.hpp"
#include "conduit/pipeline.hpp"
#include "conduit/request.hpp"
#include "conduit/status.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace conduit {

/// Lookup from (request type, response type) to the handler and behaviors
/// serving it.
///
/// Populated by explicit registration while the concrete types are still known
/// to the compiler; every entry is stored type-erased and cast back by the
/// templated lookups. Registration takes an exclusive lock, lookups a shared
/// one.
class HandlerRegistry {
public:
    HandlerRegistry() = default;
    ~HandlerRegistry() = default;

    // Non-copyable, non-movable
    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;
    HandlerRegistry(HandlerRegistry&&) = delete;
    HandlerRegistry& operator=(HandlerRegistry&&) = delete;

    // ==========================================================================
    // Registration
    // ==========================================================================

    /// Register the handler for TRequest. A later registration replaces it.
    template<typename TRequest>
    HandlerRegistry& add_handler(std::shared_ptr<RequestHandler<TRequest>> handler) {
        require(handler != nullptr, "request handler must not be null");
        put_handler(Kind::Request, route_of<TRequest>(), std::move(handler),
                    type_name<TRequest>());
        return *this;
    }

    template<typename TCommand>
    HandlerRegistry& add_command_handler(std::shared_ptr<CommandHandler<TCommand>> handler) {
        require(handler != nullptr, "command handler must not be null");
        return add_handler<TCommand>(std::shared_ptr<RequestHandler<TCommand>>(
            std::make_shared<CommandHandlerAdapter<TCommand>>(std::move(handler))));
    }

    /// Register a callable `Result<R>(const TRequest&, std::stop_token)`
    template<typename TRequest, typename F>
    HandlerRegistry& add_handler_fn(F&& fn) {
        return add_handler<TRequest>(std::shared_ptr<RequestHandler<TRequest>>(
            std::make_shared<FunctionRequestHandler<TRequest>>(std::forward<F>(fn))));
    }

    template<typename TRequest>
    HandlerRegistry& add_stream_handler(std::shared_ptr<StreamRequestHandler<TRequest>> handler) {
        require(handler != nullptr, "stream handler must not be null");
        RouteKey route{std::type_index(typeid(TRequest)),
                       std::type_index(typeid(element_t<TRequest>))};
        put_handler(Kind::Stream, route, std::move(handler), type_name<TRequest>());
        return *this;
    }

    /// Register one more handler for TNotification; the same instance twice is kept once
    template<typename TNotification>
    HandlerRegistry& add_notification_handler(
        std::shared_ptr<NotificationHandler<TNotification>> handler) {
        require(handler != nullptr, "notification handler must not be null");
        put_notification_handler(std::type_index(typeid(TNotification)), std::move(handler));
        return *this;
    }

    template<typename TNotification, typename F>
    HandlerRegistry& add_notification_fn(F&& fn) {
        return add_notification_handler<TNotification>(
            std::shared_ptr<NotificationHandler<TNotification>>(
                std::make_shared<FunctionNotificationHandler<TNotification>>(
                    std::forward<F>(fn))));
    }

    /// Behavior applied to every request route
    HandlerRegistry& add_behavior(std::shared_ptr<IPipelineBehavior> behavior);

    /// Behavior applied to TRequest only
    template<typename TRequest>
    HandlerRegistry& add_behavior(std::shared_ptr<PipelineBehavior<TRequest>> behavior) {
        require(behavior != nullptr, "pipeline behavior must not be null");
        put_behavior(route_of<TRequest>(), std::move(behavior));
        return *this;
    }

    // ==========================================================================
    // Lookup
    // ==========================================================================

    template<typename TRequest>
    [[nodiscard]] Result<std::shared_ptr<RequestHandler<TRequest>>> resolve_one() const {
        auto entry = find_handler(Kind::Request, route_of<TRequest>());
        if (!entry) {
            return Err<std::shared_ptr<RequestHandler<TRequest>>>(
                not_found(Kind::Request, type_name<TRequest>(),
                          type_name<response_t<TRequest>>()));
        }
        return std::static_pointer_cast<RequestHandler<TRequest>>(std::move(entry));
    }

    template<typename TRequest>
    [[nodiscard]] Result<std::shared_ptr<StreamRequestHandler<TRequest>>> resolve_stream() const {
        RouteKey route{std::type_index(typeid(TRequest)),
                       std::type_index(typeid(element_t<TRequest>))};
        auto entry = find_handler(Kind::Stream, route);
        if (!entry) {
            return Err<std::shared_ptr<StreamRequestHandler<TRequest>>>(
                not_found(Kind::Stream, type_name<TRequest>(),
                          type_name<element_t<TRequest>>()));
        }
        return std::static_pointer_cast<StreamRequestHandler<TRequest>>(std::move(entry));
    }

    /// All handlers for TNotification in registration order, possibly empty
    template<typename TNotification>
    [[nodiscard]] std::vector<std::shared_ptr<NotificationHandler<TNotification>>>
    resolve_many() const {
        auto entries = find_notification_handlers(std::type_index(typeid(TNotification)));
        std::vector<std::shared_ptr<NotificationHandler<TNotification>>> handlers;
        handlers.reserve(entries.size());
        for (auto& entry : entries) {
            handlers.push_back(
                std::static_pointer_cast<NotificationHandler<TNotification>>(std::move(entry)));
        }
        return handlers;
    }

    /// Global and route-specific behaviors matching `route`, in registration order
    [[nodiscard]] std::vector<std::shared_ptr<IPipelineBehavior>> resolve_behaviors(
        const RouteKey& route) const;

    // ==========================================================================
    // Introspection
    // ==========================================================================

    template<typename TRequest>
    [[nodiscard]] bool has_handler() const {
        return find_handler(Kind::Request, route_of<TRequest>()) != nullptr;
    }

    template<typename TNotification>
    [[nodiscard]] std::size_t notification_handler_count() const {
        return find_notification_handlers(std::type_index(typeid(TNotification))).size();
    }

    /// Request and stream handlers
    [[nodiscard]] std::size_t handler_count() const;
    [[nodiscard]] std::size_t behavior_count() const;

private:
    enum class Kind : std::uint8_t { Request, Stream };

    struct BehaviorEntry {
        std::optional<RouteKey> route;   // std::nullopt: applies to every route
        std::shared_ptr<IPipelineBehavior> behavior;
    };

    static void require(bool condition, const char* message) {
        if (!condition) throw std::invalid_argument(message);
    }

    [[nodiscard]] static Error not_found(Kind kind, std::string_view request_name,
                                         std::string_view response_name);

    void put_handler(Kind kind, const RouteKey& route, std::shared_ptr<void> handler,
                     std::string_view request_name);
    [[nodiscard]] std::shared_ptr<void> find_handler(Kind kind, const RouteKey& route) const;

    void put_notification_handler(std::type_index type, std::shared_ptr<void> handler);
    [[nodiscard]] std::vector<std::shared_ptr<void>> find_notification_handlers(
        std::type_index type) const;

    void put_behavior(std::optional<RouteKey> route, std::shared_ptr<IPipelineBehavior> behavior);

    mutable std::shared_mutex mutex_;
    std::unordered_map<RouteKey, std::shared_ptr<void>, RouteKeyHash> request_handlers_;
    std::unordered_map<RouteKey, std::shared_ptr<void>, RouteKeyHash> stream_handlers_;
    std::unordered_map<std::type_index, std::vector<std::shared_ptr<void>>> notification_handlers_;
    std::vector<BehaviorEntry> behaviors_;
};

} // namespace conduit
