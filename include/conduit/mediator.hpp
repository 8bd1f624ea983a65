// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Mediator (Dispatch Engine)                                        ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "conduit/config.hpp"
#include "conduit/handler.hpp"
#include "conduit/logger.hpp"
#include "conduit/pipeline.hpp"
#include "conduit/registry.hpp"
#include "conduit/request.hpp"
#include "conduit/status.hpp"
#include "conduit/stream.hpp"
#include "conduit/thread_pool.hpp"

#include <any>
#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <string_view>
#include <utility>
#include <vector>

namespace conduit {

/// Entry point routing requests to their handler through the behavior chain,
/// and broadcasting notifications to every registered handler.
///
/// The registry is shared and read-only from the mediator's point of view;
/// handler and behavior instances are borrowed for the duration of one call.
class Mediator {
public:
    // ==========================================================================
    // Construction
    // ==========================================================================

    explicit Mediator(std::shared_ptr<const HandlerRegistry> registry,
                      MediatorConfig config = {});
    ~Mediator();

    // Non-copyable, non-movable
    Mediator(const Mediator&) = delete;
    Mediator& operator=(const Mediator&) = delete;
    Mediator(Mediator&&) = delete;
    Mediator& operator=(Mediator&&) = delete;

    // ==========================================================================
    // Request / Command
    // ==========================================================================

    /// Route `request` to its single handler through the registered behaviors.
    /// Commands (Request<Unit>) take the same path and yield Unit.
    template<typename TRequest>
    [[nodiscard]] Result<response_t<TRequest>> send(const TRequest& request,
                                                    std::stop_token token = {}) const;

    /// send() on the worker pool; the request is copied into the task
    template<typename TRequest>
    [[nodiscard]] std::future<Result<response_t<TRequest>>> send_async(
        TRequest request, std::stop_token token = {});

    // ==========================================================================
    // Notification
    // ==========================================================================

    /// Start every handler of `notification` concurrently and wait for all of
    /// them. The first failure is reported once everything has settled.
    template<typename TNotification>
    [[nodiscard]] Status publish(const TNotification& notification, std::stop_token token = {});

    template<typename TNotification>
    [[nodiscard]] std::future<Status> publish_async(TNotification notification,
                                                    std::stop_token token = {});

    // ==========================================================================
    // Stream
    // ==========================================================================

    /// Lazy sequence from the single stream handler of `request`.
    /// Behaviors are not applied; `token` is checked at every element.
    template<typename TRequest>
    [[nodiscard]] Result<Stream<element_t<TRequest>>> stream(const TRequest& request,
                                                            std::stop_token token = {}) const;

    // ==========================================================================
    // Accessors
    // ==========================================================================

    [[nodiscard]] const HandlerRegistry& registry() const noexcept { return *registry_; }
    [[nodiscard]] const MediatorConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::size_t worker_count() const noexcept { return pool_->size(); }

private:
    using Invocation = std::function<Status()>;

    /// Run `invocations` concurrently on the pool and settle them
    [[nodiscard]] Status fan_out(std::string_view notification_name,
                                 std::vector<Invocation> invocations);

    [[nodiscard]] static Error cancelled(std::string_view operation, std::string_view name);

    std::shared_ptr<const HandlerRegistry> registry_;
    MediatorConfig config_;
    std::unique_ptr<ThreadPool> pool_;
};

// ==============================================================================
// Template Implementation
// ==============================================================================

template<typename TRequest>
Result<response_t<TRequest>> Mediator::send(const TRequest& request, std::stop_token token) const {
    static_assert(is_request_v<TRequest>, "send() requires a conduit::Request<R>");
    using Response = response_t<TRequest>;

    if (token.stop_requested()) {
        return Err<Response>(cancelled("send", type_name<TRequest>()));
    }

    auto context = make_context(request, token);
    auto behaviors = registry_->resolve_behaviors(context.route);

#if CONDUIT_ENABLE_LOGGING
    Logger::trace("Dispatching {} through {} behavior(s)", context.request_name, behaviors.size());
#endif

    // Handler is resolved lazily so a short-circuiting behavior needs none
    NextDelegate terminal = [this, &request, &token]() -> Result<std::any> {
        auto handler = registry_->resolve_one<TRequest>();
        if (!handler) {
            return Err<std::any>(handler.error());
        }
        return erase_result((*handler)->handle(request, token));
    };

    auto pipeline = build_pipeline(behaviors, context, std::move(terminal));
    return restore_result<Response>(pipeline());
}

template<typename TRequest>
std::future<Result<response_t<TRequest>>> Mediator::send_async(TRequest request,
                                                               std::stop_token token) {
    return pool_->enqueue([this, request = std::move(request), token = std::move(token)]() {
        return send(request, token);
    });
}

template<typename TNotification>
Status Mediator::publish(const TNotification& notification, std::stop_token token) {
    static_assert(is_notification_v<TNotification>,
                  "publish() requires a conduit::Notification");

    if (token.stop_requested()) {
        return Err(cancelled("publish", type_name<TNotification>()));
    }

    auto handlers = registry_->resolve_many<TNotification>();

#if CONDUIT_ENABLE_LOGGING
    Logger::trace("Publishing {} to {} handler(s)", type_name<TNotification>(), handlers.size());
#endif

    std::vector<Invocation> invocations;
    invocations.reserve(handlers.size());
    for (auto& handler : handlers) {
        invocations.emplace_back([handler = std::move(handler), &notification, token]() {
            return handler->handle(notification, token);
        });
    }
    return fan_out(type_name<TNotification>(), std::move(invocations));
}

template<typename TNotification>
std::future<Status> Mediator::publish_async(TNotification notification, std::stop_token token) {
    return pool_->enqueue(
        [this, notification = std::move(notification), token = std::move(token)]() {
            return publish(notification, token);
        });
}

template<typename TRequest>
Result<Stream<element_t<TRequest>>> Mediator::stream(const TRequest& request,
                                                     std::stop_token token) const {
    static_assert(is_stream_request_v<TRequest>,
                  "stream() requires a conduit::StreamRequest<E>");
    using Element = element_t<TRequest>;

    if (token.stop_requested()) {
        return Err<Stream<Element>>(cancelled("stream", type_name<TRequest>()));
    }

    auto handler = registry_->resolve_stream<TRequest>();
    if (!handler) {
        return Err<Stream<Element>>(handler.error());
    }

#if CONDUIT_ENABLE_LOGGING
    Logger::trace("Opening stream for {}", type_name<TRequest>());
#endif

    return (*handler)->handle(request, token).with_cancellation(token);
}

} // namespace conduit
