// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Handler Interfaces                                                ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "conduit/request.hpp"
#include "conduit/status.hpp"
#include "conduit/stream.hpp"

#include <functional>
#include <memory>
#include <stop_token>
#include <utility>

namespace conduit {

/// Handles one request type and produces its response
template<typename TRequest>
class RequestHandler {
public:
    static_assert(is_request_v<TRequest>, "TRequest must derive from conduit::Request<R>");

    using request_type = TRequest;
    using response_type = response_t<TRequest>;

    virtual ~RequestHandler() = default;

    [[nodiscard]] virtual Result<response_type> handle(const TRequest& request,
                                                       std::stop_token token) = 0;
};

/// Handles a command; success carries no value
template<typename TCommand>
class CommandHandler {
public:
    static_assert(std::is_same_v<response_t<TCommand>, Unit>,
                  "TCommand must derive from conduit::Command");

    using request_type = TCommand;

    virtual ~CommandHandler() = default;

    [[nodiscard]] virtual Status handle(const TCommand& command, std::stop_token token) = 0;
};

/// Handles one notification type; many may be registered for the same type
template<typename TNotification>
class NotificationHandler {
public:
    static_assert(is_notification_v<TNotification>,
                  "TNotification must derive from conduit::Notification");

    using notification_type = TNotification;

    virtual ~NotificationHandler() = default;

    [[nodiscard]] virtual Status handle(const TNotification& notification,
                                        std::stop_token token) = 0;
};

/// Produces a lazy stream for one stream request type
template<typename TRequest>
class StreamRequestHandler {
public:
    static_assert(is_stream_request_v<TRequest>,
                  "TRequest must derive from conduit::StreamRequest<E>");

    using request_type = TRequest;
    using element_type = element_t<TRequest>;

    virtual ~StreamRequestHandler() = default;

    [[nodiscard]] virtual Stream<element_type> handle(const TRequest& request,
                                                      std::stop_token token) = 0;
};

// ==============================================================================
// Adapters
// ==============================================================================

/// Presents a command handler through the result-typed request interface
template<typename TCommand>
class CommandHandlerAdapter final : public RequestHandler<TCommand> {
public:
    explicit CommandHandlerAdapter(std::shared_ptr<CommandHandler<TCommand>> inner)
        : inner_(std::move(inner)) {}

    [[nodiscard]] Result<Unit> handle(const TCommand& command, std::stop_token token) override {
        auto status = inner_->handle(command, std::move(token));
        if (!status) {
            return Err<Unit>(status.error());
        }
        return Ok(unit);
    }

private:
    std::shared_ptr<CommandHandler<TCommand>> inner_;
};

/// Request handler backed by a callable
template<typename TRequest>
class FunctionRequestHandler final : public RequestHandler<TRequest> {
public:
    using Function = std::function<Result<response_t<TRequest>>(const TRequest&, std::stop_token)>;

    explicit FunctionRequestHandler(Function fn) : fn_(std::move(fn)) {}

    [[nodiscard]] Result<response_t<TRequest>> handle(const TRequest& request,
                                                      std::stop_token token) override {
        return fn_(request, std::move(token));
    }

private:
    Function fn_;
};

/// Notification handler backed by a callable
template<typename TNotification>
class FunctionNotificationHandler final : public NotificationHandler<TNotification> {
public:
    using Function = std::function<Status(const TNotification&, std::stop_token)>;

    explicit FunctionNotificationHandler(Function fn) : fn_(std::move(fn)) {}

    [[nodiscard]] Status handle(const TNotification& notification,
                                std::stop_token token) override {
        return fn_(notification, std::move(token));
    }

private:
    Function fn_;
};

} // namespace conduit
