// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Pipeline Behavior Chain                                           ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "conduit/request.hpp"
#include "conduit/status.hpp"

#include <any>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>
#include <vector>

namespace conduit {

// ==============================================================================
// Routing Identity
// ==============================================================================

/// Registry key: (request type, response type)
struct RouteKey {
    std::type_index request;
    std::type_index response;

    bool operator==(const RouteKey&) const = default;
};

struct RouteKeyHash {
    std::size_t operator()(const RouteKey& key) const noexcept {
        auto h1 = key.request.hash_code();
        auto h2 = key.response.hash_code();
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

template<typename TRequest>
[[nodiscard]] RouteKey route_of() {
    return RouteKey{std::type_index(typeid(TRequest)),
                    std::type_index(typeid(response_t<TRequest>))};
}

// ==============================================================================
// Request Context
// ==============================================================================

/// Everything a type-erased behavior may know about the request in flight.
/// Valid for the duration of one dispatch call only.
struct RequestContext {
    RouteKey route;
    std::string_view request_name;
    const void* request{nullptr};
    const Cacheable* cacheable{nullptr};   // nullptr when the request is not cacheable
    std::stop_token token;

    template<typename TRequest>
    [[nodiscard]] bool is() const noexcept {
        return route.request == std::type_index(typeid(TRequest));
    }

    /// Caller must check is<TRequest>() first
    template<typename TRequest>
    [[nodiscard]] const TRequest& as() const noexcept {
        return *static_cast<const TRequest*>(request);
    }
};

template<typename TRequest>
[[nodiscard]] RequestContext make_context(const TRequest& request, std::stop_token token) {
    RequestContext context{route_of<TRequest>(), type_name<TRequest>(), &request, nullptr,
                           std::move(token)};
    if constexpr (is_cacheable_v<TRequest>) {
        context.cacheable = static_cast<const Cacheable*>(&request);
    }
    return context;
}

// ==============================================================================
// Continuations
// ==============================================================================

/// Type-erased continuation: the rest of the pipeline
using NextDelegate = std::function<Result<std::any>()>;

/// Typed continuation handed to PipelineBehavior<TRequest>
template<typename TResponse>
using RequestHandlerDelegate = std::function<Result<TResponse>()>;

template<typename TResponse>
[[nodiscard]] Result<std::any> erase_result(Result<TResponse> result) {
    if (!result) {
        return Err<std::any>(std::move(result).error());
    }
    return Result<std::any>(std::any(std::move(result).value()));
}

template<typename TResponse>
[[nodiscard]] Result<TResponse> restore_result(Result<std::any> result) {
    if (!result) {
        return Err<TResponse>(std::move(result).error());
    }
    auto* value = std::any_cast<TResponse>(&result.value());
    if (value == nullptr) {
        return Err<TResponse>(ErrorCode::ResponseTypeMismatch,
                              "pipeline produced a value of type " +
                                  demangle(result.value().type().name()) + ", expected " +
                                  type_name<TResponse>());
    }
    return Result<TResponse>(std::move(*value));
}

// ==============================================================================
// Behavior Contracts
// ==============================================================================

/// Cross-cutting wrapper around handler execution, applicable to any route.
/// May call `next` zero, one or several times.
class IPipelineBehavior {
public:
    virtual ~IPipelineBehavior() = default;

    [[nodiscard]] virtual Result<std::any> process(const RequestContext& context,
                                                   const NextDelegate& next) = 0;

    /// Name used in diagnostics
    [[nodiscard]] virtual std::string_view name() const noexcept { return "behavior"; }
};

/// Behavior bound to a single request type, working on concrete types
template<typename TRequest>
class PipelineBehavior : public IPipelineBehavior {
public:
    static_assert(is_request_v<TRequest>, "TRequest must derive from conduit::Request<R>");

    using request_type = TRequest;
    using response_type = response_t<TRequest>;

    [[nodiscard]] virtual Result<response_type> handle(
        const TRequest& request,
        const RequestHandlerDelegate<response_type>& next,
        std::stop_token token) = 0;

    [[nodiscard]] Result<std::any> process(const RequestContext& context,
                                           const NextDelegate& next) final {
        if (!context.is<TRequest>()) {
            // Route filtering in the registry makes this unreachable
            return next();
        }
        RequestHandlerDelegate<response_type> typed_next = [&next]() {
            return restore_result<response_type>(next());
        };
        return erase_result(handle(context.as<TRequest>(), typed_next, context.token));
    }
};

// ==============================================================================
// Chain Builder
// ==============================================================================

/// Fold behaviors right-to-left around `terminal`.
/// The first behavior becomes the outermost call.
[[nodiscard]] NextDelegate build_pipeline(
    const std::vector<std::shared_ptr<IPipelineBehavior>>& behaviors,
    const RequestContext& context,
    NextDelegate terminal);

} // namespace conduit
