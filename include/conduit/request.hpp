// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Message Contracts                                                 ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "conduit/unit.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

namespace conduit {

// ==============================================================================
// Message Markers
// ==============================================================================

/// Base for requests routed to exactly one handler.
/// Derive as `struct GetUser : conduit::Request<User> { ... };`
template<typename TResponse>
struct Request {
    using response_type = TResponse;
};

/// Request with no meaningful result
using Command = Request<Unit>;

/// Base for requests producing a lazy sequence of elements
template<typename TElement>
struct StreamRequest {
    using element_type = TElement;
};

/// Base for messages broadcast to every registered handler
struct Notification {};

// ==============================================================================
// Cache Metadata
// ==============================================================================

/// Cache priority hint forwarded to the cache store
enum class CachePriority : std::uint8_t {
    Low,
    Normal,
    High,
    NeverRemove,
};

[[nodiscard]] constexpr const char* cache_priority_to_string(CachePriority priority) noexcept {
    switch (priority) {
        case CachePriority::Low: return "low";
        case CachePriority::Normal: return "normal";
        case CachePriority::High: return "high";
        case CachePriority::NeverRemove: return "never_remove";
        default: return "unknown";
    }
}

/// Cache metadata exposed by cacheable requests
class Cacheable {
public:
    virtual ~Cacheable() = default;

    [[nodiscard]] virtual std::string cache_key() const = 0;
    [[nodiscard]] virtual std::chrono::milliseconds cache_expiration() const = 0;
    [[nodiscard]] virtual CachePriority cache_priority() const { return CachePriority::Normal; }
};

/// Query whose response may be served from the cache store
template<typename TResponse>
struct CacheableRequest : Request<TResponse>, Cacheable {};

// ==============================================================================
// Traits
// ==============================================================================

template<typename T, typename = void>
struct is_request : std::false_type {};

template<typename T>
struct is_request<T, std::void_t<typename T::response_type>> : std::true_type {};

template<typename T>
inline constexpr bool is_request_v = is_request<T>::value;

template<typename T, typename = void>
struct is_stream_request : std::false_type {};

template<typename T>
struct is_stream_request<T, std::void_t<typename T::element_type>> : std::true_type {};

template<typename T>
inline constexpr bool is_stream_request_v = is_stream_request<T>::value;

template<typename T>
inline constexpr bool is_notification_v = std::is_base_of_v<Notification, T>;

template<typename T>
inline constexpr bool is_cacheable_v = std::is_base_of_v<Cacheable, T>;

template<typename TRequest>
using response_t = typename TRequest::response_type;

template<typename TRequest>
using element_t = typename TRequest::element_type;

// ==============================================================================
// Type Names
// ==============================================================================

/// Human-readable name for a mangled type name (identity where unsupported)
[[nodiscard]] std::string demangle(const char* mangled);

/// Readable, build-stable name of T. Used in logs and cache keys.
template<typename T>
[[nodiscard]] const std::string& type_name() {
    static const std::string name = demangle(typeid(T).name());
    return name;
}

} // namespace conduit
