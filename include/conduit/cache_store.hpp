// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Cache Store Contract                                              ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "conduit/request.hpp"

#include <any>
#include <chrono>
#include <optional>
#include <string>

namespace conduit {

/// Key/value store with per-entry expiry, consumed by the caching behavior.
/// Implementations must be safe for concurrent use.
class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    /// Unexpired value stored under `key`, std::nullopt otherwise
    [[nodiscard]] virtual std::optional<std::any> try_get(const std::string& key) = 0;

    virtual void set(const std::string& key,
                     std::any value,
                     std::chrono::milliseconds expiration,
                     CachePriority priority) = 0;
};

} // namespace conduit
