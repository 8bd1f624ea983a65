// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - In-Memory Cache Store For Tests                                   ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "conduit/cache_store.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace conduit::testing {

/// Map-backed store recording every write; expiry is recorded, not enforced
class MemoryCacheStore final : public ICacheStore {
public:
    struct Entry {
        std::any value;
        std::chrono::milliseconds expiration;
        CachePriority priority;
    };

    std::optional<std::any> try_get(const std::string& key) override {
        std::lock_guard lock(mutex_);
        ++reads_;
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void set(const std::string& key, std::any value, std::chrono::milliseconds expiration,
             CachePriority priority) override {
        std::lock_guard lock(mutex_);
        ++writes_;
        entries_.insert_or_assign(key, Entry{std::move(value), expiration, priority});
    }

    [[nodiscard]] std::optional<Entry> entry(const std::string& key) {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::vector<std::string> keys() {
        std::lock_guard lock(mutex_);
        std::vector<std::string> result;
        for (const auto& [key, entry] : entries_) {
            result.push_back(key);
        }
        return result;
    }

    [[nodiscard]] std::size_t size() {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] std::size_t reads() {
        std::lock_guard lock(mutex_);
        return reads_;
    }

    [[nodiscard]] std::size_t writes() {
        std::lock_guard lock(mutex_);
        return writes_;
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::size_t reads_{0};
    std::size_t writes_{0};
};

} // namespace conduit::testing
