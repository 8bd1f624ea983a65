// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Validator Registry                                                ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "conduit/validator.hpp"

#include <mutex>

namespace conduit {

void ValidatorRegistry::put(std::type_index type, ErasedValidator validator) {
    std::unique_lock lock(mutex_);
    validators_[type].push_back(std::move(validator));
    generation_.fetch_add(1, std::memory_order_release);
}

std::vector<ValidatorRegistry::ErasedValidator> ValidatorRegistry::resolve(
    std::type_index type) const {
    std::shared_lock lock(mutex_);
    auto it = validators_.find(type);
    if (it == validators_.end()) {
        return {};
    }
    return it->second;
}

std::size_t ValidatorRegistry::count(std::type_index type) const {
    std::shared_lock lock(mutex_);
    auto it = validators_.find(type);
    return it == validators_.end() ? 0 : it->second.size();
}

} // namespace conduit
