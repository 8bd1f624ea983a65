// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Validator Contract                                                ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "conduit/request.hpp"
#include "conduit/status.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <stdexcept>
#include <stop_token>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace conduit {

/// External validation rules for one request type
template<typename TRequest>
class Validator {
public:
    virtual ~Validator() = default;

    /// Empty result means the request is valid
    [[nodiscard]] virtual std::vector<FieldError> validate(const TRequest& request,
                                                           std::stop_token token) = 0;
};

/// Validators keyed by request type, consumed by the validation behavior
class ValidatorRegistry {
public:
    /// Type-erased validation call: (request, token) -> field errors
    using ErasedValidator = std::function<std::vector<FieldError>(const void*, std::stop_token)>;

    template<typename TRequest>
    ValidatorRegistry& add_validator(std::shared_ptr<Validator<TRequest>> validator) {
        if (!validator) throw std::invalid_argument("validator must not be null");
        put(std::type_index(typeid(TRequest)),
            [validator = std::move(validator)](const void* request, std::stop_token token) {
                return validator->validate(*static_cast<const TRequest*>(request),
                                           std::move(token));
            });
        return *this;
    }

    /// Register a callable `std::vector<FieldError>(const TRequest&)`
    template<typename TRequest, typename F>
    ValidatorRegistry& add_validator_fn(F fn) {
        put(std::type_index(typeid(TRequest)),
            [fn = std::move(fn)](const void* request, std::stop_token) {
                return fn(*static_cast<const TRequest*>(request));
            });
        return *this;
    }

    /// Validators bound to `type`, in registration order
    [[nodiscard]] std::vector<ErasedValidator> resolve(std::type_index type) const;

    [[nodiscard]] std::size_t count(std::type_index type) const;

    /// Bumped by every registration
    [[nodiscard]] std::uint64_t generation() const noexcept {
        return generation_.load(std::memory_order_acquire);
    }

private:
    void put(std::type_index type, ErasedValidator validator);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::vector<ErasedValidator>> validators_;
    std::atomic<std::uint64_t> generation_{0};
};

} // namespace conduit
