// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Validation Behavior Implementation                                ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "conduit/behaviors/validation.hpp"
#include "conduit/logger.hpp"

#include <fmt/core.h>

#include <iterator>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace conduit {

ValidationBehavior::ValidationBehavior(std::shared_ptr<const ValidatorRegistry> validators,
                                       std::shared_ptr<spdlog::logger> logger)
    : validators_(std::move(validators))
    , logger_(logger ? std::move(logger) : Logger::get())
{
    if (!validators_) {
        throw std::invalid_argument("ValidationBehavior requires a validator registry");
    }
}

bool ValidationBehavior::known_unvalidated(std::type_index type) const {
    const auto generation = validators_->generation();
    std::shared_lock lock(unvalidated_mutex_);
    return unvalidated_generation_ == generation && unvalidated_.count(type) != 0;
}

Result<std::any> ValidationBehavior::process(const RequestContext& context,
                                             const NextDelegate& next) {
    const auto type = context.route.request;

    if (known_unvalidated(type)) {
        return next();
    }

    // Read before resolving: a registration racing with this call leaves a
    // stale generation behind, which invalidates the memo on the next call
    const auto generation = validators_->generation();
    auto validators = validators_->resolve(type);
    if (validators.empty()) {
        std::unique_lock lock(unvalidated_mutex_);
        if (unvalidated_generation_ != generation) {
            unvalidated_.clear();
            unvalidated_generation_ = generation;
        }
        unvalidated_.insert(type);
        lock.unlock();
        return next();
    }

    std::vector<FieldError> failures;
    for (const auto& validator : validators) {
        auto errors = validator(context.request, context.token);
        failures.insert(failures.end(),
                        std::make_move_iterator(errors.begin()),
                        std::make_move_iterator(errors.end()));
    }

    if (failures.empty()) {
        return next();
    }

    logger_->warn("Validation failed for {} with {} errors", context.request_name, failures.size());
    for (const auto& failure : failures) {
        logger_->debug("Validation error: Property: {}, Error: {}", failure.field, failure.message);
    }

    return Err<std::any>(Error(ErrorCode::ValidationFailed,
                               fmt::format("{} rejected with {} error(s)",
                                           context.request_name, failures.size()),
                               std::move(failures)));
}

} // namespace conduit
