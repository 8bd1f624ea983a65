// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Validation Behavior                                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "conduit/pipeline.hpp"
#include "conduit/validator.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string_view>
#include <typeindex>
#include <unordered_set>

namespace conduit {

/// Runs every validator bound to the request type before the rest of the
/// pipeline. Any reported field error fails the call with ValidationFailed and
/// the continuation is never invoked.
class ValidationBehavior final : public IPipelineBehavior {
public:
    explicit ValidationBehavior(std::shared_ptr<const ValidatorRegistry> validators,
                                std::shared_ptr<spdlog::logger> logger = nullptr);

    [[nodiscard]] Result<std::any> process(const RequestContext& context,
                                           const NextDelegate& next) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "validation"; }

    /// True while `type` is known to have no validators at the registry's
    /// current generation
    [[nodiscard]] bool known_unvalidated(std::type_index type) const;

private:
    std::shared_ptr<const ValidatorRegistry> validators_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::shared_mutex unvalidated_mutex_;
    std::unordered_set<std::type_index> unvalidated_;
    std::uint64_t unvalidated_generation_{0};   // registry generation the set was built at
};

} // namespace conduit
