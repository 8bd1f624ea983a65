// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Mediator Implementation                                           ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "conduit/mediator.hpp"

#include <fmt/core.h>

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace conduit {

namespace {

/// Outcome shared by the invocations of one fan-out
struct FanOutState {
    std::mutex mutex;
    std::optional<Error> first_error;
    std::exception_ptr first_exception;
    std::size_t failures{0};

    void record(Error error) {
        std::lock_guard lock(mutex);
        if (failures++ == 0) {
            first_error = std::move(error);
        }
    }

    void record(std::exception_ptr exception) {
        std::lock_guard lock(mutex);
        if (failures++ == 0) {
            first_exception = std::move(exception);
        }
    }
};

/// One handler invocation, run exactly once by whichever thread claims it first
struct FanOutSlot {
    explicit FanOutSlot(std::function<Status()> fn) : invocation(std::move(fn)) {}

    std::atomic<bool> claimed{false};
    std::function<Status()> invocation;
    std::promise<void> settled;
};

void run_slot(FanOutState& state, FanOutSlot& slot) {
    if (slot.claimed.exchange(true)) {
        return;
    }
    try {
        auto status = slot.invocation();
        if (!status) {
            state.record(status.error());
        }
    } catch (...) {
        // Rethrown to the publisher once every sibling has settled
        state.record(std::current_exception());
    }
    slot.invocation = nullptr;
    slot.settled.set_value();
}

} // anonymous namespace

Mediator::Mediator(std::shared_ptr<const HandlerRegistry> registry, MediatorConfig config)
    : registry_(std::move(registry))
    , config_(std::move(config))
{
    if (!registry_) {
        throw std::invalid_argument("Mediator requires a handler registry");
    }
    pool_ = std::make_unique<ThreadPool>(config_.effective_worker_threads());

#if CONDUIT_ENABLE_LOGGING
    Logger::debug("Mediator ready: {} handler(s), {} behavior(s), {} worker(s)",
                  registry_->handler_count(), registry_->behavior_count(), pool_->size());
#endif
}

Mediator::~Mediator() = default;

// ==============================================================================
// Fan-out
// ==============================================================================

Status Mediator::fan_out(std::string_view notification_name, std::vector<Invocation> invocations) {
    if (invocations.empty()) {
        return Ok();
    }

    auto state = std::make_shared<FanOutState>();
    std::vector<std::shared_ptr<FanOutSlot>> slots;
    std::vector<std::future<void>> pending;
    slots.reserve(invocations.size());
    pending.reserve(invocations.size());

    // Start everything before waiting on anything
    for (auto& invocation : invocations) {
        auto slot = std::make_shared<FanOutSlot>(std::move(invocation));
        pending.push_back(slot->settled.get_future());
        slots.push_back(slot);
        // The pool's own future is not awaited; a slot the publisher already
        // ran leaves a no-op task behind
        (void)pool_->enqueue([state, slot]() { run_slot(*state, *slot); });
    }

    // Run whatever the workers have not picked up yet, never foreign tasks
    for (auto& slot : slots) {
        run_slot(*state, *slot);
    }

    for (auto& future : pending) {
        future.wait();
    }

    if (state->failures == 0) {
        return Ok();
    }

#if CONDUIT_ENABLE_LOGGING
    Logger::warn("Publishing {} failed in {} of {} handler(s)",
                 notification_name, state->failures, pending.size());
#endif

    if (state->first_exception) {
        std::rethrow_exception(state->first_exception);
    }

    return Err(Error(ErrorCode::FanOutFailure,
                     fmt::format("{} of {} handler(s) for {} failed", state->failures,
                                 pending.size(), notification_name),
                     std::move(*state->first_error)));
}

Error Mediator::cancelled(std::string_view operation, std::string_view name) {
    return Error(ErrorCode::Cancelled, fmt::format("{} of {} was cancelled", operation, name));
}

} // namespace conduit
