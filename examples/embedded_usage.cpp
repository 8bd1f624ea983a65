// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Embedded Usage Example                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "conduit/version.hpp"
#include "conduit/conduit.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace {

// ==============================================================================
// Messages
// ==============================================================================

struct Account {
    std::string id;
    long balance{0};
};

struct GetAccount : conduit::CacheableRequest<Account> {
    std::string id;

    std::string cache_key() const override { return id; }
    std::chrono::milliseconds cache_expiration() const override { return std::chrono::minutes(5); }
};

struct Deposit : conduit::Command {
    std::string id;
    long amount{0};
};

struct Deposited : conduit::Notification {
    std::string id;
    long amount{0};
};

struct History : conduit::StreamRequest<long> {
    std::string id;
};

// ==============================================================================
// In-memory bank
// ==============================================================================

class Bank {
public:
    Account get(const std::string& id) {
        std::lock_guard lock(mutex_);
        return Account{id, balances_[id]};
    }

    void deposit(const std::string& id, long amount) {
        std::lock_guard lock(mutex_);
        balances_[id] += amount;
        history_[id].push_back(amount);
    }

    std::vector<long> history(const std::string& id) {
        std::lock_guard lock(mutex_);
        return history_[id];
    }

private:
    std::mutex mutex_;
    std::map<std::string, long> balances_;
    std::map<std::string, std::vector<long>> history_;
};

/// Unbounded map; expiry and priority are ignored
class MapCacheStore final : public conduit::ICacheStore {
public:
    std::optional<std::any> try_get(const std::string& key) override {
        std::lock_guard lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    void set(const std::string& key, std::any value, std::chrono::milliseconds,
             conduit::CachePriority) override {
        std::lock_guard lock(mutex_);
        values_.insert_or_assign(key, std::move(value));
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::any> values_;
};

class DepositHandler final : public conduit::CommandHandler<Deposit> {
public:
    explicit DepositHandler(std::shared_ptr<Bank> bank) : bank_(std::move(bank)) {}

    conduit::Status handle(const Deposit& command, std::stop_token) override {
        bank_->deposit(command.id, command.amount);
        return conduit::Ok();
    }

private:
    std::shared_ptr<Bank> bank_;
};

class HistoryHandler final : public conduit::StreamRequestHandler<History> {
public:
    explicit HistoryHandler(std::shared_ptr<Bank> bank) : bank_(std::move(bank)) {}

    conduit::Stream<long> handle(const History& request, std::stop_token token) override {
        return conduit::Stream<long>::from_vector(bank_->history(request.id), std::move(token));
    }

private:
    std::shared_ptr<Bank> bank_;
};

} // anonymous namespace

int main() {
    fmt::print(fmt::emphasis::bold, "\n=== Conduit Embedded Usage Example ===\n\n");

    fmt::print("Version: {}\n", conduit::VERSION_STRING);
    fmt::print("Build:   {} ({})\n\n", conduit::BUILD_TYPE, conduit::COMPILER_ID);

    conduit::LogConfig log_config;
    log_config.level = conduit::LogLevel::DEBUG;
    conduit::Logger::init(log_config);

    auto bank = std::make_shared<Bank>();

    // Validation rules
    auto validators = std::make_shared<conduit::ValidatorRegistry>();
    validators->add_validator_fn<Deposit>([](const Deposit& command) {
        std::vector<conduit::FieldError> errors;
        if (command.id.empty()) errors.push_back({"id", "must not be empty"});
        if (command.amount <= 0) errors.push_back({"amount", "must be positive"});
        return errors;
    });

    // Handlers and behaviors
    auto registry = std::make_shared<conduit::HandlerRegistry>();
    registry->add_command_handler<Deposit>(std::make_shared<DepositHandler>(bank));
    registry->add_handler_fn<GetAccount>([bank](const GetAccount& query, std::stop_token) {
        return conduit::Ok(bank->get(query.id));
    });
    registry->add_stream_handler<History>(std::make_shared<HistoryHandler>(bank));
    registry->add_notification_fn<Deposited>([](const Deposited& event, std::stop_token) {
        fmt::print("  audit: {} += {}\n", event.id, event.amount);
        return conduit::Ok();
    });
    registry->add_notification_fn<Deposited>([](const Deposited& event, std::stop_token) {
        fmt::print("  mailer: notifying owner of {}\n", event.id);
        return conduit::Ok();
    });

    registry->add_behavior(std::make_shared<conduit::PerformanceLoggingBehavior>());
    registry->add_behavior(std::make_shared<conduit::ValidationBehavior>(validators));
    registry->add_behavior(
        std::make_shared<conduit::CachingBehavior>(std::make_shared<MapCacheStore>()));

    conduit::Mediator mediator(registry);

    // Commands
    fmt::print("\nDepositing...\n");
    for (long amount : {100L, 250L, 50L}) {
        Deposit deposit;
        deposit.id = "acc-1";
        deposit.amount = amount;

        auto result = mediator.send(deposit);
        if (!result) {
            fmt::print(fg(fmt::color::red), "ERROR: {}\n", result.error().to_string());
            return 1;
        }

        Deposited event;
        event.id = deposit.id;
        event.amount = amount;
        auto published = mediator.publish(event);
        if (!published) {
            fmt::print(fg(fmt::color::red), "ERROR: {}\n", published.error().to_string());
        }
    }

    // Rejected command
    Deposit invalid;
    invalid.amount = -5;
    auto rejected = mediator.send(invalid);
    if (!rejected) {
        fmt::print(fg(fmt::color::yellow), "\nRejected as expected: {}\n",
                   rejected.error().to_string());
    }

    // Query (second call is served from the cache)
    GetAccount query;
    query.id = "acc-1";
    for (int i = 0; i < 2; ++i) {
        auto account = mediator.send(query);
        if (!account) {
            fmt::print(fg(fmt::color::red), "ERROR: {}\n", account.error().to_string());
            return 1;
        }
        fmt::print(fg(fmt::color::green), "Balance of {}: {}\n", account->id, account->balance);
    }

    // Stream
    History history;
    history.id = "acc-1";
    auto stream = mediator.stream(history);
    if (stream) {
        fmt::print("\nHistory:");
        for (long amount : *stream) {
            fmt::print(" {}", amount);
        }
        fmt::print("\n");
    }

    fmt::print(fmt::emphasis::bold, "\nDone.\n");
    return 0;
}
