// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Mediator Benchmarks                                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <benchmark/benchmark.h>

#include "conduit/conduit.hpp"

#include <spdlog/sinks/null_sink.h>

#include <any>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

using namespace conduit;

namespace {

struct Increment : Request<int> {
    int value{0};
};

struct Tick : Notification {};

struct Lookup : CacheableRequest<std::string> {
    std::string id;

    [[nodiscard]] std::string cache_key() const override { return id; }
    [[nodiscard]] std::chrono::milliseconds cache_expiration() const override {
        return std::chrono::minutes(1);
    }
};

class PassThrough final : public IPipelineBehavior {
public:
    Result<std::any> process(const RequestContext&, const NextDelegate& next) override {
        return next();
    }
};

class MapStore final : public ICacheStore {
public:
    std::optional<std::any> try_get(const std::string& key) override {
        std::lock_guard lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    void set(const std::string& key, std::any value, std::chrono::milliseconds,
             CachePriority) override {
        std::lock_guard lock(mutex_);
        values_.insert_or_assign(key, std::move(value));
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::any> values_;
};

std::shared_ptr<spdlog::logger> silent_logger() {
    static auto logger = std::make_shared<spdlog::logger>(
        "bench", std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}

std::shared_ptr<HandlerRegistry> make_registry(int behaviors) {
    auto registry = std::make_shared<HandlerRegistry>();
    registry->add_handler_fn<Increment>([](const Increment& request, std::stop_token) {
        return Ok(request.value + 1);
    });
    for (int i = 0; i < behaviors; ++i) {
        registry->add_behavior(std::make_shared<PassThrough>());
    }
    return registry;
}

} // anonymous namespace

static void BM_SendDirect(benchmark::State& state) {
    Logger::set(silent_logger());
    Mediator mediator(make_registry(0), MediatorConfig{1});
    Increment request;

    for (auto _ : state) {
        auto result = mediator.send(request);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_SendDirect);

static void BM_SendThroughBehaviors(benchmark::State& state) {
    Logger::set(silent_logger());
    Mediator mediator(make_registry(static_cast<int>(state.range(0))), MediatorConfig{1});
    Increment request;

    for (auto _ : state) {
        auto result = mediator.send(request);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_SendThroughBehaviors)->Range(1, 16);

static void BM_SendCacheHit(benchmark::State& state) {
    Logger::set(silent_logger());
    auto registry = std::make_shared<HandlerRegistry>();
    registry->add_handler_fn<Lookup>([](const Lookup& request, std::stop_token) {
        return Ok("value-" + request.id);
    });
    registry->add_behavior(std::make_shared<CachingBehavior>(
        std::make_shared<MapStore>(), CachingConfig{}, silent_logger()));
    Mediator mediator(registry, MediatorConfig{1});

    Lookup request;
    request.id = "warm";
    (void)mediator.send(request);

    for (auto _ : state) {
        auto result = mediator.send(request);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_SendCacheHit);

static void BM_PublishFanOut(benchmark::State& state) {
    Logger::set(silent_logger());
    auto registry = std::make_shared<HandlerRegistry>();
    for (int i = 0; i < state.range(0); ++i) {
        registry->add_notification_fn<Tick>([](const Tick&, std::stop_token) { return Ok(); });
    }
    Mediator mediator(registry, MediatorConfig{4});

    for (auto _ : state) {
        auto status = mediator.publish(Tick{});
        benchmark::DoNotOptimize(status);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_PublishFanOut)->Range(1, 64);

BENCHMARK_MAIN();
