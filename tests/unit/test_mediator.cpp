// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Mediator Unit Tests                                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "conduit/mediator.hpp"
#include "testing/capture_sink.hpp"
#include "testing/messages.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace conduit;
using namespace conduit::testing;
using namespace std::chrono_literals;

namespace {

class TouchHandler final : public CommandHandler<Touch> {
public:
    Status handle(const Touch& command, std::stop_token) override {
        total += command.amount;
        return Ok();
    }

    std::atomic<int> total{0};
};

class RejectingTouchHandler final : public CommandHandler<Touch> {
public:
    Status handle(const Touch&, std::stop_token) override {
        return Err(ErrorCode::HandlerFailure, "touch refused");
    }
};

class CountingBehavior final : public IPipelineBehavior {
public:
    Result<std::any> process(const RequestContext&, const NextDelegate& next) override {
        ++calls;
        return next();
    }

    std::atomic<int> calls{0};
};

/// Sleeps, then marks itself finished
class SleepyHandler final : public NotificationHandler<UserCreated> {
public:
    explicit SleepyHandler(std::chrono::milliseconds delay) : delay_(delay) {}

    Status handle(const UserCreated&, std::stop_token) override {
        std::this_thread::sleep_for(delay_);
        finished = true;
        return Ok();
    }

    std::atomic<bool> finished{false};

private:
    std::chrono::milliseconds delay_;
};

class StreamCounter final : public StreamRequestHandler<CountTo> {
public:
    Stream<int> handle(const CountTo& request, std::stop_token token) override {
        auto next = std::make_shared<int>(0);
        int limit = request.limit;
        return Stream<int>([next, limit]() -> std::optional<int> {
            if (*next >= limit) {
                return std::nullopt;
            }
            return ++*next;
        }, std::move(token));
    }
};

} // anonymous namespace

class MediatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<CaptureSink>();
        Logger::set(make_capture_logger(sink_, "mediator_test"));
        registry_ = std::make_shared<HandlerRegistry>();
    }

    void TearDown() override {
        Logger::set(nullptr);
    }

    std::unique_ptr<Mediator> make_mediator(std::size_t workers = 4) {
        MediatorConfig config;
        config.worker_threads = workers;
        return std::make_unique<Mediator>(registry_, config);
    }

    std::shared_ptr<CaptureSink> sink_;
    std::shared_ptr<HandlerRegistry> registry_;
};

// ==============================================================================
// Construction
// ==============================================================================

TEST_F(MediatorTest, RequiresRegistry) {
    EXPECT_THROW(Mediator(nullptr), std::invalid_argument);
}

TEST_F(MediatorTest, WorkerCountFromConfig) {
    auto mediator = make_mediator(3);
    EXPECT_EQ(mediator->worker_count(), 3u);
    EXPECT_EQ(mediator->config().worker_threads, 3u);
}

// ==============================================================================
// Send
// ==============================================================================

TEST_F(MediatorTest, SendReturnsHandlerResponse) {
    auto handler = std::make_shared<EchoHandler>();
    registry_->add_handler<Echo>(handler);
    auto mediator = make_mediator();

    auto response = mediator->send(Echo("hello"));

    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(*response, "hello");
    EXPECT_EQ(handler->calls.load(), 1);
}

TEST_F(MediatorTest, SendIsRepeatable) {
    auto handler = std::make_shared<EchoHandler>();
    registry_->add_handler<Echo>(handler);
    auto mediator = make_mediator();

    auto first = mediator->send(Echo("same"));
    auto second = mediator->send(Echo("same"));

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(handler->calls.load(), 2);
}

TEST_F(MediatorTest, SendWithoutHandlerIsNotFound) {
    auto mediator = make_mediator();

    auto response = mediator->send(Add(1, 2));

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code(), ErrorCode::HandlerNotFound);
}

TEST_F(MediatorTest, BehaviorsRunBeforeHandlerLookupFails) {
    auto behavior = std::make_shared<CountingBehavior>();
    registry_->add_behavior(behavior);
    auto mediator = make_mediator();

    auto response = mediator->send(Add(1, 2));

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code(), ErrorCode::HandlerNotFound);
    EXPECT_EQ(behavior->calls.load(), 1);
}

TEST_F(MediatorTest, HandlerErrorIsReturned) {
    registry_->add_handler_fn<Add>([](const Add&, std::stop_token) {
        return Err<int>(ErrorCode::HandlerFailure, "overflow");
    });
    auto mediator = make_mediator();

    auto response = mediator->send(Add(1, 2));

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code(), ErrorCode::HandlerFailure);
    EXPECT_EQ(response.error().message(), "overflow");
}

TEST_F(MediatorTest, HandlerExceptionPropagates) {
    registry_->add_handler_fn<Add>([](const Add&, std::stop_token) -> Result<int> {
        throw std::runtime_error("handler crashed");
    });
    auto mediator = make_mediator();

    EXPECT_THROW((void)mediator->send(Add(1, 2)), std::runtime_error);
}

// ==============================================================================
// Commands
// ==============================================================================

TEST_F(MediatorTest, CommandYieldsUnit) {
    auto handler = std::make_shared<TouchHandler>();
    registry_->add_command_handler<Touch>(handler);
    auto mediator = make_mediator();

    Touch command;
    command.amount = 5;
    auto response = mediator->send(command);

    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(*response, unit);
    EXPECT_EQ(handler->total.load(), 5);
}

TEST_F(MediatorTest, CommandFailureIsReturned) {
    registry_->add_command_handler<Touch>(std::make_shared<RejectingTouchHandler>());
    auto mediator = make_mediator();

    auto response = mediator->send(Touch{});

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().message(), "touch refused");
}

TEST_F(MediatorTest, CommandWithoutHandlerIsNotFound) {
    auto mediator = make_mediator();

    auto response = mediator->send(Touch{});

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code(), ErrorCode::HandlerNotFound);
}

// ==============================================================================
// Cancellation
// ==============================================================================

TEST_F(MediatorTest, CancelledBeforeSendSkipsHandler) {
    auto handler = std::make_shared<EchoHandler>();
    auto behavior = std::make_shared<CountingBehavior>();
    registry_->add_handler<Echo>(handler);
    registry_->add_behavior(behavior);
    auto mediator = make_mediator();

    std::stop_source source;
    source.request_stop();
    auto response = mediator->send(Echo("late"), source.get_token());

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code(), ErrorCode::Cancelled);
    EXPECT_EQ(handler->calls.load(), 0);
    EXPECT_EQ(behavior->calls.load(), 0);
}

TEST_F(MediatorTest, HandlerObservesToken) {
    std::stop_source source;
    registry_->add_handler_fn<Add>([&source](const Add& add, std::stop_token token) {
        source.request_stop();
        if (token.stop_requested()) {
            return Err<int>(ErrorCode::Cancelled, "stopped midway");
        }
        return Ok(add.lhs + add.rhs);
    });
    auto mediator = make_mediator();

    auto response = mediator->send(Add(1, 2), source.get_token());

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code(), ErrorCode::Cancelled);
}

TEST_F(MediatorTest, CancelledBeforePublishSkipsHandlers) {
    std::atomic<int> calls{0};
    registry_->add_notification_fn<UserCreated>([&calls](const UserCreated&, std::stop_token) {
        ++calls;
        return Ok();
    });
    auto mediator = make_mediator();

    std::stop_source source;
    source.request_stop();
    auto status = mediator->publish(UserCreated("ada"), source.get_token());

    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code(), ErrorCode::Cancelled);
    EXPECT_EQ(calls.load(), 0);
}

// ==============================================================================
// Publish
// ==============================================================================

TEST_F(MediatorTest, PublishWithoutHandlersSucceeds) {
    auto mediator = make_mediator();

    auto status = mediator->publish(Unheard{});

    EXPECT_TRUE(status.has_value());
}

TEST_F(MediatorTest, PublishInvokesEveryHandlerOnce) {
    constexpr int kHandlers = 8;
    std::vector<std::shared_ptr<std::atomic<int>>> counters;
    for (int i = 0; i < kHandlers; ++i) {
        auto counter = std::make_shared<std::atomic<int>>(0);
        counters.push_back(counter);
        registry_->add_notification_fn<UserCreated>(
            [counter](const UserCreated& event, std::stop_token) {
                EXPECT_EQ(event.name, "ada");
                ++*counter;
                return Ok();
            });
    }
    auto mediator = make_mediator();

    auto status = mediator->publish(UserCreated("ada"));

    ASSERT_TRUE(status.has_value());
    for (const auto& counter : counters) {
        EXPECT_EQ(counter->load(), 1);
    }
}

TEST_F(MediatorTest, PublishWaitsForSlowestHandler) {
    auto fast = std::make_shared<SleepyHandler>(10ms);
    auto slow = std::make_shared<SleepyHandler>(150ms);
    registry_->add_notification_handler<UserCreated>(fast);
    registry_->add_notification_handler<UserCreated>(slow);
    auto mediator = make_mediator();

    auto status = mediator->publish(UserCreated("ada"));

    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(fast->finished.load());
    EXPECT_TRUE(slow->finished.load());
}

TEST_F(MediatorTest, PublishRunsHandlersConcurrently) {
    for (int i = 0; i < 4; ++i) {
        registry_->add_notification_handler<UserCreated>(std::make_shared<SleepyHandler>(200ms));
    }
    auto mediator = make_mediator(4);

    auto start = std::chrono::steady_clock::now();
    auto status = mediator->publish(UserCreated("ada"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(status.has_value());
    EXPECT_LT(elapsed, 700ms);
}

TEST_F(MediatorTest, PublishReportsFirstFailureAfterAllSettle) {
    auto slow = std::make_shared<SleepyHandler>(100ms);
    registry_->add_notification_fn<UserCreated>([](const UserCreated&, std::stop_token) {
        return Err(ErrorCode::HandlerFailure, "mailer down");
    });
    registry_->add_notification_handler<UserCreated>(slow);
    auto mediator = make_mediator();

    auto status = mediator->publish(UserCreated("ada"));

    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code(), ErrorCode::FanOutFailure);
    ASSERT_NE(status.error().cause(), nullptr);
    EXPECT_EQ(status.error().cause()->code(), ErrorCode::HandlerFailure);
    EXPECT_EQ(status.error().cause()->message(), "mailer down");
    EXPECT_TRUE(slow->finished.load());
    EXPECT_TRUE(sink_->contains(spdlog::level::warn, "failed"));
}

TEST_F(MediatorTest, PublishRethrowsHandlerException) {
    auto slow = std::make_shared<SleepyHandler>(50ms);
    registry_->add_notification_fn<UserCreated>([](const UserCreated&, std::stop_token) -> Status {
        throw std::runtime_error("audit log unavailable");
    });
    registry_->add_notification_handler<UserCreated>(slow);
    auto mediator = make_mediator();

    try {
        (void)mediator->publish(UserCreated("ada"));
        FAIL() << "publish should have thrown";
    } catch (const std::runtime_error& ex) {
        EXPECT_STREQ(ex.what(), "audit log unavailable");
    }
    EXPECT_TRUE(slow->finished.load());
}

TEST_F(MediatorTest, PublishDoesNotRunUnrelatedQueuedWork) {
    registry_->add_handler_fn<Add>([](const Add& add, std::stop_token) {
        std::this_thread::sleep_for(std::chrono::milliseconds(add.lhs));
        return Ok(add.lhs + add.rhs);
    });
    auto fast = std::make_shared<SleepyHandler>(10ms);
    auto slow = std::make_shared<SleepyHandler>(50ms);
    registry_->add_notification_handler<UserCreated>(fast);
    registry_->add_notification_handler<UserCreated>(slow);
    auto mediator = make_mediator(1);

    // Keeps the only worker busy, with a long request queued behind it
    auto busy = mediator->send_async(Add(200, 0));
    auto queued = mediator->send_async(Add(600, 0));

    auto start = std::chrono::steady_clock::now();
    auto status = mediator->publish(UserCreated("ada"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(fast->finished.load());
    EXPECT_TRUE(slow->finished.load());
    EXPECT_LT(elapsed, 400ms);
    EXPECT_NE(queued.wait_for(0ms), std::future_status::ready);

    EXPECT_TRUE(busy.get().has_value());
    EXPECT_TRUE(queued.get().has_value());
}

TEST_F(MediatorTest, PublishRunsEachHandlerOnceUnderContention) {
    std::atomic<int> calls{0};
    for (int i = 0; i < 32; ++i) {
        registry_->add_notification_fn<UserCreated>([&calls](const UserCreated&, std::stop_token) {
            ++calls;
            return Ok();
        });
    }
    auto mediator = make_mediator(4);

    for (int round = 0; round < 20; ++round) {
        ASSERT_TRUE(mediator->publish(UserCreated("ada")).has_value());
    }

    EXPECT_EQ(calls.load(), 32 * 20);
}

// ==============================================================================
// Asynchronous Dispatch
// ==============================================================================

TEST_F(MediatorTest, SendAsyncCompletes) {
    registry_->add_handler<Echo>(std::make_shared<EchoHandler>());
    auto mediator = make_mediator();

    auto future = mediator->send_async(Echo("later"));
    auto response = future.get();

    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(*response, "later");
}

TEST_F(MediatorTest, PublishAsyncOnSingleWorker) {
    std::atomic<int> calls{0};
    for (int i = 0; i < 3; ++i) {
        registry_->add_notification_fn<UserCreated>([&calls](const UserCreated&, std::stop_token) {
            ++calls;
            return Ok();
        });
    }
    auto mediator = make_mediator(1);

    auto status = mediator->publish_async(UserCreated("ada")).get();

    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(calls.load(), 3);
}

TEST_F(MediatorTest, ConcurrentSends) {
    auto handler = std::make_shared<EchoHandler>();
    registry_->add_handler<Echo>(handler);
    auto mediator = make_mediator();

    std::vector<std::thread> threads;
    std::atomic<int> successes{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&mediator, &successes, t]() {
            for (int i = 0; i < 100; ++i) {
                auto text = std::to_string(t * 1000 + i);
                auto response = mediator->send(Echo(text));
                if (response && *response == text) {
                    ++successes;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(successes.load(), 800);
    EXPECT_EQ(handler->calls.load(), 800);
}

// ==============================================================================
// Stream
// ==============================================================================

TEST_F(MediatorTest, StreamYieldsElementsInOrder) {
    registry_->add_stream_handler<CountTo>(std::make_shared<StreamCounter>());
    auto mediator = make_mediator();

    auto stream = mediator->stream(CountTo(4));

    ASSERT_TRUE(stream.has_value());
    std::vector<int> expected{1, 2, 3, 4};
    EXPECT_EQ(stream->collect(), expected);
}

TEST_F(MediatorTest, StreamWithoutHandlerIsNotFound) {
    auto mediator = make_mediator();

    auto stream = mediator->stream(CountTo(4));

    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error().code(), ErrorCode::HandlerNotFound);
}

TEST_F(MediatorTest, StreamStopsWhenCancelled) {
    registry_->add_stream_handler<CountTo>(std::make_shared<StreamCounter>());
    auto mediator = make_mediator();

    std::stop_source source;
    auto stream = mediator->stream(CountTo(100), source.get_token());
    ASSERT_TRUE(stream.has_value());

    std::vector<int> seen;
    for (int value : *stream) {
        seen.push_back(value);
        if (value == 3) {
            source.request_stop();
        }
    }

    std::vector<int> expected{1, 2, 3};
    EXPECT_EQ(seen, expected);
    EXPECT_TRUE(stream->cancelled());
}

TEST_F(MediatorTest, StreamBypassesBehaviors) {
    auto behavior = std::make_shared<CountingBehavior>();
    registry_->add_behavior(behavior);
    registry_->add_stream_handler<CountTo>(std::make_shared<StreamCounter>());
    auto mediator = make_mediator();

    auto stream = mediator->stream(CountTo(2));
    ASSERT_TRUE(stream.has_value());
    EXPECT_EQ(stream->collect().size(), 2u);
    EXPECT_EQ(behavior->calls.load(), 0);
}
