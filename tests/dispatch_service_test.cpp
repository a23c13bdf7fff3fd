#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include "channels/dispatch_service.hpp"
#include "test_helpers.hpp"

namespace courier::channels {
namespace {

using courier::test::FakeClock;
using courier::test::LogCapture;
using courier::test::MakeOutbound;
using courier::test::MemoryDeadLetterSink;
using courier::test::ScriptedRegistry;
using courier::test::WaitUntil;
using courier::utils::LogLevel;

class DispatchServiceTest : public ::testing::Test {
protected:
    DispatchServiceTest()
        : registry_(SendResult::Success("sent-1"))
        , dlq_(std::make_shared<MemoryDeadLetterSink>()) {}

    // Inline backoff is recorded instead of slept; requeue timers still run.
    DispatchOptions MakeOptions() {
        DispatchOptions options{};
        options.retry.inline_retries = 0;
        options.retry.retry_max = 3;
        options.retry.retry_base_ms = 10;
        options.retry.retry_max_ms = 40;
        options.retry.retry_jitter_ms = 0;
        options.dlq = dlq_;
        options.sleep = [this](std::chrono::milliseconds duration) {
            std::lock_guard<std::mutex> lock(sleeps_mutex_);
            sleeps_.push_back(duration.count());
        };
        options.clock = clock_.AsFunction();
        options.consume_timeout_ms = 20;
        return options;
    }

    std::unique_ptr<DispatchService> MakeService(DispatchOptions options) {
        return std::make_unique<DispatchService>(bus_, registry_, std::move(options), logs_.MakeLogger("dispatch"));
    }

    std::vector<long long> Sleeps() {
        std::lock_guard<std::mutex> lock(sleeps_mutex_);
        return sleeps_;
    }

    courier::bus::MessageBus bus_;
    ScriptedRegistry registry_;
    std::shared_ptr<MemoryDeadLetterSink> dlq_;
    FakeClock clock_;
    LogCapture logs_;
    std::mutex sleeps_mutex_;
    std::vector<long long> sleeps_;
};

// =============================================================================
// Error classification
// =============================================================================

TEST(RetryableErrorTest, PermanentMarkersAreNotRetryable) {
    EXPECT_FALSE(IsRetryableError("invalid_auth"));
    EXPECT_FALSE(IsRetryableError("NOT_AUTHED"));
    EXPECT_FALSE(IsRetryableError("channel_not_found:slack"));
    EXPECT_FALSE(IsRetryableError("error: chat_id_required by api"));
    EXPECT_FALSE(IsRetryableError("bot_token_missing"));
    EXPECT_FALSE(IsRetryableError("Permission_Denied"));
    EXPECT_FALSE(IsRetryableError("invalid_arguments: bad chat id"));
}

TEST(RetryableErrorTest, EverythingElseIsRetryable) {
    EXPECT_TRUE(IsRetryableError("timeout"));
    EXPECT_TRUE(IsRetryableError("telegram_api_error: Too Many Requests"));
    EXPECT_TRUE(IsRetryableError("channel_not_running:telegram"));
    EXPECT_TRUE(IsRetryableError("circuit_open:telegram"));
    EXPECT_TRUE(IsRetryableError(""));
}

// =============================================================================
// Backoff
// =============================================================================

TEST_F(DispatchServiceTest, ComputeDelayStaysWithinBackoffBounds) {
    auto options = MakeOptions();
    options.retry.retry_base_ms = 700;
    options.retry.retry_max_ms = 25000;
    options.retry.retry_jitter_ms = 250;
    auto service = MakeService(options);

    long long previous_floor = 0;
    for (int attempt = 1; attempt <= 20; ++attempt) {
        long long floor = 700;
        for (int i = 1; i < attempt && floor < 25000; ++i) {
            floor *= 2;
        }
        floor = std::min(floor, 25000LL);
        EXPECT_GE(floor, previous_floor);
        previous_floor = floor;

        for (int sample = 0; sample < 20; ++sample) {
            const auto delay = service->ComputeDelay(attempt);
            EXPECT_GE(delay, floor) << "attempt " << attempt;
            EXPECT_LT(delay, floor + 250) << "attempt " << attempt;
        }
    }
}

TEST_F(DispatchServiceTest, ComputeDelayWithoutJitterDoublesToCap) {
    auto options = MakeOptions();
    options.retry.retry_base_ms = 700;
    options.retry.retry_max_ms = 25000;
    auto service = MakeService(options);

    EXPECT_EQ(service->ComputeDelay(1), 700);
    EXPECT_EQ(service->ComputeDelay(2), 1400);
    EXPECT_EQ(service->ComputeDelay(3), 2800);
    EXPECT_EQ(service->ComputeDelay(6), 22400);
    EXPECT_EQ(service->ComputeDelay(7), 25000);
    EXPECT_EQ(service->ComputeDelay(50), 25000);
}

// =============================================================================
// Idempotence
// =============================================================================

TEST_F(DispatchServiceTest, DuplicateWithinTtlIsSentOnce) {
    auto service = MakeService(MakeOptions());
    const auto msg = MakeOutbound("m-1", "deploy complete");

    auto first = service->Send("telegram", msg);
    auto second = service->Send("TELEGRAM", MakeOutbound("m-2", "Deploy   complete"));

    EXPECT_TRUE(first.ok);
    EXPECT_TRUE(second.ok);
    EXPECT_EQ(second.message_id, "sent-1");
    EXPECT_EQ(registry_.Calls(), 1u);
    EXPECT_EQ(service->HealthCheck().recent_cache_size, 1u);
}

TEST_F(DispatchServiceTest, DuplicateAfterTtlIsSentAgain) {
    auto options = MakeOptions();
    options.dedupe.ttl_ms = 1000;
    auto service = MakeService(options);
    const auto msg = MakeOutbound("m-1", "deploy complete");

    ASSERT_TRUE(service->Send("telegram", msg).ok);
    clock_.Advance(1001);
    ASSERT_TRUE(service->Send("telegram", msg).ok);
    EXPECT_EQ(registry_.Calls(), 2u);
}

TEST_F(DispatchServiceTest, FailedSendIsNotRemembered) {
    auto options = MakeOptions();
    options.retry.retry_max = 0;
    auto service = MakeService(options);
    registry_.Enqueue(SendResult::Failure("timeout"));
    const auto msg = MakeOutbound("m-1", "hello");

    EXPECT_FALSE(service->Send("telegram", msg).ok);
    EXPECT_TRUE(service->Send("telegram", msg).ok);
    EXPECT_EQ(registry_.Calls(), 2u);
}

TEST_F(DispatchServiceTest, MissingChannelMessageIdFallsBackToMessageId) {
    ScriptedRegistry registry(SendResult::Success(""));
    DispatchService service(bus_, registry, MakeOptions(), logs_.MakeLogger("dispatch"));

    auto result = service.Send("telegram", MakeOutbound("local-9", "hi"));
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.message_id, "local-9");
}

// Keys on content; ages the clock while keying the second "k0" so the
// entry expires between the prune and the lookup.
class AgingDedupePolicy : public OutboundDedupePolicy {
public:
    explicit AgingDedupePolicy(FakeClock& clock) : clock_(clock) {}

    std::string Key(const std::string& provider, const courier::bus::OutboundMessage& msg) const override {
        if (msg.content == "k0" && ++k0_calls_ == 2) {
            clock_.Advance(600);
        }
        return provider + "::" + msg.content;
    }

private:
    FakeClock& clock_;
    mutable int k0_calls_ = 0;
};

TEST_F(DispatchServiceTest, RefreshedEntrySurvivesSizeTrim) {
    auto options = MakeOptions();
    options.dedupe.ttl_ms = 2500;
    options.dedupe.max_size = 10;
    options.dedupe_policy = std::make_shared<AgingDedupePolicy>(clock_);
    auto service = MakeService(options);

    ASSERT_TRUE(service->Send("telegram", MakeOutbound("0", "k0")).ok);
    clock_.Advance(2000);
    for (int i = 1; i < 510; ++i) {
        ASSERT_TRUE(service->Send("telegram", MakeOutbound(std::to_string(i), "k" + std::to_string(i))).ok);
    }
    // Expired at lookup, so sent again and refreshed in place.
    ASSERT_TRUE(service->Send("telegram", MakeOutbound("0b", "k0")).ok);
    EXPECT_EQ(registry_.Calls(), 511u);

    // Pushes the cache past the hard cap; the trim keeps the newest entries.
    ASSERT_TRUE(service->Send("telegram", MakeOutbound("510", "k510")).ok);
    EXPECT_EQ(service->HealthCheck().recent_cache_size, 10u);

    ASSERT_TRUE(service->Send("telegram", MakeOutbound("0c", "k0")).ok);
    EXPECT_EQ(registry_.Calls(), 512u);
}

TEST_F(DispatchServiceTest, RecentCacheIsTrimmedPastSlack) {
    auto options = MakeOptions();
    options.dedupe.max_size = 10;
    auto service = MakeService(options);

    for (int i = 0; i < 511; ++i) {
        ASSERT_TRUE(service->Send("telegram", MakeOutbound(std::to_string(i), "msg " + std::to_string(i))).ok);
    }
    EXPECT_EQ(service->HealthCheck().recent_cache_size, 10u);

    // The newest entries survive the trim.
    ASSERT_TRUE(service->Send("telegram", MakeOutbound("dup", "msg 510")).ok);
    EXPECT_EQ(registry_.Calls(), 511u);
}

// =============================================================================
// Retry, requeue and dead-letter
// =============================================================================

TEST_F(DispatchServiceTest, InlineRetriesBackOffBetweenAttempts) {
    auto options = MakeOptions();
    options.retry.inline_retries = 2;
    auto service = MakeService(options);
    registry_.Enqueue(SendResult::Failure("timeout"));
    registry_.Enqueue(SendResult::Failure("timeout"));

    auto result = service->Send("telegram", MakeOutbound("m-1", "eventually"));

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(registry_.Calls(), 3u);
    EXPECT_EQ(Sleeps(), (std::vector<long long>{10, 20}));
}

TEST_F(DispatchServiceTest, NonRetryableErrorStopsImmediately) {
    auto options = MakeOptions();
    options.retry.inline_retries = 3;
    ScriptedRegistry registry(SendResult::Failure("invalid_auth"));
    DispatchService service(bus_, registry, options, logs_.MakeLogger("dispatch"));

    auto result = service.Send("telegram", MakeOutbound("m-1", "secret"));

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "invalid_auth");
    EXPECT_EQ(registry.Calls(), 1u);
    EXPECT_TRUE(Sleeps().empty());
    EXPECT_EQ(service.PendingRetries(), 0u);
    EXPECT_EQ(dlq_->Count(), 0u);
}

TEST_F(DispatchServiceTest, RetryableFailureIsRequeuedWithCounter) {
    auto options = MakeOptions();
    options.retry.retry_base_ms = 60000;
    options.retry.retry_max_ms = 60000;
    ScriptedRegistry registry(SendResult::Failure("timeout"));
    DispatchService service(bus_, registry, options, logs_.MakeLogger("dispatch"));

    auto result = service.Send("telegram", MakeOutbound("m-1", "later"));

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "requeued_retry_1:timeout");
    EXPECT_EQ(service.PendingRetries(), 1u);
    EXPECT_EQ(dlq_->Count(), 0u);

    service.Stop();
    EXPECT_EQ(service.PendingRetries(), 0u);
}

TEST_F(DispatchServiceTest, RequeuedMessageCarriesRetryMetadata) {
    auto options = MakeOptions();
    options.retry.retry_max = 1;
    ScriptedRegistry registry(SendResult::Failure("timeout"));
    DispatchService service(bus_, registry, options, logs_.MakeLogger("dispatch"));
    service.Start();

    auto source = MakeOutbound("m-1", "payload");
    source.metadata["kind"] = "notice";
    ASSERT_TRUE(bus_.PublishOutbound(source));

    ASSERT_TRUE(WaitUntil([&]() { return registry.Calls() >= 2; }));
    service.Stop();

    const auto sent = registry.Sent();
    ASSERT_GE(sent.size(), 2u);
    EXPECT_EQ(sent[1].metadata.at("dispatch_retry"), "1");
    EXPECT_EQ(sent[1].metadata.at("dispatch_error"), "timeout");
    EXPECT_FALSE(sent[1].metadata.at("dispatch_retry_at").empty());
    EXPECT_EQ(sent[1].metadata.at("kind"), "notice");
    EXPECT_EQ(sent[1].content, "payload");
}

TEST_F(DispatchServiceTest, ExhaustedRetriesProduceOneDeadLetter) {
    auto options = MakeOptions();
    options.retry.inline_retries = 1;
    options.retry.retry_max = 2;
    ScriptedRegistry registry(SendResult::Failure("timeout"));
    DispatchService service(bus_, registry, options, logs_.MakeLogger("dispatch"));
    service.Start();

    auto msg = MakeOutbound("m-1", "never delivered");
    msg.reply_to = "r-1";
    ASSERT_TRUE(bus_.PublishOutbound(msg));

    ASSERT_TRUE(WaitUntil([&]() { return dlq_->Count() >= 1; }));
    // Give a stray extra requeue time to show up.
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    service.Stop();

    ASSERT_EQ(dlq_->Count(), 1u);
    const auto record = dlq_->List(10).front();
    EXPECT_EQ(record.retry_count, 2);
    EXPECT_EQ(record.error, "timeout");
    EXPECT_EQ(record.provider, "telegram");
    EXPECT_EQ(record.message_id, "m-1");
    EXPECT_EQ(record.chat_id, "chat-1");
    EXPECT_EQ(record.reply_to, "r-1");
    EXPECT_EQ(record.content, "never delivered");
    EXPECT_FALSE(record.at.empty());
    EXPECT_EQ(registry.Calls(), 6u);
    EXPECT_TRUE(logs_.Contains(LogLevel::kWarn, "dead-lettered"));
}

TEST_F(DispatchServiceTest, NoRetryBudgetGoesStraightToDeadLetter) {
    auto options = MakeOptions();
    options.retry.retry_max = 0;
    ScriptedRegistry registry(SendResult::Failure("telegram_api_error: Bad Gateway"));
    DispatchService service(bus_, registry, options, logs_.MakeLogger("dispatch"));

    auto result = service.Send("telegram", MakeOutbound("m-1", "x"));

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "telegram_api_error: Bad Gateway");
    EXPECT_EQ(dlq_->Count(), 1u);
    EXPECT_EQ(service.PendingRetries(), 0u);
}

TEST_F(DispatchServiceTest, DeadLetterContentIsTruncated) {
    auto options = MakeOptions();
    options.retry.retry_max = 0;
    ScriptedRegistry registry(SendResult::Failure("timeout"));
    DispatchService service(bus_, registry, options, logs_.MakeLogger("dispatch"));

    service.Send("telegram", MakeOutbound("m-1", std::string(5000, 'a')));

    ASSERT_EQ(dlq_->Count(), 1u);
    EXPECT_EQ(dlq_->List(1).front().content.size(), 4000u);
}

TEST_F(DispatchServiceTest, DeadLetterFailureIsLoggedNotThrown) {
    auto options = MakeOptions();
    options.retry.retry_max = 0;
    ScriptedRegistry registry(SendResult::Failure("timeout"));
    DispatchService service(bus_, registry, options, logs_.MakeLogger("dispatch"));
    dlq_->SetFailing(true);

    SendResult result;
    EXPECT_NO_THROW(result = service.Send("telegram", MakeOutbound("m-1", "x")));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "timeout");
    EXPECT_TRUE(logs_.Contains(LogLevel::kError, "dlq append failed"));
}

TEST_F(DispatchServiceTest, DeadLetterDisabledDropsSilently) {
    auto options = MakeOptions();
    options.retry.retry_max = 0;
    options.dlq = nullptr;
    ScriptedRegistry registry(SendResult::Failure("timeout"));
    DispatchService service(bus_, registry, options, logs_.MakeLogger("dispatch"));

    EXPECT_FALSE(service.Send("telegram", MakeOutbound("m-1", "x")).ok);
    EXPECT_EQ(dlq_->Count(), 0u);
}

// =============================================================================
// Rate limiting and circuit breaking
// =============================================================================

TEST_F(DispatchServiceTest, EmptyBucketWaitsOnceThenSends) {
    auto options = MakeOptions();
    options.rate_limiter = RateLimiterOptions{1, 1, 1000};
    auto service = MakeService(options);

    ASSERT_TRUE(service->Send("telegram", MakeOutbound("1", "first")).ok);
    ASSERT_TRUE(service->Send("telegram", MakeOutbound("2", "second")).ok);

    EXPECT_EQ(Sleeps(), (std::vector<long long>{1000}));
    EXPECT_EQ(registry_.Calls(), 2u);
}

TEST_F(DispatchServiceTest, OpenCircuitSkipsTransmission) {
    auto options = MakeOptions();
    options.retry.retry_max = 0;
    options.circuit_breaker = CircuitBreakerOptions{2, 5000, 1};
    registry_.Enqueue(SendResult::Failure("timeout"));
    registry_.Enqueue(SendResult::Failure("timeout"));
    auto service = MakeService(options);

    EXPECT_FALSE(service->Send("telegram", MakeOutbound("1", "a")).ok);
    EXPECT_FALSE(service->Send("telegram", MakeOutbound("2", "b")).ok);
    EXPECT_EQ(service->HealthCheck().breakers.at("telegram"), "open");

    auto blocked = service->Send("telegram", MakeOutbound("3", "c"));
    EXPECT_FALSE(blocked.ok);
    EXPECT_EQ(blocked.error, "circuit_open:telegram");
    EXPECT_EQ(registry_.Calls(), 2u);

    clock_.Advance(5000);
    EXPECT_TRUE(service->Send("telegram", MakeOutbound("4", "d")).ok);
    EXPECT_EQ(service->HealthCheck().breakers.at("telegram"), "closed");
}

TEST_F(DispatchServiceTest, BreakersAreIndependentPerProvider) {
    auto options = MakeOptions();
    options.retry.retry_max = 0;
    options.circuit_breaker = CircuitBreakerOptions{1, 5000, 1};
    registry_.Enqueue(SendResult::Failure("timeout"));
    auto service = MakeService(options);

    EXPECT_FALSE(service->Send("telegram", MakeOutbound("1", "a")).ok);
    EXPECT_TRUE(service->Send("slack", MakeOutbound("2", "a")).ok);

    const auto health = service->HealthCheck();
    EXPECT_EQ(health.breakers.at("telegram"), "open");
    EXPECT_EQ(health.breakers.at("slack"), "closed");
}

TEST_F(DispatchServiceTest, HealthShowsHalfOpenOnceResetTimeoutPasses) {
    auto options = MakeOptions();
    options.retry.retry_max = 0;
    options.circuit_breaker = CircuitBreakerOptions{1, 1000, 1};
    registry_.Enqueue(SendResult::Failure("timeout"));
    auto service = MakeService(options);

    EXPECT_FALSE(service->Send("telegram", MakeOutbound("1", "a")).ok);
    EXPECT_EQ(service->HealthCheck().breakers.at("telegram"), "open");

    clock_.Advance(5000);
    EXPECT_EQ(service->HealthCheck().breakers.at("telegram"), "half_open");
}

TEST_F(DispatchServiceTest, BreakerAbsentUnlessConfigured) {
    auto service = MakeService(MakeOptions());
    service->Send("telegram", MakeOutbound("1", "a"));
    EXPECT_TRUE(service->HealthCheck().breakers.empty());
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(DispatchServiceTest, ConsumeLoopDeliversInOrder) {
    auto service = MakeService(MakeOptions());
    service->Start();
    service->Start();
    EXPECT_TRUE(service->IsRunning());
    EXPECT_TRUE(service->HealthCheck().ok);

    bus_.PublishOutbound(MakeOutbound("1", "one"));
    bus_.PublishOutbound(MakeOutbound("2", "two"));
    bus_.PublishOutbound(MakeOutbound("3", "three"));
    ASSERT_TRUE(WaitUntil([&]() { return registry_.Calls() == 3; }));
    service->Stop();

    const auto sent = registry_.Sent();
    EXPECT_EQ(sent[0].id, "1");
    EXPECT_EQ(sent[1].id, "2");
    EXPECT_EQ(sent[2].id, "3");
    EXPECT_FALSE(service->IsRunning());
}

TEST_F(DispatchServiceTest, MessagesWithoutProviderAreSkipped) {
    auto service = MakeService(MakeOptions());
    service->Start();

    bus_.PublishOutbound(MakeOutbound("1", "orphan", ""));
    bus_.PublishOutbound(MakeOutbound("2", "routed"));
    ASSERT_TRUE(WaitUntil([&]() { return registry_.Calls() == 1; }));
    service->Stop();

    EXPECT_EQ(registry_.Sent().front().id, "2");
}

TEST_F(DispatchServiceTest, StopCancelsPendingRetries) {
    auto options = MakeOptions();
    options.retry.retry_base_ms = 200;
    options.retry.retry_max_ms = 200;
    ScriptedRegistry registry(SendResult::Failure("timeout"));
    DispatchService service(bus_, registry, options, logs_.MakeLogger("dispatch"));
    service.Start();

    ASSERT_FALSE(service.Send("telegram", MakeOutbound("m-1", "x")).ok);
    ASSERT_EQ(service.PendingRetries(), 1u);
    service.Stop();

    EXPECT_EQ(service.PendingRetries(), 0u);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(bus_.Size(courier::bus::Direction::kOutbound), 0u);
    EXPECT_EQ(registry.Calls(), 1u);
}

TEST_F(DispatchServiceTest, LoopExitsWhenBusCloses) {
    auto service = MakeService(MakeOptions());
    service->Start();
    bus_.Close();
    EXPECT_TRUE(logs_.Contains(LogLevel::kInfo, "dispatch started"));
    ASSERT_TRUE(WaitUntil([&]() { return logs_.Contains(LogLevel::kInfo, "consume loop exiting"); }));
    ASSERT_TRUE(WaitUntil([&]() { return !service->IsRunning(); }));
    EXPECT_FALSE(service->HealthCheck().ok);

    // A second start relaunches the loop instead of being swallowed.
    service->Start();
    EXPECT_TRUE(logs_.Contains(LogLevel::kInfo, "dispatch started"));
    ASSERT_TRUE(WaitUntil([&]() { return !service->IsRunning(); }));
    service->Stop();
    EXPECT_FALSE(service->HealthCheck().ok);
}

// =============================================================================
// Configuration
// =============================================================================

TEST(DispatchOptionsTest, BuiltFromChannelConfig) {
    courier::config::ChannelConfig config{};
    config.dispatch.retry_max = 7;
    config.rate_limit.capacity = 12;
    config.circuit_breaker.enabled = true;
    config.circuit_breaker.failure_threshold = 9;
    auto sink = std::make_shared<MemoryDeadLetterSink>();

    auto options = DispatchOptionsFromConfig(config, sink);
    EXPECT_EQ(options.retry.retry_max, 7);
    EXPECT_EQ(options.rate_limiter.capacity, 12);
    ASSERT_TRUE(options.circuit_breaker.has_value());
    EXPECT_EQ(options.circuit_breaker->failure_threshold, 9);
    EXPECT_EQ(options.dlq, sink);

    config.circuit_breaker.enabled = false;
    config.dispatch.dlq_enabled = false;
    options = DispatchOptionsFromConfig(config, sink);
    EXPECT_FALSE(options.circuit_breaker.has_value());
    EXPECT_EQ(options.dlq, nullptr);
}

}  // namespace
}  // namespace courier::channels
