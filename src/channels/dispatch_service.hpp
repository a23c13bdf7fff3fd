#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "bus/message_bus.hpp"
#include "channels/channel_registry.hpp"
#include "channels/circuit_breaker.hpp"
#include "channels/dlq_store.hpp"
#include "channels/outbound_dedupe.hpp"
#include "channels/rate_limiter.hpp"
#include "config/config_schema.hpp"
#include "utils/logging.hpp"

namespace courier::channels {

// False when the error text contains one of the known permanent failure
// markers (invalid auth, unknown channel, missing chat id, ...).
bool IsRetryableError(const std::string& error);

struct DispatchOptions {
    courier::config::DispatchConfig retry;
    courier::config::OutboundDedupeConfig dedupe;
    RateLimiterOptions rate_limiter;
    // Per-provider circuit breaking is off unless set.
    std::optional<CircuitBreakerOptions> circuit_breaker;
    // Null disables dead-lettering.
    std::shared_ptr<DeadLetterSink> dlq;
    // Null selects DefaultOutboundDedupePolicy.
    std::shared_ptr<const OutboundDedupePolicy> dedupe_policy;
    std::function<void(std::chrono::milliseconds)> sleep;
    std::function<std::int64_t()> clock;
    long long consume_timeout_ms = 2000;
};

// Dispatch options as configured; the dead-letter sink is supplied by the caller.
DispatchOptions DispatchOptionsFromConfig(const courier::config::ChannelConfig& config,
                                          std::shared_ptr<DeadLetterSink> dlq);

class DispatchService {
public:
    struct Health {
        bool ok = false;
        std::size_t recent_cache_size = 0;
        std::size_t pending_retries = 0;
        std::unordered_map<std::string, std::string> breakers;
    };

    DispatchService(courier::bus::MessageBus& bus,
                    ChannelRegistry& registry,
                    DispatchOptions options,
                    courier::utils::Logger logger);
    ~DispatchService();

    DispatchService(const DispatchService&) = delete;
    DispatchService& operator=(const DispatchService&) = delete;

    // Launches the outbound consume loop; repeated calls are no-ops.
    void Start();
    // Stops the loop and cancels every scheduled retry, including any
    // scheduled by the loop while it was winding down.
    void Stop();
    bool IsRunning() const { return running_; }

    SendResult Send(const std::string& provider, const courier::bus::OutboundMessage& msg);

    Health HealthCheck() const;
    std::size_t PendingRetries() const;
    // Backoff for the given 1-based attempt, jitter included.
    long long ComputeDelay(int attempt);

private:
    struct RecentRecord {
        std::int64_t at_ms = 0;
        std::string message_id;
    };
    using RecentList = std::list<std::pair<std::string, RecentRecord>>;

    void ConsumeLoop();
    SendResult SendWithRetry(const std::string& provider, const courier::bus::OutboundMessage& msg);
    void ScheduleRetry(const std::string& provider,
                       const courier::bus::OutboundMessage& msg,
                       int retry_count,
                       const std::string& error);
    std::size_t CancelPendingRetries();
    void WriteDeadLetter(const std::string& provider,
                         const courier::bus::OutboundMessage& msg,
                         const std::string& error,
                         int retry_count);

    std::optional<std::string> LookupRecent(const std::string& key);
    void RememberRecent(const std::string& key, const std::string& message_id);
    void PruneRecentCache();
    CircuitBreaker* BreakerFor(const std::string& provider);

    courier::bus::MessageBus& bus_;
    ChannelRegistry& registry_;
    DispatchOptions options_;
    courier::utils::Logger logger_;
    TokenBucketRateLimiter rate_limiter_;

    mutable std::mutex state_mutex_;
    RecentList recent_order_;
    std::unordered_map<std::string, RecentList::iterator> recent_;
    std::unordered_map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;
    std::mt19937 rng_;

    std::atomic<bool> running_{false};
    std::thread loop_thread_;

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    mutable std::mutex retry_mutex_;
    std::unordered_map<std::uint64_t, std::shared_ptr<boost::asio::steady_timer>> pending_retries_;
    std::atomic<std::uint64_t> next_retry_id_{1};
    std::thread timer_thread_;
};

}  // namespace courier::channels
