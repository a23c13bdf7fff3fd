#include "channels/dispatch_service.hpp"

#include <algorithm>
#include <exception>
#include <future>

#include <boost/asio/post.hpp>

#include "utils/common.hpp"

namespace courier::channels {
namespace {

constexpr const char* kNonRetryableErrors[] = {
    "invalid_auth",
    "not_authed",
    "channel_not_found",
    "chat_id_required",
    "bot_token_missing",
    "permission_denied",
    "invalid_arguments",
};

constexpr std::size_t kDeadLetterContentLimit = 4000;
constexpr std::size_t kRecentCacheSlack = 500;

int GetRetryCount(const courier::bus::OutboundMessage& msg) {
    auto it = msg.metadata.find("dispatch_retry");
    if (it == msg.metadata.end() || it->second.empty()) {
        return 0;
    }
    try {
        return std::max(0, std::stoi(it->second));
    } catch (const std::exception&) {
        return 0;
    }
}

// Cuts at a byte limit without splitting a UTF-8 sequence.
std::string TruncateUtf8(const std::string& value, std::size_t limit) {
    if (value.size() <= limit) {
        return value;
    }
    std::size_t end = limit;
    while (end > 0 && (static_cast<unsigned char>(value[end]) & 0xC0) == 0x80) {
        --end;
    }
    return value.substr(0, end);
}

}  // namespace

bool IsRetryableError(const std::string& error) {
    const auto lower = courier::utils::ToLower(error);
    for (const auto* marker : kNonRetryableErrors) {
        if (lower.find(marker) != std::string::npos) {
            return false;
        }
    }
    return true;
}

DispatchOptions DispatchOptionsFromConfig(const courier::config::ChannelConfig& config,
                                          std::shared_ptr<DeadLetterSink> dlq) {
    DispatchOptions options{};
    options.retry = config.dispatch;
    options.dedupe = config.outbound_dedupe;
    options.rate_limiter.capacity = config.rate_limit.capacity;
    options.rate_limiter.refill_rate = config.rate_limit.refill_rate;
    options.rate_limiter.refill_interval_ms = config.rate_limit.refill_interval_ms;
    if (config.circuit_breaker.enabled) {
        CircuitBreakerOptions breaker{};
        breaker.failure_threshold = config.circuit_breaker.failure_threshold;
        breaker.reset_timeout_ms = config.circuit_breaker.reset_timeout_ms;
        breaker.half_open_max = config.circuit_breaker.half_open_max;
        options.circuit_breaker = breaker;
    }
    if (config.dispatch.dlq_enabled) {
        options.dlq = std::move(dlq);
    }
    return options;
}

DispatchService::DispatchService(courier::bus::MessageBus& bus,
                                 ChannelRegistry& registry,
                                 DispatchOptions options,
                                 courier::utils::Logger logger)
    : bus_(bus)
    , registry_(registry)
    , options_(std::move(options))
    , logger_(std::move(logger))
    , rate_limiter_(options_.rate_limiter, options_.clock)
    , rng_(std::random_device{}())
    , work_(boost::asio::make_work_guard(io_)) {
    if (!options_.dedupe_policy) {
        options_.dedupe_policy = std::make_shared<DefaultOutboundDedupePolicy>();
    }
    if (!options_.sleep) {
        options_.sleep = [](std::chrono::milliseconds duration) {
            std::this_thread::sleep_for(duration);
        };
    }
    if (!options_.clock) {
        options_.clock = &courier::utils::NowMs;
    }
    timer_thread_ = std::thread([this]() { io_.run(); });
}

DispatchService::~DispatchService() {
    Stop();
    work_.reset();
    io_.stop();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
    std::lock_guard<std::mutex> lock(retry_mutex_);
    pending_retries_.clear();
}

void DispatchService::Start() {
    if (running_.exchange(true)) {
        return;
    }
    // A loop that exited on its own (closed bus) is still joinable.
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    loop_thread_ = std::thread([this]() { ConsumeLoop(); });
    logger_.Info("dispatch started");
}

void DispatchService::Stop() {
    running_ = false;
    CancelPendingRetries();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    // The loop may have scheduled a retry while finishing its last message.
    CancelPendingRetries();
}

SendResult DispatchService::Send(const std::string& provider, const courier::bus::OutboundMessage& msg) {
    return SendWithRetry(courier::utils::ToLower(provider), msg);
}

DispatchService::Health DispatchService::HealthCheck() const {
    Health health{};
    health.ok = running_;
    health.pending_retries = PendingRetries();
    std::lock_guard<std::mutex> lock(state_mutex_);
    health.recent_cache_size = recent_.size();
    for (const auto& [provider, breaker] : breakers_) {
        health.breakers[provider] = ToString(breaker->State());
    }
    return health;
}

std::size_t DispatchService::PendingRetries() const {
    std::lock_guard<std::mutex> lock(retry_mutex_);
    return pending_retries_.size();
}

long long DispatchService::ComputeDelay(int attempt) {
    const auto& retry = options_.retry;
    const auto cap = std::max(0LL, retry.retry_max_ms);
    long long delay = std::max(0LL, retry.retry_base_ms);
    for (int i = 1; i < attempt && delay < cap; ++i) {
        delay *= 2;
    }
    delay = std::min(delay, cap);
    if (retry.retry_jitter_ms > 0) {
        std::uniform_int_distribution<long long> dist(0, retry.retry_jitter_ms - 1);
        std::lock_guard<std::mutex> lock(state_mutex_);
        delay += dist(rng_);
    }
    return delay;
}

void DispatchService::ConsumeLoop() {
    while (running_) {
        auto msg = bus_.ConsumeOutbound({options_.consume_timeout_ms});
        if (!msg) {
            if (bus_.IsClosed()) {
                logger_.Info("outbound bus closed, consume loop exiting");
                running_ = false;
                break;
            }
            continue;
        }
        const auto provider = ResolveProvider(*msg);
        if (!provider) {
            logger_.Debug("dropping outbound message without provider", {{"message_id", msg->id}});
            continue;
        }
        const auto result = SendWithRetry(*provider, *msg);
        if (!result.ok) {
            logger_.Debug("dispatch failed", {{"provider", *provider}, {"error", result.error}});
        }
    }
}

SendResult DispatchService::SendWithRetry(const std::string& provider,
                                          const courier::bus::OutboundMessage& msg) {
    if (!rate_limiter_.TryConsume()) {
        const auto wait = rate_limiter_.WaitTimeMs();
        logger_.Debug("rate limited, waiting", {{"provider", provider}, {"wait_ms", std::to_string(wait)}});
        options_.sleep(std::chrono::milliseconds(wait));
        if (!rate_limiter_.TryConsume()) {
            logger_.Debug("rate limit still exceeded after wait", {{"provider", provider}});
        }
    }

    PruneRecentCache();

    const auto dedupe_key = options_.dedupe_policy->Key(provider, msg);
    if (auto cached = LookupRecent(dedupe_key)) {
        return SendResult::Success(*cached);
    }

    auto* breaker = BreakerFor(provider);
    const int attempts = std::max(1, options_.retry.inline_retries + 1);
    std::string last_error;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (breaker && !breaker->TryAcquire()) {
            if (last_error.empty()) {
                last_error = "circuit_open:" + provider;
            }
            break;
        }
        auto sent = registry_.Send(msg);
        if (sent.ok) {
            if (breaker) {
                breaker->RecordSuccess();
            }
            if (sent.message_id.empty()) {
                sent.message_id = msg.id;
            }
            RememberRecent(dedupe_key, sent.message_id);
            return sent;
        }
        if (breaker) {
            breaker->RecordFailure();
        }
        last_error = sent.error.empty() ? std::string("unknown_error") : sent.error;
        if (!IsRetryableError(last_error)) {
            break;
        }
        if (attempt < attempts) {
            options_.sleep(std::chrono::milliseconds(ComputeDelay(attempt)));
        }
    }

    const int dispatch_retry = GetRetryCount(msg);
    const bool retryable = IsRetryableError(last_error);
    if (retryable && dispatch_retry < options_.retry.retry_max) {
        ScheduleRetry(provider, msg, dispatch_retry + 1, last_error);
        return SendResult::Failure(
            "requeued_retry_" + std::to_string(dispatch_retry + 1) + ":" + last_error);
    }
    if (retryable) {
        WriteDeadLetter(provider, msg, last_error, dispatch_retry);
    }
    return SendResult::Failure(last_error.empty() ? std::string("send_failed") : last_error);
}

void DispatchService::ScheduleRetry(const std::string& provider,
                                    const courier::bus::OutboundMessage& msg,
                                    int retry_count,
                                    const std::string& error) {
    const auto delay = std::chrono::milliseconds(ComputeDelay(retry_count));
    auto retry_msg = msg;
    retry_msg.metadata["dispatch_retry"] = std::to_string(retry_count);
    retry_msg.metadata["dispatch_error"] = error;
    retry_msg.metadata["dispatch_retry_at"] = courier::utils::FormatIso(courier::utils::Now() + delay);

    {
        // Held across async_wait so the handler cannot erase the entry before it exists.
        std::lock_guard<std::mutex> lock(retry_mutex_);
        const auto id = next_retry_id_++;
        auto timer = std::make_shared<boost::asio::steady_timer>(io_, delay);
        timer->async_wait([this, id, retry_msg](const boost::system::error_code& ec) {
            {
                std::lock_guard<std::mutex> guard(retry_mutex_);
                pending_retries_.erase(id);
            }
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (!running_) {
                logger_.Debug("retry dropped, dispatch stopped", {{"message_id", retry_msg.id}});
                return;
            }
            if (!bus_.PublishOutbound(retry_msg)) {
                logger_.Debug("retry publish failed", {{"message_id", retry_msg.id}, {"error", "bus_closed"}});
            }
        });
        pending_retries_.emplace(id, std::move(timer));
    }
    logger_.Debug("dispatch requeue", {
        {"provider", provider},
        {"retry", std::to_string(retry_count)},
        {"delay_ms", std::to_string(delay.count())}});
}

std::size_t DispatchService::CancelPendingRetries() {
    std::promise<std::size_t> done;
    auto cancelled = done.get_future();
    // Timers are only touched on the timer thread.
    boost::asio::post(io_, [this, &done]() {
        std::size_t count = 0;
        {
            std::lock_guard<std::mutex> lock(retry_mutex_);
            for (auto& [_, timer] : pending_retries_) {
                timer->cancel();
                ++count;
            }
            pending_retries_.clear();
        }
        done.set_value(count);
    });
    const auto count = cancelled.get();
    if (count > 0) {
        logger_.Debug("cancelled pending retries", {{"count", std::to_string(count)}});
    }
    return count;
}

void DispatchService::WriteDeadLetter(const std::string& provider,
                                      const courier::bus::OutboundMessage& msg,
                                      const std::string& error,
                                      int retry_count) {
    if (!options_.dlq) {
        return;
    }
    DeadLetterRecord record{};
    record.at = courier::utils::NowIso();
    record.provider = provider;
    record.chat_id = msg.chat_id;
    record.message_id = msg.id;
    record.sender_id = msg.sender_id;
    record.reply_to = msg.reply_to;
    record.thread_id = msg.thread_id;
    record.retry_count = retry_count;
    record.error = error.empty() ? std::string("unknown_error") : error;
    record.content = TruncateUtf8(msg.content, kDeadLetterContentLimit);
    record.metadata = msg.metadata;
    try {
        options_.dlq->Append(record);
        logger_.Warn("message dead-lettered", {
            {"provider", provider},
            {"message_id", msg.id},
            {"retry_count", std::to_string(retry_count)},
            {"error", record.error}});
    } catch (const std::exception& ex) {
        logger_.Error("dlq append failed", {{"error", ex.what()}});
    }
}

std::optional<std::string> DispatchService::LookupRecent(const std::string& key) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = recent_.find(key);
    if (it == recent_.end()) {
        return std::nullopt;
    }
    const auto& record = it->second->second;
    if (options_.clock() - record.at_ms > options_.dedupe.ttl_ms) {
        return std::nullopt;
    }
    return record.message_id;
}

void DispatchService::RememberRecent(const std::string& key, const std::string& message_id) {
    bool over_limit = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        const RecentRecord record{options_.clock(), message_id};
        auto it = recent_.find(key);
        if (it != recent_.end()) {
            it->second->second = record;
            recent_order_.splice(recent_order_.end(), recent_order_, it->second);
        } else {
            recent_order_.emplace_back(key, record);
            recent_.emplace(key, std::prev(recent_order_.end()));
        }
        over_limit = recent_.size() > options_.dedupe.max_size + kRecentCacheSlack;
    }
    if (over_limit) {
        PruneRecentCache();
    }
}

// Drops expired entries, then the oldest ones down to max_size once the
// cache has outgrown max_size plus the slack.
void DispatchService::PruneRecentCache() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (recent_.empty()) {
        return;
    }
    const auto now = options_.clock();
    for (auto it = recent_order_.begin(); it != recent_order_.end();) {
        if (now - it->second.at_ms > options_.dedupe.ttl_ms) {
            recent_.erase(it->first);
            it = recent_order_.erase(it);
        } else {
            ++it;
        }
    }
    if (recent_.size() <= options_.dedupe.max_size + kRecentCacheSlack) {
        return;
    }
    while (recent_.size() > options_.dedupe.max_size && !recent_order_.empty()) {
        recent_.erase(recent_order_.front().first);
        recent_order_.pop_front();
    }
}

CircuitBreaker* DispatchService::BreakerFor(const std::string& provider) {
    if (!options_.circuit_breaker) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& breaker = breakers_[provider];
    if (!breaker) {
        breaker = std::make_unique<CircuitBreaker>(*options_.circuit_breaker, options_.clock);
    }
    return breaker.get();
}

}  // namespace courier::channels
