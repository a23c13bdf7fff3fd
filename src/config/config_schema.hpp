#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace courier::config {

struct TelegramConfig {
    bool enabled = false;
    std::string token;
    std::vector<std::string> allow_from;
};

struct ChannelsConfig {
    TelegramConfig telegram;
};

struct DispatchConfig {
    int inline_retries = 0;
    int retry_max = 3;
    long long retry_base_ms = 700;
    long long retry_max_ms = 25000;
    long long retry_jitter_ms = 250;
    bool dlq_enabled = true;
    std::string dlq_path;  // empty: ~/.courier/dlq/dlq.db
};

struct OutboundDedupeConfig {
    long long ttl_ms = 25000;
    std::size_t max_size = 20000;
};

struct RateLimitConfig {
    int capacity = 30;
    int refill_rate = 1;
    long long refill_interval_ms = 1000;
};

struct CircuitBreakerConfig {
    bool enabled = false;
    int failure_threshold = 5;
    long long reset_timeout_ms = 30000;
    int half_open_max = 1;
};

struct ChannelConfig {
    DispatchConfig dispatch;
    OutboundDedupeConfig outbound_dedupe;
    RateLimitConfig rate_limit;
    CircuitBreakerConfig circuit_breaker;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ChannelConfig channel;
    ChannelsConfig channels;
    LoggingConfig logging;
};

}  // namespace courier::config
