#pragma once

#include <cstdint>
#include <functional>
#include <mutex>

namespace courier::channels {

struct RateLimiterOptions {
    int capacity = 30;
    int refill_rate = 1;
    long long refill_interval_ms = 1000;
};

// Token bucket shared by all outbound traffic. Refill is computed lazily in
// whole intervals; the sub-interval remainder carries over to the next check.
class TokenBucketRateLimiter {
public:
    using Clock = std::function<std::int64_t()>;

    explicit TokenBucketRateLimiter(RateLimiterOptions options = {}, Clock clock = {});

    bool TryConsume(int tokens = 1);
    // Milliseconds until one token is available, 0 if one is available now.
    long long WaitTimeMs();
    long long Available();

private:
    void Refill();

    RateLimiterOptions options_;
    Clock clock_;
    std::mutex mutex_;
    long long tokens_ = 0;
    std::int64_t last_refill_at_ = 0;
};

}  // namespace courier::channels
