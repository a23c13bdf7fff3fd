#include "channels/rate_limiter.hpp"

#include <algorithm>

#include "utils/common.hpp"

namespace courier::channels {

TokenBucketRateLimiter::TokenBucketRateLimiter(RateLimiterOptions options, Clock clock)
    : options_(options)
    , clock_(clock ? std::move(clock) : Clock(&courier::utils::NowMs)) {
    options_.capacity = std::max(1, options_.capacity);
    options_.refill_rate = std::max(1, options_.refill_rate);
    options_.refill_interval_ms = std::max(1LL, options_.refill_interval_ms);
    tokens_ = options_.capacity;
    last_refill_at_ = clock_();
}

void TokenBucketRateLimiter::Refill() {
    const auto now = clock_();
    const auto elapsed = now - last_refill_at_;
    if (elapsed < options_.refill_interval_ms) {
        return;
    }
    const auto intervals = elapsed / options_.refill_interval_ms;
    tokens_ = std::min<long long>(options_.capacity, tokens_ + intervals * options_.refill_rate);
    last_refill_at_ = now - (elapsed % options_.refill_interval_ms);
}

bool TokenBucketRateLimiter::TryConsume(int tokens) {
    std::lock_guard<std::mutex> lock(mutex_);
    Refill();
    if (tokens_ >= tokens) {
        tokens_ -= tokens;
        return true;
    }
    return false;
}

long long TokenBucketRateLimiter::WaitTimeMs() {
    std::lock_guard<std::mutex> lock(mutex_);
    Refill();
    if (tokens_ >= 1) {
        return 0;
    }
    const auto deficit = 1 - tokens_;
    const auto intervals = (deficit + options_.refill_rate - 1) / options_.refill_rate;
    const auto since_refill = clock_() - last_refill_at_;
    return std::max(1LL, intervals * options_.refill_interval_ms - since_refill);
}

long long TokenBucketRateLimiter::Available() {
    std::lock_guard<std::mutex> lock(mutex_);
    Refill();
    return tokens_;
}

}  // namespace courier::channels
