#include "channels/circuit_breaker.hpp"

#include <algorithm>

#include "utils/common.hpp"

namespace courier::channels {

const char* ToString(CircuitState state) {
    switch (state) {
        case CircuitState::kClosed: return "closed";
        case CircuitState::kOpen: return "open";
        case CircuitState::kHalfOpen: return "half_open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(CircuitBreakerOptions options, Clock clock)
    : options_(options)
    , clock_(clock ? std::move(clock) : Clock(&courier::utils::NowMs)) {
    options_.failure_threshold = std::max(1, options_.failure_threshold);
    options_.half_open_max = std::max(1, options_.half_open_max);
    options_.reset_timeout_ms = std::max(0LL, options_.reset_timeout_ms);
}

CircuitState CircuitBreaker::State() {
    std::lock_guard<std::mutex> lock(mutex_);
    TryTransitionToHalfOpen();
    return state_;
}

void CircuitBreaker::TryTransitionToHalfOpen() {
    if (state_ == CircuitState::kOpen && clock_() - last_failure_at_ >= options_.reset_timeout_ms) {
        state_ = CircuitState::kHalfOpen;
        half_open_attempts_ = 0;
    }
}

bool CircuitBreaker::CanAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    TryTransitionToHalfOpen();
    if (state_ == CircuitState::kClosed) {
        return true;
    }
    return state_ == CircuitState::kHalfOpen && half_open_attempts_ < options_.half_open_max;
}

bool CircuitBreaker::TryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    TryTransitionToHalfOpen();
    if (state_ == CircuitState::kClosed) {
        return true;
    }
    if (state_ == CircuitState::kHalfOpen && half_open_attempts_ < options_.half_open_max) {
        ++half_open_attempts_;
        return true;
    }
    return false;
}

void CircuitBreaker::RecordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::kClosed;
    failure_count_ = 0;
    half_open_attempts_ = 0;
}

void CircuitBreaker::RecordFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failure_count_;
    last_failure_at_ = clock_();
    if (state_ == CircuitState::kHalfOpen) {
        state_ = CircuitState::kOpen;
        half_open_attempts_ = 0;
        return;
    }
    if (failure_count_ >= options_.failure_threshold) {
        state_ = CircuitState::kOpen;
    }
}

void CircuitBreaker::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::kClosed;
    failure_count_ = 0;
    half_open_attempts_ = 0;
    last_failure_at_ = 0;
}

int CircuitBreaker::FailureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_count_;
}

int CircuitBreaker::HalfOpenAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return half_open_attempts_;
}

}  // namespace courier::channels
