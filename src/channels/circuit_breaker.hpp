#pragma once

#include <cstdint>
#include <functional>
#include <mutex>

namespace courier::channels {

enum class CircuitState {
    kClosed,
    kOpen,
    kHalfOpen
};

const char* ToString(CircuitState state);

struct CircuitBreakerOptions {
    int failure_threshold = 5;
    long long reset_timeout_ms = 30000;
    int half_open_max = 1;
};

// Per-destination failure gate: closed -> open after failure_threshold
// consecutive failures, open -> half_open once reset_timeout_ms has passed
// since the last failure (evaluated on access), half_open -> closed on a
// success and back to open on a failure.
class CircuitBreaker {
public:
    using Clock = std::function<std::int64_t()>;

    explicit CircuitBreaker(CircuitBreakerOptions options = {}, Clock clock = {});

    // Applies the lazy open -> half_open transition before reporting.
    CircuitState State();

    // Admission check without consuming a half-open trial slot.
    bool CanAcquire();
    // Admission check that consumes a half-open trial slot on success.
    bool TryAcquire();

    void RecordSuccess();
    void RecordFailure();
    void Reset();

    int FailureCount() const;
    int HalfOpenAttempts() const;

private:
    void TryTransitionToHalfOpen();

    CircuitBreakerOptions options_;
    Clock clock_;
    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::kClosed;
    int failure_count_ = 0;
    int half_open_attempts_ = 0;
    std::int64_t last_failure_at_ = 0;
};

}  // namespace courier::channels
