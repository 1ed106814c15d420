#pragma once

#include <chrono>

namespace nonkyc {

struct ReconnectState {
    int consecutive_failures = 0;
    std::chrono::milliseconds current_backoff{0};
    std::chrono::milliseconds max_backoff{0};
};

// Exponential reconnect backoff with a failure-count circuit breaker.
// After k consecutive failures the backoff is min(base * 2^k, max).
class ReconnectPolicy {
public:
    ReconnectPolicy(std::chrono::milliseconds base,
                    std::chrono::milliseconds max,
                    int max_failures);

    [[nodiscard]] std::chrono::milliseconds current_backoff() const noexcept;

    // Returns the delay to wait before the next attempt, then counts the failure.
    std::chrono::milliseconds record_failure() noexcept;

    void record_success() noexcept;

    [[nodiscard]] bool circuit_open() const noexcept;

    [[nodiscard]] ReconnectState state() const noexcept;

    [[nodiscard]] int consecutive_failures() const noexcept { return failures_; }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds max_;
    int max_failures_;
    int failures_ = 0;
};

} // namespace nonkyc
