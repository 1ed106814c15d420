#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace nonkyc {

struct RateLimiterState {
    double capacity = 0.0;
    double tokens_available = 0.0;
    std::chrono::steady_clock::time_point last_refill_time{};
};

// Token bucket shared by every outbound call made with one credential.
// Tokens are refilled lazily from elapsed time whenever the bucket is touched;
// refill and consumption happen under one lock.
class RateLimiter {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Sleeper = std::function<void(std::chrono::nanoseconds)>;

    RateLimiter(double capacity, double refill_per_second,
                Clock clock = {}, Sleeper sleeper = {});

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Blocks until one token is available, then takes it.
    void acquire();

    bool try_acquire();

    [[nodiscard]] RateLimiterState state() const;

    [[nodiscard]] std::uint64_t waits() const;

private:
    void refill_locked(std::chrono::steady_clock::time_point now);

    double capacity_;
    double refill_per_second_;
    Clock clock_;
    Sleeper sleeper_;
    double tokens_;
    std::chrono::steady_clock::time_point last_refill_;
    std::uint64_t waits_ = 0;
    mutable std::mutex mutex_;
};

} // namespace nonkyc
