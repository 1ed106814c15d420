#include "nonkyc/rate_limiter.hpp"
#include "nonkyc/errors.hpp"

#include <algorithm>
#include <cmath>
#include <thread>
#include <utility>

namespace nonkyc {

RateLimiter::RateLimiter(double capacity, double refill_per_second, Clock clock, Sleeper sleeper)
    : capacity_(capacity),
      refill_per_second_(refill_per_second),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })),
      sleeper_(sleeper ? std::move(sleeper)
                       : Sleeper([](std::chrono::nanoseconds duration) { std::this_thread::sleep_for(duration); })),
      tokens_(capacity) {
    if (!(capacity_ >= 1.0) || !std::isfinite(capacity_)) {
        throw ConfigurationError("Rate limiter capacity must be at least 1");
    }
    if (!(refill_per_second_ > 0.0) || !std::isfinite(refill_per_second_)) {
        throw ConfigurationError("Rate limiter refill rate must be positive");
    }
    last_refill_ = clock_();
}

void RateLimiter::refill_locked(std::chrono::steady_clock::time_point now) {
    if (now <= last_refill_) {
        return;
    }
    const double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    tokens_ = std::min(capacity_, tokens_ + elapsed * refill_per_second_);
    last_refill_ = now;
}

void RateLimiter::acquire() {
    while (true) {
        std::chrono::nanoseconds wait{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            refill_locked(clock_());
            if (tokens_ >= 1.0) {
                tokens_ -= 1.0;
                return;
            }
            const double seconds = (1.0 - tokens_) / refill_per_second_;
            wait = std::chrono::nanoseconds(static_cast<std::int64_t>(std::ceil(seconds * 1e9)));
            ++waits_;
        }
        sleeper_(wait);
    }
}

bool RateLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    refill_locked(clock_());
    if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        return true;
    }
    return false;
}

RateLimiterState RateLimiter::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return RateLimiterState{capacity_, tokens_, last_refill_};
}

std::uint64_t RateLimiter::waits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waits_;
}

} // namespace nonkyc
