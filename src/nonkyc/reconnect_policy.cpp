#include "nonkyc/reconnect_policy.hpp"
#include "nonkyc/errors.hpp"

#include <algorithm>

namespace nonkyc {

ReconnectPolicy::ReconnectPolicy(std::chrono::milliseconds base,
                                 std::chrono::milliseconds max,
                                 int max_failures)
    : base_(base), max_(max), max_failures_(max_failures) {
    if (base_.count() <= 0 || max_ < base_) {
        throw ConfigurationError("Reconnect backoff needs 0 < base <= max");
    }
    if (max_failures_ < 1) {
        throw ConfigurationError("Reconnect circuit breaker threshold must be at least 1");
    }
}

std::chrono::milliseconds ReconnectPolicy::current_backoff() const noexcept {
    auto backoff = base_;
    for (int i = 0; i < failures_ && backoff < max_; ++i) {
        backoff *= 2;
    }
    return std::min(backoff, max_);
}

std::chrono::milliseconds ReconnectPolicy::record_failure() noexcept {
    const auto delay = current_backoff();
    ++failures_;
    return delay;
}

void ReconnectPolicy::record_success() noexcept {
    failures_ = 0;
}

bool ReconnectPolicy::circuit_open() const noexcept {
    return failures_ >= max_failures_;
}

ReconnectState ReconnectPolicy::state() const noexcept {
    return ReconnectState{failures_, current_backoff(), max_};
}

} // namespace nonkyc
