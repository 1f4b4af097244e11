// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/retry_policy.hpp>
#include <cmath>
#include <condition_variable>
#include <mutex>

namespace ferry::core {

bool RetryPolicy::retryable(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::transient_network:
        case FailureKind::transient_server:
            return true;
        case FailureKind::permanent:
        case FailureKind::local_io:
        case FailureKind::cancelled:
        case FailureKind::probe_failure:
            return false;
    }
    return false;
}

std::chrono::milliseconds RetryPolicy::backoff(std::uint32_t attempt) const noexcept {
    double factor = std::pow(base_, static_cast<double>(attempt));
    return std::chrono::milliseconds{
        static_cast<std::int64_t>(std::llround(static_cast<double>(unit_.count()) * factor))};
}

bool RetryPolicy::wait(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    auto lock = std::unique_lock(mutex);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

RetryDecision RetryPolicy::decide(std::uint32_t attempt, FailureKind kind) const noexcept {
    // Permanent failures never retry, whatever budget is left
    if (!retryable(kind) || attempt >= max_retries_) {
        return RetryDecision::give_up();
    }
    return RetryDecision::after(backoff(attempt));
}

} // namespace ferry::core
