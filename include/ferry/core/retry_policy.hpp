// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <stop_token>

namespace ferry::core {

struct RetryDecision {
    bool retry{false};
    std::chrono::milliseconds delay{0};

    [[nodiscard]] static RetryDecision give_up() noexcept { return {}; }
    [[nodiscard]] static RetryDecision after(std::chrono::milliseconds d) noexcept { return {true, d}; }
};

// Pure retry/backoff policy. `attempt` counts failed attempts so far,
// starting at 0 for the first failure; the k-th retry waits unit * base^k.
class RetryPolicy {
public:
    RetryPolicy() = default;
    RetryPolicy(std::uint32_t max_retries,
                double base = DEFAULT_BACKOFF_BASE,
                std::chrono::milliseconds unit = DEFAULT_BACKOFF_UNIT) noexcept
        : max_retries_(max_retries), base_(base), unit_(unit) {}

    [[nodiscard]] static RetryPolicy from_config(const EngineConfig& cfg) noexcept {
        return {cfg.retry_attempts, cfg.backoff_base, cfg.backoff_unit};
    }

    [[nodiscard]] RetryDecision decide(std::uint32_t attempt, FailureKind kind) const noexcept;

    // unit * base^attempt
    [[nodiscard]] std::chrono::milliseconds backoff(std::uint32_t attempt) const noexcept;

    [[nodiscard]] static bool retryable(FailureKind kind) noexcept;

    // Sleep for `delay`; false when `stop` fired first
    [[nodiscard]] static bool wait(std::chrono::milliseconds delay, std::stop_token stop);

    [[nodiscard]] std::uint32_t max_retries() const noexcept { return max_retries_; }

private:
    std::uint32_t max_retries_{DEFAULT_RETRY_ATTEMPTS};
    double base_{DEFAULT_BACKOFF_BASE};
    std::chrono::milliseconds unit_{DEFAULT_BACKOFF_UNIT};
};

} // namespace ferry::core
