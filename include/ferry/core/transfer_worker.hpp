// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/http_client.hpp>
#include <ferry/core/progress_tracker.hpp>
#include <ferry/core/rate_limiter.hpp>
#include <ferry/core/retry_policy.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <stop_token>
#include <string_view>

namespace ferry::core {

// Shared services every worker of a job uses
struct WorkerContext {
    HttpClient& client;
    RateLimiter& limiter;
    RetryPolicy retry;
    const EngineConfig& config;
    std::shared_ptr<JobCounter> progress;   // may be null
    std::stop_token stop;

    [[nodiscard]] HttpRequest make_request(const std::string& url) const;
};

// One way of moving bytes for a job: the whole file, or one ranged segment.
// run() returns the number of bytes received over the network.
class TransferWorker {
public:
    virtual ~TransferWorker() = default;

    [[nodiscard]] virtual std::expected<std::uint64_t, TransferError> run() = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

} // namespace ferry::core
