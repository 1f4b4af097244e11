// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/collaborators.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/http_client.hpp>
#include <ferry/core/job.hpp>
#include <ferry/core/progress_tracker.hpp>
#include <ferry/core/rate_limiter.hpp>
#include <ferry/core/transfer_planner.hpp>
#include <cstddef>
#include <stop_token>

namespace ferry::core {

// Drives one job through the state machine:
// pending -> probing -> single_stream | segmented -> combining -> verifying -> completed,
// or failed. Retries happen inside the workers, never here.
class TransferJobRunner {
public:
    TransferJobRunner(HttpClient& client, RateLimiter& limiter, ProgressTracker& tracker,
                      const EngineConfig& config, TelemetrySink* telemetry = nullptr);

    // Always returns a terminal result; never throws
    [[nodiscard]] JobResult run(const JobSpec& spec, std::size_t index, std::stop_token stop) noexcept;

private:
    [[nodiscard]] std::expected<JobSuccess, TransferError>
    execute(DownloadJob& job, std::stop_token stop);

    [[nodiscard]] std::expected<std::uint64_t, TransferError>
    transfer(DownloadJob& job, ProbeResult info, std::stop_token stop);

    void record(const JobResult& result) const;

    HttpClient& client_;
    RateLimiter& limiter_;
    ProgressTracker& tracker_;
    const EngineConfig& config_;
    TelemetrySink* telemetry_;
    TransferPlanner planner_;
};

} // namespace ferry::core
