// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/channel.hpp>
#include <ferry/core/collaborators.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/http_client.hpp>
#include <ferry/core/job.hpp>
#include <ferry/core/progress_tracker.hpp>
#include <ferry/core/rate_limiter.hpp>
#include <ferry/core/transfer_job.hpp>
#include <ferry/core/webhook_notifier.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>

namespace ferry::core {

// Receives each terminal result; calls are serialized
using ResultSink = std::function<void(const JobResult&)>;

// Top-level orchestrator. Reads jobs from a JobSource in chunks of
// batch_size, feeds them through a Channel of capacity max_concurrent and
// runs them on max_concurrent consumer threads. Emits exactly one result per
// started job and always produces a summary. Without an explicit notifier a
// configured webhook_url gets a WebhookNotifier.
class BatchScheduler {
public:
    BatchScheduler(HttpClient& client, EngineConfig config,
                   TelemetrySink* telemetry = nullptr, BatchNotifier* notifier = nullptr);
    ~BatchScheduler();

    BatchScheduler(const BatchScheduler&) = delete;
    BatchScheduler& operator=(const BatchScheduler&) = delete;

    // Blocks until every job read from `source` finished or cancel() was called
    [[nodiscard]] BatchSummary run(JobSource& source, ResultSink on_result = {});

    // Stop all workers; pending jobs are dropped, in-flight jobs end as cancelled.
    // Sticky: later runs start nothing.
    void cancel() noexcept;
    [[nodiscard]] bool cancelled() const noexcept { return stop_.stop_requested(); }

    // Called on every progress tick while run() is active
    void on_progress(ProgressListener listener) { progress_listener_ = std::move(listener); }

    [[nodiscard]] ProgressSnapshot progress() const { return tracker_.snapshot(); }

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] RateLimiter& limiter() noexcept { return limiter_; }

private:
    struct QueuedJob {
        JobSpec spec;
        std::size_t index{0};
    };

    void produce(JobSource& source, Channel<QueuedJob>& channel);
    void consume(Channel<QueuedJob>& channel, const ResultSink& on_result, BatchSummary& summary);

    EngineConfig config_;
    std::unique_ptr<WebhookNotifier> webhook_;
    BatchNotifier* notifier_;

    RateLimiter limiter_;
    ProgressTracker tracker_;
    TransferJobRunner runner_;

    std::stop_source stop_;
    ProgressListener progress_listener_;
    std::mutex result_mutex_;
};

} // namespace ferry::core
