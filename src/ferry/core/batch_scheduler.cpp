// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/batch_scheduler.hpp>
#include <ferry/core/log.hpp>
#include <ferry/version.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace ferry::core {

BatchScheduler::BatchScheduler(HttpClient& client, EngineConfig config,
                               TelemetrySink* telemetry, BatchNotifier* notifier)
    : config_(std::move(config))
    , notifier_(notifier)
    , limiter_(config_.max_concurrent, config_.bandwidth_bytes_per_sec())
    , tracker_(config_.progress_interval)
    , runner_(client, limiter_, tracker_, config_, telemetry) {
    log::init(log::parse_level(config_.log_level));

    if (!notifier_ && !config_.webhook_url.empty()) {
        webhook_ = std::make_unique<WebhookNotifier>(
            config_.webhook_url, std::chrono::seconds{config_.timeout_seconds});
        notifier_ = webhook_.get();
    }
}

BatchScheduler::~BatchScheduler() {
    tracker_.stop();
}

void BatchScheduler::cancel() noexcept {
    if (stop_.request_stop()) {
        log::logger()->warn("batch cancelled");
    }
}

BatchSummary BatchScheduler::run(JobSource& source, ResultSink on_result) {
    auto start = std::chrono::steady_clock::now();
    BatchSummary summary;

    std::uint32_t consumers = std::max<std::uint32_t>(1, config_.max_concurrent);
    Channel<QueuedJob> channel(consumers);

    log::logger()->info("ferry {}: batch started: {} workers, batch size {}, bandwidth {}",
                        version.to_string(), consumers, config_.batch_size,
                        limiter_.bytes_per_sec() == 0
                            ? std::string("unlimited")
                            : fmt::format("{} B/s", limiter_.bytes_per_sec()));

    tracker_.start(progress_listener_);
    {
        std::vector<std::jthread> threads;
        threads.reserve(consumers + 1);
        threads.emplace_back([this, &source, &channel] { produce(source, channel); });
        for (std::uint32_t i = 0; i < consumers; ++i) {
            threads.emplace_back([this, &channel, &on_result, &summary] {
                consume(channel, on_result, summary);
            });
        }
    }
    tracker_.stop();

    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    log::logger()->info("batch finished: {} total, {} succeeded, {} failed, {} bytes in {} ms ({:.0f} B/s)",
                        summary.total, summary.succeeded, summary.failed, summary.total_bytes,
                        summary.elapsed.count(), summary.average_speed_bps());

    if (notifier_) {
        try {
            notifier_->notify(summary);
        } catch (const std::exception& e) {
            log::logger()->error("batch notification failed: {}", e.what());
        }
    }
    return summary;
}

void BatchScheduler::produce(JobSource& source, Channel<QueuedJob>& channel) {
    auto stop = stop_.get_token();
    std::size_t index = 0;
    std::size_t chunk = std::max<std::size_t>(1, config_.batch_size);

    try {
        while (!stop.stop_requested()) {
            auto batch = source.next_batch(chunk);
            if (batch.empty()) {
                break;
            }
            log::logger()->debug("queued chunk of {} jobs", batch.size());

            for (auto& spec : batch) {
                // Blocks while the window is full
                if (!channel.push(QueuedJob{std::move(spec), index}, stop)) {
                    break;
                }
                ++index;
            }
        }
    } catch (const std::exception& e) {
        log::logger()->error("job source failed after {} jobs: {}", index, e.what());
    }

    // End of input
    channel.close();
}

void BatchScheduler::consume(Channel<QueuedJob>& channel, const ResultSink& on_result,
                             BatchSummary& summary) {
    auto stop = stop_.get_token();

    while (auto queued = channel.pop(stop)) {
        // Cancelled while queued: never started, no result
        if (stop.stop_requested()) {
            break;
        }

        auto result = runner_.run(queued->spec, queued->index, stop);

        auto lock = std::unique_lock(result_mutex_);
        ++summary.total;
        if (result.ok()) {
            ++summary.succeeded;
            summary.total_bytes += result.outcome->bytes;
        } else {
            ++summary.failed;
        }
        if (on_result) {
            try {
                on_result(result);
            } catch (const std::exception& e) {
                log::logger()->error("{}: result sink failed: {}", result.url, e.what());
            }
        }
    }
}

} // namespace ferry::core
