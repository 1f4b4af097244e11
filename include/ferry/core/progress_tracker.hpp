// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ferry::core {

// Byte counter of one active job, written only by that job's worker(s).
// bytes() is what the temp file holds; received() only grows with network
// bytes, so resuming or restarting a job never looks like throughput.
class JobCounter {
public:
    explicit JobCounter(std::string url) : url_(std::move(url)) {}

    void add(std::uint64_t bytes) noexcept {
        bytes_.fetch_add(bytes, std::memory_order_relaxed);
        received_.fetch_add(bytes, std::memory_order_relaxed);
    }
    // Reposition after a resume or restart; not counted as received
    void set(std::uint64_t bytes) noexcept { bytes_.store(bytes, std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t bytes() const noexcept { return bytes_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t received() const noexcept { return received_.load(std::memory_order_relaxed); }

    // 0 means unknown
    void total(std::uint64_t bytes) noexcept { total_.store(bytes, std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t total() const noexcept { return total_.load(std::memory_order_relaxed); }

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

private:
    std::string url_;
    std::atomic<std::uint64_t> bytes_{0};
    std::atomic<std::uint64_t> received_{0};
    std::atomic<std::uint64_t> total_{0};
};

// Point-in-time view; derived, never authoritative
struct ProgressSnapshot {
    std::uint64_t completed_bytes{0};
    std::optional<std::uint64_t> total_bytes;     // unknown while any active job has no size
    double speed_bps{0.0};
    std::optional<std::chrono::seconds> eta;      // unknown when speed or total is unknown
    std::uint32_t active_jobs{0};

    [[nodiscard]] double percent() const noexcept {
        if (!total_bytes || *total_bytes == 0) return 0.0;
        return static_cast<double>(completed_bytes) * 100.0 / static_cast<double>(*total_bytes);
    }
};

using ProgressListener = std::function<void(const ProgressSnapshot&)>;

// Aggregates per-job counters into speed and ETA. Speed is the mean of the
// deltas between the last `history` samples of received bytes divided by the
// sample interval.
class ProgressTracker {
public:
    explicit ProgressTracker(std::chrono::milliseconds interval = PROGRESS_INTERVAL,
                             std::size_t history = PROGRESS_HISTORY);
    ~ProgressTracker();

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    [[nodiscard]] std::shared_ptr<JobCounter> register_job(std::string url);

    // Folds the job's bytes into the finished total
    void unregister_job(const std::shared_ptr<JobCounter>& counter);

    // Take one sample of the aggregate byte count
    void tick();

    [[nodiscard]] ProgressSnapshot snapshot() const;

    // Tick every interval on a background thread, calling `listener` after each
    void start(ProgressListener listener = {});
    void stop() noexcept;

    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    // Caller holds mutex_
    [[nodiscard]] std::uint64_t aggregate_bytes() const noexcept;
    [[nodiscard]] std::uint64_t aggregate_received() const noexcept;

    const std::chrono::milliseconds interval_;
    const std::size_t history_size_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<JobCounter>> active_;
    std::uint64_t finished_bytes_{0};
    std::uint64_t finished_total_{0};
    std::uint64_t finished_received_{0};
    std::deque<std::uint64_t> samples_;

    std::condition_variable_any ticker_cv_;
    std::jthread ticker_;
};

} // namespace ferry::core
