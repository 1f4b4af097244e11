// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/progress_tracker.hpp>
#include <algorithm>
#include <cmath>

namespace ferry::core {

ProgressTracker::ProgressTracker(std::chrono::milliseconds interval, std::size_t history)
    : interval_(interval.count() > 0 ? interval : PROGRESS_INTERVAL)
    , history_size_(std::max<std::size_t>(2, history)) {}

ProgressTracker::~ProgressTracker() {
    stop();
}

std::shared_ptr<JobCounter> ProgressTracker::register_job(std::string url) {
    auto counter = std::make_shared<JobCounter>(std::move(url));
    auto lock = std::unique_lock(mutex_);
    active_.push_back(counter);
    return counter;
}

void ProgressTracker::unregister_job(const std::shared_ptr<JobCounter>& counter) {
    if (!counter) return;

    auto lock = std::unique_lock(mutex_);
    auto it = std::find(active_.begin(), active_.end(), counter);
    if (it == active_.end()) return;

    finished_bytes_ += counter->bytes();
    finished_total_ += std::max(counter->total(), counter->bytes());
    finished_received_ += counter->received();
    active_.erase(it);
}

std::uint64_t ProgressTracker::aggregate_bytes() const noexcept {
    std::uint64_t total = finished_bytes_;
    for (const auto& counter : active_) {
        total += counter->bytes();
    }
    return total;
}

std::uint64_t ProgressTracker::aggregate_received() const noexcept {
    std::uint64_t total = finished_received_;
    for (const auto& counter : active_) {
        total += counter->received();
    }
    return total;
}

void ProgressTracker::tick() {
    auto lock = std::unique_lock(mutex_);
    samples_.push_back(aggregate_received());
    while (samples_.size() > history_size_) {
        samples_.pop_front();
    }
}

ProgressSnapshot ProgressTracker::snapshot() const {
    auto lock = std::unique_lock(mutex_);

    ProgressSnapshot snap;
    snap.completed_bytes = aggregate_bytes();
    snap.active_jobs = static_cast<std::uint32_t>(active_.size());

    std::uint64_t total = finished_total_;
    bool known = true;
    for (const auto& counter : active_) {
        if (counter->total() == 0) {
            known = false;
            break;
        }
        total += counter->total();
    }
    if (known) {
        snap.total_bytes = total;
    }

    // Mean of successive deltas: (last - first) / (n - 1)
    if (samples_.size() >= 2) {
        double deltas = static_cast<double>(samples_.back() - samples_.front());
        double mean = deltas / static_cast<double>(samples_.size() - 1);
        std::chrono::duration<double> seconds = interval_;
        snap.speed_bps = mean / seconds.count();
    }

    if (snap.total_bytes && snap.speed_bps > 0.0) {
        std::uint64_t remaining = *snap.total_bytes > snap.completed_bytes
            ? *snap.total_bytes - snap.completed_bytes
            : 0;
        snap.eta = std::chrono::seconds{
            static_cast<std::int64_t>(std::ceil(static_cast<double>(remaining) / snap.speed_bps))};
    }

    return snap;
}

void ProgressTracker::start(ProgressListener listener) {
    if (ticker_.joinable()) return;

    ticker_ = std::jthread([this, listener = std::move(listener)](std::stop_token stoken) {
        std::mutex wait_mutex;
        auto lock = std::unique_lock(wait_mutex);
        while (!stoken.stop_requested()) {
            // Returns early when stop is requested
            if (ticker_cv_.wait_for(lock, stoken, interval_, [] { return false; })) {
                break;
            }
            if (stoken.stop_requested()) break;

            tick();
            if (listener) {
                listener(snapshot());
            }
        }
    });
}

void ProgressTracker::stop() noexcept {
    if (ticker_.joinable()) {
        ticker_.request_stop();
        ticker_.join();
    }
}

} // namespace ferry::core
