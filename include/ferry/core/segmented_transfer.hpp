// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/job.hpp>
#include <ferry/core/transfer_planner.hpp>
#include <ferry/core/transfer_worker.hpp>
#include <ferry/disk/file_writer.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ferry::core {

// Downloads one byte range [start + written, end) of a job into the shared
// temp file at the matching offset. Retries only its own remainder.
class SegmentWorker final : public TransferWorker {
public:
    SegmentWorker(const Segment& segment, disk::FileWriter& writer,
                  const WorkerContext& ctx, std::string url, std::string validator);

    SegmentWorker(const SegmentWorker&) = delete;
    SegmentWorker& operator=(const SegmentWorker&) = delete;

    [[nodiscard]] std::expected<std::uint64_t, TransferError> run() override;

    [[nodiscard]] std::string_view name() const noexcept override { return "ranged-segment"; }

    // Current view of the segment (written may be slightly stale while running)
    [[nodiscard]] Segment segment() const noexcept;

    [[nodiscard]] std::uint32_t id() const noexcept { return id_; }

private:
    [[nodiscard]] std::error_code fetch_remainder();

    std::uint32_t id_;
    std::uint64_t start_;
    std::uint64_t end_;
    std::atomic<std::uint64_t> written_;
    disk::FileWriter& writer_;
    const WorkerContext& ctx_;
    std::string url_;
    std::string validator_;
};

// Join barrier over a job's segments. Workers report once each; the job is
// published only after every segment reported success and the temp file
// length equals the total size.
class Combiner {
public:
    explicit Combiner(std::size_t segment_count);

    // Called once per segment, from the worker's thread
    void report(std::uint32_t segment_id, std::error_code ec);

    // Block until every segment has reported; returns the first failure
    [[nodiscard]] TransferError wait();

    // True once every segment has reported, false on timeout
    [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout);

    // Verify length, then rename temp -> final. Publishes at most once.
    [[nodiscard]] std::error_code finalize(disk::FileWriter& writer,
                                           const std::filesystem::path& temp,
                                           const std::filesystem::path& final_path,
                                           std::uint64_t total_size);

    [[nodiscard]] std::size_t reported() const;
    [[nodiscard]] bool published() const noexcept { return published_; }

private:
    const std::size_t expected_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t reported_{0};
    std::error_code first_error_;
    std::uint32_t first_error_segment_{0};
    bool published_{false};
};

// Runs a job's segment workers in parallel over one pre-sized temp file,
// persisting per-segment progress in the resume sidecar every
// checkpoint_interval and after a failure.
class SegmentedTransfer {
public:
    SegmentedTransfer(DownloadJob& job, const ProbeResult& info,
                      std::vector<Segment> segments, const WorkerContext& ctx);

    // Run every segment to completion (join barrier). The temp file is
    // complete on success but not yet published.
    [[nodiscard]] std::expected<std::uint64_t, TransferError> run();

    // Verify and publish; call after run() succeeded
    [[nodiscard]] std::error_code combine();

    // Segments after run(), with their written counts
    [[nodiscard]] const std::vector<Segment>& segments() const noexcept { return segments_; }

    // True when a sidecar from an earlier run was reused
    [[nodiscard]] bool resumed() const noexcept { return resumed_; }

private:
    // Reuse sidecar progress when it still describes the same remote content
    void load_progress();
    [[nodiscard]] std::error_code save_progress() const;

    // Sync the temp file, then record what the workers have written so far
    void checkpoint(const std::vector<std::unique_ptr<SegmentWorker>>& workers);

    DownloadJob& job_;
    ProbeResult info_;
    std::vector<Segment> segments_;
    const WorkerContext& ctx_;
    disk::FileWriter writer_;
    Combiner combiner_;
    bool resumed_{false};
};

} // namespace ferry::core
