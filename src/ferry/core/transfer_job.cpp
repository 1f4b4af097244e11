// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/transfer_job.hpp>
#include <ferry/core/log.hpp>
#include <ferry/core/naming.hpp>
#include <ferry/core/segmented_transfer.hpp>
#include <ferry/core/single_stream_worker.hpp>
#include <ferry/disk/error.hpp>
#include <ferry/disk/file_writer.hpp>
#include <filesystem>

namespace ferry::core {

namespace {

// Drops the job's counter from the tracker when the transfer ends
class CounterGuard {
public:
    CounterGuard(ProgressTracker& tracker, std::shared_ptr<JobCounter> counter)
        : tracker_(tracker), counter_(std::move(counter)) {}
    ~CounterGuard() { tracker_.unregister_job(counter_); }

    CounterGuard(const CounterGuard&) = delete;
    CounterGuard& operator=(const CounterGuard&) = delete;

private:
    ProgressTracker& tracker_;
    std::shared_ptr<JobCounter> counter_;
};

std::error_code advance(DownloadJob& job, JobState next) {
    auto from = job.state();
    if (auto ec = job.transition(next)) {
        log::logger()->error("{}: illegal transition {} -> {}", job.url(), to_string(from), to_string(next));
        return ec;
    }
    log::logger()->debug("{}: {} -> {}", job.url(), to_string(from), to_string(next));
    return {};
}

} // namespace

TransferJobRunner::TransferJobRunner(HttpClient& client, RateLimiter& limiter,
                                     ProgressTracker& tracker, const EngineConfig& config,
                                     TelemetrySink* telemetry)
    : client_(client)
    , limiter_(limiter)
    , tracker_(tracker)
    , config_(config)
    , telemetry_(telemetry)
    , planner_(client, limiter, RetryPolicy::from_config(config), config) {}

JobResult TransferJobRunner::run(const JobSpec& spec, std::size_t index, std::stop_token stop) noexcept {
    auto start = std::chrono::steady_clock::now();

    JobResult result;
    result.index = index;
    try {
        result.url = spec.url;
        auto paths = spec.destination.empty()
            ? paths_for(spec.url, config_.output_folder)
            : paths_for_destination(spec.destination);

        DownloadJob job(spec, paths.final_path, paths.temp_path, paths.meta_path);
        result.outcome = execute(job, stop);
        if (!result.outcome) {
            job.fail(result.outcome.error());
        }
    } catch (const std::exception& e) {
        log::logger()->error("{}: {}", spec.url, e.what());
        result.outcome = std::unexpected(TransferError(make_error_code(std::errc::io_error)));
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    try {
        record(result);
    } catch (const std::exception& e) {
        log::logger()->warn("{}: telemetry failed: {}", spec.url, e.what());
    }
    return result;
}

std::expected<JobSuccess, TransferError>
TransferJobRunner::execute(DownloadJob& job, std::stop_token stop) {
    if (stop.stop_requested()) {
        return std::unexpected(TransferError(make_error_code(DownloadErrc::cancelled)));
    }

    std::error_code ec;
    auto folder = job.final_path().parent_path();
    if (!folder.empty()) {
        std::filesystem::create_directories(folder, ec);
        if (ec) {
            return std::unexpected(TransferError(ec));
        }
    }

    // Already downloaded: no request at all
    if (std::filesystem::exists(job.final_path(), ec)) {
        if (auto rc = advance(job, JobState::verifying)) return std::unexpected(TransferError(rc));
        if (auto rc = advance(job, JobState::completed)) return std::unexpected(TransferError(rc));
        log::logger()->info("{}: {} already exists", job.url(), job.final_path().string());
        return JobSuccess{job.final_path().string(), 0, true};
    }

    if (auto rc = advance(job, JobState::probing)) {
        return std::unexpected(TransferError(rc));
    }
    auto info = planner_.probe(job.url(), stop);
    if (!info) {
        return std::unexpected(info.error());
    }
    job.total_size(info->total_size);

    auto bytes = transfer(job, *info, stop);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    job.add_transferred(*bytes);

    if (auto rc = advance(job, JobState::verifying)) {
        return std::unexpected(TransferError(rc));
    }
    if (!std::filesystem::exists(job.final_path(), ec)) {
        return std::unexpected(TransferError(make_error_code(disk::DiskErrc::file_not_found)));
    }
    auto length = disk::file_length(job.final_path());
    if (job.total_size() && length != *job.total_size()) {
        log::logger()->error("{}: final size {} != expected {}", job.url(), length, *job.total_size());
        return std::unexpected(TransferError(make_error_code(DownloadErrc::size_mismatch)));
    }
    if (auto rc = advance(job, JobState::completed)) {
        return std::unexpected(TransferError(rc));
    }

    return JobSuccess{job.final_path().string(), job.bytes_transferred(), false};
}

std::expected<std::uint64_t, TransferError>
TransferJobRunner::transfer(DownloadJob& job, ProbeResult info, std::stop_token stop) {
    auto counter = tracker_.register_job(job.url());
    CounterGuard guard(tracker_, counter);

    WorkerContext ctx{client_, limiter_, RetryPolicy::from_config(config_), config_, counter, stop};
    auto plan = planner_.plan(info, job.workers());

    if (plan.mode == TransferMode::segmented) {
        if (auto rc = advance(job, JobState::segmented)) {
            return std::unexpected(TransferError(rc));
        }

        SegmentedTransfer segmented(job, info, std::move(plan.segments), ctx);
        auto result = segmented.run();
        if (result) {
            if (auto rc = advance(job, JobState::combining)) {
                return std::unexpected(TransferError(rc));
            }
            if (auto rc = segmented.combine()) {
                return std::unexpected(TransferError(rc));
            }
            return *result;
        }

        const auto& code = result.error().code;
        if (code != DownloadErrc::probe_failed && code != DownloadErrc::validator_changed) {
            return std::unexpected(result.error());
        }

        // Ranges not honoured or content changed: restart as one stream from 0
        log::logger()->warn("{}: {}, falling back to a single stream", job.url(), code.message());
        if (code == DownloadErrc::probe_failed) {
            info.accepts_ranges = false;
        }
    }

    if (auto rc = advance(job, JobState::single_stream)) {
        return std::unexpected(TransferError(rc));
    }
    SingleStreamWorker worker(job, info, ctx);
    return worker.run();
}

void TransferJobRunner::record(const JobResult& result) const {
    if (result.ok()) {
        log::logger()->info("{}: done, {} bytes in {} ms", result.url,
                            result.outcome->bytes, result.duration.count());
    } else if (result.outcome.error().kind == FailureKind::cancelled) {
        log::logger()->info("{}: cancelled", result.url);
    } else {
        log::logger()->error("{}: failed [{}]: {}", result.url,
                             to_string(result.outcome.error().kind), result.outcome.error().message());
    }

    if (!telemetry_) return;

    AttemptRecord rec;
    rec.url = result.url;
    rec.duration = result.duration;
    if (result.ok()) {
        rec.status = result.outcome->already_existed ? AttemptStatus::already_exists : AttemptStatus::success;
        rec.bytes = result.outcome->bytes;
    } else {
        rec.status = AttemptStatus::failed;
    }
    telemetry_->record(rec);
}

} // namespace ferry::core
