// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/segmented_transfer.hpp>
#include <ferry/core/log.hpp>
#include <ferry/core/resume_meta.hpp>
#include <memory>
#include <thread>

namespace ferry::core {

namespace {

// Writes one ranged response at the segment's file offset
class SegmentSink final : public BodySink {
public:
    SegmentSink(disk::FileWriter& writer, const WorkerContext& ctx,
                std::uint64_t start, std::uint64_t size,
                std::atomic<std::uint64_t>& written, std::uint64_t& transferred,
                const std::string& validator) noexcept
        : writer_(writer), ctx_(ctx), start_(start), size_(size)
        , written_(written), transferred_(transferred), validator_(validator) {}

    std::error_code on_response(const HttpResponse& response) override {
        if (auto ec = http_status_error(response.status_code)) {
            return ec;
        }
        // 200 means the whole body: ranges are not honoured after all
        if (!response.partial()) {
            return make_error_code(DownloadErrc::probe_failed);
        }
        auto current = response.validator();
        if (!validator_.empty() && !current.empty() && current != validator_) {
            return make_error_code(DownloadErrc::validator_changed);
        }
        // Bytes for another offset must not land at ours
        std::uint64_t requested = start_ + written_.load(std::memory_order_relaxed);
        if (response.content_range_start && *response.content_range_start != requested) {
            log::logger()->warn("segment at {}: server sent range starting at {}",
                                requested, *response.content_range_start);
            return make_error_code(DownloadErrc::malformed_response);
        }
        return {};
    }

    std::error_code on_data(const std::byte* data, std::size_t size) override {
        std::uint64_t written = written_.load(std::memory_order_relaxed);
        if (written + size > size_) {
            return make_error_code(DownloadErrc::malformed_response);
        }
        if (auto ec = ctx_.limiter.acquire_bytes(size, ctx_.stop)) {
            return ec;
        }
        if (auto ec = writer_.write(start_ + written, data, size)) {
            return ec;
        }
        // Release: a checkpoint that sees this count also sees the write
        written_.store(written + size, std::memory_order_release);
        transferred_ += size;
        if (ctx_.progress) ctx_.progress->add(size);
        return {};
    }

private:
    disk::FileWriter& writer_;
    const WorkerContext& ctx_;
    std::uint64_t start_;
    std::uint64_t size_;
    std::atomic<std::uint64_t>& written_;
    std::uint64_t& transferred_;
    const std::string& validator_;
};

// Errors that end the segmented attempt for the whole job
bool needs_whole_file_fallback(const std::error_code& ec) noexcept {
    return ec == DownloadErrc::probe_failed || ec == DownloadErrc::validator_changed;
}

} // namespace

//=============================================================================
// SegmentWorker
//=============================================================================

SegmentWorker::SegmentWorker(const Segment& segment, disk::FileWriter& writer,
                             const WorkerContext& ctx, std::string url, std::string validator)
    : id_(segment.id)
    , start_(segment.start)
    , end_(segment.end)
    , written_(segment.written)
    , writer_(writer)
    , ctx_(ctx)
    , url_(std::move(url))
    , validator_(std::move(validator)) {}

Segment SegmentWorker::segment() const noexcept {
    Segment seg;
    seg.id = id_;
    seg.start = start_;
    seg.end = end_;
    seg.written = written_.load(std::memory_order_acquire);
    seg.complete = seg.written == seg.size();
    return seg;
}

std::error_code SegmentWorker::fetch_remainder() {
    auto permit = ctx_.limiter.acquire_slot(ctx_.stop);
    if (!permit) {
        return permit.error();
    }

    std::uint64_t transferred = 0;
    std::uint64_t written = written_.load(std::memory_order_relaxed);
    auto request = ctx_.make_request(url_);
    request.range = RangeSpec{start_ + written, end_ - 1};

    SegmentSink sink(writer_, ctx_, start_, end_ - start_, written_, transferred, validator_);
    auto response = ctx_.client.fetch(request, sink);
    if (!response) {
        return response.error();
    }

    // Clean close before the range was filled
    if (written_.load(std::memory_order_relaxed) < end_ - start_) {
        return make_error_code(DownloadErrc::short_read);
    }
    return {};
}

std::expected<std::uint64_t, TransferError> SegmentWorker::run() {
    std::uint64_t before = written_.load(std::memory_order_relaxed);

    for (std::uint32_t attempt = 0;; ++attempt) {
        if (written_.load(std::memory_order_relaxed) >= end_ - start_) {
            break;
        }

        auto ec = fetch_remainder();
        if (!ec) {
            continue;
        }

        TransferError error(ec);
        if (needs_whole_file_fallback(ec)) {
            return std::unexpected(error);
        }

        auto decision = ctx_.retry.decide(attempt, error.kind);
        if (!decision.retry) {
            return std::unexpected(error);
        }

        log::logger()->debug("{}: segment {} attempt {} failed [{}]: {}, retrying remainder in {} ms",
                             url_, id_, attempt + 1, to_string(error.kind), error.message(),
                             decision.delay.count());
        if (!RetryPolicy::wait(decision.delay, ctx_.stop)) {
            return std::unexpected(TransferError(make_error_code(DownloadErrc::cancelled)));
        }
    }

    return written_.load(std::memory_order_relaxed) - before;
}

//=============================================================================
// Combiner
//=============================================================================

Combiner::Combiner(std::size_t segment_count)
    : expected_(segment_count) {}

void Combiner::report(std::uint32_t segment_id, std::error_code ec) {
    {
        auto lock = std::unique_lock(mutex_);
        ++reported_;
        if (ec && !first_error_) {
            first_error_ = ec;
            first_error_segment_ = segment_id;
        }
    }
    cv_.notify_all();
}

TransferError Combiner::wait() {
    auto lock = std::unique_lock(mutex_);
    cv_.wait(lock, [this] { return reported_ >= expected_; });
    if (first_error_) {
        log::logger()->debug("combiner: segment {} failed first: {}",
                             first_error_segment_, first_error_.message());
        return TransferError(first_error_);
    }
    return {};
}

bool Combiner::wait_for(std::chrono::milliseconds timeout) {
    auto lock = std::unique_lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return reported_ >= expected_; });
}

std::size_t Combiner::reported() const {
    auto lock = std::unique_lock(mutex_);
    return reported_;
}

std::error_code Combiner::finalize(disk::FileWriter& writer,
                                   const std::filesystem::path& temp,
                                   const std::filesystem::path& final_path,
                                   std::uint64_t total_size) {
    if (published_) {
        return {};
    }

    auto length = writer.size();
    if (!length) {
        return length.error();
    }
    if (*length != total_size) {
        return make_error_code(DownloadErrc::size_mismatch);
    }

    if (auto ec = writer.flush()) {
        return ec;
    }
    writer.close();

    if (auto ec = disk::publish_file(temp, final_path)) {
        return ec;
    }
    published_ = true;
    return {};
}

//=============================================================================
// SegmentedTransfer
//=============================================================================

SegmentedTransfer::SegmentedTransfer(DownloadJob& job, const ProbeResult& info,
                                     std::vector<Segment> segments, const WorkerContext& ctx)
    : job_(job)
    , info_(info)
    , segments_(std::move(segments))
    , ctx_(ctx)
    , combiner_(segments_.size()) {}

void SegmentedTransfer::load_progress() {
    if (!info_.total_size || disk::file_length(job_.temp_path()) != *info_.total_size) {
        return;
    }

    auto meta = ResumeMeta::load(job_.meta_path());
    if (!meta || !meta->segmented || meta->segments.size() != segments_.size() ||
        !meta->matches(job_.url(), info_.validator, info_.total_size)) {
        return;
    }

    // Ranges must still partition [0, total)
    std::uint64_t expected_start = 0;
    for (const auto& seg : meta->segments) {
        if (seg.start != expected_start) return;
        expected_start = seg.end;
    }
    if (expected_start != *info_.total_size) return;

    segments_ = meta->segments;
    resumed_ = true;
}

std::error_code SegmentedTransfer::save_progress() const {
    ResumeMeta meta;
    meta.url = job_.url();
    meta.validator = info_.validator;
    meta.total_size = info_.total_size;
    meta.segmented = true;
    meta.segments = segments_;

    // No validator: partial segments cannot be trusted by a later run
    if (meta.validator.empty()) {
        return ResumeMeta::remove(job_.meta_path());
    }
    return meta.save(job_.meta_path());
}

void SegmentedTransfer::checkpoint(const std::vector<std::unique_ptr<SegmentWorker>>& workers) {
    // Counts first, fsync second: the sidecar never claims unsynced bytes
    for (std::size_t i = 0; i < workers.size(); ++i) {
        segments_[i] = workers[i]->segment();
    }
    if (auto ec = writer_.flush()) {
        log::logger()->warn("{}: cannot sync temp file: {}", job_.url(), ec.message());
        return;
    }
    if (auto ec = save_progress()) {
        log::logger()->warn("{}: cannot write resume sidecar: {}", job_.url(), ec.message());
    }
}

std::expected<std::uint64_t, TransferError> SegmentedTransfer::run() {
    load_progress();

    std::uint64_t total = info_.total_size.value_or(0);
    auto mode = resumed_ ? disk::OpenMode::keep : disk::OpenMode::truncate;
    if (auto ec = writer_.open(job_.temp_path(), mode, total)) {
        return std::unexpected(TransferError(ec));
    }

    std::uint64_t already = 0;
    for (const auto& seg : segments_) {
        already += seg.written;
    }
    job_.resume_offset(already);
    job_.validator(info_.validator);
    if (ctx_.progress) {
        ctx_.progress->set(already);
        ctx_.progress->total(total);
    }
    if (resumed_) {
        log::logger()->info("{}: resuming {} segments with {} bytes on disk",
                            job_.url(), segments_.size(), already);
    }

    if (auto ec = save_progress()) {
        log::logger()->warn("{}: cannot write resume sidecar: {}", job_.url(), ec.message());
    }

    // A terminal failure in one segment stops its siblings; their progress stays on disk
    std::stop_source job_stop;
    std::stop_callback forward_stop(ctx_.stop, [&job_stop] { job_stop.request_stop(); });
    WorkerContext segment_ctx{ctx_.client, ctx_.limiter, ctx_.retry, ctx_.config,
                              ctx_.progress, job_stop.get_token()};

    std::vector<std::unique_ptr<SegmentWorker>> workers;
    workers.reserve(segments_.size());
    for (const auto& seg : segments_) {
        workers.push_back(std::make_unique<SegmentWorker>(
            seg, writer_, segment_ctx, job_.url(), info_.validator));
    }

    std::vector<std::expected<std::uint64_t, TransferError>> results(workers.size());
    TransferError failure;
    {
        std::vector<std::jthread> threads;
        threads.reserve(workers.size());
        for (std::size_t i = 0; i < workers.size(); ++i) {
            threads.emplace_back([this, &workers, &results, &job_stop, i] {
                results[i] = workers[i]->run();
                std::error_code ec = results[i] ? std::error_code{} : results[i].error().code;
                combiner_.report(workers[i]->id(), ec);
                if (ec && classify(ec) != FailureKind::cancelled) {
                    job_stop.request_stop();
                }
            });
        }

        // Join barrier: every segment reports before anything is combined
        auto interval = ctx_.config.checkpoint_interval.count() > 0
            ? ctx_.config.checkpoint_interval
            : CHECKPOINT_INTERVAL;
        while (!combiner_.wait_for(interval)) {
            checkpoint(workers);
        }
        failure = combiner_.wait();
    }

    std::uint64_t transferred = 0;
    for (std::size_t i = 0; i < workers.size(); ++i) {
        segments_[i] = workers[i]->segment();
        if (results[i]) {
            transferred += *results[i];
        }
    }

    if (failure.code) {
        if (auto ec = save_progress()) {
            log::logger()->warn("{}: cannot write resume sidecar: {}", job_.url(), ec.message());
        }
        job_.last_error(failure);
        return std::unexpected(failure);
    }
    return transferred;
}

std::error_code SegmentedTransfer::combine() {
    if (auto ec = combiner_.finalize(writer_, job_.temp_path(), job_.final_path(),
                                     info_.total_size.value_or(0))) {
        return ec;
    }
    if (auto ec = ResumeMeta::remove(job_.meta_path())) {
        log::logger()->debug("{}: cannot remove sidecar: {}", job_.url(), ec.message());
    }
    log::logger()->info("{}: published {} ({} bytes, {} segments)", job_.url(),
                        job_.final_path().string(), info_.total_size.value_or(0), segments_.size());
    return {};
}

} // namespace ferry::core
