// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/single_stream_worker.hpp>
#include <ferry/core/log.hpp>
#include <ferry/core/resume_meta.hpp>

namespace ferry::core {

namespace {

// Streams one response body into the temp file at the current offset
class StreamSink final : public BodySink {
public:
    StreamSink(disk::FileWriter& writer, const WorkerContext& ctx,
               std::uint64_t& offset, std::uint64_t& transferred,
               std::optional<std::uint64_t>& expected_total, std::string& validator,
               bool ranged) noexcept
        : writer_(writer), ctx_(ctx), offset_(offset), transferred_(transferred)
        , expected_total_(expected_total), validator_(validator), ranged_(ranged) {}

    std::error_code on_response(const HttpResponse& response) override {
        // Nothing left past the temp length
        if (ranged_ && response.status_code == 416) {
            range_exhausted_ = true;
            return make_error_code(DownloadErrc::range_not_satisfiable);
        }
        if (auto ec = http_status_error(response.status_code)) {
            return ec;
        }

        if (ranged_ && response.partial()) {
            auto current = response.validator();
            if (!validator_.empty() && !current.empty() && current != validator_) {
                return make_error_code(DownloadErrc::validator_changed);
            }
            if (response.content_range_start && *response.content_range_start != offset_) {
                return make_error_code(DownloadErrc::malformed_response);
            }
            if (!expected_total_ && response.content_range_total) {
                expected_total_ = response.content_range_total;
            }
            return {};
        }

        // Full body from byte 0, even if a range was asked for
        if (offset_ > 0) {
            log::logger()->info("{}: server ignored range, restarting from 0", writer_.path().string());
            if (auto ec = writer_.truncate(0)) {
                return ec;
            }
            offset_ = 0;
            if (ctx_.progress) ctx_.progress->set(0);
        }
        if (response.content_length) {
            expected_total_ = response.content_length;
            if (ctx_.progress) ctx_.progress->total(*response.content_length);
        }
        if (auto current = response.validator(); !current.empty()) {
            validator_ = std::move(current);
        }
        return {};
    }

    std::error_code on_data(const std::byte* data, std::size_t size) override {
        // Charge the byte budget before accepting the chunk
        if (auto ec = ctx_.limiter.acquire_bytes(size, ctx_.stop)) {
            return ec;
        }
        if (auto ec = writer_.write(offset_, data, size)) {
            return ec;
        }
        offset_ += size;
        transferred_ += size;
        if (ctx_.progress) ctx_.progress->add(size);
        return {};
    }

    [[nodiscard]] bool range_exhausted() const noexcept { return range_exhausted_; }

private:
    disk::FileWriter& writer_;
    const WorkerContext& ctx_;
    std::uint64_t& offset_;
    std::uint64_t& transferred_;
    std::optional<std::uint64_t>& expected_total_;
    std::string& validator_;
    bool ranged_;
    bool range_exhausted_{false};
};

} // namespace

SingleStreamWorker::SingleStreamWorker(DownloadJob& job, const ProbeResult& info,
                                       const WorkerContext& ctx)
    : job_(job)
    , info_(info)
    , ctx_(ctx) {}

std::uint64_t SingleStreamWorker::reusable_offset() const {
    // Without range support a resume is a restart
    if (!info_.range_capable()) return 0;

    auto length = disk::file_length(job_.temp_path());
    if (length == 0) return 0;

    auto meta = ResumeMeta::load(job_.meta_path());
    if (!meta || meta->segmented ||
        !meta->matches(job_.url(), info_.validator, info_.total_size)) {
        log::logger()->info("{}: partial file does not match remote, discarding {} bytes",
                            job_.url(), length);
        return 0;
    }
    if (length > *info_.total_size) {
        return 0;
    }
    return length;
}

std::error_code SingleStreamWorker::restart_from_zero() {
    if (auto ec = writer_.truncate(0)) {
        return ec;
    }
    offset_ = 0;
    validator_.clear();
    complete_ = false;
    if (ctx_.progress) ctx_.progress->set(0);
    return {};
}

std::error_code SingleStreamWorker::save_sidecar() const {
    if (validator_.empty() || !info_.range_capable()) {
        return ResumeMeta::remove(job_.meta_path());
    }

    ResumeMeta meta;
    meta.url = job_.url();
    meta.validator = validator_;
    meta.total_size = expected_total_;
    meta.segmented = false;
    return meta.save(job_.meta_path());
}

std::error_code SingleStreamWorker::stream_once() {
    auto permit = ctx_.limiter.acquire_slot(ctx_.stop);
    if (!permit) {
        return permit.error();
    }

    bool ranged = offset_ > 0 && info_.range_capable();
    auto request = ctx_.make_request(job_.url());
    if (ranged) {
        request.range = RangeSpec{offset_, std::nullopt};
    }

    StreamSink sink(writer_, ctx_, offset_, transferred_, expected_total_, validator_, ranged);
    auto response = ctx_.client.fetch(request, sink);

    if (sink.range_exhausted()) {
        // 416 on resume: the temp file already holds everything
        if (!expected_total_ || offset_ == *expected_total_) {
            complete_ = true;
            return {};
        }
        if (auto ec = restart_from_zero()) {
            return ec;
        }
        return make_error_code(DownloadErrc::range_not_satisfiable);
    }
    if (!response) {
        return response.error();
    }

    // Clean close: a known size must be met exactly
    if (expected_total_ && offset_ < *expected_total_) {
        return make_error_code(DownloadErrc::short_read);
    }
    if (expected_total_ && offset_ > *expected_total_) {
        return make_error_code(DownloadErrc::size_mismatch);
    }
    complete_ = true;
    return {};
}

std::expected<std::uint64_t, TransferError> SingleStreamWorker::run() {
    expected_total_ = info_.total_size;
    validator_ = info_.validator;
    offset_ = reusable_offset();
    initial_offset_ = offset_;

    auto mode = offset_ > 0 ? disk::OpenMode::keep : disk::OpenMode::truncate;
    if (auto ec = writer_.open(job_.temp_path(), mode)) {
        return std::unexpected(TransferError(ec));
    }

    job_.resume_offset(offset_);
    job_.validator(validator_);
    if (ctx_.progress) {
        ctx_.progress->set(offset_);
        if (expected_total_) ctx_.progress->total(*expected_total_);
    }
    if (offset_ > 0) {
        log::logger()->info("{}: resuming at byte {}", job_.url(), offset_);
    }

    for (std::uint32_t attempt = 0;; ++attempt) {
        if (auto ec = save_sidecar()) {
            log::logger()->warn("{}: cannot write resume sidecar: {}", job_.url(), ec.message());
        }

        auto ec = stream_once();
        if (!ec) {
            break;
        }

        TransferError error(ec);
        if (ec == DownloadErrc::validator_changed) {
            log::logger()->warn("{}: remote content changed, discarding partial file", job_.url());
            if (auto rc = restart_from_zero()) {
                return std::unexpected(TransferError(rc));
            }
        }

        auto decision = ctx_.retry.decide(attempt, error.kind);
        if (!decision.retry) {
            if (error.kind != FailureKind::cancelled) {
                log::logger()->error("{}: giving up after {} attempt(s) [{}]: {}",
                                     job_.url(), attempt + 1, to_string(error.kind), error.message());
            }
            job_.last_error(error);
            return std::unexpected(error);
        }

        log::logger()->warn("{}: attempt {} failed [{}]: {}, retrying in {} ms",
                            job_.url(), attempt + 1, to_string(error.kind), error.message(),
                            decision.delay.count());
        if (!RetryPolicy::wait(decision.delay, ctx_.stop)) {
            return std::unexpected(TransferError(make_error_code(DownloadErrc::cancelled)));
        }

        if (!info_.range_capable() && offset_ > 0) {
            if (auto rc = restart_from_zero()) {
                return std::unexpected(TransferError(rc));
            }
        }
    }

    if (auto ec = writer_.flush()) {
        return std::unexpected(TransferError(ec));
    }
    writer_.close();

    // Sole visibility point of the final file
    if (auto ec = disk::publish_file(job_.temp_path(), job_.final_path())) {
        return std::unexpected(TransferError(ec));
    }
    if (auto ec = ResumeMeta::remove(job_.meta_path())) {
        log::logger()->debug("{}: cannot remove sidecar: {}", job_.url(), ec.message());
    }
    job_.total_size(expected_total_ ? expected_total_ : std::optional<std::uint64_t>(offset_));

    log::logger()->info("{}: published {} ({} bytes)", job_.url(), job_.final_path().string(), offset_);
    return transferred_;
}

} // namespace ferry::core
