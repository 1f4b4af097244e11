// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/transfer_planner.hpp>
#include <ferry/core/log.hpp>
#include <algorithm>

namespace ferry::core {

namespace {

// Captures the headers of a GET and abandons the body
class HeaderOnlySink final : public BodySink {
public:
    std::error_code on_response(const HttpResponse& response) override {
        response_ = response;
        return make_error_code(DownloadErrc::cancelled);
    }

    std::error_code on_data(const std::byte*, std::size_t) override {
        return make_error_code(DownloadErrc::cancelled);
    }

    [[nodiscard]] const std::optional<HttpResponse>& response() const noexcept { return response_; }

private:
    std::optional<HttpResponse> response_;
};

ProbeResult to_probe_result(const HttpResponse& response) {
    ProbeResult info;
    info.total_size = response.content_range_total ? response.content_range_total
                                                   : response.content_length;
    info.accepts_ranges = response.accepts_ranges;
    info.validator = response.validator();
    return info;
}

} // namespace

TransferPlanner::TransferPlanner(HttpClient& client, RateLimiter& limiter,
                                 RetryPolicy retry, const EngineConfig& config) noexcept
    : client_(client)
    , limiter_(limiter)
    , retry_(retry)
    , config_(config) {}

std::expected<ProbeResult, std::error_code>
TransferPlanner::probe_once(const std::string& url, std::stop_token stop) {
    auto permit = limiter_.acquire_slot(stop);
    if (!permit) {
        return std::unexpected(permit.error());
    }

    HttpRequest request;
    request.url = url;
    request.timeout = std::chrono::seconds{config_.timeout_seconds};
    request.chunk_size = config_.chunk_size_bytes;
    request.stop = stop;

    auto head = client_.head(request);
    if (head && head->status_code >= 200 && head->status_code < 300) {
        return to_probe_result(*head);
    }
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    // Server mishandled HEAD: read only the headers of a GET
    log::logger()->debug("probe: HEAD {} unusable ({}), trying GET", url,
                         head ? std::to_string(head->status_code) : head.error().message());

    HeaderOnlySink sink;
    auto get = client_.fetch(request, sink);
    if (!sink.response()) {
        return std::unexpected(get ? make_error_code(DownloadErrc::malformed_response) : get.error());
    }

    const auto& response = *sink.response();
    if (auto ec = http_status_error(response.status_code)) {
        return std::unexpected(ec);
    }

    auto info = to_probe_result(response);
    info.used_get_fallback = true;
    return info;
}

std::expected<ProbeResult, TransferError>
TransferPlanner::probe(const std::string& url, std::stop_token stop) {
    for (std::uint32_t attempt = 0;; ++attempt) {
        auto result = probe_once(url, stop);
        if (result) {
            return result.value();
        }

        TransferError error(result.error());
        auto decision = retry_.decide(attempt, error.kind);
        if (!decision.retry) {
            if (error.kind != FailureKind::cancelled) {
                log::logger()->warn("probe {} failed [{}] after {} attempt(s): {}",
                                    url, to_string(error.kind), attempt + 1, error.message());
            }
            return std::unexpected(error);
        }

        log::logger()->warn("probe {} attempt {} failed [{}]: {}, retrying in {} ms",
                            url, attempt + 1, to_string(error.kind), error.message(),
                            decision.delay.count());
        if (!RetryPolicy::wait(decision.delay, stop)) {
            return std::unexpected(TransferError(make_error_code(DownloadErrc::cancelled)));
        }
    }
}

TransferPlan TransferPlanner::plan(const ProbeResult& info, std::uint32_t worker_hint) const {
    TransferPlan result;

    std::uint32_t workers = worker_hint == 0 ? config_.segments : worker_hint;
    workers = std::clamp(workers, MIN_SEGMENTS, MAX_SEGMENTS);

    if (!info.range_capable() || *info.total_size < config_.min_segment_size || workers < 2) {
        return result;
    }

    result.mode = TransferMode::segmented;
    result.segments = make_segments(*info.total_size, workers);
    return result;
}

std::vector<Segment> TransferPlanner::make_segments(std::uint64_t total, std::uint32_t count) {
    std::vector<Segment> segments;
    if (total == 0) return segments;

    // Never more segments than bytes
    std::uint64_t n = std::clamp<std::uint64_t>(count, 1, total);
    std::uint64_t base = total / n;
    std::uint64_t extra = total % n;

    segments.reserve(static_cast<std::size_t>(n));
    std::uint64_t offset = 0;
    for (std::uint64_t i = 0; i < n; ++i) {
        // The first `extra` segments take one byte more
        std::uint64_t size = base + (i < extra ? 1 : 0);
        Segment seg;
        seg.id = static_cast<std::uint32_t>(i);
        seg.start = offset;
        seg.end = offset + size;
        segments.push_back(seg);
        offset += size;
    }
    return segments;
}

} // namespace ferry::core
