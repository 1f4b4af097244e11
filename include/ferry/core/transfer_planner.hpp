// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/http_client.hpp>
#include <ferry/core/job.hpp>
#include <ferry/core/rate_limiter.hpp>
#include <ferry/core/retry_policy.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace ferry::core {

// What a metadata probe learned about a URL
struct ProbeResult {
    std::optional<std::uint64_t> total_size;   // absent: unknown
    bool accepts_ranges{false};
    std::string validator;                     // absent: no cross-restart resume
    bool used_get_fallback{false};

    // Ranged resume and segmentation need both signals
    [[nodiscard]] bool range_capable() const noexcept { return total_size.has_value() && accepts_ranges; }
};

enum class TransferMode : std::uint8_t {
    single_stream,
    segmented
};

struct TransferPlan {
    TransferMode mode{TransferMode::single_stream};
    std::vector<Segment> segments;             // segmented mode only
};

// Probes a URL and decides between one stream and ranged segments
class TransferPlanner {
public:
    TransferPlanner(HttpClient& client, RateLimiter& limiter,
                    RetryPolicy retry, const EngineConfig& config) noexcept;

    // HEAD, falling back to a GET read up to its headers. Each probe holds one
    // concurrency permit; failures are retried under the retry policy.
    [[nodiscard]] std::expected<ProbeResult, TransferError>
    probe(const std::string& url, std::stop_token stop = {});

    // Segmented iff size and range support are known and size >= min_segment_size
    [[nodiscard]] TransferPlan plan(const ProbeResult& info, std::uint32_t worker_hint) const;

    // Near-equal contiguous ranges covering [0, total)
    [[nodiscard]] static std::vector<Segment> make_segments(std::uint64_t total, std::uint32_t count);

private:
    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe_once(const std::string& url, std::stop_token stop);

    HttpClient& client_;
    RateLimiter& limiter_;
    RetryPolicy retry_;
    const EngineConfig& config_;
};

} // namespace ferry::core
