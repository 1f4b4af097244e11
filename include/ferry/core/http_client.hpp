// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <stop_token>
#include <string>

namespace ferry::core {

// Byte range for a Range header: bytes=from-[to], `to` inclusive when set
struct RangeSpec {
    std::uint64_t from{0};
    std::optional<std::uint64_t> to;

    [[nodiscard]] std::string header_value() const;
};

struct HttpRequest {
    std::string url;
    std::optional<RangeSpec> range;
    std::chrono::seconds timeout{300};
    std::size_t chunk_size{8192};
    std::stop_token stop;
};

// Response headers, available before any body byte
struct HttpResponse {
    long status_code{0};
    std::map<std::string, std::string> headers;      // lower-case names
    std::optional<std::uint64_t> content_length;
    std::optional<std::uint64_t> content_range_start; // a in Content-Range: bytes a-b/total
    std::optional<std::uint64_t> content_range_total; // total in Content-Range: bytes a-b/total
    bool accepts_ranges{false};
    std::string etag;
    std::string last_modified;

    [[nodiscard]] bool partial() const noexcept { return status_code == 206; }

    // Strong ETag, else Last-Modified, else empty
    [[nodiscard]] std::string validator() const;

    // Fill the derived fields from `headers`
    void parse_headers();
};

// Receives one response. Either callback may return an error to abandon the
// transfer; the client then reports that error from fetch().
class BodySink {
public:
    virtual ~BodySink() = default;

    [[nodiscard]] virtual std::error_code on_response(const HttpResponse& response) = 0;
    [[nodiscard]] virtual std::error_code on_data(const std::byte* data, std::size_t size) = 0;
};

// The HTTP capability the engine depends on
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Header-only request. Non-2xx final statuses are reported in the
    // response, not as errors; transport failures are errors.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request) = 0;

    // GET, streaming the body into `sink` in chunks of at most
    // request.chunk_size. Returns the response on a clean close.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    fetch(const HttpRequest& request, BodySink& sink) = 0;
};

} // namespace ferry::core
