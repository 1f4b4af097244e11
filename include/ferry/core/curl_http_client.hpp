// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/http_client.hpp>
#include <map>
#include <string>
#include <string_view>

namespace ferry::core {

// HttpClient over the libcurl easy interface. One easy handle per request,
// so a single instance may be shared by any number of worker threads.
class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient() = default;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const HttpRequest& request) override;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    fetch(const HttpRequest& request, BodySink& sink) override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // Parse one raw header line into `headers` (lower-case name). A status
    // line clears the map, since redirects deliver several header blocks.
    static void parse_header_line(std::string_view line,
                                  std::map<std::string, std::string>& headers);

    // Map a CURLcode value to a download error
    [[nodiscard]] static std::error_code curl_error(int curl_code) noexcept;
};

} // namespace ferry::core
